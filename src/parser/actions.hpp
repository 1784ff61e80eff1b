#pragma once
#include "prelude.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>

namespace upcast::parser::actions {
using namespace tao::pegtl;
using upcast::parser::build_state;

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::binding_param > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, build_state& st){ st.add_param(in.string()); }
};

template<> struct action< grammar::node_label > {
    template<typename ActionInput>
    static void apply(const ActionInput& in, build_state& st){
        const auto p = in.position();
        st.add_node(in.string(), static_cast<int>(p.line), static_cast<int>(p.column));
    }
};

// block_open only matches directly after a node label, so sink().back() is that node
template<> struct action< grammar::block_open > {
    template<typename ActionInput>
    static void apply(const ActionInput&, build_state& st){ st.open_block(); }
};

template<> struct action< grammar::block_close > {
    template<typename ActionInput>
    static void apply(const ActionInput&, build_state& st){ st.close_block(); }
};

// Error messages for the rules a must<>/if_must<> can fail on.
template<typename Rule> constexpr const char* error_code(){ return "E0100"; }
template<> constexpr const char* error_code< grammar::bindings >(){ return "E0101"; }

template<typename Rule> constexpr const char* error_message(){ return "malformed hierarchy description"; }
template<> constexpr const char* error_message< grammar::bindings >(){ return "expected a binding list '[...]' before the hierarchy"; }
template<> constexpr const char* error_message< grammar::bind_close >(){ return "malformed binding list; expected ',' or ']'"; }
template<> constexpr const char* error_message< grammar::block_close >(){ return "unbalanced block; expected ',' or '}'"; }
template<> constexpr const char* error_message< grammar::missing_comma >(){ return "expected ',' between siblings"; }
template<> constexpr const char* error_message< eof >(){ return "unexpected input after the hierarchy (unbalanced '}' or missing ',')"; }

template<typename Rule>
struct control : normal<Rule> {
    template<typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, build_state& st, States&&...){
        st.error_code = error_code<Rule>();
        st.error_message = error_message<Rule>();
        throw tao::pegtl::parse_error(st.error_message, in);
    }
};

} // namespace upcast::parser::actions
