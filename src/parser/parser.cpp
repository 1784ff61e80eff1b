#include "upcast/parser.hpp"
#include "prelude.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include <tao/pegtl.hpp>

namespace upcast {
using namespace upcast::parser;

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(filename));
    build_state st;
    ParseResult r;
    try {
        if(!tao::pegtl::parse< grammar::file, actions::action, actions::control >(in, st)){
            r.code = "E0100"; r.error_message = "malformed hierarchy description"; r.line = 1; r.column = 1;
            return r;
        }
    } catch (const tao::pegtl::parse_error& e) {
        const auto& p = e.positions().front();
        r.success = false;
        r.code = st.error_code.empty() ? "E0100" : st.error_code;
        r.error_message = st.error_message.empty() ? e.what() : st.error_message;
        r.line = static_cast<int>(p.line);
        r.column = static_cast<int>(p.column);
        return r;
    }
    r.success = true;
    r.hierarchy.bindings = st.bindings;
    r.hierarchy.roots = std::move(st.roots);
    return r;
}

Hierarchy parse_hierarchy(std::string_view src, std::string_view filename){
    auto r = Parser{}.parse_string(src, filename);
    if(!r.success) throw parse_error(r.code, r.error_message, r.line, r.column);
    return std::move(r.hierarchy);
}

} // namespace upcast
