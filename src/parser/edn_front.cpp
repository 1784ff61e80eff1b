// EDN front-end: (hierarchy [bindings...] node...) where node is an atom or (label child...)
#include "upcast/parser.hpp"
#include "upcast/edn.hpp"

namespace upcast {

namespace {

[[noreturn]] void shape_error(const edn::node& at, const std::string& msg){
    throw parse_error("E0102", msg, at.line, at.col);
}

TreeNode tree_from_form(const edn::node_ptr& form){
    TreeNode t; t.line = form->line; t.col = form->col;
    if(auto *l = edn::as_list(*form)){
        if(l->elems.empty()) shape_error(*form, "empty node form; expected (label child...)");
        t.type_expr = collapse_ws(edn::atom_text(*l->elems[0]));
        if(t.type_expr.empty()) shape_error(*l->elems[0], "node label must be a symbol or string");
        for(size_t i=1;i<l->elems.size(); ++i) t.children.push_back(tree_from_form(l->elems[i]));
        return t;
    }
    t.type_expr = collapse_ws(edn::atom_text(*form));
    if(t.type_expr.empty()) shape_error(*form, "node must be a symbol, string or (label child...) list");
    return t;
}

} // namespace

Hierarchy hierarchy_from_edn(const edn::node_ptr& form){
    if(!form) throw parse_error("E0102", "missing hierarchy form", -1, -1);
    auto *l = edn::as_list(*form);
    if(!l || l->elems.empty() || !edn::as_symbol(*l->elems[0]) || edn::as_symbol(*l->elems[0])->name != "hierarchy")
        shape_error(*form, "expected (hierarchy [bindings] node...)");
    if(l->elems.size() < 2 || !edn::as_vector(*l->elems[1]))
        throw parse_error("E0101", "expected a binding vector after 'hierarchy'", form->line, form->col);
    auto bindings = std::make_shared<BindingSet>();
    for(auto& b : edn::as_vector(*l->elems[1])->elems){
        auto text = collapse_ws(edn::atom_text(*b));
        if(text.empty()) shape_error(*b, "binding entries must be symbols or strings");
        bindings->params.push_back(make_generic_param(text));
    }
    Hierarchy h; h.bindings = bindings;
    for(size_t i=2;i<l->elems.size(); ++i) h.roots.push_back(tree_from_form(l->elems[i]));
    return h;
}

ParseResult Parser::parse_edn(std::string_view src) const {
    ParseResult r;
    try {
        r.hierarchy = hierarchy_from_edn(edn::parse(src));
        r.success = true;
    } catch (const parse_error& e) {
        r.code = e.code; r.error_message = e.what(); r.line = e.line; r.column = e.col;
    } catch (const edn::parse_error& e) {
        r.code = "E0100"; r.error_message = e.what(); r.line = e.line; r.column = e.col;
    }
    return r;
}

} // namespace upcast
