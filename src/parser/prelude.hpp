#pragma once
#include "upcast/hierarchy.hpp"

#include <memory>
#include <string>
#include <vector>

namespace upcast::parser {

// Tree under construction. Only the children vector on top of `open` is ever
// appended to, so the pointers below it stay valid while nested blocks grow.
struct build_state {
    std::shared_ptr<BindingSet> bindings = std::make_shared<BindingSet>();
    std::vector<TreeNode> roots;
    std::vector<std::vector<TreeNode>*> open;

    // Set by the control class right before a parse_error is thrown.
    std::string error_code;
    std::string error_message;

    std::vector<TreeNode>& sink(){ return open.empty() ? roots : *open.back(); }

    void add_param(const std::string& raw){ bindings->params.push_back(make_generic_param(collapse_ws(raw))); }
    void add_node(const std::string& raw, int line, int col){
        TreeNode n; n.type_expr = collapse_ws(raw); n.line = line; n.col = col;
        sink().push_back(std::move(n));
    }
    void open_block(){ open.push_back(&sink().back().children); }
    void close_block(){ if(!open.empty()) open.pop_back(); }
};

} // namespace upcast::parser
