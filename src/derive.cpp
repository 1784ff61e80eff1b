#include "upcast/derive.hpp"

#include <cstdio>

namespace upcast {

const char* to_string(PairDeriver::State s){
    return s == PairDeriver::State::Traversing ? "Traversing" : "Emitting";
}

size_t PairDeriver::run(const Hierarchy& h){
    bindings_ = h.bindings ? h.bindings : std::make_shared<const BindingSet>();
    state_ = State::Traversing;
    emitted_ = 0;
    walk_forest(h.roots);
    if(trace_) std::fprintf(stderr, "[upcast][trace] walk complete: %zu edge(s)\n", emitted_);
    return emitted_;
}

void PairDeriver::walk_forest(const std::vector<TreeNode>& nodes){
    for(const auto& root : nodes){
        if(root.is_leaf()) continue;
        // pairs rooted inside the subtree first, so every child -> grandchild hop exists
        walk_forest(root.children);
        for(const auto& child : root.children){
            if(child.is_leaf()) continue;
            std::vector<const TreeNode*> chain{ &root, &child };
            derive_below(chain, child.children);
        }
    }
}

void PairDeriver::derive_below(std::vector<const TreeNode*>& chain, const std::vector<TreeNode>& below){
    for(const auto& g : below){
        if(!g.is_leaf()){
            chain.push_back(&g);
            derive_below(chain, g.children);
            chain.pop_back();
        }
        emit(chain, g);
    }
}

void PairDeriver::emit(const std::vector<const TreeNode*>& chain, const TreeNode& descendant){
    ConversionEdge e;
    e.ancestor = chain[0];
    e.intermediate = chain[1];
    e.descendant = &descendant;
    e.path.reserve(chain.size()+1);
    e.path.push_back(&descendant);
    for(auto it = chain.rbegin(); it != chain.rend(); ++it) e.path.push_back(*it);

    state_ = State::Emitting;
    if(trace_) std::fprintf(stderr, "[upcast][trace] %s -> %s: %s <- %s via %s\n", to_string(State::Traversing), to_string(State::Emitting),
                            e.ancestor->type_expr.c_str(), e.descendant->type_expr.c_str(), e.intermediate->type_expr.c_str());
    if(edge_) edge_(e, *bindings_);
    ++emitted_;
    state_ = State::Traversing;
}

std::vector<ConversionEdge> derive_edges(const Hierarchy& h){
    std::vector<ConversionEdge> out;
    PairDeriver d;
    d.on_edge([&](const ConversionEdge& e, const BindingSet&){ out.push_back(e); });
    d.run(h);
    return out;
}

} // namespace upcast
