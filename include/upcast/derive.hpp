// derive.hpp - walks a Hierarchy and yields every (ancestor, descendant) pair at distance >= 2
#pragma once
#include "upcast/hierarchy.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace upcast {

// One composed conversion: descendant -> intermediate -> ancestor.
// `intermediate` is the immediate child of `ancestor` on the path; the
// descendant -> intermediate hop is either a direct edge or an edge derived
// earlier in the same walk.
struct ConversionEdge {
    const TreeNode* ancestor=nullptr;
    const TreeNode* intermediate=nullptr;
    const TreeNode* descendant=nullptr;
    std::vector<const TreeNode*> path; // descendant, ..., intermediate, ancestor

    size_t distance() const { return path.empty() ? 0 : path.size()-1; }
};

// Emission order matches the recursive expansion: a node's children are
// walked as a forest of their own before the node's pairs are produced, and
// under one child deeper descendants come before shallower ones.
class PairDeriver {
public:
    enum class State { Traversing, Emitting };
    using EdgeFn = std::function<void(const ConversionEdge&, const BindingSet&)>;

    PairDeriver& on_edge(EdgeFn fn){ edge_ = std::move(fn); return *this; }
    // Log every Traversing <-> Emitting transition to stderr.
    PairDeriver& trace(bool enabled){ trace_ = enabled; return *this; }

    // Walk the forest; returns the number of edges handed to the callback.
    size_t run(const Hierarchy& h);

    State state() const { return state_; }

private:
    EdgeFn edge_{};
    bool trace_ = false;
    State state_ = State::Traversing;
    std::shared_ptr<const BindingSet> bindings_;
    size_t emitted_ = 0;

    void walk_forest(const std::vector<TreeNode>& nodes);
    // `chain` holds ancestor, child, ..., parent-of-`below` (root first).
    void derive_below(std::vector<const TreeNode*>& chain, const std::vector<TreeNode>& below);
    void emit(const std::vector<const TreeNode*>& chain, const TreeNode& descendant);
};

// Convenience: collect every edge in emission order. The edges point into `h`,
// which must outlive them; temporaries are rejected.
std::vector<ConversionEdge> derive_edges(const Hierarchy& h);
std::vector<ConversionEdge> derive_edges(Hierarchy&&) = delete;

const char* to_string(PairDeriver::State s);

} // namespace upcast
