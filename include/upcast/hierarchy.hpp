// hierarchy.hpp - tree model for a parsed conversion hierarchy
#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace upcast {

// One entry of the binding list, e.g. `'a`, `T: Debug + Clone`, `const N: usize`.
struct GenericParam {
    enum class Kind { Lifetime, Type, Const };
    Kind kind = Kind::Type;
    std::string name;       // `'a`, `T`, `N`
    std::string constraint; // text after the first top-level ':' (bounds or const type), may be empty
    std::string text;       // the whole entry, whitespace-collapsed
};

// The generic parameters shared by every generated conversion. Built once, never narrowed per node.
struct BindingSet {
    std::vector<GenericParam> params;

    bool empty() const { return params.empty(); }
    // Entries joined with ", " exactly as written.
    std::string joined() const;
    bool operator==(const BindingSet& o) const;
    bool operator!=(const BindingSet& o) const { return !(*this == o); }
};

struct TreeNode {
    std::string type_expr; // opaque label, quoted verbatim into generated code
    std::vector<TreeNode> children;
    int line = -1;
    int col = -1;

    bool is_leaf() const { return children.empty(); }
};

struct Hierarchy {
    std::shared_ptr<const BindingSet> bindings = std::make_shared<BindingSet>();
    std::vector<TreeNode> roots;

    size_t node_count() const;
    // Pre-order visit; depth is 0 for roots.
    void for_each(const std::function<void(const TreeNode&, size_t depth)>& fn) const;
    // Canonical surface rendering: `[bindings] A { B { C }, D }`.
    std::string to_surface() const;
};

// Split one binding entry into kind/name/constraint. `entry` is already whitespace-collapsed.
GenericParam make_generic_param(const std::string& entry);

// Collapse whitespace runs to one space and trim both ends.
std::string collapse_ws(const std::string& s);

} // namespace upcast
