// plan.hpp - language-agnostic artifact descriptors produced by the generation pass
#pragma once
#include "upcast/derive.hpp"
#include "upcast/edn.hpp"
#include "upcast/hierarchy.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace upcast {

struct plan_error : std::runtime_error {
    plan_error(const std::string& msg, int line, int col): std::runtime_error(msg), line(line), col(col) {}
    int line;
    int col;
};

// One generated conversion: target::from(source) = target::from(via::from(source)).
struct Artifact {
    std::string target;
    std::string source;
    std::string via;                 // immediate child of target on the path
    std::vector<std::string> chain;  // source, ..., via, target
    int line=-1, col=-1;             // where the source label was declared
    std::shared_ptr<const BindingSet> bindings; // the one set shared by every artifact

    // Distance-2 artifacts compose two direct edges; longer ones reuse a generated source -> via.
    bool via_is_generated() const { return chain.size() > 3; }
};

struct GenerationPlan {
    std::shared_ptr<const BindingSet> bindings = std::make_shared<BindingSet>();
    std::vector<Artifact> artifacts;
    // Direct (user-supplied) edges as (parent, child), declaration order; back-ends declare these.
    std::vector<std::pair<std::string,std::string>> direct_edges;
};

// Conversion Emitter: one artifact per derived edge, parameterized by `bindings` unchanged.
Artifact make_artifact(const ConversionEdge& e, const std::shared_ptr<const BindingSet>& bindings);

// Tree walk + emission.
GenerationPlan build_plan(const Hierarchy& h, bool trace = false);

// (upcast-plan :bindings [...] :direct [...] :artifacts [(transitive-from ...) ...])
edn::node_ptr plan_to_edn(const GenerationPlan& p);
std::string plan_to_edn_string(const GenerationPlan& p);
// Inverse of plan_to_edn; throws plan_error on a malformed form.
GenerationPlan plan_from_edn(const edn::node_ptr& form);

} // namespace upcast
