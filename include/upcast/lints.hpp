#pragma once
#include "upcast/diagnostics.hpp"
#include "upcast/hierarchy.hpp"
#include "upcast/plan.hpp"

#include <string>

namespace upcast {

// Lints (never fatal):
// - W0300: type/const binding parameter that neither the target nor the source label mentions
// - W0301: type label declared more than once in the forest
void lint_unused_bindings(GenerateResult& r, const GenerationPlan& plan);
void lint_duplicate_labels(GenerateResult& r, const Hierarchy& h);

// Whole-token occurrence of `name` in `label` (identifier boundaries on both sides).
bool mentions_token(const std::string& label, const std::string& name);

} // namespace upcast
