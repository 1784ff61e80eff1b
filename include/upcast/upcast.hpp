// upcast.hpp - one-call pipeline: description -> tree -> plan -> lints
#pragma once
#include "upcast/derive.hpp"
#include "upcast/diagnostics.hpp"
#include "upcast/env.hpp"
#include "upcast/hierarchy.hpp"
#include "upcast/lints.hpp"
#include "upcast/parser.hpp"
#include "upcast/plan.hpp"

#include <string_view>

namespace upcast {

enum class InputSyntax { Surface, Edn };

struct Generation {
    GenerateResult result;
    Hierarchy hierarchy; // empty when parsing failed
    GenerationPlan plan; // empty when parsing failed
};

// Parse `src`, derive the plan and run lints. Structural errors make
// result.success false and leave the plan empty; lints only add warnings.
Generation generate(std::string_view src, const Env& env, std::string_view filename = "<memory>",
                    InputSyntax syntax = InputSyntax::Surface);

} // namespace upcast
