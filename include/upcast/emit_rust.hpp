#pragma once
#include "upcast/plan.hpp"
#include <string>

namespace upcast {

// One `impl From` per artifact, in plan order:
//   impl<'a, T> ::core::convert::From<G> for P {
//       fn from(g: G) -> Self {
//           <P>::from(<C>::from(g))
//       }
//   }
std::string emit_rust_impl(const Artifact& a);
std::string emit_rust(const GenerationPlan& p);

} // namespace upcast
