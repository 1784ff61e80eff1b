#pragma once
#include "upcast/diagnostics.hpp"
#include "upcast/env.hpp"
#include "upcast/plan.hpp"
#include <memory>
#include <string>

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/DerivedTypes.h>

namespace upcast {

// Symbol of the conversion target <- source, e.g. "A::from(K)". Used for both
// generated definitions and the direct conversions they call.
std::string conversion_symbol(const std::string& target, const std::string& source);

// Lowers a plan to an LLVM module. Every artifact becomes
//   define ptr @"P::from(G)"(ptr %g) {
//     %hop = call ptr @"C::from(G)"(ptr %g)
//     %r = call ptr @"P::from(C)"(ptr %hop)
//     ret ptr %r
//   }
// Hops that are direct edges stay external declarations; a missing direct
// conversion therefore surfaces as an undefined symbol when the module is linked.
class IREmitter {
public:
    explicit IREmitter(Env env = detectEnv());
    ~IREmitter();
    // Returns nullptr on failure (errors recorded in r).
    llvm::Module* emit(const GenerationPlan& plan, GenerateResult& r);
    std::unique_ptr<llvm::Module> takeModule() { return std::move(module_); }
    std::string moduleText() const;
    llvm::LLVMContext& context() { return *llctx_; }
private:
    Env env_;
    std::unique_ptr<llvm::LLVMContext> llctx_;
    std::unique_ptr<llvm::Module> module_;

    llvm::PointerType* handle_type();
    llvm::FunctionType* conversion_type();
};

// Run an LLVM preset pipeline (env.optLevel 1..3) over M; no-op at 0.
void run_pass_pipeline(llvm::Module& M, const Env& env);

} // namespace upcast
