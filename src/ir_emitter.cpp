// ir_emitter.cpp - GenerationPlan -> LLVM IR
#include "upcast/ir_emitter.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Metadata.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Passes/PassBuilder.h>
#include <llvm/Support/raw_ostream.h>

#include <unordered_set>

namespace upcast {

std::string conversion_symbol(const std::string& target, const std::string& source){
    return target + "::from(" + source + ")";
}

IREmitter::IREmitter(Env env) : env_(std::move(env)), llctx_(std::make_unique<llvm::LLVMContext>()) {}
IREmitter::~IREmitter() = default;

llvm::PointerType* IREmitter::handle_type(){
    return llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(*llctx_));
}

llvm::FunctionType* IREmitter::conversion_type(){
    return llvm::FunctionType::get(handle_type(), { handle_type() }, false);
}

std::string IREmitter::moduleText() const {
    if(!module_) return {};
    std::string buf; llvm::raw_string_ostream os(buf); module_->print(os, nullptr); os.flush(); return buf;
}

llvm::Module* IREmitter::emit(const GenerationPlan& plan, GenerateResult& r){
    ErrorReporter rep{r};
    module_ = std::make_unique<llvm::Module>(env_.moduleName, *llctx_);
    if(!env_.targetTriple.empty()) module_->setTargetTriple(env_.targetTriple);

    // Bindings travel with the module and with every definition.
    const std::string bindingText = plan.bindings->joined();
    auto* named = module_->getOrInsertNamedMetadata("upcast.bindings");
    std::vector<llvm::Metadata*> entries;
    for(auto& p : plan.bindings->params) entries.push_back(llvm::MDString::get(*llctx_, p.text));
    named->addOperand(llvm::MDNode::get(*llctx_, entries));

    // Define every artifact before emitting bodies so generated hops resolve to definitions.
    // A generated symbol may not repeat another one or shadow a direct edge.
    std::vector<llvm::Function*> defs; defs.reserve(plan.artifacts.size());
    std::unordered_set<std::string> direct, defined;
    for(auto& d : plan.direct_edges) direct.insert(conversion_symbol(d.first, d.second));
    for(auto& a : plan.artifacts){
        std::string name = conversion_symbol(a.target, a.source);
        if(direct.count(name)){
            rep.emit_error(ErrorReporter::make("E0200", "generated conversion '"+name+"' collides with a direct edge",
                "'"+a.source+"' is declared both directly under '"+a.target+"' and deeper below it", a.line, a.col));
            r.success = false;
            module_.reset();
            return nullptr;
        }
        if(!defined.insert(name).second){
            rep.emit_error(ErrorReporter::make("E0200", "conflicting definitions for '"+name+"'",
                "a type label appears in more than one place; the hierarchy must be a tree", a.line, a.col));
            r.success = false;
            module_.reset();
            return nullptr;
        }
        auto* F = llvm::Function::Create(conversion_type(), llvm::Function::ExternalLinkage, name, module_.get());
        F->addFnAttr("upcast.bindings", bindingText);
        F->getArg(0)->setName("g");
        defs.push_back(F);
    }

    size_t declared = 0;
    llvm::IRBuilder<> b(*llctx_);
    for(size_t i=0;i<plan.artifacts.size(); ++i){
        auto& a = plan.artifacts[i];
        auto* F = defs[i];
        b.SetInsertPoint(llvm::BasicBlock::Create(*llctx_, "entry", F));
        auto hopName = conversion_symbol(a.via, a.source);
        auto stepName = conversion_symbol(a.target, a.via);
        for(auto* nm : { &hopName, &stepName }) if(!module_->getFunction(*nm)) ++declared;
        llvm::FunctionCallee hop = module_->getOrInsertFunction(hopName, conversion_type());
        llvm::FunctionCallee step = module_->getOrInsertFunction(stepName, conversion_type());
        llvm::Value* mid = b.CreateCall(hop, { F->getArg(0) }, "hop");
        llvm::Value* out = b.CreateCall(step, { mid }, "r");
        b.CreateRet(out);
    }
    if(env_.trace) llvm::errs() << "[upcast][ir] defined " << defs.size() << " conversion(s), declared " << declared << " direct hop(s)\n";

    if(env_.verifyIR){
        std::string msg; llvm::raw_string_ostream os(msg);
        if(llvm::verifyModule(*module_, &os)){
            os.flush();
            rep.emit_error(ErrorReporter::make("E0200", "IR verification failed: "+msg, "", -1, -1));
            r.success = false;
            module_.reset();
            return nullptr;
        }
    }
    run_pass_pipeline(*module_, env_);
    return module_.get();
}

void run_pass_pipeline(llvm::Module& M, const Env& env){
    if(env.optLevel <= 0) return; // leave unoptimized
    llvm::PassBuilder PB;
    llvm::LoopAnalysisManager LAM;
    llvm::FunctionAnalysisManager FAM;
    llvm::CGSCCAnalysisManager CGAM;
    llvm::ModuleAnalysisManager MAM;
    PB.registerModuleAnalyses(MAM);
    PB.registerCGSCCAnalyses(CGAM);
    PB.registerFunctionAnalyses(FAM);
    PB.registerLoopAnalyses(LAM);
    PB.crossRegisterProxies(LAM, FAM, CGAM, MAM);
    llvm::OptimizationLevel level = llvm::OptimizationLevel::O1;
    if(env.optLevel == 2) level = llvm::OptimizationLevel::O2;
    else if(env.optLevel >= 3) level = llvm::OptimizationLevel::O3;
    llvm::ModulePassManager MPM = PB.buildPerModuleDefaultPipeline(level);
    MPM.run(M, MAM);
    if(env.verifyIR && llvm::verifyModule(M, &llvm::errs())) llvm::errs() << "[upcast] IR verify failed after preset pipeline\n";
}

} // namespace upcast
