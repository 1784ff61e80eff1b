// Library example: generate the Rust impls and the LLVM module for an error hierarchy.
#include <iostream>
#include <string>
#include "upcast/emit_rust.hpp"
#include "upcast/ir_emitter.hpp"
#include "upcast/upcast.hpp"
#include <llvm/IR/Verifier.h>

using namespace upcast;

int main(){
    const char* src = R"HIER(
        ['a]
        GlobalError<'a> {
            FsError<'a> { std::io::Error, FileNotFound<'a> },
            ConfigError { toml::de::Error },
        }
    )HIER";

    Env env = detectEnv();
    auto g = generate(src, env, "<example>");
    std::cerr << format_result(g.result, "<example>");
    if(!g.result.success) return 1;

    std::cout << emit_rust(g.plan);

    IREmitter emitter(env); GenerateResult ir;
    auto *M = emitter.emit(g.plan, ir);
    if(!ir.success || !M){
        std::cerr << format_result(ir, "<example>");
        return 1;
    }
    std::string err; llvm::raw_string_ostream rso(err);
    if(llvm::verifyModule(*M, &rso)){
        std::cerr << rso.str(); return 2;
    }
    std::cout << "; " << M->getFunctionList().size() << " function(s) in " << M->getModuleIdentifier() << "\n";
    return 0;
}
