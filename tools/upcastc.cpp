// upcastc - generate transitive conversions for a hierarchy description
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "upcast/emit_rust.hpp"
#include "upcast/ir_emitter.hpp"
#include "upcast/upcast.hpp"

using namespace upcast;

static int usage(){
    std::cerr << "usage: upcastc <file|-> [--emit=rust|edn|llvm|pairs] [--edn-input] [--from-plan] [-o <out>]\n"
                 "                [--no-lint] [--json-diagnostics] [--trace] [--verify] [--triple=<t>] [--opt=<0-3>]\n";
    return 1;
}

static bool read_input(const std::string& path, std::string& out){
    if(path=="-"){ out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()); return true; }
    std::ifstream ifs(path, std::ios::binary); if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true;
}

static std::string render_pairs(const GenerationPlan& p){
    std::string out;
    for(auto& a : p.artifacts){
        out += a.target + " <- " + a.source + "\tvia " + a.via + "\t[";
        for(size_t i=0;i<a.chain.size(); ++i){ if(i) out += " -> "; out += a.chain[i]; }
        out += "]\n";
    }
    return out;
}

static int run(int argc, char** argv){
    std::string input, output, emit = "rust";
    bool ednInput=false, fromPlan=false;
    Env env = detectEnv();
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a.rfind("--emit=",0)==0) emit = a.substr(7);
        else if(a=="--edn-input") ednInput = true;
        else if(a=="--from-plan") fromPlan = true;
        else if(a=="-o"){ if(++i>=argc) return usage(); output = argv[i]; }
        else if(a=="--no-lint") env.lint = false;
        else if(a=="--json-diagnostics") env.diagJson = true;
        else if(a=="--trace") env.trace = true;
        else if(a=="--verify") env.verifyIR = true;
        else if(a.rfind("--triple=",0)==0) env.targetTriple = a.substr(9);
        else if(a.rfind("--opt=",0)==0){
            int lvl = parse_opt_level(a.substr(6), -1);
            if(lvl<0){ std::cerr << "invalid optimization level: " << a.substr(6) << "\n"; return 1; }
            env.optLevel = lvl;
        }
        else if(a=="-h"||a=="--help") return usage();
        else if(!a.empty() && a[0]=='-' && a!="-"){ std::cerr << "unknown option: " << a << "\n"; return usage(); }
        else if(input.empty()) input = a;
        else return usage();
    }
    if(input.empty()) return usage();
    if(emit!="rust" && emit!="edn" && emit!="llvm" && emit!="pairs"){ std::cerr << "unknown --emit kind: " << emit << "\n"; return 1; }

    std::string src;
    if(!read_input(input, src)){ std::cerr << "failed to read " << input << "\n"; return 1; }

    GenerationPlan plan;
    GenerateResult result;
    if(fromPlan){
        try {
            plan = plan_from_edn(edn::parse(src));
        } catch(const plan_error& e){
            result.errors.push_back(ErrorReporter::make("E0201", e.what(), "", e.line, e.col));
            result.success = false;
        } catch(const edn::parse_error& e){
            result.errors.push_back(ErrorReporter::make("E0201", e.what(), "", e.line, e.col));
            result.success = false;
        }
        if(env.diagJson) std::cerr << diagnostics_to_json(result) << "\n";
    } else {
        Generation g = generate(src, env, input, ednInput ? InputSyntax::Edn : InputSyntax::Surface);
        result = std::move(g.result);
        plan = std::move(g.plan);
    }
    std::cerr << format_result(result, input);
    if(!result.success) return 2;

    std::string text;
    if(emit=="rust") text = emit_rust(plan);
    else if(emit=="edn") text = plan_to_edn_string(plan);
    else if(emit=="pairs") text = render_pairs(plan);
    else {
        IREmitter em(env);
        GenerateResult irr;
        if(!em.emit(plan, irr)){ std::cerr << format_result(irr, input); return 3; }
        text = em.moduleText();
    }

    if(output.empty()){ std::cout << text; return 0; }
    std::ofstream ofs(output, std::ios::binary);
    if(!ofs){ std::cerr << "failed to open " << output << "\n"; return 1; }
    ofs << text;
    return ofs ? 0 : 1;
}

int main(int argc, char** argv){
    try{
        return run(argc, argv);
    }catch(const std::exception& e){ std::cerr << "[upcastc] exception: " << e.what() << "\n"; return 1; }
}
