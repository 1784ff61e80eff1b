#include <cassert>
#include <iostream>
#include "upcast/upcast.hpp"
#include "test_env.hpp"

using namespace upcast;

static bool hasError(const GenerateResult& r, const std::string& code){
    for(const auto& e : r.errors) if(e.code==code) return true;
    return false;
}

void run_diagnostics_tests(){
    Env env{};
    // coded parse errors carry position and hint, and leave the plan empty
    {
        auto g = generate("A { B { C } }", env, "missing.hier");
        assert(!g.result.success && hasError(g.result, "E0101"));
        assert(g.plan.artifacts.empty() && g.hierarchy.roots.empty());
        auto text = format_result(g.result, "missing.hier");
        assert(text.rfind("missing.hier:1:1: error[E0101]: ", 0)==0);
        assert(text.find("  hint: ")!=std::string::npos);
    }
    {
        auto g = generate("[] A { B { C }\n", env);
        assert(!g.result.success && hasError(g.result, "E0100"));
        assert(g.result.errors[0].line==2);
    }
    {
        auto g = generate("(hierarchy [] (A B) 7)", env, "x.edn", InputSyntax::Edn);
        assert(!g.result.success && hasError(g.result, "E0102"));
        assert(g.result.errors[0].hint.find("(hierarchy")!=std::string::npos);
    }
    // notes render under the message
    {
        Diagnostic d = ErrorReporter::make("W0301", "dup", "", 3, 4);
        d.notes.push_back(Note{"first declared here", 1, 2});
        auto s = format_diagnostic(d, "warning", "f");
        assert(s=="f:3:4: warning[W0301]: dup\n  note: first declared here (1:2)\n");
    }
    // JSON
    {
        GenerateResult r;
        ErrorReporter rep{r};
        auto e = ErrorReporter::make("E0100", "bad \"quote\"\n", "h", 1, 2);
        e.notes.push_back(Note{"n", 3, 4});
        rep.emit_error(e);
        r.success = false;
        auto js = diagnostics_to_json(r);
        assert(js=="{\"success\":false,\"errors\":[{\"code\":\"E0100\",\"message\":\"bad \\\"quote\\\"\\n\",\"hint\":\"h\",\"line\":1,\"col\":2,"
                   "\"notes\":[{\"message\":\"n\",\"line\":3,\"col\":4}]}],\"warnings\":[]}");
        assert(json_escape(std::string("\x01"))=="\"\\u0001\"");
        assert(json_escape(std::string("\x1f\\\r\t"))=="\"\\u001f\\\\\\r\\t\"");
    }
    std::cout << "Diagnostics tests passed\n";
}

void run_env_tests(){
    _putenv("UPCAST_LINT=0");
    _putenv("UPCAST_TRACE=1");
    _putenv("UPCAST_OPT_LEVEL=O2");
    _putenv("UPCAST_TARGET_TRIPLE=x86_64-unknown-linux-gnu");
    _putenv("UPCAST_MODULE_NAME=conversions");
    Env e = detectEnv();
    assert(!e.lint && e.trace && !e.diagJson);
    assert(e.optLevel==2);
    assert(e.targetTriple=="x86_64-unknown-linux-gnu" && e.moduleName=="conversions");
    _putenv("UPCAST_LINT=");
    _putenv("UPCAST_TRACE=");
    _putenv("UPCAST_OPT_LEVEL=");
    _putenv("UPCAST_TARGET_TRIPLE=");
    _putenv("UPCAST_MODULE_NAME=");
    Env d = detectEnv();
    assert(d.lint && !d.trace && d.optLevel==0 && d.targetTriple.empty() && d.moduleName=="upcast.module");

    assert(parse_opt_level("3", 0)==3 && parse_opt_level("o1", 0)==1);
    assert(parse_opt_level("4", -1)==-1 && parse_opt_level("", 7)==7);
    std::cout << "Env tests passed\n";
}
