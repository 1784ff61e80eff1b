#include "upcast/env.hpp"
#include <cctype>
#include <string>

namespace upcast {

int parse_opt_level(const std::string& s, int fallback){
    std::string t = s; for(char &c: t) c = (char)std::tolower((unsigned char)c);
    if(!t.empty() && t[0]=='o') t = t.substr(1);
    if(t.size()==1 && t[0]>='0' && t[0]<='3') return t[0]-'0';
    return fallback;
}

// Reads process env vars and constructs an Env.
Env detectEnv(){
    Env e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("UPCAST_LINT")) e.lint = (v[0] != '0');
    e.diagJson = flag_enabled("UPCAST_DIAG_JSON");
    e.trace = flag_enabled("UPCAST_TRACE");
    e.verifyIR = flag_enabled("UPCAST_VERIFY_IR");
    if (const char* v = get("UPCAST_OPT_LEVEL")) e.optLevel = parse_opt_level(v, 0);
    if (const char* v = get("UPCAST_TARGET_TRIPLE")) e.targetTriple = v;
    if (const char* v = get("UPCAST_MODULE_NAME")) e.moduleName = v;

    return e;
}

} // namespace upcast
