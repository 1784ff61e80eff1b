#pragma once
#include <cstdlib>
#include <string>

namespace upcast {

// Generation/emission settings. detectEnv() fills these from UPCAST_* variables;
// the driver then applies command-line overrides.
struct Env {
    bool lint = true;          // UPCAST_LINT (default on, "0" disables)
    bool diagJson = false;     // UPCAST_DIAG_JSON=1
    bool trace = false;        // UPCAST_TRACE=1
    bool verifyIR = false;     // UPCAST_VERIFY_IR=1
    int optLevel = 0;          // UPCAST_OPT_LEVEL 0..3
    std::string targetTriple;  // UPCAST_TARGET_TRIPLE, empty = leave unset
    std::string moduleName = "upcast.module"; // UPCAST_MODULE_NAME
};

inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

Env detectEnv();

// Parse "0".."3" or "O0".."O3" (case-insensitive); anything else yields `fallback`.
int parse_opt_level(const std::string& s, int fallback);

} // namespace upcast
