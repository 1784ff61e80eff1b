// diagnostics.hpp - coded errors/warnings shared by parser, lints and back-ends
#pragma once
#include <string>
#include <vector>

namespace upcast {

// Codes:
//   E0100 malformed hierarchy description      E0101 binding list missing
//   E0102 EDN hierarchy has the wrong shape
//   E0200 back-end failure                     E0201 plan EDN has the wrong shape
//   W0300 binding parameter unused by an artifact
//   W0301 type label declared more than once
struct Note { std::string message; int line=-1; int col=-1; };
struct Diagnostic { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<Note> notes; };

struct GenerateResult { bool success=true; std::vector<Diagnostic> errors; std::vector<Diagnostic> warnings; };

// Thin sink so every stage formats diagnostics the same way.
struct ErrorReporter {
    std::vector<Diagnostic>* errors=nullptr;
    std::vector<Diagnostic>* warnings=nullptr;
    explicit ErrorReporter(GenerateResult& r): errors(&r.errors), warnings(&r.warnings) {}
    void emit_error(const Diagnostic& e){ if(errors) errors->push_back(e); }
    void emit_warning(const Diagnostic& w){ if(warnings) warnings->push_back(w); }
    static Diagnostic make(std::string code, std::string message, std::string hint, int line, int col){ return Diagnostic{std::move(code),std::move(message),std::move(hint),line,col,{}}; }
};

// "file:line:col: error[E0100]: message" followed by indented notes and hint.
std::string format_diagnostic(const Diagnostic& d, const std::string& severity, const std::string& filename);
std::string format_result(const GenerateResult& r, const std::string& filename);

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const GenerateResult& r);

} // namespace upcast
