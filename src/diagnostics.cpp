#include "upcast/diagnostics.hpp"
#include <sstream>
#include <cstdio>

namespace upcast {

std::string format_diagnostic(const Diagnostic& d, const std::string& severity, const std::string& filename){
    std::ostringstream os;
    os<<filename;
    if(d.line>0) os<<":"<<d.line<<":"<<d.col;
    os<<": "<<severity<<"["<<d.code<<"]: "<<d.message<<"\n";
    for(auto &n : d.notes){
        os<<"  note: "<<n.message;
        if(n.line>0) os<<" ("<<n.line<<":"<<n.col<<")";
        os<<"\n";
    }
    if(!d.hint.empty()) os<<"  hint: "<<d.hint<<"\n";
    return os.str();
}

std::string format_result(const GenerateResult& r, const std::string& filename){
    std::string out;
    for(auto &e : r.errors) out += format_diagnostic(e, "error", filename);
    for(auto &w : r.warnings) out += format_diagnostic(w, "warning", filename);
    return out;
}

std::string json_escape(const std::string& s){
    std::string out; out.reserve(s.size()+2);
    out += '"';
    for(unsigned char c : s){
        if(c=='"' || c=='\\'){ out += '\\'; out += static_cast<char>(c); }
        else if(c=='\n') out += "\\n";
        else if(c=='\r') out += "\\r";
        else if(c=='\t') out += "\\t";
        else if(c < 0x20){ char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c)); out += buf; }
        else out += static_cast<char>(c);
    }
    out += '"';
    return out;
}

static void append_diag_json(std::ostringstream& os, const Diagnostic& d){
    os<<"{\"code\":"<<json_escape(d.code)
      <<",\"message\":"<<json_escape(d.message)
      <<",\"hint\":"<<json_escape(d.hint)
      <<",\"line\":"<<d.line
      <<",\"col\":"<<d.col
      <<",\"notes\":[";
    for(size_t i=0;i<d.notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(d.notes[i].message)<<",\"line\":"<<d.notes[i].line<<",\"col\":"<<d.notes[i].col<<"}";
    }
    os<<"]}";
}

std::string diagnostics_to_json(const GenerateResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){ if(i) os<<","; append_diag_json(os, r.errors[i]); }
    os<<"],\"warnings\":[";
    for(size_t i=0;i<r.warnings.size(); ++i){ if(i) os<<","; append_diag_json(os, r.warnings[i]); }
    os<<"]}";
    return os.str();
}

} // namespace upcast
