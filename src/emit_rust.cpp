#include "upcast/emit_rust.hpp"
#include <sstream>

namespace upcast {

std::string emit_rust_impl(const Artifact& a){
    std::ostringstream os;
    os << "impl";
    if(a.bindings && !a.bindings->empty()) os << "<" << a.bindings->joined() << ">";
    os << " ::core::convert::From<" << a.source << "> for " << a.target << " {\n"
       << "    fn from(g: " << a.source << ") -> Self {\n"
       << "        <" << a.target << ">::from(<" << a.via << ">::from(g))\n"
       << "    }\n"
       << "}\n";
    return os.str();
}

std::string emit_rust(const GenerationPlan& p){
    std::string out;
    for(size_t i=0;i<p.artifacts.size(); ++i){
        if(i) out += "\n";
        out += emit_rust_impl(p.artifacts[i]);
    }
    return out;
}

} // namespace upcast
