#include "upcast/hierarchy.hpp"

#include <cctype>

namespace upcast {

std::string BindingSet::joined() const {
    std::string out;
    for(size_t i=0;i<params.size(); ++i){ if(i) out += ", "; out += params[i].text; }
    return out;
}

bool BindingSet::operator==(const BindingSet& o) const {
    if(params.size()!=o.params.size()) return false;
    for(size_t i=0;i<params.size(); ++i){
        const auto &a=params[i], &b=o.params[i];
        if(a.kind!=b.kind || a.name!=b.name || a.constraint!=b.constraint || a.text!=b.text) return false;
    }
    return true;
}

size_t Hierarchy::node_count() const {
    size_t n=0; for_each([&](const TreeNode&, size_t){ ++n; }); return n;
}

void Hierarchy::for_each(const std::function<void(const TreeNode&, size_t)>& fn) const {
    std::function<void(const TreeNode&, size_t)> walk = [&](const TreeNode& t, size_t depth){
        fn(t, depth);
        for(auto &c : t.children) walk(c, depth+1);
    };
    for(auto &r : roots) walk(r, 0);
}

static void render(const TreeNode& t, std::string& out){
    out += t.type_expr;
    if(t.children.empty()) return;
    out += " { ";
    for(size_t i=0;i<t.children.size(); ++i){ if(i) out += ", "; render(t.children[i], out); }
    out += " }";
}

std::string Hierarchy::to_surface() const {
    std::string out = "[" + (bindings ? bindings->joined() : std::string()) + "]";
    for(size_t i=0;i<roots.size(); ++i){ out += (i ? ", " : " "); render(roots[i], out); }
    return out;
}

std::string collapse_ws(const std::string& s){
    std::string out; out.reserve(s.size());
    bool pendingSpace=false;
    for(char c : s){
        if(std::isspace((unsigned char)c)){ pendingSpace = !out.empty(); continue; }
        if(pendingSpace){ out += ' '; pendingSpace=false; }
        out += c;
    }
    return out;
}

GenericParam make_generic_param(const std::string& entry){
    GenericParam p; p.text = entry;
    // first ':' at nesting depth 0 that is not part of a '::' path separator
    int depth=0; size_t colon=std::string::npos;
    for(size_t i=0;i<entry.size(); ++i){
        char c=entry[i];
        if(c=='<'||c=='('||c=='[') ++depth;
        else if((c=='>'||c==')'||c==']') && depth>0) --depth;
        else if(c==':' && depth==0){
            bool path = (i+1<entry.size() && entry[i+1]==':') || (i>0 && entry[i-1]==':');
            if(!path){ colon=i; break; }
        }
    }
    std::string head = collapse_ws(entry.substr(0, colon));
    if(colon!=std::string::npos) p.constraint = collapse_ws(entry.substr(colon+1));
    if(!head.empty() && head[0]=='\''){
        p.kind = GenericParam::Kind::Lifetime;
    } else if(head.rfind("const ", 0)==0){
        p.kind = GenericParam::Kind::Const;
        head = collapse_ws(head.substr(6));
    }
    p.name = head;
    return p;
}

} // namespace upcast
