#include "upcast/lints.hpp"

#include <cctype>
#include <unordered_map>

namespace upcast {

static bool ident_char(char c){ return std::isalnum((unsigned char)c) || c=='_'; }

bool mentions_token(const std::string& label, const std::string& name){
    if(name.empty()) return false;
    for(size_t pos = label.find(name); pos != std::string::npos; pos = label.find(name, pos+1)){
        bool leftOk = pos==0 || !ident_char(label[pos-1]);
        size_t end = pos + name.size();
        bool rightOk = end>=label.size() || !ident_char(label[end]);
        if(leftOk && rightOk) return true;
    }
    return false;
}

void lint_unused_bindings(GenerateResult& r, const GenerationPlan& plan){
    ErrorReporter rep{r};
    for(const auto& a : plan.artifacts){
        for(const auto& p : a.bindings->params){
            // unconstrained lifetimes are accepted by the host; only types and consts must appear
            if(p.kind == GenericParam::Kind::Lifetime) continue;
            if(mentions_token(a.target, p.name) || mentions_token(a.source, p.name)) continue;
            auto w = ErrorReporter::make("W0300",
                "binding parameter '"+p.name+"' is not used by the conversion "+a.target+" <- "+a.source,
                "the host may reject an unconstrained parameter; move this branch into a hierarchy with its own binding list",
                a.line, a.col);
            w.notes.push_back(Note{"bindings: ["+a.bindings->joined()+"]", a.line, a.col});
            rep.emit_warning(w);
        }
    }
}

void lint_duplicate_labels(GenerateResult& r, const Hierarchy& h){
    ErrorReporter rep{r};
    std::unordered_map<std::string, const TreeNode*> first;
    h.for_each([&](const TreeNode& n, size_t){
        auto ins = first.emplace(n.type_expr, &n);
        if(ins.second) return;
        const TreeNode* prev = ins.first->second;
        auto w = ErrorReporter::make("W0301",
            "type '"+n.type_expr+"' is declared more than once; the hierarchy is not a tree",
            "each type may have only one parent; conversions through both positions will conflict",
            n.line, n.col);
        w.notes.push_back(Note{"first declared here", prev->line, prev->col});
        rep.emit_warning(w);
    });
}

} // namespace upcast
