#include "upcast/plan.hpp"

namespace upcast {

Artifact make_artifact(const ConversionEdge& e, const std::shared_ptr<const BindingSet>& bindings){
    Artifact a;
    a.target = e.ancestor->type_expr;
    a.source = e.descendant->type_expr;
    a.via = e.intermediate->type_expr;
    a.chain.reserve(e.path.size());
    for(auto* n : e.path) a.chain.push_back(n->type_expr);
    a.line = e.descendant->line;
    a.col = e.descendant->col;
    a.bindings = bindings;
    return a;
}

static void collect_direct(const std::vector<TreeNode>& nodes, std::vector<std::pair<std::string,std::string>>& out){
    for(auto& n : nodes){
        for(auto& c : n.children) out.emplace_back(n.type_expr, c.type_expr);
        collect_direct(n.children, out);
    }
}

GenerationPlan build_plan(const Hierarchy& h, bool trace){
    GenerationPlan p;
    p.bindings = h.bindings ? h.bindings : std::make_shared<const BindingSet>();
    collect_direct(h.roots, p.direct_edges);
    PairDeriver d;
    d.trace(trace).on_edge([&](const ConversionEdge& e, const BindingSet&){ p.artifacts.push_back(make_artifact(e, p.bindings)); });
    d.run(h);
    return p;
}

edn::node_ptr plan_to_edn(const GenerationPlan& p){
    using namespace edn;
    auto bvec = node_vec();
    for(auto& b : p.bindings->params) bvec << n_str(b.text);
    auto direct = node_vec();
    for(auto& d : p.direct_edges) direct << node_vec({ n_str(d.first), n_str(d.second) });
    auto arts = node_vec();
    for(auto& a : p.artifacts){
        auto chain = node_vec();
        for(auto& c : a.chain) chain << n_str(c);
        arts << node_list({ n_sym("transitive-from"),
                            n_kw("target"), n_str(a.target),
                            n_kw("source"), n_str(a.source),
                            n_kw("via"), n_str(a.via),
                            n_kw("chain"), chain,
                            n_kw("line"), n_i64(a.line),
                            n_kw("col"), n_i64(a.col) });
    }
    return node_list({ n_sym("upcast-plan"), n_kw("bindings"), bvec, n_kw("direct"), direct, n_kw("artifacts"), arts });
}

std::string plan_to_edn_string(const GenerationPlan& p){
    return edn::to_pretty_string(plan_to_edn(p)) + "\n";
}

namespace {

[[noreturn]] void bad(const edn::node& n, const std::string& msg){ throw plan_error(msg, n.line, n.col); }

std::string req_str(const std::vector<edn::node_ptr>& elems, const edn::node& form, const char* key){
    auto v = edn::keyword_arg(elems, key);
    if(!v || !edn::as_string(*v)) bad(form, std::string("transitive-from requires :") + key + " \"...\"");
    return *edn::as_string(*v);
}

const std::vector<edn::node_ptr>& req_vec(const std::vector<edn::node_ptr>& elems, const edn::node& form, const char* key){
    auto v = edn::keyword_arg(elems, key);
    if(!v || !edn::as_vector(*v)) bad(form, std::string("missing vector :") + key);
    return edn::as_vector(*v)->elems;
}

int opt_int(const std::vector<edn::node_ptr>& elems, const char* key){
    auto v = edn::keyword_arg(elems, key);
    if(v){ if(auto* i = edn::as_int(*v)) return static_cast<int>(*i); }
    return -1;
}

} // namespace

GenerationPlan plan_from_edn(const edn::node_ptr& form){
    if(!form) throw plan_error("missing plan form", -1, -1);
    auto* top = edn::as_list(*form);
    if(!top || top->elems.empty() || !edn::as_symbol(*top->elems[0]) || edn::as_symbol(*top->elems[0])->name != "upcast-plan")
        bad(*form, "expected (upcast-plan ...)");
    GenerationPlan p;
    auto bindings = std::make_shared<BindingSet>();
    for(auto& b : req_vec(top->elems, *form, "bindings")){
        if(!edn::as_string(*b)) bad(*b, "binding entries must be strings");
        bindings->params.push_back(make_generic_param(*edn::as_string(*b)));
    }
    p.bindings = bindings;
    if(edn::keyword_arg(top->elems, "direct")){
        for(auto& d : req_vec(top->elems, *form, "direct")){
            auto* pair = edn::as_vector(*d);
            if(!pair || pair->elems.size()!=2 || !edn::as_string(*pair->elems[0]) || !edn::as_string(*pair->elems[1]))
                bad(*d, "direct edges are [\"parent\" \"child\"] pairs");
            p.direct_edges.emplace_back(*edn::as_string(*pair->elems[0]), *edn::as_string(*pair->elems[1]));
        }
    }
    for(auto& a : req_vec(top->elems, *form, "artifacts")){
        auto* l = edn::as_list(*a);
        if(!l || l->elems.empty() || !edn::as_symbol(*l->elems[0]) || edn::as_symbol(*l->elems[0])->name != "transitive-from")
            bad(*a, "artifacts must be (transitive-from ...) forms");
        Artifact art;
        art.target = req_str(l->elems, *a, "target");
        art.source = req_str(l->elems, *a, "source");
        art.via = req_str(l->elems, *a, "via");
        for(auto& c : req_vec(l->elems, *a, "chain")){
            if(!edn::as_string(*c)) bad(*c, ":chain entries must be strings");
            art.chain.push_back(*edn::as_string(*c));
        }
        if(art.chain.size() < 3 || art.chain.front()!=art.source || art.chain.back()!=art.target || art.chain[art.chain.size()-2]!=art.via)
            bad(*a, ":chain must run source, ..., via, target with at least one hop in between");
        art.line = opt_int(l->elems, "line");
        art.col = opt_int(l->elems, "col");
        art.bindings = p.bindings;
        p.artifacts.push_back(std::move(art));
    }
    return p;
}

} // namespace upcast
