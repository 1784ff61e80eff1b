#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "upcast/derive.hpp"
#include "upcast/parser.hpp"

using namespace upcast;

// edges point into the hierarchy, so only lvalues may be walked
template<typename H>
constexpr bool derivable_from = requires(H&& h){ derive_edges(std::forward<H>(h)); };
static_assert(derivable_from<const Hierarchy&>);
static_assert(derivable_from<Hierarchy&>);
static_assert(!derivable_from<Hierarchy>);

static std::string pair_of(const ConversionEdge& e){ return e.ancestor->type_expr + "<-" + e.descendant->type_expr; }

static std::vector<std::string> pairs(const std::string& src){
    auto h = parse_hierarchy(src);
    std::vector<std::string> out;
    for(auto& e : derive_edges(h)) out.push_back(pair_of(e));
    return out;
}

static void test_chain_and_leaves(){
    // depth-1 trees and leaves yield nothing
    assert(pairs("[] A").empty());
    assert(pairs("[] A { B, C, D }").empty());
    assert(pairs("[]").empty());
    // A -> B -> C: only A <- C
    auto p = pairs("[] A { B { C } }");
    assert(p.size()==1 && p[0]=="A<-C");
}

static void test_chain_of_four(){
    auto h = parse_hierarchy("[] A { B { C { D } } }");
    auto edges = derive_edges(h);
    std::vector<std::string> got;
    for(auto& e : edges) got.push_back(pair_of(e));
    std::vector<std::string> want{ "B<-D", "A<-D", "A<-C" };
    assert(got==want);
    // A <- D composes through B, which already converts from D
    assert(edges[1].intermediate->type_expr=="B");
    assert(edges[1].distance()==3);
    assert(edges[1].path.front()->type_expr=="D" && edges[1].path.back()->type_expr=="A");
}

static void test_forest_roots_are_independent(){
    auto p = pairs("[] A { B { C } }, X { Y { Z } }");
    assert(p.size()==2 && p[0]=="A<-C" && p[1]=="X<-Z");
}

static void test_state_machine(){
    PairDeriver d;
    std::vector<PairDeriver::State> seen;
    d.on_edge([&](const ConversionEdge&, const BindingSet&){ seen.push_back(d.state()); });
    size_t n = d.run(parse_hierarchy("[] A { B { C, D } }"));
    assert(n==2 && seen.size()==2);
    for(auto s : seen) assert(s==PairDeriver::State::Emitting);
    assert(d.state()==PairDeriver::State::Traversing);
    assert(std::string(to_string(PairDeriver::State::Emitting))=="Emitting");
}

static void test_bindings_handed_through(){
    auto h = parse_hierarchy("['a, T] R<'a> { M<T> { L } }");
    PairDeriver d;
    int calls=0;
    d.on_edge([&](const ConversionEdge&, const BindingSet& b){ ++calls; assert(&b==h.bindings.get()); });
    d.run(h);
    assert(calls==1);
}

void run_derive_tests(){
    test_chain_and_leaves();
    test_chain_of_four();
    test_forest_roots_are_independent();
    test_state_machine();
    test_bindings_handed_through();
    std::cout << "Derive tests passed\n";
}
