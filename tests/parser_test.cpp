#include <cassert>
#include <iostream>
#include "upcast/parser.hpp"

using namespace upcast;

static const TreeNode& child(const TreeNode& n, size_t i){ assert(i < n.children.size()); return n.children[i]; }

static void test_worked_example_shape(){
    auto h = parse_hierarchy("[] A { B { E, F { J, K } }, C { G }, D { H, I { L } } }");
    assert(h.bindings->empty());
    assert(h.roots.size()==1);
    const auto& a = h.roots[0];
    assert(a.type_expr=="A" && a.children.size()==3);
    assert(child(a,0).type_expr=="B" && child(child(a,0),1).type_expr=="F");
    assert(child(child(child(a,0),1),1).type_expr=="K");
    assert(child(child(a,2),1).children.size()==1 && child(child(child(a,2),1),0).type_expr=="L");
    assert(h.node_count()==12);
    assert(h.to_surface()=="[] A { B { E, F { J, K } }, C { G }, D { H, I { L } } }");
}

static void test_generic_labels_and_bindings(){
    auto h = parse_hierarchy(R"(['a, T: Clone + Into<u64>, const N: usize]
        GlobalError<'a> {
            FsError<'a> { std::io::Error, Box<dyn Fn(T) -> [u8; N]> },
            Wrapper<T, N>,
        })");
    assert(h.bindings->params.size()==3);
    const auto& ps = h.bindings->params;
    assert(ps[0].kind==GenericParam::Kind::Lifetime && ps[0].name=="'a" && ps[0].constraint.empty());
    assert(ps[1].kind==GenericParam::Kind::Type && ps[1].name=="T" && ps[1].constraint=="Clone + Into<u64>");
    assert(ps[2].kind==GenericParam::Kind::Const && ps[2].name=="N" && ps[2].constraint=="usize");
    assert(h.bindings->joined()=="'a, T: Clone + Into<u64>, const N: usize");
    const auto& root = h.roots[0];
    assert(root.type_expr=="GlobalError<'a>");
    assert(root.children.size()==2);
    assert(child(child(root,0),0).type_expr=="std::io::Error");
    assert(child(child(root,0),1).type_expr=="Box<dyn Fn(T) -> [u8; N]>");
    assert(child(root,1).type_expr=="Wrapper<T, N>" && child(root,1).is_leaf());
}

static void test_positions_and_comments(){
    auto h = parse_hierarchy("[]\n// roots\nA {\n  /* inner */ B\n}\n");
    assert(h.roots[0].line==3 && h.roots[0].col==1);
    assert(h.roots[0].children[0].type_expr=="B");
    assert(h.roots[0].children[0].line==4 && h.roots[0].children[0].col==15);
}

static void test_forest_and_empty(){
    auto h = parse_hierarchy("[] A { B }, C, D { E { F } },");
    assert(h.roots.size()==3 && h.roots[1].is_leaf());
    auto e = parse_hierarchy("[]");
    assert(e.roots.empty() && e.node_count()==0);
    auto leaf = parse_hierarchy("[T] Only<T>");
    assert(leaf.roots.size()==1 && leaf.roots[0].is_leaf());

    // hand-built trees may leave bindings unset
    Hierarchy bare; bare.bindings.reset();
    TreeNode a; a.type_expr = "A";
    TreeNode b; b.type_expr = "B";
    a.children.push_back(b);
    bare.roots.push_back(a);
    assert(bare.to_surface()=="[] A { B }");
}

static void test_prefixed_labels_keep_their_spaces(){
    auto h = parse_hierarchy("[] Root<'a> { &'a str, dyn Error + Send + 'static, *const T, fn(u8) -> u16, &mut Vec<u8>, impl Display }");
    const auto& r = h.roots[0];
    assert(r.children.size()==6);
    assert(child(r,0).type_expr=="&'a str");
    assert(child(r,1).type_expr=="dyn Error + Send + 'static");
    assert(child(r,2).type_expr=="*const T");
    assert(child(r,3).type_expr=="fn(u8) -> u16");
    assert(child(r,4).type_expr=="&mut Vec<u8>");
    assert(child(r,5).type_expr=="impl Display");
}

static void test_missing_comma_between_siblings(){
    Parser p;
    auto sameLine = p.parse_string("[] A { B C }");
    assert(!sameLine.success && sameLine.code=="E0100");
    assert(sameLine.error_message=="expected ',' between siblings");
    assert(sameLine.line==1 && sameLine.column==10);

    auto newline = p.parse_string("[] A {\n  B\n  C\n}");
    assert(!newline.success && newline.code=="E0100");
    assert(newline.line==3 && newline.column==3);

    auto roots = p.parse_string("[] A { B } C");
    assert(!roots.success && roots.error_message=="expected ',' between siblings" && roots.column==12);

    auto afterPrefix = p.parse_string("[] A { &'a str B }");
    assert(!afterPrefix.success && afterPrefix.column==16);
}

static void test_errors(){
    Parser p;
    auto missing = p.parse_string("A { B }");
    assert(!missing.success && missing.code=="E0101");
    assert(missing.line==1 && missing.column==1);

    auto unclosed = p.parse_string("[] A { B { C }");
    assert(!unclosed.success && unclosed.code=="E0100");
    assert(unclosed.error_message.find("unbalanced")!=std::string::npos);

    auto stray = p.parse_string("[] A { B } }");
    assert(!stray.success && stray.code=="E0100" && stray.column==12);

    auto badBind = p.parse_string("['a, T");
    assert(!badBind.success && badBind.code=="E0100");

    bool threw=false;
    try { parse_hierarchy("[] A {", "x.hier"); } catch(const parse_error& e){ threw = true; assert(e.code=="E0100" && e.line==1); }
    assert(threw);
}

static void test_edn_front_end(){
    Parser p;
    auto r = p.parse_edn("(hierarchy [] (A (B E (F J K)) (C G) (D H (I L))))");
    assert(r.success);
    assert(r.hierarchy.to_surface()=="[] A { B { E, F { J, K } }, C { G }, D { H, I { L } } }");

    auto g = p.parse_edn("(hierarchy [\"'a\" \"T: Debug\"] (\"GlobalError<'a>\" \"FsError<'a>\" \"Wrapper<T>\"))");
    assert(g.success && g.hierarchy.bindings->params.size()==2);
    assert(g.hierarchy.bindings->params[1].constraint=="Debug");
    assert(g.hierarchy.roots[0].children[0].type_expr=="FsError<'a>");

    auto noBind = p.parse_edn("(hierarchy (A B))");
    assert(!noBind.success && noBind.code=="E0101");
    auto wrongHead = p.parse_edn("(tree [] A)");
    assert(!wrongHead.success && wrongHead.code=="E0102");
    auto badNode = p.parse_edn("(hierarchy [] (A 42))");
    assert(!badNode.success && badNode.code=="E0102");
    auto unbalanced = p.parse_edn("(hierarchy [] (A B)");
    assert(!unbalanced.success && unbalanced.code=="E0100");
}

void run_parser_tests(){
    test_worked_example_shape();
    test_generic_labels_and_bindings();
    test_positions_and_comments();
    test_forest_and_empty();
    test_prefixed_labels_keep_their_spaces();
    test_missing_comma_between_siblings();
    test_errors();
    test_edn_front_end();
    std::cout << "Parser tests passed\n";
}
