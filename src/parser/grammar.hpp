#pragma once
#include <tao/pegtl.hpp>

namespace upcast::parser::grammar {
using namespace tao::pegtl;

// Grammar:
//   file     := skip bindings skip forest skip EOF
//   bindings := '[' (param (',' param)* ','?)? ']'
//   forest   := (node (',' node)* ','?)?
//   node     := label ('{' forest '}')?
//   label    := term (('+' | '->') term)*,  term := (prefix ws)* word
// Labels and params are opaque token runs balanced over <> () [] ({} only inside a group).

// Comments and whitespace
struct comment_line : seq< two<'/'>, until< eolf > > {};
struct block_comment : seq< one<'/'>, one<'*'>, until< seq< one<'*'>, one<'/'> > > > {};
struct space_or_comment : sor< space, comment_line, block_comment > {};
struct skip : star< space_or_comment > {};

// A lone '/' that does not start a comment
struct slash : seq< one<'/'>, not_at< one<'/','*'> > > {};
// '->' must not close an angle group
struct arrow : string<'-','>'> {};

struct angle_group;
struct paren_group;
struct bracket_group;
struct brace_group;
struct nested : sor< angle_group, paren_group, bracket_group, brace_group > {};
struct group_piece : sor< nested, arrow, not_one<'<','>','(',')','[',']','{','}'> > {};
struct angle_group : seq< one<'<'>, star< group_piece >, one<'>'> > {};
struct paren_group : seq< one<'('>, star< group_piece >, one<')'> > {};
struct bracket_group : seq< one<'['>, star< group_piece >, one<']'> > {};
struct brace_group : seq< one<'{'>, star< group_piece >, one<'}'> > {};

// Whitespace may sit between pieces but never at the ends of a token run.
template< typename Piece >
struct token_run : seq< Piece, star< star< space >, Piece > > {};

// '+' is left to label_bound so `Error + Send` splits into words
struct label_piece : sor< angle_group, paren_group, bracket_group, arrow, slash,
                          not_one<',','{','}','<','>','(',')','[',']','/','+',' ','\t','\r','\n','\v','\f'> > {};
struct param_piece : sor< nested, arrow, slash,
                          not_one<',',']','[','<','>','(',')','{','}','/',' ','\t','\r','\n','\v','\f'> > {};

struct comma : one<','> {};

// Binding list
struct binding_param : token_run< param_piece > {};
struct bind_open : one<'['> {};
struct bind_close : one<']'> {};
struct binding_items : seq< binding_param, star< skip, comma, skip, binding_param >, opt< skip, comma > > {};
struct bindings : if_must< bind_open, skip, opt< binding_items >, skip, bind_close > {};

// Forest
// A label is a run of words. Whitespace may only follow a prefix word
// (`dyn`, `impl`, `mut`, `const`, `unsafe`, `extern`, `&`, `*const`, `&'a`,
// `for<'a>`) or surround a `+` bound or a `->` return type, so `B C` is two
// siblings missing their ',' rather than one label.
struct label_word : plus< label_piece > {};
struct lifetime : seq< one<'\''>, identifier > {};
struct prefix_kw : sor< keyword<'d','y','n'>, keyword<'i','m','p','l'>, keyword<'m','u','t'>, keyword<'c','o','n','s','t'>,
                        keyword<'u','n','s','a','f','e'>, keyword<'e','x','t','e','r','n'> > {};
struct sigils : plus< one<'&','*'> > {};
struct prefix_word : sor< seq< opt< sigils >, sor< lifetime, prefix_kw > >, seq< keyword<'f','o','r'>, angle_group >, sigils > {};
struct label_term : seq< star< prefix_word, plus< space >, at< label_piece > >, label_word > {};
struct label_bound : seq< star< space >, sor< one<'+'>, arrow >, star< space >, label_term > {};
struct node_label : seq< label_term, star< label_bound > > {};
struct block_open : one<'{'> {};
struct block_close : one<'}'> {};
struct forest;
struct block : if_must< block_open, skip, forest, skip, block_close > {};
struct node_decl : seq< node_label, skip, opt< block > > {};
// Raised when another label follows a node with only whitespace between them.
struct missing_comma {};
struct sibling_sep : seq< skip, sor< comma, seq< at< label_piece >, raise< missing_comma > > > > {};
struct forest : opt< node_decl, star< sibling_sep, skip, node_decl >, opt< skip, comma > > {};

struct file : must< skip, bindings, skip, forest, skip, eof > {};

} // namespace upcast::parser::grammar
