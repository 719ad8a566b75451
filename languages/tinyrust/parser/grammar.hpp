#pragma once
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace tinyrust::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct comment_line : seq< two<'/'>, until< eolf > > {};
struct block_comment : seq< one<'/'>, one<'*'>, until< seq< one<'*'>, one<'/'> > > > {};
struct space_or_comment : sor< space, comment_line, block_comment > {};
struct sp : star< space_or_comment > {};

template<typename Rule>
using ws = pad< Rule, space_or_comment >;

// keywords
struct kw_fn : TAO_PEGTL_KEYWORD("fn") {};
struct kw_enum : TAO_PEGTL_KEYWORD("enum") {};
struct kw_let : TAO_PEGTL_KEYWORD("let") {};
struct kw_mut : TAO_PEGTL_KEYWORD("mut") {};
struct kw_if : TAO_PEGTL_KEYWORD("if") {};
struct kw_else : TAO_PEGTL_KEYWORD("else") {};
struct kw_match : TAO_PEGTL_KEYWORD("match") {};
struct kw_loop : TAO_PEGTL_KEYWORD("loop") {};
struct kw_while : TAO_PEGTL_KEYWORD("while") {};
struct kw_return : TAO_PEGTL_KEYWORD("return") {};
struct kw_break : TAO_PEGTL_KEYWORD("break") {};
struct kw_continue : TAO_PEGTL_KEYWORD("continue") {};
struct kw_true : TAO_PEGTL_KEYWORD("true") {};
struct kw_false : TAO_PEGTL_KEYWORD("false") {};
struct keyword : sor< kw_fn, kw_enum, kw_let, kw_mut, kw_if, kw_else, kw_match, kw_loop, kw_while,
                      kw_return, kw_break, kw_continue, kw_true, kw_false > {};

// tokens
struct ident : seq< not_at< keyword >, identifier > {};
struct path : seq< ident, plus< two<':'>, ident > > {};
struct lparen : one<'('> {};
struct rparen : one<')'> {};
struct lbrace : one<'{'> {};
struct rbrace : one<'}'> {};
struct comma : one<','> {};
struct colon : seq< one<':'>, not_at< one<':'> > > {};
struct arrow : string<'-','>'> {};
struct fat_arrow : string<'=','>'> {};
struct equal : seq< one<'='>, not_at< one<'=','>'> > > {};
// a comma inside parentheses makes a tuple: (x) is grouping, (x,) is a 1-tuple
struct tuple_comma : one<','> {};
struct semi_tok : one<';'> {};
struct empty_stmt : one<';'> {};

// types: i64, bool, (), (T,), (A, B), Name, Name<T, ...>
struct type;
struct tuple_type : seq< ws< lparen >, opt< type, star< ws< tuple_comma >, type >, opt< ws< tuple_comma > > >, ws< rparen > > {};
struct type_args : seq< ws< one<'<'> >, type, star< ws< comma >, type >, ws< one<'>'> > > {};
struct named_type : seq< ws< ident >, opt< type_args > > {};
struct type : sor< tuple_type, named_type > {};

// patterns
struct pattern;
struct pat_int : seq< opt< one<'-'> >, plus< digit > > {};
struct pat_bool : sor< kw_true, kw_false > {};
struct pat_mut : seq< ws< kw_mut >, ws< ident > > {};
struct pat_tuple : seq< ws< lparen >, opt< pattern, star< ws< tuple_comma >, pattern >, opt< ws< tuple_comma > > >, ws< rparen > > {};
struct pat_ctor : seq< ws< path >, ws< lparen >, opt< pattern, star< ws< comma >, pattern >, opt< ws< comma > > >, ws< rparen > > {};
struct pattern : sor< pat_ctor, pat_tuple, pat_mut, ws< pat_bool >, ws< pat_int >, ws< path >, ws< ident > > {};

// expressions, lowest precedence last
struct expr;
struct block;
struct int_lit : seq< plus< digit >, not_at< identifier_other > > {};
struct bool_lit : sor< kw_true, kw_false > {};
struct call_args : seq< ws< lparen >, opt< expr, star< ws< comma >, expr >, opt< ws< comma > > >, must< ws< rparen > > > {};
struct call_or_name : seq< ws< sor< path, ident > >, opt< call_args > > {};
struct paren_expr : seq< ws< lparen >, opt< expr, star< ws< tuple_comma >, expr >, opt< ws< tuple_comma > > >, must< ws< rparen > > > {};
struct closure_params : sor< seq< one<'|'>, opt< pattern, star< ws< comma >, pattern > >, one<'|'> >, two<'|'> > {};
struct closure_expr : seq< ws< closure_params >, expr > {};
struct if_expr : seq< ws< kw_if >, expr, block, opt< ws< kw_else >, sor< if_expr, block > > > {};
struct arm_guard : seq< ws< kw_if >, expr > {};
struct match_arm : seq< pattern, opt< arm_guard >, ws< fat_arrow >, expr, opt< ws< comma > > > {};
struct match_expr : seq< ws< kw_match >, expr, ws< lbrace >, star< match_arm >, must< ws< rbrace > > > {};
struct loop_expr : seq< ws< kw_loop >, block > {};
struct while_expr : seq< ws< kw_while >, expr, block > {};
struct return_expr : seq< ws< kw_return >, opt< expr > > {};
struct break_expr : seq< ws< kw_break >, opt< expr > > {};
struct continue_expr : ws< kw_continue > {};
struct primary : sor< if_expr, match_expr, loop_expr, while_expr, block, return_expr, break_expr, continue_expr,
                      closure_expr, ws< bool_lit >, ws< int_lit >, paren_expr, call_or_name > {};

struct method_suffix : seq< ws< one<'.'> >, ws< ident >, call_args > {};
struct postfix_expr : seq< primary, star< method_suffix > > {};
struct unary_op : sor< seq< one<'-'>, not_at< one<'>','='> > >, seq< one<'!'>, not_at< one<'='> > > > {};
struct unary_expr : sor< seq< ws< unary_op >, unary_expr >, postfix_expr > {};

struct mul_op : seq< one<'*','/','%'>, not_at< one<'='> > > {};
struct add_op : sor< seq< one<'+'>, not_at< one<'='> > >, seq< one<'-'>, not_at< one<'=','>'> > > > {};
struct cmp_op : sor< string<'=','='>, string<'!','='>, string<'<','='>, string<'>','='>, one<'<'>, one<'>'> > {};
struct and_op : string<'&','&'> {};
struct or_op : string<'|','|'> {};
struct assign_op : sor< string<'+','='>, string<'-','='>, string<'*','='>, string<'/','='>, string<'%','='>, equal > {};

struct mul_expr : seq< unary_expr, star< ws< mul_op >, unary_expr > > {};
struct add_expr : seq< mul_expr, star< ws< add_op >, mul_expr > > {};
struct cmp_expr : seq< add_expr, opt< ws< cmp_op >, add_expr > > {};
struct and_expr : seq< cmp_expr, star< ws< and_op >, cmp_expr > > {};
struct or_expr : seq< and_expr, star< ws< or_op >, and_expr > > {};
struct expr : seq< or_expr, opt< ws< assign_op >, expr > > {};

// statements and items
struct item;
struct let_stmt : seq< ws< kw_let >, must< pattern, opt< ws< colon >, type >, ws< equal >, expr, ws< one<';'> > > > {};
struct expr_stmt : seq< expr, opt< ws< semi_tok > > > {};
struct stmt : sor< let_stmt, item, expr_stmt, ws< empty_stmt > > {};
struct block : seq< ws< lbrace >, star< stmt >, must< ws< rbrace > > > {};

struct attribute : seq< one<'#'>, ws< one<'['> >, ws< ident >, must< ws< one<']'> > > > {};
struct param : seq< pattern, ws< colon >, type > {};
struct param_list : seq< ws< lparen >, opt< param, star< ws< comma >, param >, opt< ws< comma > > >, must< ws< rparen > > > {};
struct ret_type : seq< ws< arrow >, type > {};
struct fn_item : seq< star< ws< attribute > >, ws< kw_fn >, must< ws< ident >, param_list, opt< ret_type >, sor< block, ws< one<';'> > > > > {};
struct generics : seq< ws< one<'<'> >, ws< ident >, star< ws< comma >, ws< ident > >, ws< one<'>'> > > {};
struct variant : seq< ws< ident >, opt< ws< lparen >, opt< type, star< ws< comma >, type > >, opt< ws< comma > >, ws< rparen > > > {};
struct enum_item : seq< star< ws< attribute > >, ws< kw_enum >,
                        must< ws< ident >, opt< generics >, ws< lbrace >, opt< variant, star< ws< comma >, variant > >, opt< ws< comma > >, ws< rbrace > > > {};
struct item : sor< fn_item, enum_item > {};

struct module_rule : must< sp, star< item >, sp, eof > {};

// Rules that become parse-tree nodes; the chains fold away when they wrap a single operand.
template<typename Rule>
using selector = tao::pegtl::parse_tree::selector< Rule,
    tao::pegtl::parse_tree::store_content::on<
        ident, path, int_lit, bool_lit, pat_int, pat_bool, tuple_comma, semi_tok,
        unary_op, mul_op, add_op, cmp_op, and_op, or_op, assign_op,
        attribute, fn_item, enum_item, generics, variant, param_list, param, ret_type,
        tuple_type, named_type, type_args, pat_mut, pat_tuple, pat_ctor,
        block, let_stmt, expr_stmt, if_expr, match_expr, match_arm, arm_guard,
        loop_expr, while_expr, return_expr, break_expr, continue_expr,
        closure_params, closure_expr, paren_expr, call_args, method_suffix >,
    tao::pegtl::parse_tree::fold_one::on<
        expr, or_expr, and_expr, cmp_expr, add_expr, mul_expr, unary_expr, postfix_expr, call_or_name > >;

} // namespace tinyrust::grammar
