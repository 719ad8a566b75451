// tinyrust surface: parsing, lowering to the function language, and source round-trips.
#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "tinyrust/parser.hpp"
#include "tinyrust/source_emitter.hpp"
#include "tailrec/edn.hpp"
#include "tailrec/forms.hpp"
#include "tailrec/transform.hpp"
#include "tailrec/rebuild.hpp"

#ifndef TINYRUST_SAMPLES_DIR
#define TINYRUST_SAMPLES_DIR "languages/tinyrust/samples"
#endif

using tailrec::parse;

static tailrec::node_ptr lower(const char* src){
    tinyrust::Parser parser;
    auto r = parser.parse_string(src, "test.rs");
    if(!r.success){ std::cerr << "parse failed: " << r.error_message << "\n"; }
    assert(r.success);
    // the textual form reads back to the same tree
    assert(tailrec::equal(parse(r.edn), r.module));
    return r.module;
}

static bool same(const tailrec::node_ptr& n, const char* edn){
    bool ok = tailrec::equal(n, parse(edn));
    if(!ok) std::cerr << "got: " << tailrec::to_string(n) << "\n";
    return ok;
}

static void test_fn_with_returns(){
    auto m = lower(R"RS(
#[recursive]
fn sum_to(n: i64, acc: i64) -> i64 {
    if n == 0 {
        return acc;
    }
    return sum_to(n - 1, acc + n);
}
)RS");
    assert(same(m,
        "(module (fn :name sum_to :attrs [recursive] :params [(param n Int) (param acc Int)] :ret Int"
        " :body (block (semi (if (== n 0) (block (semi (return acc)))))"
        "              (semi (return (call sum_to (- n 1) (+ acc n)))))))"));
    auto fn = tailrec::elems_of(m)[1];
    assert(tailrec::line(*fn) == 2);
    auto params = tailrec::elems_of(tailrec::kw_value(fn, "params"));
    assert(tailrec::line(*params[1]) == 3 && tailrec::col(*params[1]) == 19);
}

static void test_operators(){
    auto m = lower(R"RS(
fn f(x: i64) -> bool {
    let mut y: i64 = -x * 2;
    y += -3;
    !(y < 0) && x != 1 || false
}
)RS");
    assert(same(tailrec::kw_value(tailrec::elems_of(m)[1], "body"),
        "(block (let (mut y) :type Int (* (neg x) 2))"
        "       (semi (assign y (+ y -3)))"
        "       (|| (&& (not (< y 0)) (!= x 1)) false))"));
}

static void test_enum_match_patterns(){
    auto m = lower(R"RS(
enum Opt { Some(i64), None }
// pick the payload when it beats a
fn pick(o: Opt, (a, mut b): (i64, i64)) -> i64 {
    match o {
        Opt::Some(v) if v > a => v,
        Opt::None => { b = 0; b }
        _ => a,
    }
}
)RS");
    assert(same(m,
        "(module (enum Opt :variants [(Some Int) (None)])"
        " (fn :name pick :params [(param o Opt) (param (tuple a (mut b)) (tuple Int Int))] :ret Int"
        "  :body (block (match o (arm (ctor Opt::Some v) :if (> v a) v)"
        "                        (arm Opt::None (block (semi (assign b 0)) b))"
        "                        (arm _ a)))))"));
}

static void test_loops_closures_methods(){
    auto m = lower(R"RS(
fn misc(s: Walker, n: i64) -> i64 {
    let f = |x| x + 1;
    let mut i = 0;
    while i < n { i += 1; }
    loop { break; }
    s.walk(i, f(2))
}
)RS");
    assert(same(tailrec::kw_value(tailrec::elems_of(m)[1], "body"),
        "(block (let f (closure [x] (+ x 1)))"
        "       (let (mut i) 0)"
        "       (semi (while (< i n) (block (semi (assign i (+ i 1))))))"
        "       (semi (loop (block (semi (break)))))"
        "       (method-call s walk i (call f 2)))"));
}

static void test_types_and_declarations(){
    auto m = lower("fn step(s: (i64,), u: ()) -> Action<(i64, bool), ()>;");
    assert(same(m,
        "(module (fn :name step :params [(param s (tuple Int)) (param u (tuple))]"
        " :ret (app Action (tuple Int Bool) (tuple))))"));
}

static void test_errors(){
    tinyrust::Parser parser;
    auto missing_semi = parser.parse_string("fn f() -> i64 {\n    1\n    2\n}\n", "semi.rs");
    assert(!missing_semi.success);
    assert(missing_semi.line == 3);
    assert(missing_semi.error_message.find("expected ';'") != std::string::npos);

    auto unclosed = parser.parse_string("fn f( {", "paren.rs");
    assert(!unclosed.success && unclosed.line == 1);

    auto trailing = parser.parse_string("fn f() {}\nlet", "trail.rs");
    assert(!trailing.success && trailing.line == 2);

    auto big = parser.parse_string("fn f() -> i64 { 99999999999999999999 }", "big.rs");
    assert(!big.success);
    assert(big.error_message.find("out of range") != std::string::npos);
}

static void test_block_like_operand_round_trip(){
    auto m = lower("fn f(c: bool, x: Opt) -> i64 { (if c { 1 } else { 2 }) + (match x { _ => 3 }) }");
    assert(same(tailrec::kw_value(tailrec::elems_of(m)[1], "body"),
        "(block (+ (if c (block 1) (block 2)) (match x (arm _ 3))))"));
    auto src = tinyrust::emit_source(m);
    tinyrust::Parser parser;
    auto again = parser.parse_string(src, "operand.rs");
    assert(again.success);
    assert(tailrec::equal(again.module, m));
}

static std::string read_sample(const std::string& name){
    std::ifstream in(std::string(TINYRUST_SAMPLES_DIR) + "/" + name, std::ios::binary);
    if(!in){ std::cerr << "missing sample " << name << "\n"; }
    assert(in);
    std::stringstream ss; ss << in.rdbuf();
    return ss.str();
}

// Sample files: rewrite, print back as source, read again; nothing may change.
static void test_samples_round_trip(){
    tailrec::TransformOptions opts;
    opts.lints = false;
    for(const char* name : {"sum_to.rs", "is_even.rs", "count.rs", "collatz.rs", "countdown.rs", "skip.rs"}){
        tinyrust::Parser parser;
        auto r = parser.parse_string(read_sample(name), name);
        if(!r.success) std::cerr << name << ": " << r.error_message << "\n";
        assert(r.success);
        auto ex = tailrec::expand_tailrec(r.module, opts);
        assert(ex.diags.success);
        assert(ex.transformed >= 1);
        auto src = tinyrust::emit_source(ex.module);
        auto again = parser.parse_string(src, name);
        if(!again.success) std::cerr << name << " (emitted): " << again.error_message << "\n" << src;
        assert(again.success);
        assert(tailrec::equal(again.module, ex.module));
        // the reread output is recognized as already rewritten
        assert(tailrec::expand_tailrec(again.module, opts).transformed == 0);
    }
}

int main(){
    test_fn_with_returns();
    test_operators();
    test_enum_match_patterns();
    test_loops_closures_methods();
    test_types_and_declarations();
    test_errors();
    test_block_like_operand_round_trip();
    test_samples_round_trip();
    std::cout << "tinyrust parser tests passed\n";
    return 0;
}
