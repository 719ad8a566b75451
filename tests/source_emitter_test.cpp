#include <cassert>
#include <iostream>
#include "tailrec/edn.hpp"
#include "tailrec/transform.hpp"
#include "tinyrust/source_emitter.hpp"

using namespace tailrec;

static void test_trampolined_fn(){
    auto out = transform(parse(
        "(fn :name count :attrs [recursive] :params [(param x Int)] :ret Int"
        " :body (block (match x (arm 0 1) (arm n (call count (- n 1))))))"));
    auto src = tinyrust::emit_source(out);
    const char* expected =
        "#[recursive]\n"
        "fn count(x: i64) -> i64 {\n"
        "    enum Action<C, R> { Continue(C), Return(R) }\n"
        "    fn count_inner((x,): (i64,)) -> Action<(i64,), i64> {\n"
        "        match x {\n"
        "            0 => Action::Return(1),\n"
        "            n => Action::Continue((n - 1,)),\n"
        "        }\n"
        "    }\n"
        "    let mut acc = (x,);\n"
        "    loop {\n"
        "        match count_inner(acc) {\n"
        "            Action::Return(r) => return r,\n"
        "            Action::Continue(c) => acc = c,\n"
        "        }\n"
        "    }\n"
        "}\n";
    assert(src == expected);
}

static void test_expressions(){
    auto e = [](const char* edn){ return tinyrust::emit_source(parse(edn)); };
    // parentheses only where precedence needs them
    assert(e("(* (+ a 1) b)") == "(a + 1) * b");
    assert(e("(+ a (* 1 b))") == "a + 1 * b");
    assert(e("(- a (- b c))") == "a - (b - c)");
    assert(e("(- (- a b) c)") == "a - b - c");
    assert(e("(== (< a b) c)") == "(a < b) == c");
    assert(e("(&& (|| a b) c)") == "(a || b) && c");
    assert(e("(neg (+ a 1))") == "-(a + 1)");
    assert(e("(not done)") == "!done");
    assert(e("(* -2 x)") == "-2 * x");
    assert(e("(method-call (call mk 1) walk (- n 1) acc)") == "mk(1).walk(n - 1, acc)");
    assert(e("(tuple)") == "()");
    assert(e("(tuple a)") == "(a,)");
    assert(e("(tuple a (tuple b c))") == "(a, (b, c))");
    assert(e("(return)") == "return");
    assert(e("(closure [x (mut y)] (+ x y))") == "|x, mut y| x + y");
    assert(e("(if c (block 1) (if d (block 2) (block 3)))") ==
        "if c {\n    1\n} else if d {\n    2\n} else {\n    3\n}");
    // block-like operands
    assert(e("(+ (if c (block 1) (block 2)) 1)") == "(if c {\n    1\n} else {\n    2\n}) + 1");
    assert(e("(method-call (match x (arm _ 1)) abs)") == "(match x {\n    _ => 1,\n}).abs()");
    assert(e("(* 2 (block 3))") == "2 * ({\n    3\n})");
    assert(e("(assign x (if c (block 1) (block 2)))") == "x = if c {\n    1\n} else {\n    2\n}");
}

static void test_statements(){
    auto src = tinyrust::emit_source(parse(
        "(fn :name tick :params [(param (tuple _ n) (tuple Int Bool))]"
        " :body (block (let x :type Int 1) (semi (while (> x 0) (block (semi (assign x (- x 1))))))"
        "              (match n (arm true :if (== x 0) (block (semi (return)))) (arm _ (tuple)))))"));
    const char* expected =
        "fn tick((_, n): (i64, bool)) {\n"
        "    let x: i64 = 1;\n"
        "    while x > 0 {\n"
        "        x = x - 1;\n"
        "    };\n"
        "    match n {\n"
        "        true if x == 0 => {\n"
        "            return;\n"
        "        }\n"
        "        _ => (),\n"
        "    }\n"
        "}\n";
    assert(src == expected);
    assert(tinyrust::emit_source(parse("(fn :name ext :params [(param n Int)] :ret Int)")) == "fn ext(n: i64) -> i64;\n");
}

static void test_module_and_indent(){
    tinyrust::EmitOptions two;
    two.indent = 2;
    auto src = tinyrust::emit_source(parse(
        "(module (enum Opt :variants [(Some Int) None]) (fn :name f :params [] :ret Int :body (block 0)))"), two);
    assert(src == "enum Opt { Some(i64), None }\n\nfn f() -> i64 {\n  0\n}\n");
}

static void test_unsupported(){
    bool threw = false;
    try { tinyrust::emit_source(parse("(module (struct P))")); }
    catch(const tinyrust::emit_error& e){ threw = true; assert(std::string(e.what()).find("struct") != std::string::npos); }
    assert(threw);
}

void run_source_emitter_tests(){
    test_trampolined_fn();
    test_expressions();
    test_statements();
    test_module_and_indent();
    test_unsupported();
    std::cout << "Source emitter tests passed\n";
}
