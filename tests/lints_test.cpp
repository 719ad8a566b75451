// Warnings produced alongside a successful rewrite (W1100..W1102)
#include <cassert>
#include <iostream>
#include "tailrec/edn.hpp"
#include "tailrec/transform.hpp"
#include "test_env.hpp"

using namespace tailrec;

static int count_warnings(const Diagnostics& d, const std::string& code){
    int n = 0;
    for(const auto& w : d.warnings) if(w.code == code) ++n;
    return n;
}

static void test_shadowing(){
    // parameter named after the function
    auto r1 = transform_function(parse(
        "(fn :name f :params [(param f Int)] :ret Int :body (block (if (== f 0) (block 0) (block (call f (- f 1))))))"),
        TransformOptions{});
    assert(r1.diags.success);
    assert(count_warnings(r1.diags, "W1100") == 1);

    // let, match arm, closure parameter and nested item
    auto r2 = transform_function(parse(
        "(fn :name g :params [(param n Int)] :ret Int :body (block"
        "  (let (tuple g _) (tuple 1 2))"
        "  (let h (closure [g] (block g)))"
        "  (fn :name g :params [] :ret Int :body (block 0))"
        "  (match n (arm 0 0) (arm g (call g (- g 1))))))"),
        TransformOptions{});
    assert(r2.diags.success);
    assert(count_warnings(r2.diags, "W1100") == 4);
    // shadowed or not, the tail call is still treated as a self-call
    assert(r2.stats.continues == 1);

    auto clean = transform_function(parse(
        "(fn :name k :params [(param n Int)] :ret Int :body (block (let m n) (if (== m 0) (block 0) (block (call k (- m 1))))))"),
        TransformOptions{});
    assert(clean.diags.warnings.empty());
}

static void test_no_tail_call(){
    auto r = transform_function(parse(
        "(fn :name ident :params [(param n Int)] :ret Int :body (block n))"), TransformOptions{});
    assert(r.diags.success);
    assert(has_warning(r.diags, "W1101"));
    assert(!has_warning(r.diags, "W1102"));
    assert(r.stats.continues == 0 && r.stats.returns == 1);
}

// recurse(n) = if n == 0 { 0 } else { helper(recurse(n - 1)) }
static void test_non_tail_self_call(){
    auto r = transform_function(parse(
        "(fn :name recurse :params [(param n Int)] :ret Int"
        " :body (block (if (== n 0) (block 0) (block (call helper (call recurse (- n 1)))))))"),
        TransformOptions{});
    assert(r.diags.success && r.fn);
    assert(has_warning(r.diags, "W1101"));
    assert(has_warning(r.diags, "W1102"));
    for(const auto& w : r.diags.warnings){
        assert(w.line == 1 && w.col == 1);
        assert(!w.hint.empty());
    }

    auto mixed = transform_function(parse(
        "(fn :name m :params [(param n Int)] :ret Int"
        " :body (block (if (== n 0) (block 0) (block (call m (call m (- n 1)))))))"),
        TransformOptions{});
    assert(!has_warning(mixed.diags, "W1101"));
    assert(has_warning(mixed.diags, "W1102"));
}

static void test_lints_disabled(){
    TransformOptions o;
    o.lints = false;
    auto r = transform_function(parse(
        "(fn :name f :params [(param f Int)] :ret Int :body (block (call helper (call f 1))))"), o);
    assert(r.diags.success);
    assert(r.diags.warnings.empty());

    ScopedEnv off("TAILREC_NO_LINT", "1");
    auto t = transform(parse("(fn :name f :params [(param f Int)] :ret Int :body (block f))"));
    assert(t);
}

void run_lints_tests(){
    test_shadowing();
    test_no_tail_call();
    test_non_tail_self_call();
    test_lints_disabled();
    std::cout << "Lint tests passed\n";
}
