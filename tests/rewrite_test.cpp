#include <cassert>
#include <iostream>
#include "tailrec/edn.hpp"
#include "tailrec/forms.hpp"
#include "tailrec/rewrite.hpp"
#include "test_env.hpp"

using namespace tailrec;

namespace {

struct Rewritten {
    node_ptr body;
    RewriteStats stats;
};

Rewritten rewrite(const char* fn_name, const char* body_src, const TransformOptions& opts = TransformOptions{}){
    Rewritten r;
    r.body = parse(body_src);
    TailRewriter rw(RewriteContext{fn_name, &opts});
    rw.rewrite_body(r.body);
    r.stats = rw.stats();
    return r;
}

} // namespace

static void test_classify(){
    assert(classify(parse("(call f 1)")) == expr_kind::Call);
    assert(classify(parse("(method-call x f 1)")) == expr_kind::MethodCall);
    assert(classify(parse("(match x (arm _ 1))")) == expr_kind::Match);
    assert(classify(parse("(if c (block 1))")) == expr_kind::Conditional);
    assert(classify(parse("(block)")) == expr_kind::Block);
    assert(classify(parse("(return 1)")) == expr_kind::Return);
    assert(classify(parse("(+ 1 2)")) == expr_kind::Other);
    assert(classify(parse("42")) == expr_kind::Other);
    auto n = parse("(call f 1)");
    mark_opaque(*n);
    assert(classify(n) == expr_kind::Opaque);
    assert(std::string(kind_name(expr_kind::MethodCall)) == "method-call");
    assert(is_statement(parse("(let x 1)")) && is_statement(parse("(semi x)")) && is_statement(parse("(enum E)")));
    assert(!is_statement(parse("(call f)")));
}

// return sum_to(n - 1, acc + n) with an early `return acc`
static void test_explicit_returns(){
    auto r = rewrite("sum_to",
        "(block (semi (if (== n 0) (block (semi (return acc)))))"
        "       (semi (return (call sum_to (- n 1) (+ acc n)))))");
    assert(same_edn(r.body,
        "(block (semi (if (== n 0) (block (semi (return (call Action::Return acc))))))"
        "       (semi (return (call Action::Continue (tuple (- n 1) (+ acc n))))))"));
    assert(r.stats.continues == 1 && r.stats.returns == 1);
}

// implicit tail through if / else if / else
static void test_implicit_tail_if(){
    auto r = rewrite("is_even",
        "(block (if (== n 0) (block true) (if (== n 1) (block false) (block (call is_even (- n 2))))))");
    assert(same_edn(r.body,
        "(block (if (== n 0) (block (call Action::Return true))"
        "  (if (== n 1) (block (call Action::Return false)) (block (call Action::Continue (tuple (- n 2)))))))"));
    assert(r.stats.continues == 1 && r.stats.returns == 2);
}

static void test_match_arms(){
    auto r = rewrite("f", "(block (match x (arm 0 1) (arm n :if (> n 10) (call f 0)) (arm n (call f (- n 1)))))");
    assert(same_edn(r.body,
        "(block (match x (arm 0 (call Action::Return 1))"
        "  (arm n :if (> n 10) (call Action::Continue (tuple 0)))"
        "  (arm n (call Action::Continue (tuple (- n 1))))))"));
    assert(r.stats.continues == 2 && r.stats.returns == 1);
}

// helper(recurse(n)): only the outer value is terminal
static void test_non_tail_call_kept(){
    auto r = rewrite("recurse", "(block (if (== n 0) (block 0) (block (call helper (call recurse (- n 1))))))");
    assert(same_edn(r.body,
        "(block (if (== n 0) (block (call Action::Return 0))"
        "  (block (call Action::Return (call helper (call recurse (- n 1)))))))"));
    assert(r.stats.continues == 0);
    assert(count_self_calls(r.body, "recurse") == 1);
}

static void test_method_call(){
    auto r = rewrite("walk", "(block (method-call self walk (- n 1) acc))");
    assert(same_edn(r.body, "(block (call Action::Continue (tuple (- n 1) acc)))"));
    // a method with another name is just a value
    auto other = rewrite("walk", "(block (method-call self step n))");
    assert(same_edn(other.body, "(block (call Action::Return (method-call self step n)))"));
}

static void test_closures_and_loops_untouched(){
    auto r = rewrite("f",
        "(block (let g (closure [y] (block (return (call f y)))))"
        "       (semi (loop (block (semi (call f 1)) (break))))"
        "       (call g x))");
    assert(same_edn(r.body,
        "(block (let g (closure [y] (block (return (call f y)))))"
        "       (semi (loop (block (semi (call f 1)) (break))))"
        "       (call Action::Return (call g x)))"));
    // a loop in tail position is a terminal value as a whole
    auto l = rewrite("f", "(block (loop (block (semi (call f 1)))))");
    assert(same_edn(l.body, "(block (call Action::Return (loop (block (semi (call f 1))))))"));
}

static void test_nested_fn_returns_untouched(){
    auto r = rewrite("f", "(block (fn :name g :params [] :ret Int :body (block (return (call f 1)))) (call f 2))");
    assert(same_edn(r.body,
        "(block (fn :name g :params [] :ret Int :body (block (return (call f 1)))) (call Action::Continue (tuple 2)))"));
    assert(count_self_calls(parse("(block (fn :name g :body (block (call f 1))) (call f 2))"), "f") == 1);
}

static void test_unit_fall_through(){
    // if without else in tail position gets an else that returns unit
    auto r = rewrite("countdown", "(block (if (> n 0) (block (call countdown (- n 1)))))");
    assert(same_edn(r.body,
        "(block (if (> n 0) (block (call Action::Continue (tuple (- n 1))))"
        "  (block (call Action::Return (tuple)))))"));
    // block ending in a statement returns unit, unless that statement is a return
    auto s = rewrite("tick", "(block (let x 1) (semi (call print x)))");
    assert(same_edn(s.body, "(block (let x 1) (semi (call print x)) (call Action::Return (tuple)))"));
    auto t = rewrite("tick", "(block (semi (return)))");
    assert(same_edn(t.body, "(block (semi (return (call Action::Return (tuple)))))"));
    auto e = rewrite("tick", "(block)");
    assert(same_edn(e.body, "(block (call Action::Return (tuple)))"));
}

static void test_diverging_last_statement(){
    assert(diverges(parse("(return)")));
    assert(diverges(parse("(match x (arm 0 (return 1)) (arm _ (block (semi (return 2)))))")));
    assert(!diverges(parse("(match x (arm 0 (return 1)) (arm _ 2))")));
    assert(!diverges(parse("(if c (block (semi (return 1))))")));
    // the break belongs to the while, so the outer loop never exits
    assert(diverges(parse("(loop (block (semi (while c (block (semi (break)))))))")));
    assert(!diverges(parse("(loop (block (semi (break))))")));

    // every branch of the final if returns: no unit Return after it
    auto r = rewrite("f",
        "(block (semi (if (== n 0) (block (semi (return a)))"
        "                          (block (semi (return (call f (- n 1) (+ a n))))))))");
    assert(same_edn(r.body,
        "(block (semi (if (== n 0) (block (semi (return (call Action::Return a))))"
        "  (block (semi (return (call Action::Continue (tuple (- n 1) (+ a n)))))))))"));
    assert(r.stats.returns == 1 && r.stats.continues == 1);

    auto l = rewrite("f",
        "(block (let (mut i) 0) (semi (loop (block (semi (assign i (+ i 1)))"
        "                                          (semi (if (> i n) (block (semi (return i)))))))))");
    assert(same_edn(l.body,
        "(block (let (mut i) 0) (semi (loop (block (semi (assign i (+ i 1)))"
        "  (semi (if (> i n) (block (semi (return (call Action::Return i))))))))))"));

    // a loop that can be left still falls through to unit
    auto b = rewrite("f", "(block (semi (loop (block (semi (break))))))");
    assert(same_edn(b.body, "(block (semi (loop (block (semi (break))))) (call Action::Return (tuple)))"));
}

static void test_second_pass_is_noop(){
    TransformOptions opts;
    auto body = parse("(block (match x (arm 0 1) (arm n (call f (- n 1)))))");
    TailRewriter first(RewriteContext{"f", &opts});
    first.rewrite_body(body);
    auto snapshot = clone(body);
    TailRewriter second(RewriteContext{"f", &opts});
    second.rewrite_body(body);
    assert(second.stats().continues == 0 && second.stats().returns == 0);
    assert(second.stats().opaque_skipped == 2);
    assert(equal(body, snapshot));
}

static void test_custom_names(){
    TransformOptions opts;
    opts.action_name = "Step";
    opts.continue_variant = "Again";
    opts.return_variant = "Done";
    auto r = rewrite("f", "(block (if c (block (call f 1)) (block 2)))", opts);
    assert(same_edn(r.body, "(block (if c (block (call Step::Again (tuple 1))) (block (call Step::Done 2))))"));
}

static void test_positions_carried(){
    auto r = rewrite("f", "(block\n  (call f 1))");
    auto tail = elems_of(r.body)[1];
    assert(line(*tail) == 2 && col(*tail) == 3);
    assert(is_opaque(*tail));
}

void run_rewrite_tests(){
    test_classify();
    test_explicit_returns();
    test_implicit_tail_if();
    test_match_arms();
    test_non_tail_call_kept();
    test_method_call();
    test_closures_and_loops_untouched();
    test_nested_fn_returns_untouched();
    test_unit_fall_through();
    test_diverging_last_statement();
    test_second_pass_is_noop();
    test_custom_names();
    test_positions_carried();
    std::cout << "Rewrite tests passed\n";
}
