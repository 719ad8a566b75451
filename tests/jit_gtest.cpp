// End-to-end: trampolined functions compiled through the LLVM backend and run in the ORC JIT.
#include <gtest/gtest.h>
#include <cstdint>
#include <string>

#include "tailrec/edn.hpp"
#include "tailrec/forms.hpp"
#include "tailrec/transform.hpp"
#include "tailrec/rebuild.hpp"
#include "tailrec/ir_emitter.hpp"
#include "tailrec/jit.hpp"

using namespace tailrec;

namespace {

class TrampolineJit : public ::testing::Test {
protected:
    // Expands `src`, lowers it and hands it to a fresh JIT. Returns false with the diagnostics
    // text in `log` when any stage reports an error.
    bool compile(const std::string& src, bool all = false){
        auto ex = expand_tailrec(parse(src), TransformOptions{}, all);
        expanded = ex.module;
        transformDiags = ex.diags;
        log = format_diagnostics(ex.diags);
        if(!ex.diags.success) return false;
        Diagnostics d;
        if(!emitter.emit(ex.module, d)){
            irDiags = d;
            log += format_diagnostics(d);
            return false;
        }
        jit.add_module(emitter.toThreadSafeModule());
        return true;
    }
    template<class Fn> Fn fn(const std::string& name){ return jit.function<Fn>(name); }

    IREmitter emitter;
    JitEngine jit;
    node_ptr expanded;
    Diagnostics transformDiags;
    Diagnostics irDiags;
    std::string log;
};

bool has_code(const std::vector<Error>& es, const std::string& code){
    for(auto& e : es) if(e.code == code) return true;
    return false;
}
bool has_code(const std::vector<Warning>& ws, const std::string& code){
    for(auto& w : ws) if(w.code == code) return true;
    return false;
}

} // namespace

TEST_F(TrampolineJit, ExplicitReturnsRunInConstantStack){
    ASSERT_TRUE(compile(
        "(module (fn :name sum_to :attrs [recursive] :params [(param n Int) (param acc Int)] :ret Int"
        "  :body (block (semi (if (== n 0) (block (semi (return acc)))))"
        "               (semi (return (call sum_to (- n 1) (+ acc n)))))))")) << log;
    auto sum_to = fn<int64_t(*)(int64_t, int64_t)>("sum_to");
    EXPECT_EQ(sum_to(0, 0), 0);
    EXPECT_EQ(sum_to(10, 0), 55);
    EXPECT_EQ(sum_to(100000, 0), 5000050000LL);
}

TEST_F(TrampolineJit, BothBranchesReturnFromLastStatement){
    ASSERT_TRUE(compile(
        "(module (fn :name sum_down :attrs [recursive] :params [(param n Int) (param a Int)] :ret Int"
        "  :body (block (semi (if (== n 0) (block (semi (return a)))"
        "                                  (block (semi (return (call sum_down (- n 1) (+ a n))))))))))")) << log;
    auto inner = kw_value(elems_of(kw_value(elems_of(expanded)[1], "body"))[2], "body");
    // nothing is appended after the if
    EXPECT_EQ(elems_of(inner).size(), 2u);
    auto sum_down = fn<int64_t(*)(int64_t, int64_t)>("sum_down");
    EXPECT_EQ(sum_down(200000, 0), 20000100000LL);
}

TEST_F(TrampolineJit, ImplicitTailThroughElseIf){
    ASSERT_TRUE(compile(
        "(module (fn :name is_even :attrs [recursive] :params [(param n Int)] :ret Bool"
        "  :body (block (if (== n 0) (block true) (if (== n 1) (block false) (block (call is_even (- n 2))))))))")) << log;
    auto is_even = fn<bool(*)(int64_t)>("is_even");
    EXPECT_TRUE(is_even(0));
    EXPECT_TRUE(is_even(10000));
    EXPECT_FALSE(is_even(7));
    EXPECT_FALSE(is_even(999999));
}

TEST_F(TrampolineJit, MatchesUntransformedTwin){
    // gcd_rec is rewritten, gcd_plain is emitted as ordinary recursion
    ASSERT_TRUE(compile(
        "(module"
        "  (fn :name gcd_rec :attrs [recursive] :params [(param a Int) (param b Int)] :ret Int"
        "      :body (block (if (== b 0) (block a) (block (call gcd_rec b (% a b))))))"
        "  (fn :name gcd_plain :params [(param a Int) (param b Int)] :ret Int"
        "      :body (block (if (== b 0) (block a) (block (call gcd_plain b (% a b))))))"
        "  (fn :name sum_rec :attrs [recursive] :params [(param n Int) (param acc Int)] :ret Int"
        "      :body (block (if (== n 0) (block acc) (block (call sum_rec (- n 1) (+ acc n))))))"
        "  (fn :name sum_plain :params [(param n Int) (param acc Int)] :ret Int"
        "      :body (block (if (== n 0) (block acc) (block (call sum_plain (- n 1) (+ acc n)))))))")) << log;
    EXPECT_TRUE(is_trampolined(elems_of(expanded)[1], TransformOptions{}));
    EXPECT_FALSE(is_trampolined(elems_of(expanded)[2], TransformOptions{}));
    auto gcd_rec = fn<int64_t(*)(int64_t, int64_t)>("gcd_rec");
    auto gcd_plain = fn<int64_t(*)(int64_t, int64_t)>("gcd_plain");
    auto sum_rec = fn<int64_t(*)(int64_t, int64_t)>("sum_rec");
    auto sum_plain = fn<int64_t(*)(int64_t, int64_t)>("sum_plain");
    const int64_t pairs[][2] = {{48, 18}, {17, 5}, {0, 9}, {1071, 462}, {1000000007, 998244353}};
    for(auto& p : pairs) EXPECT_EQ(gcd_rec(p[0], p[1]), gcd_plain(p[0], p[1])) << p[0] << "," << p[1];
    for(int64_t n : {0, 1, 2, 50, 1000}) EXPECT_EQ(sum_rec(n, 7), sum_plain(n, 7)) << n;
}

TEST_F(TrampolineJit, NonTailSelfCallKeepsRecursion){
    ASSERT_TRUE(compile(
        "(module"
        "  (fn :name helper :params [(param x Int)] :ret Int :body (block (+ x 1)))"
        "  (fn :name recurse :attrs [recursive] :params [(param n Int)] :ret Int"
        "      :body (block (if (== n 0) (block 0) (block (call helper (call recurse (- n 1))))))))")) << log;
    EXPECT_TRUE(has_code(transformDiags.warnings, "W1101"));
    EXPECT_TRUE(has_code(transformDiags.warnings, "W1102"));
    auto recurse = fn<int64_t(*)(int64_t)>("recurse");
    EXPECT_EQ(recurse(10), 10);
}

TEST_F(TrampolineJit, MatchArmTailCall){
    ASSERT_TRUE(compile(
        "(module (fn :name count :attrs [recursive] :params [(param x Int)] :ret Int"
        "  :body (block (match x (arm 0 1) (arm n (call count (- n 1)))))))")) << log;
    auto count = fn<int64_t(*)(int64_t)>("count");
    EXPECT_EQ(count(0), 1);
    EXPECT_EQ(count(1000000), 1);
}

TEST_F(TrampolineJit, GuardedArms){
    ASSERT_TRUE(compile(
        "(module (fn :name collatz :attrs [recursive] :params [(param n Int) (param steps Int)] :ret Int"
        "  :body (block (match n"
        "    (arm 1 steps)"
        "    (arm m :if (== (% m 2) 0) (call collatz (/ m 2) (+ steps 1)))"
        "    (arm m (call collatz (+ (* 3 m) 1) (+ steps 1)))))))")) << log;
    auto collatz = fn<int64_t(*)(int64_t, int64_t)>("collatz");
    EXPECT_EQ(collatz(1, 0), 0);
    EXPECT_EQ(collatz(6, 0), 8);
    EXPECT_EQ(collatz(27, 0), 111);
}

TEST_F(TrampolineJit, UnitResultFallsThrough){
    ASSERT_TRUE(compile(
        "(module"
        "  (fn :name countdown :attrs [recursive] :params [(param n Int)]"
        "      :body (block (if (> n 0) (block (call countdown (- n 1))))))"
        "  (fn :name run_countdown :params [] :ret Int :body (block (semi (call countdown 100000)) 7)))")) << log;
    auto run = fn<int64_t(*)()>("run_countdown");
    EXPECT_EQ(run(), 7);
}

TEST_F(TrampolineJit, WildcardParameter){
    ASSERT_TRUE(compile(
        "(module (fn :name skip :attrs [recursive] :params [(param _ Int) (param n Int)] :ret Int"
        "  :body (block (if (== n 0) (block 0) (block (call skip 1 (- n 1)))))))")) << log;
    auto skip = fn<int64_t(*)(int64_t, int64_t)>("skip");
    EXPECT_EQ(skip(5, 100000), 0);
}

TEST_F(TrampolineJit, AllFlagRewritesUnattributedFns){
    ASSERT_TRUE(compile(
        "(module (fn :name down :params [(param n Int) (param acc Int)] :ret Int"
        "  :body (block (if (<= n 0) (block acc) (block (call down (- n 1) (+ acc 2)))))))", /*all=*/true)) << log;
    EXPECT_TRUE(is_trampolined(elems_of(expanded)[1], TransformOptions{}));
    auto down = fn<int64_t(*)(int64_t, int64_t)>("down");
    EXPECT_EQ(down(500000, 0), 1000000);
}

TEST_F(TrampolineJit, WrongArityReportedByBackend){
    // the rewrite itself succeeds; the Continue payload does not fit the state tuple
    EXPECT_FALSE(compile(
        "(module (fn :name bad :attrs [recursive] :params [(param n Int) (param m Int)] :ret Int"
        "  :body (block (if (== n 0) (block m) (block (call bad (- n 1)))))))"));
    EXPECT_TRUE(transformDiags.success);
    EXPECT_TRUE(has_code(irDiags.errors, "E2104")) << log;
}

TEST_F(TrampolineJit, UnknownFunctionReported){
    EXPECT_FALSE(compile(
        "(module (fn :name f :attrs [recursive] :params [(param n Int)] :ret Int"
        "  :body (block (if (== n 0) (block (call missing n)) (block (call f (- n 1)))))))"));
    EXPECT_TRUE(has_code(irDiags.errors, "E2101")) << log;
}

TEST_F(TrampolineJit, DivisionAndRemainder){
    ASSERT_TRUE(compile(
        "(module (fn :name quot :params [(param a Int) (param b Int)] :ret Int :body (block (/ a b)))"
        "        (fn :name rem :params [(param a Int) (param b Int)] :ret Int :body (block (% a b))))")) << log;
    auto quot = fn<int64_t(*)(int64_t, int64_t)>("quot");
    auto rem = fn<int64_t(*)(int64_t, int64_t)>("rem");
    EXPECT_EQ(quot(7, 2), 3);
    EXPECT_EQ(quot(-7, 2), -3);
    EXPECT_EQ(rem(-7, 2), -1);
    EXPECT_EQ(quot(INT64_MIN, 1), INT64_MIN);
}

using TrampolineJitDeathTest = TrampolineJit;

TEST_F(TrampolineJitDeathTest, DivisionTrapsInsteadOfOverflowing){
    ASSERT_TRUE(compile(
        "(module (fn :name quot :params [(param a Int) (param b Int)] :ret Int :body (block (/ a b)))"
        "        (fn :name rem :params [(param a Int) (param b Int)] :ret Int :body (block (% a b))))")) << log;
    auto quot = fn<int64_t(*)(int64_t, int64_t)>("quot");
    auto rem = fn<int64_t(*)(int64_t, int64_t)>("rem");
    EXPECT_DEATH(quot(1, 0), "");
    EXPECT_DEATH(rem(1, 0), "");
    EXPECT_DEATH(quot(INT64_MIN, -1), "");
}
