#include "tailrec/ir/control_ops.hpp"
#include "tailrec/ir/pattern_ops.hpp"
#include "tailrec/forms.hpp"

namespace tailrec::ir::control_ops {

Val merge_values(builder::State& S, Hooks& H, llvm::BasicBlock* merge,
                 const std::vector<std::pair<Val, llvm::BasicBlock*>>& in, const node_ptr& at){
    if(in.empty()){
        merge->eraseFromParent();
        return Val{};
    }
    TypePtr ty = in.front().first.ty;
    for(auto& [v, bb] : in) expect_type(v, ty, at, "branch types differ");
    S.builder.SetInsertPoint(merge);
    if(is_unit(ty)) return Val{unit_value(H), ty};
    if(in.size() == 1) return Val{in.front().first.v, ty};
    auto* phi = S.builder.CreatePHI(H.types->lower(ty), (unsigned)in.size(), "merge");
    for(auto& [v, bb] : in) phi->addIncoming(v.v, bb);
    return Val{phi, ty};
}

// (if c then [else])
Val emit_if(builder::State& S, Hooks& H, const node_ptr& e, const TypePtr& expected){
    auto& B = S.builder;
    const auto& el = elems_of(e);
    if(el.size() < 3 || el.size() > 4) throw ir_error("E2102", "malformed if", e);
    bool hasElse = el.size() == 4;
    auto c = H.expr(S, el[1], bool_type());
    if(c.diverged()) return c;
    expect_type(c, bool_type(), el[1], "if condition");

    auto* thenBB = S.block("if.then");
    auto* elseBB = S.block("if.else");
    auto* endBB = S.block("if.end");
    B.CreateCondBr(c.v, thenBB, elseBB);

    std::vector<std::pair<Val, llvm::BasicBlock*>> in;
    B.SetInsertPoint(thenBB);
    auto tv = H.expr(S, el[2], hasElse ? expected : unit_type());
    if(!tv.diverged()){
        if(!hasElse) expect_type(tv, unit_type(), el[2], "if without else");
        in.emplace_back(tv, B.GetInsertBlock());
        B.CreateBr(endBB);
    }
    B.SetInsertPoint(elseBB);
    Val ev{unit_value(H), unit_type()};
    if(hasElse) ev = H.expr(S, el[3], expected);
    if(!ev.diverged()){
        in.emplace_back(ev, B.GetInsertBlock());
        B.CreateBr(endBB);
    }
    return merge_values(S, H, endBB, in, e);
}

// (match scrutinee (arm pat [:if guard] body)*): arms are tested in order; no match is unreachable.
Val emit_match(builder::State& S, Hooks& H, const node_ptr& e, const TypePtr& expected){
    auto& B = S.builder;
    const auto& el = elems_of(e);
    if(el.size() < 2) throw ir_error("E2102", "malformed match", e);
    auto scr = H.expr(S, el[1], nullptr);
    if(scr.diverged()) return scr;
    auto* slot = S.entry_alloca(H.types->lower(scr.ty), "match.scrut");
    B.CreateStore(scr.v, slot);

    auto* endBB = S.block("match.end");
    std::vector<std::pair<Val, llvm::BasicBlock*>> in;
    for(size_t i = 2; i < el.size(); ++i){
        const auto& arm = elems_of(el[i]);
        if(!is_form(el[i], "arm") || arm.size() < 3) throw ir_error("E2102", "malformed match arm", el[i]);
        auto* guard = find_kw(*as_list(*el[i]), "if", 2);
        auto* bodyBB = S.block("match.arm");
        auto* nextBB = S.block("match.next");
        B.CreateCondBr(pattern_ops::test(S, H, arm[1], slot, scr.ty), bodyBB, nextBB);

        B.SetInsertPoint(bodyBB);
        S.push_scope();
        pattern_ops::bind_pattern(S, H, arm[1], slot, scr.ty);
        bool live = true;
        if(guard){
            auto g = H.expr(S, *guard, bool_type());
            if(g.diverged()) live = false;
            else {
                expect_type(g, bool_type(), *guard, "match guard");
                auto* takeBB = S.block("match.guarded");
                B.CreateCondBr(g.v, takeBB, nextBB);
                B.SetInsertPoint(takeBB);
            }
        }
        if(live){
            auto v = H.expr(S, arm.back(), expected);
            if(!v.diverged()){
                in.emplace_back(v, B.GetInsertBlock());
                B.CreateBr(endBB);
            }
        }
        S.pop_scope();
        B.SetInsertPoint(nextBB);
    }
    B.CreateUnreachable();
    return merge_values(S, H, endBB, in, e);
}

// (loop body): diverges unless some break leaves it.
Val emit_loop(builder::State& S, Hooks& H, const node_ptr& e){
    auto& B = S.builder;
    const auto& el = elems_of(e);
    if(el.size() != 2) throw ir_error("E2102", "malformed loop", e);
    auto* bodyBB = S.block("loop.body");
    auto* exitBB = S.block("loop.exit");
    B.CreateBr(bodyBB);
    B.SetInsertPoint(bodyBB);
    S.loops.push_back(LoopTarget{exitBB, bodyBB, true});
    auto v = H.expr(S, el[1], unit_type());
    if(!v.diverged()) B.CreateBr(bodyBB);
    LoopTarget lt = S.loops.back();
    S.loops.pop_back();
    if(!lt.broken){
        exitBB->eraseFromParent();
        return Val{};
    }
    B.SetInsertPoint(exitBB);
    if(lt.result) return Val{B.CreateLoad(H.types->lower(lt.result_ty), lt.result, "loop.value"), lt.result_ty};
    return Val{unit_value(H), unit_type()};
}

// (while cond body)
Val emit_while(builder::State& S, Hooks& H, const node_ptr& e){
    auto& B = S.builder;
    const auto& el = elems_of(e);
    if(el.size() != 3) throw ir_error("E2102", "malformed while", e);
    auto* condBB = S.block("while.cond");
    auto* bodyBB = S.block("while.body");
    auto* exitBB = S.block("while.exit");
    B.CreateBr(condBB);
    B.SetInsertPoint(condBB);
    auto c = H.expr(S, el[1], bool_type());
    if(c.diverged()){
        bodyBB->eraseFromParent();
        exitBB->eraseFromParent();
        return c;
    }
    expect_type(c, bool_type(), el[1], "while condition");
    B.CreateCondBr(c.v, bodyBB, exitBB);
    B.SetInsertPoint(bodyBB);
    S.loops.push_back(LoopTarget{exitBB, condBB, false});
    auto v = H.expr(S, el[2], unit_type());
    if(!v.diverged()) B.CreateBr(condBB);
    S.loops.pop_back();
    B.SetInsertPoint(exitBB);
    return Val{unit_value(H), unit_type()};
}

Val emit_break(builder::State& S, Hooks& H, const node_ptr& e){
    auto& B = S.builder;
    const auto& el = elems_of(e);
    if(S.loops.empty()) throw ir_error("E2107", "break outside of a loop", e);
    Val v{unit_value(H), unit_type()};
    if(el.size() >= 2){
        v = H.expr(S, el[1], S.loops.back().result_ty);
        if(v.diverged()) return v;
    }
    // looked up after the operand: nested loops inside it may have grown the stack
    auto& lt = S.loops.back();
    if(el.size() >= 2 && !lt.value_loop) throw ir_error("E2102", "break with a value outside of `loop`", e);
    if(lt.result_ty) expect_type(v, lt.result_ty, e, "break value");
    else {
        lt.result_ty = v.ty;
        if(!is_unit(v.ty)) lt.result = S.entry_alloca(H.types->lower(v.ty), "loop.result");
    }
    if(lt.result) B.CreateStore(v.v, lt.result);
    lt.broken = true;
    B.CreateBr(lt.exit);
    return Val{};
}

Val emit_continue(builder::State& S, Hooks&, const node_ptr& e){
    if(S.loops.empty()) throw ir_error("E2107", "continue outside of a loop", e);
    S.builder.CreateBr(S.loops.back().next);
    return Val{};
}

Val emit_return(builder::State& S, Hooks& H, const node_ptr& e){
    const auto& el = elems_of(e);
    Val v{unit_value(H), unit_type()};
    if(el.size() >= 2){
        v = H.expr(S, el[1], S.ret);
        if(v.diverged()) return v;
    }
    expect_type(v, S.ret, e, "return value of '" + S.fn_name + "'");
    S.builder.CreateRet(v.v);
    return Val{};
}

} // namespace tailrec::ir::control_ops
