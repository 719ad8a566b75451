#include "tailrec/ir_emitter.hpp"
#include "tailrec/config.hpp"
#include "tailrec/forms.hpp"
#include "tailrec/rewrite.hpp"
#include "tailrec/ir/builder.hpp"
#include "tailrec/ir/control_ops.hpp"
#include "tailrec/ir/pattern_ops.hpp"
#include "tailrec/ir/types.hpp"

#include <llvm/IR/Intrinsics.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <limits>

namespace tailrec {

using namespace tailrec::ir;
using builder::State;

struct IREmitter::Impl {
    std::unique_ptr<llvm::LLVMContext> llctx;
    std::unique_ptr<llvm::Module> module;
    std::unique_ptr<TypeLowering> types;
    std::vector<std::unique_ptr<EnumDef>> enums; // every enum seen, any scope
    std::vector<ItemScope> items;                // innermost last
    Diagnostics diags;
    ErrorReporter rep{&diags};
    Hooks hooks;
    int enum_ids = 0;

    Impl(){
        hooks.expr = [this](State& S, const node_ptr& e, const TypePtr& want){ return expr(S, e, want); };
    }

    void reset(){
        module.reset();
        types.reset();
        llctx = std::make_unique<llvm::LLVMContext>();
        module = std::make_unique<llvm::Module>("tailrec", *llctx);
        types = std::make_unique<TypeLowering>(*llctx);
        hooks.types = types.get();
        enums.clear(); items.clear();
        diags = Diagnostics{};
    }

    void report(const ir_error& e){ rep.error(e.code, e.what(), e.hint, e.at); }

    // RAII push/pop of an item scope
    struct ItemsGuard {
        std::vector<ItemScope>& v;
        explicit ItemsGuard(std::vector<ItemScope>& s) : v(s) { v.emplace_back(); }
        ~ItemsGuard(){ v.pop_back(); }
    };

    const EnumDef* find_enum(const std::string& n) const {
        for(auto it = items.rbegin(); it != items.rend(); ++it)
            if(auto f = it->enums.find(n); f != it->enums.end()) return f->second;
        return nullptr;
    }
    const FnInfo* find_fn(const std::string& n) const {
        for(auto it = items.rbegin(); it != items.rend(); ++it)
            if(auto f = it->fns.find(n); f != it->fns.end()) return &f->second;
        return nullptr;
    }

    TypePtr resolve_type(const node_ptr& t, const EnumDef* generic_ctx = nullptr){
        if(!t) return unit_type();
        if(auto* s = as_symbol(*t)){
            const auto& n = s->name;
            if(n == "Int") return int_type();
            if(n == "Bool") return bool_type();
            if(n == "Unit") return unit_type();
            if(generic_ctx)
                for(size_t i=0;i<generic_ctx->generics.size();++i)
                    if(generic_ctx->generics[i] == n) return param_type((int)i);
            if(auto* d = find_enum(n)){
                if(!d->generics.empty())
                    throw ir_error("E2103", "enum '" + n + "' needs " + std::to_string(d->generics.size()) + " type argument(s)", t);
                return enum_type(d, {});
            }
            throw ir_error("E2103", "unknown type '" + n + "'", t);
        }
        auto h = head_name(t);
        const auto& el = elems_of(t);
        if(h == "tuple"){
            std::vector<TypePtr> parts;
            for(size_t i=1;i<el.size();++i) parts.push_back(resolve_type(el[i], generic_ctx));
            return tuple_type(std::move(parts));
        }
        if(h == "app" && el.size() >= 2){
            auto n = name_of(el[1]);
            auto* d = find_enum(n);
            if(!d) throw ir_error("E2103", "unknown type '" + n + "'", t);
            if(d->generics.size() != el.size() - 2)
                throw ir_error("E2103", "enum '" + n + "' takes " + std::to_string(d->generics.size()) + " type argument(s)", t);
            std::vector<TypePtr> args;
            for(size_t i=2;i<el.size();++i) args.push_back(resolve_type(el[i], generic_ctx));
            return enum_type(d, std::move(args));
        }
        throw ir_error("E2103", "unsupported type " + to_string(t), t);
    }

    // ---- items -----------------------------------------------------------------------

    // Register the enum and fn items among el[start..] in the innermost item scope and return
    // the fns that have bodies. Bodies are emitted afterwards so items may refer to each other.
    std::vector<std::pair<node_ptr, FnInfo>> declare_items(const std::vector<node_ptr>& el, size_t start, const std::string& prefix){
        auto& scope = items.back();
        std::vector<std::pair<EnumDef*, node_ptr>> fresh;
        for(size_t i=start;i<el.size();++i){
            if(!is_form(el[i], "enum")) continue;
            const auto& en = elems_of(el[i]);
            auto d = std::make_unique<EnumDef>();
            d->id = ++enum_ids;
            d->name = en.size() >= 2 ? name_of(en[1]) : std::string();
            d->origin = el[i];
            for(auto& g : elems_of(kw_value(el[i], "generics"))) d->generics.push_back(name_of(g));
            if(d->name.empty()){ rep.error("E2102", "enum item without a name", "", el[i]); continue; }
            scope.enums[d->name] = d.get();
            fresh.emplace_back(d.get(), el[i]);
            enums.push_back(std::move(d));
        }
        for(auto& [d, n] : fresh){
            try {
                for(auto& v : elems_of(kw_value(n, "variants"))){
                    EnumDef::Variant var;
                    if(as_symbol(*v)) var.name = name_of(v);
                    else {
                        const auto& vl = elems_of(v);
                        if(vl.empty()) throw ir_error("E2102", "malformed variant in enum '" + d->name + "'", v);
                        var.name = name_of(vl[0]);
                        for(size_t k=1;k<vl.size();++k) var.fields.push_back(resolve_type(vl[k], d));
                    }
                    d->variants.push_back(std::move(var));
                }
            } catch(const ir_error& e){ report(e); }
        }

        std::vector<std::pair<node_ptr, FnInfo>> fns;
        for(size_t i=start;i<el.size();++i){
            if(!is_form(el[i], "fn")) continue;
            try {
                auto name = name_of(kw_value(el[i], "name"));
                if(name.empty()) throw ir_error("E2102", "fn item without a name", el[i]);
                FnInfo info;
                for(auto& p : elems_of(kw_value(el[i], "params"))){
                    const auto& pl = elems_of(p);
                    if(!is_form(p, "param") || pl.size() != 3) throw ir_error("E2102", "malformed parameter of fn '" + name + "'", p);
                    info.params.push_back(resolve_type(pl[2]));
                }
                info.ret = resolve_type(kw_value(el[i], "ret"));
                std::vector<llvm::Type*> pts;
                for(auto& t : info.params) pts.push_back(types->lower(t));
                auto* fty = llvm::FunctionType::get(types->lower(info.ret), pts, false);
                auto sym = prefix.empty() ? name : prefix + "." + name;
                info.fn = llvm::Function::Create(fty, llvm::Function::ExternalLinkage, sym, *module);
                for(unsigned k=0;k<info.params.size();++k)
                    if(info.params[k]->kind == Type::Kind::Bool) info.fn->addParamAttr(k, llvm::Attribute::ZExt);
                if(info.ret->kind == Type::Kind::Bool) info.fn->addRetAttr(llvm::Attribute::ZExt);
                scope.fns[name] = info;
                if(kw_value(el[i], "body")) fns.emplace_back(el[i], info);
            } catch(const ir_error& e){ report(e); }
        }
        return fns;
    }

    void emit_function(const node_ptr& fn, const FnInfo& info){
        State S(*llctx, info.fn);
        S.fn_name = info.fn->getName().str();
        S.ret = info.ret;
        S.builder.SetInsertPoint(llvm::BasicBlock::Create(*llctx, "entry", info.fn));
        try {
            S.push_scope();
            const auto& params = elems_of(kw_value(fn, "params"));
            unsigned i = 0;
            for(auto& arg : info.fn->args()){
                auto pat = elems_of(params[i])[1];
                if(!pattern_ops::irrefutable(pat)) throw ir_error("E2102", "refutable parameter pattern", pat);
                if(auto* s = as_symbol(*pat)) arg.setName(s->name);
                auto* slot = S.entry_alloca(types->lower(info.params[i]), "arg" + std::to_string(i));
                S.builder.CreateStore(&arg, slot);
                pattern_ops::bind_pattern(S, hooks, pat, slot, info.params[i]);
                ++i;
            }
            auto body = kw_value(fn, "body");
            auto v = expr(S, body, S.ret);
            if(!v.diverged()){
                expect_type(v, S.ret, body, "body of '" + S.fn_name + "'");
                S.builder.CreateRet(v.v);
            }
            // join blocks no path reached
            for(auto& bb : *info.fn)
                if(!bb.getTerminator()){ llvm::IRBuilder<> tb(&bb); tb.CreateUnreachable(); }
        } catch(const ir_error& e){
            report(e);
            info.fn->deleteBody();
        }
    }

    // ---- expressions -----------------------------------------------------------------

    Val expr(State& S, const node_ptr& e, const TypePtr& expected){
        if(!e) throw ir_error("E2102", "missing expression", nullptr);
        auto& B = S.builder;
        if(std::holds_alternative<int64_t>(e->data)) return Val{B.getInt64(std::get<int64_t>(e->data)), int_type()};
        if(std::holds_alternative<bool>(e->data)) return Val{B.getInt1(std::get<bool>(e->data)), bool_type()};
        if(auto* s = as_symbol(*e)){
            if(auto* l = S.lookup(s->name)) return Val{B.CreateLoad(types->lower(l->type), l->slot, s->name), l->type};
            if(s->name.find("::") != std::string::npos) return construct_variant(S, e, s->name, {}, expected);
            throw ir_error("E2100", "unknown variable '" + s->name + "'", e);
        }
        auto h = head_name(e);
        const auto& el = elems_of(e);
        if(h == "block") return block(S, e, expected);
        if(h == "if") return control_ops::emit_if(S, hooks, e, expected);
        if(h == "match") return control_ops::emit_match(S, hooks, e, expected);
        if(h == "loop") return control_ops::emit_loop(S, hooks, e);
        if(h == "while") return control_ops::emit_while(S, hooks, e);
        if(h == "break") return control_ops::emit_break(S, hooks, e);
        if(h == "continue") return control_ops::emit_continue(S, hooks, e);
        if(h == "return") return control_ops::emit_return(S, hooks, e);
        if(h == "call") return call(S, e, expected);
        if(h == "tuple") return tuple(S, e, expected);
        if(h == "assign") return assign(S, e);
        if(h == "&&" || h == "||") return logical(S, e, h == "&&");
        if((h == "not" || h == "neg") && el.size() == 2) return unary(S, e, h);
        if(el.size() == 3 && (h == "+" || h == "-" || h == "*" || h == "/" || h == "%" || h == "==" || h == "!=" ||
                              h == "<" || h == "<=" || h == ">" || h == ">="))
            return binary(S, e, h);
        throw ir_error("E2102", "unsupported form '" + (h.empty() ? to_string(e) : h) + "'", e,
                       h == "method-call" || h == "closure" ? "the LLVM backend lowers free functions only" : "");
    }

    // (block stmt* tail?)
    Val block(State& S, const node_ptr& b, const TypePtr& expected){
        const auto& el = elems_of(b);
        ItemsGuard guard(items);
        auto fns = declare_items(el, 1, S.fn_name);
        for(auto& [fn, info] : fns) emit_function(fn, info);

        bool hasTail = el.size() > 1 && !is_statement(el.back());
        S.push_scope();
        for(size_t i=1;i<el.size();++i){
            const auto& st = el[i];
            if(i == el.size() - 1 && hasTail){
                auto v = expr(S, st, expected);
                S.pop_scope();
                return v;
            }
            auto h = head_name(st);
            if(h == "fn" || h == "enum") continue;
            bool live = true;
            if(h == "let") live = let(S, st);
            else if(h == "semi" && elems_of(st).size() == 2) live = !expr(S, elems_of(st)[1], nullptr).diverged();
            else throw ir_error("E2102", "unsupported statement " + to_string(st), st);
            if(!live){
                S.pop_scope();
                return Val{};
            }
        }
        S.pop_scope();
        return Val{unit_value(hooks), unit_type()};
    }

    // (let pat [:type T] init); false when the initializer diverges
    bool let(State& S, const node_ptr& st){
        const auto& el = elems_of(st);
        if(el.size() != 3 && el.size() != 5) throw ir_error("E2102", "malformed let", st);
        TypePtr declared;
        if(auto* t = find_kw(*as_list(*st), "type", 2)) declared = resolve_type(*t);
        auto v = expr(S, el.back(), declared);
        if(v.diverged()) return false;
        if(declared) expect_type(v, declared, el.back(), "let initializer");
        if(!pattern_ops::irrefutable(el[1])) throw ir_error("E2102", "refutable pattern in let", el[1]);
        auto* slot = S.entry_alloca(types->lower(v.ty), "let.value");
        S.builder.CreateStore(v.v, slot);
        pattern_ops::bind_pattern(S, hooks, el[1], slot, v.ty);
        return true;
    }

    Val tuple(State& S, const node_ptr& e, const TypePtr& expected){
        const auto& el = elems_of(e);
        if(el.size() == 1) return Val{unit_value(hooks), unit_type()};
        bool shaped = expected && expected->kind == Type::Kind::Tuple && expected->args.size() == el.size() - 1;
        std::vector<Val> parts;
        std::vector<TypePtr> tys;
        for(size_t i=1;i<el.size();++i){
            auto v = expr(S, el[i], shaped ? expected->args[i-1] : nullptr);
            if(v.diverged()) return v;
            parts.push_back(v);
            tys.push_back(v.ty);
        }
        auto ty = tuple_type(std::move(tys));
        llvm::Value* agg = llvm::UndefValue::get(types->lower(ty));
        for(unsigned k=0;k<parts.size();++k) agg = S.builder.CreateInsertValue(agg, parts[k].v, {k});
        return Val{agg, ty};
    }

    Val assign(State& S, const node_ptr& e){
        const auto& el = elems_of(e);
        auto* s = el.size() == 3 ? as_symbol(*el[1]) : nullptr;
        if(!s) throw ir_error("E2102", "only local variables can be assigned", e);
        auto* found = S.lookup(s->name);
        if(!found) throw ir_error("E2100", "unknown variable '" + s->name + "'", el[1]);
        Local target = *found;
        auto v = expr(S, el[2], target.type);
        if(v.diverged()) return v;
        expect_type(v, target.type, el[2], "assignment to '" + s->name + "'");
        S.builder.CreateStore(v.v, target.slot);
        return Val{unit_value(hooks), unit_type()};
    }

    Val unary(State& S, const node_ptr& e, const std::string& op){
        auto a = expr(S, elems_of(e)[1], nullptr);
        if(a.diverged()) return a;
        if(op == "neg"){
            expect_type(a, int_type(), e, "operand of unary -");
            return Val{S.builder.CreateNeg(a.v), a.ty};
        }
        if(a.ty->kind != Type::Kind::Int && a.ty->kind != Type::Kind::Bool)
            throw ir_error("E2108", "operand of ! must be Int or Bool, found " + describe(a.ty), e);
        return Val{S.builder.CreateNot(a.v), a.ty};
    }

    Val binary(State& S, const node_ptr& e, const std::string& op){
        auto& B = S.builder;
        const auto& el = elems_of(e);
        auto a = expr(S, el[1], nullptr);
        if(a.diverged()) return a;
        auto b = expr(S, el[2], a.ty);
        if(b.diverged()) return b;
        expect_type(b, a.ty, el[2], "right operand of " + op);
        bool eq = op == "==" || op == "!=";
        if(eq && (a.ty->kind == Type::Kind::Int || a.ty->kind == Type::Kind::Bool))
            return Val{op == "==" ? B.CreateICmpEQ(a.v, b.v) : B.CreateICmpNE(a.v, b.v), bool_type()};
        expect_type(a, int_type(), el[1], "operand of " + op);
        if(op == "+") return Val{B.CreateAdd(a.v, b.v), int_type()};
        if(op == "-") return Val{B.CreateSub(a.v, b.v), int_type()};
        if(op == "*") return Val{B.CreateMul(a.v, b.v), int_type()};
        if(op == "/" || op == "%") return checked_division(S, a, b, op == "/");
        if(op == "<") return Val{B.CreateICmpSLT(a.v, b.v), bool_type()};
        if(op == "<=") return Val{B.CreateICmpSLE(a.v, b.v), bool_type()};
        if(op == ">") return Val{B.CreateICmpSGT(a.v, b.v), bool_type()};
        return Val{B.CreateICmpSGE(a.v, b.v), bool_type()};
    }

    // sdiv/srem guarded: a zero divisor or INT64_MIN / -1 traps.
    Val checked_division(State& S, const Val& a, const Val& b, bool quotient){
        auto& B = S.builder;
        auto* zero = B.CreateICmpEQ(b.v, B.getInt64(0));
        auto* overflow = B.CreateAnd(
            B.CreateICmpEQ(a.v, B.getInt64(static_cast<uint64_t>(std::numeric_limits<int64_t>::min()))),
            B.CreateICmpEQ(b.v, B.getInt64(static_cast<uint64_t>(-1))));
        auto* trapBB = S.block("div.trap");
        auto* okBB = S.block("div.ok");
        B.CreateCondBr(B.CreateOr(zero, overflow), trapBB, okBB);
        B.SetInsertPoint(trapBB);
        B.CreateCall(llvm::Intrinsic::getDeclaration(module.get(), llvm::Intrinsic::trap));
        B.CreateUnreachable();
        B.SetInsertPoint(okBB);
        return Val{quotient ? B.CreateSDiv(a.v, b.v) : B.CreateSRem(a.v, b.v), int_type()};
    }

    // Short-circuit && / ||
    Val logical(State& S, const node_ptr& e, bool isAnd){
        auto& B = S.builder;
        const auto& el = elems_of(e);
        if(el.size() != 3) throw ir_error("E2102", "malformed logical operator", e);
        auto a = expr(S, el[1], bool_type());
        if(a.diverged()) return a;
        expect_type(a, bool_type(), el[1], "operand of logical operator");
        auto* lhsBB = B.GetInsertBlock();
        auto* rhsBB = S.block(isAnd ? "and.rhs" : "or.rhs");
        auto* endBB = S.block(isAnd ? "and.end" : "or.end");
        if(isAnd) B.CreateCondBr(a.v, rhsBB, endBB);
        else B.CreateCondBr(a.v, endBB, rhsBB);
        B.SetInsertPoint(rhsBB);
        auto b = expr(S, el[2], bool_type());
        auto* shortValue = isAnd ? B.getFalse() : B.getTrue();
        if(b.diverged()){
            B.SetInsertPoint(endBB);
            return Val{shortValue, bool_type()};
        }
        expect_type(b, bool_type(), el[2], "operand of logical operator");
        auto* rhsEnd = B.GetInsertBlock();
        B.CreateBr(endBB);
        B.SetInsertPoint(endBB);
        auto* phi = B.CreatePHI(B.getInt1Ty(), 2, isAnd ? "and" : "or");
        phi->addIncoming(shortValue, lhsBB);
        phi->addIncoming(b.v, rhsEnd);
        return Val{phi, bool_type()};
    }

    // (call f args...) or (call Enum::Variant fields...)
    Val call(State& S, const node_ptr& e, const TypePtr& expected){
        const auto& el = elems_of(e);
        if(el.size() < 2 || !as_symbol(*el[1])) throw ir_error("E2102", "callee must be a name", e);
        auto callee = name_of(el[1]);
        std::vector<node_ptr> args(el.begin() + 2, el.end());
        if(auto* found = find_fn(callee)){
            FnInfo f = *found;
            if(args.size() != f.params.size())
                throw ir_error("E2106", "fn '" + callee + "' takes " + std::to_string(f.params.size()) +
                               " argument(s), found " + std::to_string(args.size()), e);
            std::vector<llvm::Value*> av;
            for(size_t i=0;i<args.size();++i){
                auto v = expr(S, args[i], f.params[i]);
                if(v.diverged()) return v;
                expect_type(v, f.params[i], args[i], "argument " + std::to_string(i + 1) + " of '" + callee + "'");
                av.push_back(v.v);
            }
            auto* ci = S.builder.CreateCall(f.fn, av);
            if(f.ret->kind == Type::Kind::Bool) ci->addRetAttr(llvm::Attribute::ZExt);
            return Val{ci, f.ret};
        }
        if(callee.find("::") != std::string::npos) return construct_variant(S, e, callee, args, expected);
        throw ir_error("E2101", "unknown function '" + callee + "'", el[1]);
    }

    // The instantiation comes from the expected type when it names the same enum, otherwise
    // it is inferred from the payload.
    Val construct_variant(State& S, const node_ptr& at, const std::string& path, const std::vector<node_ptr>& args, const TypePtr& expected){
        std::string en, vn;
        if(!split_path(path, en, vn)) throw ir_error("E2109", "malformed variant path '" + path + "'", at);
        auto* def = find_enum(en);
        if(!def) throw ir_error("E2109", "unknown enum '" + en + "'", at);
        int vi = def->variant_index(vn);
        if(vi < 0) throw ir_error("E2109", "enum '" + en + "' has no variant '" + vn + "'", at);
        const auto& fields = def->variants[vi].fields;
        if(args.size() != fields.size())
            throw ir_error("E2104", path + " takes " + std::to_string(fields.size()) + " field(s), found " + std::to_string(args.size()), at);

        TypePtr ty = (expected && expected->kind == Type::Kind::Enum && expected->def == def) ? expected : nullptr;
        std::vector<TypePtr> bound(def->generics.size());
        std::vector<llvm::Value*> vals;
        for(size_t k=0;k<args.size();++k){
            TypePtr want = ty ? substitute(fields[k], ty->args) : (has_params(fields[k]) ? nullptr : fields[k]);
            auto v = expr(S, args[k], want);
            if(v.diverged()) return v;
            if(want ? !same_type(v.ty, want) : !unify(fields[k], v.ty, bound))
                throw ir_error("E2104", "payload of " + path + " does not match: found " + describe(v.ty) +
                               (want ? ", expected " + describe(want) : std::string()), args[k],
                               "a self-call must pass one argument per parameter, in order");
            vals.push_back(v.v);
        }
        if(!ty){
            for(auto& b : bound)
                if(!b) throw ir_error("E2105", "cannot infer the type arguments of '" + en + "' from " + path, at,
                                      "add a type annotation or use it where the enum type is known");
            ty = enum_type(def, bound);
        }
        auto& B = S.builder;
        llvm::Value* agg = llvm::UndefValue::get(types->lower(ty));
        agg = B.CreateInsertValue(agg, B.getInt32(vi), {0u});
        for(size_t k=0;k<vals.size();++k) agg = B.CreateInsertValue(agg, vals[k], {types->field_index(ty, vi, k)});
        return Val{agg, ty};
    }
};

IREmitter::IREmitter() : impl_(std::make_unique<Impl>()) {}
IREmitter::~IREmitter() = default;

llvm::Module* IREmitter::emit(const node_ptr& module_ast, Diagnostics& diags){
    auto& I = *impl_;
    I.reset();
    std::vector<node_ptr> top;
    if(is_form(module_ast, "module")){
        const auto& el = elems_of(module_ast);
        top.assign(el.begin() + 1, el.end());
    } else if(is_form(module_ast, "fn")){
        top.push_back(module_ast);
    } else {
        I.rep.error("E2102", "expected (module ...) or (fn ...)", "", module_ast);
    }
    {
        Impl::ItemsGuard guard(I.items);
        auto fns = I.declare_items(top, 0, "");
        for(auto& [fn, info] : fns) I.emit_function(fn, info);
    }
    if(I.diags.success){
        std::string err;
        llvm::raw_string_ostream os(err);
        if(llvm::verifyModule(*I.module, &os)){
            os.flush();
            I.rep.error("E2110", "LLVM verifier rejected the module", err, nullptr);
        }
    }
    if(env_flag_enabled("TAILREC_DUMP_IR") && I.module) I.module->print(llvm::errs(), nullptr);
    merge(diags, I.diags);
    return I.diags.success ? I.module.get() : nullptr;
}

llvm::orc::ThreadSafeModule IREmitter::toThreadSafeModule(){
    return llvm::orc::ThreadSafeModule(std::move(impl_->module), std::move(impl_->llctx));
}

std::string IREmitter::ir_text() const {
    std::string s;
    if(!impl_->module) return s;
    llvm::raw_string_ostream os(s);
    impl_->module->print(os, nullptr);
    os.flush();
    return s;
}

} // namespace tailrec
