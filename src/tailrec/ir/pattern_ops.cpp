#include "tailrec/ir/pattern_ops.hpp"
#include "tailrec/forms.hpp"

namespace tailrec::ir::pattern_ops {

static bool is_path(const node_ptr& p){
    auto* s = as_symbol(*p);
    return s && s->name.find("::") != std::string::npos;
}

// Variant index and sub-patterns of (ctor E::V p*) or a bare E::V path.
static int variant_of(Hooks& H, const node_ptr& pat, const TypePtr& ty, std::vector<node_ptr>& subs){
    std::string path;
    if(is_path(pat)) path = as_symbol(*pat)->name;
    else {
        const auto& el = elems_of(pat);
        if(el.size() < 2) throw ir_error("E2102", "malformed ctor pattern", pat);
        path = name_of(el[1]);
        subs.assign(el.begin() + 2, el.end());
    }
    if(ty->kind != Type::Kind::Enum)
        throw ir_error("E2108", "pattern " + path + " cannot match a value of type " + describe(ty), pat);
    std::string en, vn;
    if(!split_path(path, en, vn) || en != ty->def->name)
        throw ir_error("E2108", "pattern " + path + " cannot match a value of type " + describe(ty), pat);
    int vi = ty->def->variant_index(vn);
    if(vi < 0) throw ir_error("E2109", "enum '" + en + "' has no variant '" + vn + "'", pat);
    if(subs.size() != H.types->variant_fields(ty, vi).size())
        throw ir_error("E2104", "pattern " + path + " has " + std::to_string(subs.size()) + " field(s), variant has " +
                       std::to_string(H.types->variant_fields(ty, vi).size()), pat);
    return vi;
}

llvm::Value* test(builder::State& S, Hooks& H, const node_ptr& pat, llvm::Value* slot, const TypePtr& ty){
    auto& B = S.builder;
    if(std::holds_alternative<int64_t>(pat->data)){
        if(ty->kind != Type::Kind::Int) throw ir_error("E2108", "integer pattern against " + describe(ty), pat);
        auto* v = B.CreateLoad(H.types->lower(ty), slot);
        return B.CreateICmpEQ(v, B.getInt64(std::get<int64_t>(pat->data)));
    }
    if(std::holds_alternative<bool>(pat->data)){
        if(ty->kind != Type::Kind::Bool) throw ir_error("E2108", "boolean pattern against " + describe(ty), pat);
        auto* v = B.CreateLoad(H.types->lower(ty), slot);
        return B.CreateICmpEQ(v, B.getInt1(std::get<bool>(pat->data)));
    }
    if(as_symbol(*pat) && !is_path(pat)) return B.getTrue();
    auto h = head_name(pat);
    if(h == "mut") return B.getTrue();
    if(h == "tuple"){
        const auto& el = elems_of(pat);
        if(ty->kind != Type::Kind::Tuple || ty->args.size() != el.size() - 1)
            throw ir_error("E2108", "tuple pattern of " + std::to_string(el.size() - 1) + " element(s) against " + describe(ty), pat);
        auto* st = H.types->lower(ty);
        llvm::Value* acc = B.getTrue();
        for(size_t i = 1; i < el.size(); ++i){
            auto* fp = B.CreateStructGEP(st, slot, (unsigned)(i - 1));
            acc = B.CreateAnd(acc, test(S, H, el[i], fp, ty->args[i - 1]));
        }
        return acc;
    }
    if(h == "ctor" || is_path(pat)){
        std::vector<node_ptr> subs;
        int vi = variant_of(H, pat, ty, subs);
        auto* st = H.types->lower(ty);
        auto* tag = B.CreateLoad(B.getInt32Ty(), B.CreateStructGEP(st, slot, 0), "tag");
        llvm::Value* acc = B.CreateICmpEQ(tag, B.getInt32(vi));
        const auto fields = H.types->variant_fields(ty, vi);
        for(size_t k = 0; k < subs.size(); ++k){
            auto* fp = B.CreateStructGEP(st, slot, H.types->field_index(ty, vi, k));
            acc = B.CreateAnd(acc, test(S, H, subs[k], fp, fields[k]));
        }
        return acc;
    }
    throw ir_error("E2102", "unsupported pattern " + to_string(pat), pat);
}

void bind_pattern(builder::State& S, Hooks& H, const node_ptr& pat, llvm::Value* slot, const TypePtr& ty){
    auto& B = S.builder;
    if(auto* s = as_symbol(*pat); s && !is_path(pat)){
        if(s->name == "_") return;
        auto* lt = H.types->lower(ty);
        auto* a = S.entry_alloca(lt, s->name);
        B.CreateStore(B.CreateLoad(lt, slot), a);
        S.bind(s->name, Local{a, ty});
        return;
    }
    auto h = head_name(pat);
    const auto& el = elems_of(pat);
    if(h == "mut" && el.size() == 2){ bind_pattern(S, H, el[1], slot, ty); return; }
    if(h == "tuple"){
        auto* st = H.types->lower(ty);
        for(size_t i = 1; i < el.size(); ++i)
            bind_pattern(S, H, el[i], B.CreateStructGEP(st, slot, (unsigned)(i - 1)), ty->args[i - 1]);
        return;
    }
    if(h == "ctor" || is_path(pat)){
        std::vector<node_ptr> subs;
        int vi = variant_of(H, pat, ty, subs);
        auto* st = H.types->lower(ty);
        const auto fields = H.types->variant_fields(ty, vi);
        for(size_t k = 0; k < subs.size(); ++k)
            bind_pattern(S, H, subs[k], B.CreateStructGEP(st, slot, H.types->field_index(ty, vi, k)), fields[k]);
    }
}

bool irrefutable(const node_ptr& pat){
    if(!pat) return false;
    if(as_symbol(*pat)) return !is_path(pat);
    auto h = head_name(pat);
    const auto& el = elems_of(pat);
    if(h == "mut") return el.size() == 2 && irrefutable(el[1]);
    if(h == "tuple"){
        for(size_t i = 1; i < el.size(); ++i) if(!irrefutable(el[i])) return false;
        return true;
    }
    return false;
}

} // namespace tailrec::ir::pattern_ops
