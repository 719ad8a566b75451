#include "tailrec/ir/types.hpp"

namespace tailrec::ir {

static TypePtr make(Type::Kind k, std::vector<TypePtr> args = {}, const EnumDef* def = nullptr, int index = -1){
    auto t = std::make_shared<Type>();
    t->kind = k; t->args = std::move(args); t->def = def; t->index = index;
    return t;
}

TypePtr int_type(){ static const TypePtr t = make(Type::Kind::Int); return t; }
TypePtr bool_type(){ static const TypePtr t = make(Type::Kind::Bool); return t; }
TypePtr unit_type(){ static const TypePtr t = make(Type::Kind::Tuple); return t; }
TypePtr tuple_type(std::vector<TypePtr> elems){ return elems.empty() ? unit_type() : make(Type::Kind::Tuple, std::move(elems)); }
TypePtr enum_type(const EnumDef* def, std::vector<TypePtr> args){ return make(Type::Kind::Enum, std::move(args), def); }
TypePtr param_type(int index){ return make(Type::Kind::Param, {}, nullptr, index); }

bool same_type(const TypePtr& a, const TypePtr& b){
    if(a == b) return true;
    if(!a || !b || a->kind != b->kind) return false;
    if(a->kind == Type::Kind::Enum && a->def != b->def) return false;
    if(a->kind == Type::Kind::Param) return a->index == b->index;
    if(a->args.size() != b->args.size()) return false;
    for(size_t i=0;i<a->args.size();++i) if(!same_type(a->args[i], b->args[i])) return false;
    return true;
}

bool has_params(const TypePtr& t){
    if(!t) return false;
    if(t->kind == Type::Kind::Param) return true;
    for(auto& a : t->args) if(has_params(a)) return true;
    return false;
}

std::string describe(const TypePtr& t){
    if(!t) return "!";
    switch(t->kind){
    case Type::Kind::Int: return "Int";
    case Type::Kind::Bool: return "Bool";
    case Type::Kind::Param: return "$" + std::to_string(t->index);
    case Type::Kind::Tuple: {
        std::string s = "(";
        for(size_t i=0;i<t->args.size();++i){ if(i) s += ", "; s += describe(t->args[i]); }
        if(t->args.size() == 1) s += ",";
        return s + ")";
    }
    case Type::Kind::Enum: {
        std::string s = t->def ? t->def->name : std::string("?");
        if(t->args.empty()) return s;
        s += "<";
        for(size_t i=0;i<t->args.size();++i){ if(i) s += ", "; s += describe(t->args[i]); }
        return s + ">";
    }
    }
    return "?";
}

TypePtr substitute(const TypePtr& t, const std::vector<TypePtr>& args){
    if(!t) return t;
    if(t->kind == Type::Kind::Param) return (t->index >= 0 && (size_t)t->index < args.size()) ? args[t->index] : t;
    if(t->args.empty()) return t;
    std::vector<TypePtr> out;
    for(auto& a : t->args) out.push_back(substitute(a, args));
    if(t->kind == Type::Kind::Tuple) return tuple_type(std::move(out));
    return enum_type(t->def, std::move(out));
}

bool unify(const TypePtr& templ, const TypePtr& concrete, std::vector<TypePtr>& bound){
    if(!templ || !concrete) return false;
    if(templ->kind == Type::Kind::Param){
        auto& slot = bound.at(templ->index);
        if(!slot){ slot = concrete; return true; }
        return same_type(slot, concrete);
    }
    if(templ->kind != concrete->kind) return false;
    if(templ->kind == Type::Kind::Enum && templ->def != concrete->def) return false;
    if(templ->args.size() != concrete->args.size()) return false;
    for(size_t i=0;i<templ->args.size();++i)
        if(!unify(templ->args[i], concrete->args[i], bound)) return false;
    return true;
}

std::string TypeLowering::key(const TypePtr& t){
    switch(t->kind){
    case Type::Kind::Int: return "i";
    case Type::Kind::Bool: return "b";
    case Type::Kind::Param: return "$" + std::to_string(t->index);
    case Type::Kind::Tuple: {
        std::string s = "(";
        for(auto& a : t->args) s += key(a) + ",";
        return s + ")";
    }
    case Type::Kind::Enum: {
        std::string s = "E" + std::to_string(t->def->id) + "<";
        for(auto& a : t->args) s += key(a) + ",";
        return s + ">";
    }
    }
    return "?";
}

llvm::Type* TypeLowering::lower(const TypePtr& t){
    switch(t->kind){
    case Type::Kind::Int: return llvm::Type::getInt64Ty(ctx_);
    case Type::Kind::Bool: return llvm::Type::getInt1Ty(ctx_);
    case Type::Kind::Tuple: {
        std::vector<llvm::Type*> elems;
        for(auto& a : t->args) elems.push_back(lower(a));
        return llvm::StructType::get(ctx_, elems);
    }
    case Type::Kind::Enum: return layout(t).st;
    case Type::Kind::Param: break;
    }
    throw ir_error("E2103", "generic parameter used outside of its enum", nullptr);
}

TypeLowering::EnumLayout& TypeLowering::layout(const TypePtr& t){
    auto k = key(t);
    if(auto it = enums_.find(k); it != enums_.end()) return it->second;
    if(in_progress_.count(k))
        throw ir_error("E2103", "enum " + describe(t) + " contains itself", t->def->origin, "recursive enums are not supported");
    in_progress_.insert(k);
    EnumLayout L;
    std::vector<llvm::Type*> elems{ llvm::Type::getInt32Ty(ctx_) };
    for(auto& v : t->def->variants){
        L.first.push_back((unsigned)elems.size());
        std::vector<TypePtr> fields;
        for(auto& f : v.fields){
            auto ft = substitute(f, t->args);
            elems.push_back(lower(ft));
            fields.push_back(ft);
        }
        L.fields.push_back(std::move(fields));
    }
    L.st = llvm::StructType::create(ctx_, elems, "enum." + describe(t));
    in_progress_.erase(k);
    return enums_[k] = std::move(L);
}

const std::vector<TypePtr>& TypeLowering::variant_fields(const TypePtr& enum_ty, int variant){
    return layout(enum_ty).fields.at(variant);
}

unsigned TypeLowering::field_index(const TypePtr& enum_ty, int variant, size_t k){
    return layout(enum_ty).first.at(variant) + (unsigned)k;
}

} // namespace tailrec::ir
