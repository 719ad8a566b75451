#include "tailrec/signature.hpp"
#include "tailrec/forms.hpp"

namespace tailrec {

static bool is_binding_symbol(const node_ptr& p){
    auto* s = p ? as_symbol(*p) : nullptr;
    return s && s->name != "_" && s->name.find("::") == std::string::npos;
}

bool extract_signature(const node_ptr& fn_form, FunctionSignature& out, ErrorReporter& rep){
    if(!is_form(fn_form, "fn")){
        rep.error("E1000", "expected a (fn ...) form", "pass a single function definition", fn_form);
        return false;
    }
    out = FunctionSignature{};
    out.origin = fn_form;
    auto nameNode = kw_value(fn_form, "name");
    out.name = name_of(nameNode);
    if(out.name.empty()){
        rep.error("E1001", "fn missing :name", "add :name <symbol>", fn_form);
        return false;
    }
    auto body = kw_value(fn_form, "body");
    if(!body){
        rep.error("E1002", "fn '"+out.name+"' has no :body", "declaration-only signatures cannot be transformed", fn_form);
        return false;
    }
    if(!is_form(body, "block")){
        rep.error("E1005", "fn '"+out.name+"' :body must be a (block ...) form", "wrap the body in (block ...)", body);
        return false;
    }
    bool ok = true;
    if(auto params = kw_value(fn_form, "params")){
        if(!is_vector(*params)){
            rep.error("E1003", "fn '"+out.name+"' :params must be a vector", "use :params [ (param <pat> <type>) ... ]", params);
            return false;
        }
        for(auto& p : as_vector(*params)->elems){
            const auto& pl = elems_of(p);
            if(!is_form(p, "param") || pl.size() != 3 || !pl[1] || !pl[2]){
                rep.error("E1004", "malformed parameter in fn '"+out.name+"'", "expected (param <pattern> <type>)", p);
                ok = false;
                continue;
            }
            out.params.push_back(Param{clone(pl[1]), clone(pl[2])});
        }
    }
    if(auto ret = kw_value(fn_form, "ret")) out.ret = clone(ret);
    return ok;
}

std::vector<node_ptr> input_patterns(const FunctionSignature& sig){
    std::vector<node_ptr> out; out.reserve(sig.params.size());
    for(auto& p : sig.params) out.push_back(clone(p.pattern));
    return out;
}

std::vector<node_ptr> input_types(const FunctionSignature& sig){
    std::vector<node_ptr> out; out.reserve(sig.params.size());
    for(auto& p : sig.params) out.push_back(clone(p.type));
    return out;
}

node_ptr return_type(const FunctionSignature& sig){
    return sig.ret ? clone(sig.ret) : unit_form();
}

node_ptr state_type(const FunctionSignature& sig){
    return form("tuple", input_types(sig));
}

static void collect_names(const node_ptr& p, std::vector<std::string>& out){
    if(!p) return;
    if(is_binding_symbol(p)){ out.push_back(as_symbol(*p)->name); return; }
    auto h = head_name(p);
    if(h == "mut" || h == "tuple" || h == "ctor"){
        const auto& el = elems_of(p);
        // ctor carries its path in slot 1
        for(size_t i = (h=="ctor") ? 2 : 1; i<el.size(); ++i) collect_names(el[i], out);
    }
}

std::vector<std::string> bound_names(const node_ptr& pattern){
    std::vector<std::string> out;
    collect_names(pattern, out);
    return out;
}

node_ptr pattern_to_expr(const node_ptr& pattern){
    if(is_binding_symbol(pattern)) return n_sym(as_symbol(*pattern)->name);
    auto h = head_name(pattern);
    const auto& el = elems_of(pattern);
    if(h == "mut" && el.size() == 2) return pattern_to_expr(el[1]);
    if(h == "tuple"){
        std::vector<node_ptr> parts;
        for(size_t i=1;i<el.size();++i){
            auto e = pattern_to_expr(el[i]);
            if(!e) return nullptr;
            parts.push_back(e);
        }
        return form("tuple", std::move(parts));
    }
    return nullptr;
}

node_ptr name_wildcards(const node_ptr& pattern, int& counter){
    if(!pattern) return nullptr;
    if(auto* s = as_symbol(*pattern); s && s->name == "_") return n_sym("__arg" + std::to_string(counter++));
    auto h = head_name(pattern);
    if(h == "mut" || h == "tuple"){
        auto out = clone(pattern);
        auto& el = as_list(*out)->elems;
        for(size_t i=1;i<el.size();++i) el[i] = name_wildcards(el[i], counter);
        return out;
    }
    return clone(pattern);
}

} // namespace tailrec
