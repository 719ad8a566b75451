// forms.hpp - accessors and constructors for the function-language forms carried in EDN
#pragma once
#include "tailrec/edn.hpp"
#include <string>
#include <vector>

namespace tailrec {

// Head symbol name of a list form, or "" for anything else.
inline std::string head_name(const node& n){
    auto* l = as_list(n);
    if(!l || l->elems.empty() || !l->elems[0]) return {};
    auto* s = as_symbol(*l->elems[0]);
    return s ? s->name : std::string();
}
inline std::string head_name(const node_ptr& n){ return n ? head_name(*n) : std::string(); }
inline bool is_form(const node_ptr& n, const char* head){ return n && head_name(*n) == head; }

// Symbol or string payload; "" otherwise.
inline std::string name_of(const node_ptr& n){
    if(!n) return {};
    if(std::holds_alternative<symbol>(n->data)) return std::get<symbol>(n->data).name;
    if(std::holds_alternative<std::string>(n->data)) return std::get<std::string>(n->data);
    return {};
}

// Keyword argument lookup in (head :k v :k2 v2 ...). Scans pairs from `start`; returns the
// value slot so callers can replace it in place, or nullptr when absent.
inline node_ptr* find_kw(list& l, const std::string& kw, size_t start = 1){
    for(size_t i=start; i+1<l.elems.size(); ++i){
        if(l.elems[i] && std::holds_alternative<keyword>(l.elems[i]->data) && std::get<keyword>(l.elems[i]->data).name == kw)
            return &l.elems[i+1];
    }
    return nullptr;
}
inline const node_ptr* find_kw(const list& l, const std::string& kw, size_t start = 1){
    return find_kw(const_cast<list&>(l), kw, start);
}
inline node_ptr kw_value(const node_ptr& form, const std::string& kw){
    auto* l = form ? as_list(*form) : nullptr;
    if(!l) return nullptr;
    auto* slot = find_kw(*l, kw);
    return slot ? *slot : nullptr;
}

// Elements of a list or vector node; empty for other nodes.
inline const std::vector<node_ptr>& elems_of(const node_ptr& n){
    static const std::vector<node_ptr> none;
    if(!n) return none;
    if(auto* l = as_list(*n)) return l->elems;
    if(auto* v = as_vector(*n)) return v->elems;
    return none;
}

inline node_ptr form(const char* head, std::vector<node_ptr> rest){
    list l; l.elems.reserve(rest.size()+1);
    l.elems.push_back(n_sym(head));
    for(auto& r : rest) l.elems.push_back(std::move(r));
    return detail::make_node(std::move(l));
}

// Unit value and unit type share the empty tuple form.
inline node_ptr unit_form(){ return form("tuple", {}); }
inline bool is_unit_type(const node_ptr& t){
    if(!t) return true;
    if(name_of(t) == "Unit") return true;
    return is_form(t, "tuple") && as_list(*t)->elems.size() == 1;
}

// Enum::Variant path helpers
inline std::string join_path(const std::string& a, const std::string& b){ return a + "::" + b; }
inline bool split_path(const std::string& path, std::string& prefix, std::string& last){
    auto pos = path.rfind("::");
    if(pos == std::string::npos) return false;
    prefix = path.substr(0, pos); last = path.substr(pos+2);
    return !prefix.empty() && !last.empty();
}

// ---- Opaque marker -------------------------------------------------------------------
// A node carrying this metadata key has already been finalized by the rewriter.
inline constexpr const char* kOpaqueMeta = "opaque";
inline void mark_opaque(node& n){ n.metadata[kOpaqueMeta] = n_bool(true); }
inline bool is_opaque(const node& n){
    auto it = n.metadata.find(kOpaqueMeta);
    return it != n.metadata.end() && it->second && std::holds_alternative<bool>(it->second->data) && std::get<bool>(it->second->data);
}

} // namespace tailrec
