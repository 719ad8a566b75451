#pragma once
#include "tailrec/edn.hpp"
#include <unordered_map>
#include <functional>
#include <optional>

namespace tailrec {

// Generic two-phase tree walker:
// 1. Macro expansion (head symbol -> macro function) rewriting list forms.
// 2. Visiting the expanded tree (head symbol -> visitor) for analysis.
//
// Macros: signature std::optional<node_ptr>(const node_ptr& form)
//   Return std::nullopt if not applicable. A returned form is expanded again, so a macro must
//   eventually decline its own output (the tail-recursion macro declines trampolined fns).
// Visitors: invoked on each list whose head symbol has a registered visitor. A visitor returns
//   false to stop the walk from descending into that form.
class Transformer {
public:
    using MacroFn = std::function<std::optional<node_ptr>(const node_ptr&)>;
    using ListVisitorFn = std::function<bool(node&, list&, const symbol& head)>;

    Transformer& add_macro(std::string name, MacroFn fn) {
        macros_[std::move(name)] = std::move(fn); return *this;
    }
    Transformer& add_visitor(std::string name, ListVisitorFn fn) {
        visitors_[std::move(name)] = std::move(fn); return *this;
    }

    // Expand macros (returns an expanded deep copy, input untouched)
    node_ptr expand(const node_ptr& n){ return expand_impl(n); }

    // Traverse without expansion
    void traverse(const node_ptr& n){ traverse_impl(n); }

private:
    std::unordered_map<std::string, MacroFn> macros_;
    std::unordered_map<std::string, ListVisitorFn> visitors_;

    node_ptr expand_impl(const node_ptr& n){
        if(!n) return n;
        if(std::holds_alternative<vector_t>(n->data)){
            auto copy = std::make_shared<node>(); copy->metadata = n->metadata;
            vector_t v; for(auto& c : std::get<vector_t>(n->data).elems) v.elems.push_back(expand_impl(c));
            copy->data = std::move(v); return copy;
        }
        if(!std::holds_alternative<list>(n->data)) return clone(n);
        auto current = clone(n);
        auto& elems = std::get<list>(current->data).elems;
        if(!elems.empty() && elems[0] && std::holds_alternative<symbol>(elems[0]->data)){
            auto it = macros_.find(std::get<symbol>(elems[0]->data).name);
            if(it != macros_.end()){
                // the replacement is expanded to a fixed point, children included
                if(auto maybe = it->second(current)) return expand_impl(*maybe);
            }
        }
        auto& l = std::get<list>(current->data);
        for(size_t i = 1; i < l.elems.size(); ++i) l.elems[i] = expand_impl(l.elems[i]);
        return current;
    }

    void traverse_impl(const node_ptr& n){
        if(!n) return;
        if(std::holds_alternative<list>(n->data)){
            auto& l = std::get<list>(n->data);
            if(!l.elems.empty() && std::holds_alternative<symbol>(l.elems[0]->data)){
                auto head = std::get<symbol>(l.elems[0]->data);
                auto it = visitors_.find(head.name);
                if(it != visitors_.end() && !it->second(*n, l, head)) return;
            }
            for(auto& ch : l.elems) traverse_impl(ch);
            return;
        }
        if(std::holds_alternative<vector_t>(n->data)){
            for(auto& ch : std::get<vector_t>(n->data).elems) traverse_impl(ch);
        }
    }
};

} // namespace tailrec
