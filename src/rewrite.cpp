#include "tailrec/rewrite.hpp"
#include "tailrec/forms.hpp"

namespace tailrec {

expr_kind classify(const node_ptr& n){
    if(!n) return expr_kind::Other;
    if(is_opaque(*n)) return expr_kind::Opaque;
    auto h = head_name(*n);
    if(h == "call") return expr_kind::Call;
    if(h == "method-call") return expr_kind::MethodCall;
    if(h == "match") return expr_kind::Match;
    if(h == "if") return expr_kind::Conditional;
    if(h == "block") return expr_kind::Block;
    if(h == "return") return expr_kind::Return;
    return expr_kind::Other;
}

const char* kind_name(expr_kind k){
    switch(k){
        case expr_kind::Call: return "call";
        case expr_kind::MethodCall: return "method-call";
        case expr_kind::Match: return "match";
        case expr_kind::Conditional: return "if";
        case expr_kind::Block: return "block";
        case expr_kind::Return: return "return";
        case expr_kind::Opaque: return "opaque";
        case expr_kind::Other: return "other";
    }
    return "other";
}

bool is_statement(const node_ptr& n){
    auto h = head_name(n);
    return h == "let" || h == "semi" || h == "fn" || h == "enum";
}

static std::string where(const node_ptr& n){
    if(!n || line(*n) < 0) return "?";
    return std::to_string(line(*n)) + ":" + std::to_string(col(*n));
}

static void copy_position(const node_ptr& from, node& to){
    if(!from) return;
    for(const char* k : {"line", "col", "end-line", "end-col"}){
        auto it = from->metadata.find(k);
        if(it != from->metadata.end()) to.metadata[k] = it->second;
    }
}

node_ptr TailRewriter::make_continue(std::vector<node_ptr> args, const node_ptr& origin){
    auto path = join_path(ctx_.opts->action_name, ctx_.opts->continue_variant);
    auto out = form("call", { n_sym(path), form("tuple", std::move(args)) });
    copy_position(origin, *out);
    mark_opaque(*out);
    ++stats_.continues;
    return out;
}

node_ptr TailRewriter::make_return(node_ptr value, const node_ptr& origin){
    auto path = join_path(ctx_.opts->action_name, ctx_.opts->return_variant);
    auto out = form("call", { n_sym(path), std::move(value) });
    copy_position(origin, *out);
    mark_opaque(*out);
    ++stats_.returns;
    return out;
}

bool TailRewriter::is_self_name(const node_ptr& callee) const {
    auto* s = callee ? as_symbol(*callee) : nullptr;
    return s && s->name == ctx_.fn_name;
}

void TailRewriter::rewrite_body(node_ptr& body){
    rewrite_returns(body);
    rewrite_tail(body);
}

void TailRewriter::rewrite_returns(node_ptr& n){
    if(!n || is_opaque(*n)) return;
    auto* l = as_list(*n);
    if(!l){
        if(is_vector(*n)) for(auto& ch : std::get<vector_t>(n->data).elems) rewrite_returns(ch);
        return;
    }
    auto h = head_name(*n);
    // returns inside nested items and closures exit those, not this function
    if(h == "fn" || h == "closure") return;
    for(size_t i = 1; i < l->elems.size(); ++i) rewrite_returns(l->elems[i]);
    if(h == "return") rewrite_return_form(n);
}

void TailRewriter::rewrite_return_form(node_ptr& ret){
    auto& el = as_list(*ret)->elems;
    if(el.size() < 2){
        trace(*ctx_.opts, "rewrite", ctx_.fn_name + ": bare return at " + where(ret) + " -> Return(())");
        el.push_back(make_return(unit_form(), ret));
        return;
    }
    rewrite_tail(el[1]);
}

void TailRewriter::rewrite_tail(node_ptr& slot){
    if(!slot) return;
    auto kind = classify(slot);
    switch(kind){
    case expr_kind::Opaque:
        ++stats_.opaque_skipped;
        return;
    case expr_kind::Call: {
        auto& el = as_list(*slot)->elems;
        if(el.size() >= 2 && is_self_name(el[1])){
            trace(*ctx_.opts, "rewrite", ctx_.fn_name + ": self-tail-call at " + where(slot) + " -> Continue");
            std::vector<node_ptr> args(el.begin() + 2, el.end());
            slot = make_continue(std::move(args), slot);
            return;
        }
        break;
    }
    case expr_kind::MethodCall: {
        // (method-call recv name args...); the receiver is not part of the state
        auto& el = as_list(*slot)->elems;
        if(el.size() >= 3 && is_self_name(el[2])){
            trace(*ctx_.opts, "rewrite", ctx_.fn_name + ": self-tail-call (method) at " + where(slot) + " -> Continue");
            std::vector<node_ptr> args(el.begin() + 3, el.end());
            slot = make_continue(std::move(args), slot);
            return;
        }
        break;
    }
    case expr_kind::Match: {
        auto& el = as_list(*slot)->elems;
        for(size_t i = 2; i < el.size(); ++i){
            if(!is_form(el[i], "arm")) continue;
            auto& arm = as_list(*el[i])->elems;
            if(arm.size() >= 3) rewrite_tail(arm.back());
        }
        return;
    }
    case expr_kind::Conditional: {
        auto& el = as_list(*slot)->elems;
        if(el.size() >= 3) rewrite_tail(el[2]);
        if(el.size() >= 4){
            rewrite_tail(el[3]);
        } else if(el.size() == 3){
            // the missing else yields unit; give that path its own Return
            el.push_back(form("block", { make_return(unit_form(), slot) }));
        }
        return;
    }
    case expr_kind::Block:
        rewrite_block_tail(slot);
        return;
    case expr_kind::Return:
        if(as_list(*slot)->elems.size() < 2 || !is_opaque(*as_list(*slot)->elems[1])) rewrite_return_form(slot);
        return;
    case expr_kind::Other:
        break;
    }
    trace(*ctx_.opts, "rewrite", ctx_.fn_name + ": terminal " + kind_name(kind) + " at " + where(slot) + " -> Return");
    slot = make_return(slot, slot);
}

void TailRewriter::rewrite_block_tail(node_ptr& block){
    auto& el = as_list(*block)->elems;
    if(el.size() >= 2 && !is_statement(el.back())){
        rewrite_tail(el.back());
        return;
    }
    if(el.size() >= 2 && diverges(el.back())) return;
    // falls off the end with unit
    el.push_back(make_return(unit_form(), block));
}

// A break that exits the loop whose body is `n`; nested loops and closures own theirs.
static bool has_break(const node_ptr& n){
    auto h = head_name(n);
    if(h == "break") return true;
    if(h == "loop" || h == "while" || h == "closure" || h == "fn") return false;
    for(auto& ch : elems_of(n)) if(has_break(ch)) return true;
    return false;
}

bool diverges(const node_ptr& n){
    auto h = head_name(n);
    const auto& el = elems_of(n);
    if(h == "return") return true;
    if(h == "semi" || h == "let") return el.size() >= 2 && diverges(el.back());
    if(h == "block"){
        for(size_t i = 1; i < el.size(); ++i) if(diverges(el[i])) return true;
        return false;
    }
    if(h == "loop") return el.size() >= 2 && !has_break(el[1]);
    if(h == "if"){
        if(el.size() >= 2 && diverges(el[1])) return true;
        return el.size() >= 4 && diverges(el[2]) && diverges(el[3]);
    }
    if(h == "match"){
        if(el.size() >= 2 && diverges(el[1])) return true;
        if(el.size() < 3) return false;
        for(size_t i = 2; i < el.size(); ++i){
            const auto& arm = elems_of(el[i]);
            if(arm.size() < 3 || !diverges(arm.back())) return false;
        }
        return true;
    }
    return false;
}

int count_self_calls(const node_ptr& n, const std::string& fn_name){
    if(!n) return 0;
    const auto& el = elems_of(n);
    if(el.empty()) return 0;
    auto h = head_name(n);
    if(h == "fn") return 0;
    int count = 0;
    if(h == "call" && el.size() >= 2 && name_of(el[1]) == fn_name && as_symbol(*el[1])) ++count;
    if(h == "method-call" && el.size() >= 3 && name_of(el[2]) == fn_name) ++count;
    for(auto& ch : el) count += count_self_calls(ch, fn_name);
    return count;
}

} // namespace tailrec
