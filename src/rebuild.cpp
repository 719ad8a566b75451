#include "tailrec/rebuild.hpp"
#include "tailrec/forms.hpp"
#include "tailrec/rewrite.hpp"

namespace tailrec {

std::string inner_name(const FunctionSignature& sig, const TransformOptions& opts){
    return sig.name + opts.inner_suffix;
}

node_ptr action_enum(const TransformOptions& opts){
    return form("enum", {
        n_sym(opts.action_name),
        n_kw("generics"), node_vec({ n_sym("C"), n_sym("R") }),
        n_kw("variants"), node_vec({
            node_list({ n_sym(opts.continue_variant), n_sym("C") }),
            node_list({ n_sym(opts.return_variant), n_sym("R") }) })
    });
}

bool is_trampolined(const node_ptr& fn_form, const TransformOptions& opts){
    auto body = kw_value(fn_form, "body");
    const auto& el = elems_of(body);
    if(!is_form(body, "block") || el.size() < 3) return false;
    const auto& en = elems_of(el[1]);
    if(!is_form(el[1], "enum") || en.size() < 2 || name_of(en[1]) != opts.action_name) return false;
    if(!is_form(el[2], "fn")) return false;
    return name_of(kw_value(el[2], "name")) == name_of(kw_value(fn_form, "name")) + opts.inner_suffix;
}

static node_ptr inner_function(const FunctionSignature& sig, node_ptr body, const TransformOptions& opts){
    auto stateTy = state_type(sig);
    auto pattern = form("tuple", input_patterns(sig));
    auto retTy = form("app", { n_sym(opts.action_name), stateTy, return_type(sig) });
    auto fn = form("fn", {
        n_kw("name"), n_sym(inner_name(sig, opts)),
        n_kw("params"), node_vec({ form("param", { pattern, clone(stateTy) }) }),
        n_kw("ret"), retTy,
        n_kw("body"), std::move(body)
    });
    // generated item; module expansion must not pick it up again
    mark_opaque(*fn);
    return fn;
}

// loop { match inner(acc) { Action::Return(r) => return r, Action::Continue(c) => acc = c } }
static node_ptr driver_loop(const FunctionSignature& sig, const TransformOptions& opts){
    auto acc = [&]{ return n_sym(opts.accumulator); };
    auto retArm = form("arm", {
        form("ctor", { n_sym(join_path(opts.action_name, opts.return_variant)), n_sym(opts.return_binder) }),
        form("return", { n_sym(opts.return_binder) }) });
    auto contArm = form("arm", {
        form("ctor", { n_sym(join_path(opts.action_name, opts.continue_variant)), n_sym(opts.continue_binder) }),
        form("assign", { acc(), n_sym(opts.continue_binder) }) });
    auto step = form("match", { form("call", { n_sym(inner_name(sig, opts)), acc() }), retArm, contArm });
    return form("loop", { form("block", { step }) });
}

node_ptr rebuild_function(const node_ptr& fn_form, const FunctionSignature& sig, node_ptr rewritten_body,
                          const TransformOptions& opts, ErrorReporter& rep){
    // correctness net: a second full pass over the finished body must be a no-op
    if(opts.verify){
        TailRewriter again(RewriteContext{sig.name, &opts});
        again.rewrite_body(rewritten_body);
        if(again.stats().continues || again.stats().returns){
            rep.error("E1099", "rewrite of '"+sig.name+"' was not stable under a second pass",
                      "internal error: a tail expression escaped the opaque marker", fn_form);
        }
    }

    // Outer parameters: wildcards get names so the accumulator can be built from them.
    int wildcard = 0;
    auto params = node_vec();
    std::vector<node_ptr> accParts;
    for(auto& p : sig.params){
        auto outerPat = name_wildcards(p.pattern, wildcard);
        params << form("param", { outerPat, clone(p.type) });
        accParts.push_back(pattern_to_expr(outerPat));
    }

    auto body = form("block", {
        action_enum(opts),
        inner_function(sig, std::move(rewritten_body), opts),
        form("let", { form("mut", { n_sym(opts.accumulator) }), form("tuple", std::move(accParts)) }),
        driver_loop(sig, opts)
    });

    // Keep the original header (its key order and any extra keys) and swap params/body.
    auto out = clone(fn_form);
    auto& l = *as_list(*out);
    if(auto* slot = find_kw(l, "params")) *slot = params;
    if(auto* slot = find_kw(l, "body")) *slot = body;
    return out;
}

} // namespace tailrec
