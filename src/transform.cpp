#include "tailrec/transform.hpp"
#include "tailrec/expander.hpp"
#include "tailrec/forms.hpp"
#include "tailrec/rebuild.hpp"
#include "tailrec/signature.hpp"
#include <algorithm>

namespace tailrec {

bool has_attr(const node_ptr& fn_form, const std::string& attr){
    for(auto& a : elems_of(kw_value(fn_form, "attrs")))
        if(name_of(a) == attr) return true;
    return false;
}

// W1100: bindings that hide the function's own name. Self-calls are still matched by name.
static void lint_shadowing(const FunctionSignature& sig, const node_ptr& body, ErrorReporter& rep){
    auto shadows = [&](const node_ptr& pat){
        auto names = bound_names(pat);
        return std::find(names.begin(), names.end(), sig.name) != names.end();
    };
    const std::string hint = "calls to '" + sig.name + "' after this binding are still rewritten as self-calls; rename the binding";
    for(auto& p : sig.params)
        if(shadows(p.pattern)) rep.warning("W1100", "parameter shadows function name '"+sig.name+"'", hint, p.pattern);

    Transformer walker;
    walker.add_visitor("let", [&](node&, list& l, const symbol&){
        if(l.elems.size() >= 3 && shadows(l.elems[1]))
            rep.warning("W1100", "let binding shadows function name '"+sig.name+"'", hint, l.elems[1]);
        return true;
    });
    walker.add_visitor("arm", [&](node&, list& l, const symbol&){
        if(l.elems.size() >= 3 && shadows(l.elems[1]))
            rep.warning("W1100", "match arm binding shadows function name '"+sig.name+"'", hint, l.elems[1]);
        return true;
    });
    walker.add_visitor("closure", [&](node&, list& l, const symbol&){
        if(l.elems.size() >= 2)
            for(auto& p : elems_of(l.elems[1]))
                if(shadows(p)) rep.warning("W1100", "closure parameter shadows function name '"+sig.name+"'", hint, p);
        return true;
    });
    walker.add_visitor("fn", [&](node&, list& l, const symbol&){
        auto* nm = find_kw(l, "name");
        if(nm && name_of(*nm) == sig.name)
            rep.warning("W1100", "nested fn item shadows function name '"+sig.name+"'", hint, *nm);
        return false;
    });
    walker.traverse(body);
}

static bool validate_params(const FunctionSignature& sig, ErrorReporter& rep){
    bool ok = true;
    int counter = 0;
    for(auto& p : sig.params){
        if(!pattern_to_expr(name_wildcards(p.pattern, counter))){
            rep.error("E1004", "parameter pattern of fn '"+sig.name+"' cannot be rebuilt into the state tuple",
                      "use identifiers, _, (mut x) or (tuple ...) patterns for parameters", p.pattern);
            ok = false;
        }
    }
    return ok;
}

TransformResult transform_function(const node_ptr& fn_form, const TransformOptions& opts){
    TransformResult res;
    ErrorReporter rep{&res.diags};
    FunctionSignature sig;
    if(!extract_signature(fn_form, sig, rep) || !validate_params(sig, rep)) return res;

    if(is_trampolined(fn_form, opts)){
        trace(opts, "transform", sig.name + ": already trampolined, unchanged");
        res.fn = clone(fn_form);
        res.unchanged = true;
        return res;
    }
    trace(opts, "transform", sig.name + ": " + std::to_string(sig.params.size()) + " parameter(s)");
    if(opts.lints) lint_shadowing(sig, kw_value(fn_form, "body"), rep);

    auto body = clone(kw_value(fn_form, "body"));
    TailRewriter rewriter(RewriteContext{sig.name, &opts});
    rewriter.rewrite_body(body);
    res.stats = rewriter.stats();

    if(opts.lints){
        if(res.stats.continues == 0)
            rep.warning("W1101", "fn '"+sig.name+"' has no self-call in tail position",
                        "the trampoline only adds overhead here", fn_form);
        if(int n = count_self_calls(body, sig.name); n > 0)
            rep.warning("W1102", "fn '"+sig.name+"' calls itself in "+std::to_string(n)+" non-tail position(s)",
                        "those calls still grow the stack", fn_form);
    }

    auto out = rebuild_function(fn_form, sig, std::move(body), opts, rep);
    trace(opts, "transform", sig.name + ": continues=" + std::to_string(res.stats.continues) +
                             " returns=" + std::to_string(res.stats.returns));
    if(res.diags.success) res.fn = out;
    return res;
}

node_ptr transform(const node_ptr& fn_form){
    auto r = transform_function(fn_form, detect_options());
    maybe_print_json(r.diags);
    if(!r.diags.success) throw transform_error(format_diagnostics(r.diags), r.diags);
    return r.fn;
}

ExpandResult expand_tailrec(const node_ptr& module_form, const TransformOptions& opts, bool all){
    ExpandResult res;
    Transformer tr;
    tr.add_macro("fn", [&](const node_ptr& f) -> std::optional<node_ptr> {
        if(is_opaque(*f) || !kw_value(f, "body")) return std::nullopt;
        if(!all && !has_attr(f, "recursive")) return std::nullopt;
        if(is_trampolined(f, opts)) return std::nullopt;
        auto r = transform_function(f, opts);
        merge(res.diags, r.diags);
        if(!r.fn) return std::nullopt;
        ++res.transformed;
        return r.fn;
    });
    res.module = tr.expand(module_form);
    trace(opts, "expand", std::to_string(res.transformed) + " function(s) rewritten");
    maybe_print_json(res.diags);
    return res;
}

} // namespace tailrec
