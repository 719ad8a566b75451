// transform.hpp - public entry points of the self-tail-call trampolining transform
#pragma once
#include "tailrec/edn.hpp"
#include "tailrec/config.hpp"
#include "tailrec/diagnostics.hpp"
#include "tailrec/rewrite.hpp"
#include <stdexcept>

namespace tailrec {

struct TransformResult {
    node_ptr fn;            // rewritten (fn ...) form; nullptr when diags.success is false
    Diagnostics diags;
    RewriteStats stats;
    bool unchanged = false; // input already had the trampoline shape
};

// Rewrite one (fn ...) form into its loop-driven equivalent. The input is not modified.
TransformResult transform_function(const node_ptr& fn_form, const TransformOptions& opts);

struct transform_error : std::runtime_error {
    transform_error(const std::string& msg, Diagnostics d) : std::runtime_error(msg), diags(std::move(d)) {}
    Diagnostics diags;
};

// Convenience form with options from the environment. Throws transform_error on invalid input.
node_ptr transform(const node_ptr& fn_form);

struct ExpandResult {
    node_ptr module;
    Diagnostics diags;
    int transformed = 0;
};

// Rewrite every fn item marked :attrs [recursive] (at any depth); everything else is copied.
// With `all` set, every fn item with a body is rewritten regardless of attributes.
ExpandResult expand_tailrec(const node_ptr& module_form, const TransformOptions& opts, bool all = false);

bool has_attr(const node_ptr& fn_form, const std::string& attr);

} // namespace tailrec
