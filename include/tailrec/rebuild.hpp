// rebuild.hpp - assembles the trampolined function from a signature and a rewritten body
#pragma once
#include "tailrec/edn.hpp"
#include "tailrec/config.hpp"
#include "tailrec/diagnostics.hpp"
#include "tailrec/signature.hpp"

namespace tailrec {

// Produces (fn <original header> :body (block <enum> <inner fn> <accumulator> <loop>)).
//
// The rewritten body is re-walked with a fresh TailRewriter first; because every rewritten node
// is opaque that walk must change nothing, and E1099 is reported if it did.
node_ptr rebuild_function(const node_ptr& fn_form, const FunctionSignature& sig, node_ptr rewritten_body,
                          const TransformOptions& opts, ErrorReporter& rep);

std::string inner_name(const FunctionSignature& sig, const TransformOptions& opts);

// (enum Action :generics [C R] :variants [(Continue C) (Return R)])
node_ptr action_enum(const TransformOptions& opts);

// True when the body already starts with the Action enum and the <name>_inner item.
bool is_trampolined(const node_ptr& fn_form, const TransformOptions& opts);

} // namespace tailrec
