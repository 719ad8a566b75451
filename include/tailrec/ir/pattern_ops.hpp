#pragma once

#include <llvm/IR/Value.h>

#include "tailrec/edn.hpp"
#include "tailrec/ir/builder.hpp"

namespace tailrec::ir::pattern_ops {

// Patterns: `_`, x, (mut x), literals, (tuple p*), (ctor Enum::Variant p*), bare Enum::Variant.
// All work on a pointer to the matched value so nested fields are reached with struct GEPs.

// i1 that is true when the value at `slot` matches `pat`. Only loads, no side effects.
llvm::Value* test(builder::State& S, Hooks& H, const node_ptr& pat, llvm::Value* slot, const TypePtr& ty);

// Bind the names of `pat` in the innermost scope (copies into fresh allocas).
void bind_pattern(builder::State& S, Hooks& H, const node_ptr& pat, llvm::Value* slot, const TypePtr& ty);

// True for patterns that match every value (allowed in let and parameters).
bool irrefutable(const node_ptr& pat);

} // namespace tailrec::ir::pattern_ops
