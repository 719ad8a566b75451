#pragma once

#include <utility>
#include <vector>

#include <llvm/IR/BasicBlock.h>

#include "tailrec/edn.hpp"
#include "tailrec/ir/builder.hpp"

namespace tailrec::ir::control_ops {

// Control-flow forms. `expected` is the type the context wants (may be null) and is
// passed down to branch bodies so variant constructions there can pick their instantiation.
Val emit_if(builder::State& S, Hooks& H, const node_ptr& e, const TypePtr& expected);
Val emit_match(builder::State& S, Hooks& H, const node_ptr& e, const TypePtr& expected);
Val emit_loop(builder::State& S, Hooks& H, const node_ptr& e);
Val emit_while(builder::State& S, Hooks& H, const node_ptr& e);
Val emit_break(builder::State& S, Hooks& H, const node_ptr& e);
Val emit_continue(builder::State& S, Hooks& H, const node_ptr& e);
Val emit_return(builder::State& S, Hooks& H, const node_ptr& e);

// Join branch results in `merge` (phi for non-unit values). Diverged inputs are skipped;
// when every input diverged `merge` is erased and the join itself diverges.
Val merge_values(builder::State& S, Hooks& H, llvm::BasicBlock* merge,
                 const std::vector<std::pair<Val, llvm::BasicBlock*>>& in, const node_ptr& at);

} // namespace tailrec::ir::control_ops
