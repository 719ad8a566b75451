#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Value.h>

#include "tailrec/edn.hpp"
#include "tailrec/ir/types.hpp"

namespace tailrec::ir {

// Value of a lowered expression. A null `v` means control never reaches the end of the
// expression (return/break/continue, or a loop without break); the insert block is then
// already terminated.
struct Val {
    llvm::Value* v = nullptr;
    TypePtr ty;
    bool diverged() const { return v == nullptr; }
};

struct FnInfo {
    llvm::Function* fn = nullptr;
    std::vector<TypePtr> params;
    TypePtr ret;
};

// Items declared by one block (or the module): visible to the whole block and to nested fns.
struct ItemScope {
    std::unordered_map<std::string, const EnumDef*> enums;
    std::unordered_map<std::string, FnInfo> fns;
};

struct Local { llvm::AllocaInst* slot = nullptr; TypePtr type; };

struct LoopTarget {
    llvm::BasicBlock* exit = nullptr;
    llvm::BasicBlock* next = nullptr;  // continue target
    bool value_loop = false;           // `loop` may break with a value, `while` may not
    bool broken = false;
    TypePtr result_ty;                 // fixed by the first break
    llvm::AllocaInst* result = nullptr;
};

namespace builder {

// Per-function emission state. Each function (nested fn items included) gets its own
// IRBuilder so item bodies can be emitted while the enclosing function is half built.
struct State {
    State(llvm::LLVMContext& c, llvm::Function* f) : llctx(c), builder(c), F(f) {}

    llvm::LLVMContext& llctx;
    llvm::IRBuilder<> builder;
    llvm::Function* F;
    std::string fn_name;  // emitted (mangled) name, prefix for nested items
    TypePtr ret;
    std::vector<std::unordered_map<std::string, Local>> scopes;
    std::vector<LoopTarget> loops;
    int counter = 0;

    void push_scope(){ scopes.emplace_back(); }
    void pop_scope(){ scopes.pop_back(); }
    void bind(const std::string& name, Local l){ scopes.back()[name] = std::move(l); }
    const Local* lookup(const std::string& name) const {
        for(auto it = scopes.rbegin(); it != scopes.rend(); ++it){
            auto f = it->find(name);
            if(f != it->end()) return &f->second;
        }
        return nullptr;
    }

    // Allocas live in the entry block so loops do not grow the frame.
    llvm::AllocaInst* entry_alloca(llvm::Type* ty, const std::string& name){
        auto& entry = F->getEntryBlock();
        llvm::IRBuilder<> tmp(&entry, entry.begin());
        return tmp.CreateAlloca(ty, nullptr, name);
    }
    llvm::BasicBlock* block(const std::string& label){
        return llvm::BasicBlock::Create(llctx, label + "." + std::to_string(counter++), F);
    }
};

} // namespace builder

// Recursion hooks supplied by the emitter to the op handlers.
struct Hooks {
    std::function<Val(builder::State&, const node_ptr&, const TypePtr&)> expr;
    TypeLowering* types = nullptr;
};

inline llvm::Value* unit_value(Hooks& H){ return llvm::Constant::getNullValue(H.types->lower(unit_type())); }

inline void expect_type(const Val& v, const TypePtr& want, const node_ptr& at, const std::string& what){
    if(!same_type(v.ty, want))
        throw ir_error("E2108", what + ": expected " + describe(want) + ", found " + describe(v.ty), at);
}

} // namespace tailrec::ir
