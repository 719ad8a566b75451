#pragma once
#include "tailrec/edn.hpp"
#include "tailrec/diagnostics.hpp"
#include <memory>
#include <string>

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>

namespace tailrec {

// Lowers a (module ...) or single (fn ...) form to an LLVM module.
// Module-level fns keep their names; nested fn items are emitted as <outer>.<inner>.
class IREmitter {
public:
    IREmitter();
    ~IREmitter();
    // Returns nullptr on failure (errors E21xx in diags). The module stays owned by the emitter.
    llvm::Module* emit(const node_ptr& module_ast, Diagnostics& diags);
    // Ownership transfer into ORC JIT
    llvm::orc::ThreadSafeModule toThreadSafeModule();
    // Textual IR of the last emitted module.
    std::string ir_text() const;
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tailrec
