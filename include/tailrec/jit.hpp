#pragma once
#include <memory>
#include <stdexcept>
#include <string>

#include <llvm/ExecutionEngine/Orc/LLJIT.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>

namespace tailrec {

struct jit_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Thin owner of an ORC LLJIT instance. One engine per thread.
class JitEngine {
public:
    JitEngine(); // throws jit_error
    ~JitEngine();
    void add_module(llvm::orc::ThreadSafeModule tsm);
    // Address of an emitted function; throws jit_error when the symbol is missing.
    void* lookup(const std::string& name);

    template<class Fn> Fn function(const std::string& name){ return reinterpret_cast<Fn>(lookup(name)); }
private:
    std::unique_ptr<llvm::orc::LLJIT> jit_;
};

} // namespace tailrec
