#include "tailrec/jit.hpp"

#include <llvm/Config/llvm-config.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/TargetSelect.h>

#include <cstdint>
#include <mutex>

namespace tailrec {

static void init_native_target(){
    static std::once_flag once;
    std::call_once(once, []{
        llvm::InitializeNativeTarget();
        llvm::InitializeNativeTargetAsmPrinter();
    });
}

JitEngine::JitEngine(){
    init_native_target();
    auto jitExp = llvm::orc::LLJITBuilder().create();
    if(!jitExp) throw jit_error("failed to create JIT: " + llvm::toString(jitExp.takeError()));
    jit_ = std::move(*jitExp);
}

JitEngine::~JitEngine() = default;

void JitEngine::add_module(llvm::orc::ThreadSafeModule tsm){
    if(auto err = jit_->addIRModule(std::move(tsm)))
        throw jit_error("failed to add module: " + llvm::toString(std::move(err)));
}

void* JitEngine::lookup(const std::string& name){
    auto sym = jit_->lookup(name);
    if(!sym) throw jit_error("function not found: " + name + " (" + llvm::toString(sym.takeError()) + ")");
#if LLVM_VERSION_MAJOR >= 15
    return sym->toPtr<void*>();
#else
    return reinterpret_cast<void*>(static_cast<uintptr_t>(sym->getAddress()));
#endif
}

} // namespace tailrec
