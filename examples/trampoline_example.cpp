// Trampoline example: rewrite a self-recursive fn, lower it to LLVM and run it in the JIT.
#include <cstdint>
#include <iostream>
#include <string>
#include "tailrec/edn.hpp"
#include "tailrec/transform.hpp"
#include "tailrec/ir_emitter.hpp"
#include "tailrec/jit.hpp"

using namespace tailrec;

int main(){
    const char* src = R"EDN(
        (module
          (fn :name sum_to :attrs [recursive] :params [ (param n Int) (param acc Int) ] :ret Int :body
            (block
              (if (== n 0)
                (block acc)
                (block (call sum_to (- n 1) (+ acc n)))))))
    )EDN";

    auto ast = parse(src);
    auto ex = expand_tailrec(ast, detect_options());
    if(!ex.diags.success){
        std::cerr << format_diagnostics(ex.diags);
        return 1;
    }
    std::cout << to_pretty_string(ex.module) << "\n";

    IREmitter emitter; Diagnostics d;
    if(!emitter.emit(ex.module, d)){
        std::cerr << format_diagnostics(d);
        return 2;
    }
    try {
        JitEngine jit;
        jit.add_module(emitter.toThreadSafeModule());
        auto sum_to = jit.function<int64_t(*)(int64_t, int64_t)>("sum_to");
        std::cout << "sum_to(1000000, 0) = " << sum_to(1000000, 0) << "\n";
    } catch(const jit_error& e){
        std::cerr << e.what() << "\n";
        return 3;
    }
    return 0;
}
