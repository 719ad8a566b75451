#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "tailrec/edn.hpp"
#include "tailrec/forms.hpp"
#include "tailrec/transform.hpp"
#include "tailrec/ir_emitter.hpp"
#include "tailrec/jit.hpp"
#include "tinyrust/source_emitter.hpp"
#ifdef TAILREC_WITH_TINYRUST
#include "tinyrust/parser.hpp"
#endif

using namespace tailrec;

namespace {

enum exit_code : int { EXIT_USAGE = 1, EXIT_PARSE = 2, EXIT_TRANSFORM = 3, EXIT_EMIT = 4, EXIT_JIT = 5 };

int usage(){
    std::cerr << "usage: tailrec_driver <file.edn|file.rs> [--emit=edn|source|llvm] [--all] [--run <fn> <int-args...>]\n";
    std::cerr << "  --emit=edn     print the rewritten EDN (default)\n";
    std::cerr << "  --emit=source  print the rewritten tree as tinyrust source\n";
    std::cerr << "  --emit=llvm    print the LLVM IR of the rewritten module\n";
    std::cerr << "  --all          rewrite every fn, not only #[recursive] ones\n";
    std::cerr << "  --run          JIT the module and call <fn> with the given integers\n";
    return EXIT_USAGE;
}

bool ends_with(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

node_ptr find_fn(const node_ptr& root, const std::string& name){
    if(is_form(root, "fn")) return name_of(kw_value(root, "name")) == name ? root : nullptr;
    for(auto& it : elems_of(root))
        if(is_form(it, "fn") && name_of(kw_value(it, "name")) == name) return it;
    return nullptr;
}

// Calls fn(args...) for up to four Int parameters.
int64_t call_int(void* addr, const std::vector<int64_t>& a){
    switch(a.size()){
        case 0: return reinterpret_cast<int64_t(*)()>(addr)();
        case 1: return reinterpret_cast<int64_t(*)(int64_t)>(addr)(a[0]);
        case 2: return reinterpret_cast<int64_t(*)(int64_t,int64_t)>(addr)(a[0], a[1]);
        case 3: return reinterpret_cast<int64_t(*)(int64_t,int64_t,int64_t)>(addr)(a[0], a[1], a[2]);
        default: return reinterpret_cast<int64_t(*)(int64_t,int64_t,int64_t,int64_t)>(addr)(a[0], a[1], a[2], a[3]);
    }
}
bool call_bool(void* addr, const std::vector<int64_t>& a){
    switch(a.size()){
        case 0: return reinterpret_cast<bool(*)()>(addr)();
        case 1: return reinterpret_cast<bool(*)(int64_t)>(addr)(a[0]);
        case 2: return reinterpret_cast<bool(*)(int64_t,int64_t)>(addr)(a[0], a[1]);
        case 3: return reinterpret_cast<bool(*)(int64_t,int64_t,int64_t)>(addr)(a[0], a[1], a[2]);
        default: return reinterpret_cast<bool(*)(int64_t,int64_t,int64_t,int64_t)>(addr)(a[0], a[1], a[2], a[3]);
    }
}

} // namespace

int main(int argc, char** argv){
    if(argc < 2) return usage();
    std::string path;
    std::string emit;
    bool all = false;
    std::string run;
    std::vector<int64_t> run_args;
    for(int i=1; i<argc; ++i){
        std::string arg = argv[i];
        if(arg.rfind("--emit=", 0) == 0) emit = arg.substr(7);
        else if(arg == "--all") all = true;
        else if(arg == "--run"){
            if(i + 1 >= argc) return usage();
            run = argv[++i];
            for(; i + 1 < argc; ++i){
                try { run_args.push_back(std::stoll(argv[i+1])); }
                catch(const std::exception&){ break; }
            }
        }
        else if(!arg.empty() && arg[0] == '-') return usage();
        else if(path.empty()) path = arg;
        else return usage();
    }
    if(emit.empty() && run.empty()) emit = "edn";
    if(path.empty() || (!emit.empty() && emit != "edn" && emit != "source" && emit != "llvm")) return usage();

    std::ifstream f(path, std::ios::binary);
    if(!f){ std::cerr << "tailrec: cannot open '" << path << "'\n"; return EXIT_USAGE; }
    std::stringstream ss; ss << f.rdbuf();
    std::string src = ss.str();

    node_ptr ast;
    if(ends_with(path, ".rs")){
#ifdef TAILREC_WITH_TINYRUST
        tinyrust::Parser p;
        auto pres = p.parse_string(src, path);
        if(!pres.success){ std::cerr << path << ":" << pres.line << ":" << pres.column << ": parse error: " << pres.error_message << "\n"; return EXIT_PARSE; }
        ast = pres.module;
#else
        std::cerr << "tailrec: built without the tinyrust frontend; cannot read '" << path << "'\n";
        return EXIT_USAGE;
#endif
    } else {
        try { ast = parse(src); }
        catch(const parse_error& e){ std::cerr << path << ": parse error: " << e.what() << "\n"; return EXIT_PARSE; }
    }

    auto opts = detect_options();
    auto ex = expand_tailrec(ast, opts, all);
    if(!ex.diags.errors.empty() || !ex.diags.warnings.empty()) std::cerr << format_diagnostics(ex.diags);
    if(!ex.diags.success){ std::cerr << "transform failed\n"; return EXIT_TRANSFORM; }

    if(emit == "edn") std::cout << to_pretty_string(ex.module) << "\n";
    else if(emit == "source"){
        try { std::cout << tinyrust::emit_source(ex.module); }
        catch(const tinyrust::emit_error& e){ std::cerr << "source emission failed: " << e.what() << "\n"; return EXIT_EMIT; }
    }
    if(emit != "llvm" && run.empty()) return 0;

    IREmitter em;
    Diagnostics irdiags;
    auto* mod = em.emit(ex.module, irdiags);
    if(!mod || !irdiags.success){
        std::cerr << format_diagnostics(irdiags) << "ir emission failed\n";
        return EXIT_EMIT;
    }
    if(emit == "llvm") std::cout << em.ir_text();
    if(run.empty()) return 0;

    auto fn = find_fn(ex.module, run);
    if(!fn){ std::cerr << "tailrec: no function '" << run << "'\n"; return EXIT_JIT; }
    const auto& params = elems_of(kw_value(fn, "params"));
    if(params.size() != run_args.size() || run_args.size() > 4){
        std::cerr << "tailrec: '" << run << "' takes " << params.size() << " argument(s), got " << run_args.size() << " (at most 4 supported)\n";
        return EXIT_JIT;
    }
    for(auto& p : params){
        const auto& pe = elems_of(p);
        if(pe.size() != 3 || name_of(pe[2]) != "Int"){ std::cerr << "tailrec: --run supports Int parameters only\n"; return EXIT_JIT; }
    }
    auto ret = name_of(kw_value(fn, "ret"));
    if(ret != "Int" && ret != "Bool"){ std::cerr << "tailrec: --run supports Int or Bool results only\n"; return EXIT_JIT; }

    try {
        JitEngine jit;
        jit.add_module(em.toThreadSafeModule());
        void* addr = jit.lookup(run);
        if(ret == "Bool") std::cout << "Result: " << (call_bool(addr, run_args) ? 1 : 0) << "\n";
        else std::cout << "Result: " << call_int(addr, run_args) << "\n";
    } catch(const jit_error& e){
        std::cerr << "jit: " << e.what() << "\n";
        return EXIT_JIT;
    }
    return 0;
}
