// Diagnostics shared by the transform, the module expander and the IR emitter.
#pragma once
#include "tailrec/edn.hpp"
#include <string>
#include <vector>

namespace tailrec {

struct Note { std::string message; int line=-1; int col=-1; };
struct Error { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<Note> notes; };
struct Warning { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<Note> notes; };

struct Diagnostics { bool success=true; std::vector<Error> errors; std::vector<Warning> warnings; };

// Central reporter so all components share formatting
struct ErrorReporter {
    Diagnostics* out=nullptr;
    void error(std::string code, std::string message, std::string hint, const node_ptr& at){
        if(!out) return;
        out->success = false;
        out->errors.push_back(Error{std::move(code),std::move(message),std::move(hint), at? line(*at):-1, at? col(*at):-1, {}});
    }
    void warning(std::string code, std::string message, std::string hint, const node_ptr& at){
        if(!out) return;
        out->warnings.push_back(Warning{std::move(code),std::move(message),std::move(hint), at? line(*at):-1, at? col(*at):-1, {}});
    }
    void note(std::string message, const node_ptr& at){
        if(!out) return;
        Note n{std::move(message), at? line(*at):-1, at? col(*at):-1};
        if(!out->errors.empty()) out->errors.back().notes.push_back(std::move(n));
        else if(!out->warnings.empty()) out->warnings.back().notes.push_back(std::move(n));
    }
};

inline void merge(Diagnostics& into, const Diagnostics& from){
    into.success = into.success && from.success;
    into.errors.insert(into.errors.end(), from.errors.begin(), from.errors.end());
    into.warnings.insert(into.warnings.end(), from.warnings.begin(), from.warnings.end());
}

// Human readable rendering, one diagnostic per line plus hint/note lines.
std::string format_diagnostics(const Diagnostics& d);

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const Diagnostics& d);

// If TAILREC_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const Diagnostics& d);

} // namespace tailrec
