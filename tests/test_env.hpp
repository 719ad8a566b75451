#pragma once
// Test-only helpers shared by the cassert suites.
#include <cstdlib>
#include <string>

#include "tailrec/edn.hpp"
#include "tailrec/diagnostics.hpp"

// Sets an environment variable for the lifetime of the object and restores the previous value.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if(const char* old = std::getenv(name)){ had_ = true; old_ = old; }
        ::setenv(name, value, 1);
    }
    ~ScopedEnv(){
        if(had_) ::setenv(name_.c_str(), old_.c_str(), 1);
        else ::unsetenv(name_.c_str());
    }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::string old_;
    bool had_ = false;
};

inline bool has_error(const tailrec::Diagnostics& d, const std::string& code){
    for(const auto& e : d.errors) if(e.code == code) return true;
    return false;
}
inline bool has_warning(const tailrec::Diagnostics& d, const std::string& code){
    for(const auto& w : d.warnings) if(w.code == code) return true;
    return false;
}

// Structural comparison against EDN text, metadata ignored.
inline bool same_edn(const tailrec::node_ptr& n, const char* expected){
    return tailrec::equal(n, tailrec::parse(expected));
}
