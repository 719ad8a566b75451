#pragma once
#include <cstdlib>
#include <string>

namespace tailrec {

// Feature flags sourced from environment
inline bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0]=='1' || v[0]=='t' || v[0]=='T' || v[0]=='y' || v[0]=='Y');
}
inline std::string env_string(const char* name, const std::string& def){
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : def;
}

// Names used by the rebuilt function and switches for the optional passes.
struct TransformOptions {
    std::string inner_suffix = "_inner";
    std::string action_name = "Action";
    std::string continue_variant = "Continue";
    std::string return_variant = "Return";
    std::string accumulator = "acc";
    std::string return_binder = "r";
    std::string continue_binder = "c";
    // Re-apply the rewrite over the finished body and check it is a no-op.
    bool verify = true;
    // W1100..W1102 lints
    bool lints = true;
    bool trace = false;
};

// Defaults overridden by TAILREC_INNER_SUFFIX, TAILREC_ACTION_NAME, TAILREC_NO_VERIFY,
// TAILREC_NO_LINT and TAILREC_TRACE.
TransformOptions detect_options();

// "[tailrec][<tag>] <msg>" on stderr when tracing is on.
void trace(const TransformOptions& opts, const char* tag, const std::string& msg);

} // namespace tailrec
