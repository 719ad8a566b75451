#include "tailrec/config.hpp"
#include <cstdio>

namespace tailrec {

TransformOptions detect_options(){
    TransformOptions o;
    o.inner_suffix = env_string("TAILREC_INNER_SUFFIX", o.inner_suffix);
    o.action_name = env_string("TAILREC_ACTION_NAME", o.action_name);
    if(env_flag_enabled("TAILREC_NO_VERIFY")) o.verify = false;
    if(env_flag_enabled("TAILREC_NO_LINT")) o.lints = false;
    o.trace = env_flag_enabled("TAILREC_TRACE");
    if(o.trace){
        std::fprintf(stderr, "[tailrec][cfg] inner-suffix=%s action=%s verify=%d lints=%d\n",
                     o.inner_suffix.c_str(), o.action_name.c_str(), (int)o.verify, (int)o.lints);
    }
    return o;
}

void trace(const TransformOptions& opts, const char* tag, const std::string& msg){
    if(!opts.trace) return;
    std::fprintf(stderr, "[tailrec][%s] %s\n", tag, msg.c_str());
}

} // namespace tailrec
