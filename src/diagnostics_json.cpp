#include "tailrec/diagnostics.hpp"
#include "tailrec/config.hpp"
#include <sstream>
#include <cstdio>

namespace tailrec {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_notes_json(std::ostringstream& os, const std::vector<Note>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)
          <<",\"line\":"<<notes[i].line
          <<",\"col\":"<<notes[i].col
          <<"}";
    }
    os<<"]";
}

template<typename D>
static void append_entry_json(std::ostringstream& os, const D& e){
    os<<"{"
        "\"code\":"<<json_escape(e.code)
        <<",\"message\":"<<json_escape(e.message)
        <<",\"hint\":"<<json_escape(e.hint)
        <<",\"line\":"<<e.line
        <<",\"col\":"<<e.col
        <<",\"notes\":";
    append_notes_json(os,e.notes);
    os<<"}";
}

std::string diagnostics_to_json(const Diagnostics& d){
    std::ostringstream os;
    os<<"{\"success\":"<<(d.success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<d.errors.size(); ++i){ if(i) os<<","; append_entry_json(os, d.errors[i]); }
    os<<"],\"warnings\":[";
    for(size_t i=0;i<d.warnings.size(); ++i){ if(i) os<<","; append_entry_json(os, d.warnings[i]); }
    os<<"]}";
    return os.str();
}

template<typename D>
static void append_entry_text(std::ostringstream& os, const char* kind, const D& e){
    os << kind; if(!e.code.empty()) os << "[" << e.code << "]";
    os << ": " << e.message; if(e.line>=0) os << " (line " << e.line << ":" << e.col << ")";
    os << "\n";
    if(!e.hint.empty()) os << "  hint: " << e.hint << "\n";
    for(auto& n : e.notes){ os << "  note: " << n.message; if(n.line>=0) os << " (line " << n.line << ":" << n.col << ")"; os << "\n"; }
}

std::string format_diagnostics(const Diagnostics& d){
    std::ostringstream os;
    for(auto& e : d.errors) append_entry_text(os, "error", e);
    for(auto& w : d.warnings) append_entry_text(os, "warning", w);
    return os.str();
}

void maybe_print_json(const Diagnostics& d){
    if(env_flag_enabled("TAILREC_DIAG_JSON")){
        auto js=diagnostics_to_json(d);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace tailrec
