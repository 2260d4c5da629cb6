#include "weft/diagnostics.hpp"
#include "weft/config.hpp"
#include <cstdio>
#include <sstream>

namespace weft {

Location locate(std::string_view source, size_t offset){
    Location loc;
    if(offset > source.size()) offset = source.size();
    for(size_t i = 0; i < offset; ++i){
        if(source[i] == '\n'){ ++loc.line; loc.col = 1; } else ++loc.col;
    }
    return loc;
}

const char* kind_name(ErrorKind k){
    switch(k){
        case ErrorKind::lexical: return "lexical";
        case ErrorKind::parse: return "parse";
        case ErrorKind::configuration: return "configuration";
        case ErrorKind::runtime_type: return "type";
        case ErrorKind::scope: return "scope";
        case ErrorKind::extern_resolution: return "extern";
        case ErrorKind::runtime: return "runtime";
    }
    return "unknown";
}

Diagnostic to_diagnostic(const error& e, std::string_view source){
    Diagnostic d{e.kind(), e.code(), e.what(), e.hint(), -1, -1, e.span()};
    if(e.has_span() || e.span().start > 0){
        auto loc = locate(source, e.span().start);
        d.line = loc.line; d.col = loc.col;
    }
    return d;
}

Diagnostic ErrorReporter::make(const error& e, std::string_view source) const { return to_diagnostic(e, source); }

std::string format_diagnostic(const Diagnostic& d, std::string_view filename){
    std::ostringstream os;
    os << filename;
    if(d.line > 0) os << ':' << d.line << ':' << d.col;
    os << ": " << kind_name(d.kind) << " error[" << d.code << "]: " << d.message;
    if(!d.hint.empty()) os << "\n  hint: " << d.hint;
    return os.str();
}

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

std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& errors){
    std::ostringstream os;
    os<<"{\"success\":"<<(success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<errors.size(); ++i){
        const auto &e=errors[i]; if(i) os<<",";
        os<<"{"
            "\"kind\":"<<json_escape(kind_name(e.kind))
            <<",\"code\":"<<json_escape(e.code)
            <<",\"message\":"<<json_escape(e.message)
            <<",\"hint\":"<<json_escape(e.hint)
            <<",\"line\":"<<e.line
            <<",\"col\":"<<e.col
            <<",\"start\":"<<e.span.start
            <<",\"end\":"<<e.span.end
            <<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const RunEnv& env, bool success, const std::vector<Diagnostic>& errors){
    if(!env.diagJson) return;
    auto js = diagnostics_to_json(success, errors);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace weft
