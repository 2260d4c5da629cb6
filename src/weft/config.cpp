#include "weft/config.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace weft {

bool RunEnv::tracing(const char* component) const {
    if(traceAll) return true;
    for(auto& c : traceComponents) if(c == component) return true;
    return false;
}

// Reads process env vars and constructs a RunEnv.
RunEnv detectEnv(){
    RunEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("WEFT_TRACE")){
        std::string s(v);
        if (s == "1" || s == "all") e.traceAll = true;
        else if (s != "0") {
            std::stringstream ss(s); std::string part;
            while (std::getline(ss, part, ',')) if (!part.empty()) e.traceComponents.push_back(part);
        }
    }

    if (const char* v = get("WEFT_DIAG_JSON")) e.diagJson = (std::string(v) == "1");

    if (const char* v = get("WEFT_MAX_DEPTH")){
        char* end = nullptr;
        unsigned long long n = std::strtoull(v, &end, 10);
        if (end && *end == '\0') e.maxDepth = static_cast<size_t>(n);
        else std::fprintf(stderr, "[weft][config] ignoring non-numeric WEFT_MAX_DEPTH='%s'\n", v);
    }

    if (const char* v = get("WEFT_DUMP_CANON")) e.dumpCanon = (std::string(v) == "1");

    return e;
}

static RunEnv& cached_env(){ static RunEnv env = detectEnv(); return env; }

const RunEnv& process_env(){ return cached_env(); }

void refresh_trace_env(){ cached_env() = detectEnv(); }

void trace(const char* component, const char* fmt, ...){
    if(!cached_env().tracing(component)) return;
    std::fprintf(stderr, "[weft][%s] ", component);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace weft
