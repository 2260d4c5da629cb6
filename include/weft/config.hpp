#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace weft {

// Process-level switches, read once from the environment:
//   WEFT_TRACE=1 | WEFT_TRACE=lex,parse,exec,extern  component tracing on stderr
//   WEFT_DIAG_JSON=1                                  JSON diagnostics on stderr
//   WEFT_MAX_DEPTH=<n>                                call depth limit (0 = unlimited, default 1000)
//   WEFT_DUMP_CANON=1                                 print canonical EDN before running
inline constexpr size_t kDefaultMaxDepth = 1000;

struct RunEnv {
    bool traceAll = false;
    std::vector<std::string> traceComponents;
    bool diagJson = false;
    size_t maxDepth = kDefaultMaxDepth;
    bool dumpCanon = false;

    bool tracing(const char* component) const;
};

RunEnv detectEnv();

// Cached detectEnv() result used by trace(); refresh_trace_env() re-reads it.
const RunEnv& process_env();
void refresh_trace_env();

// "[weft][component] message" on stderr when the component is enabled.
void trace(const char* component, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace weft
