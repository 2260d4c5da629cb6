// Kernel error hierarchy. Errors travel as exceptions inside the kernel and are
// turned into Diagnostic values at the public run/invoke boundaries.
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace weft {

// Half-open byte range [start, end) into the source text.
struct Span {
    size_t start = 0;
    size_t end = 0;
    size_t size() const { return end - start; }
    bool empty() const { return start == end; }
};

inline Span join(Span a, Span b){ return Span{a.start < b.start ? a.start : b.start, a.end > b.end ? a.end : b.end}; }

struct Location { int line = 1; int col = 1; };

// 1-based line/column of a byte offset. Offsets past the end clamp to the end.
Location locate(std::string_view source, size_t offset);

enum class ErrorKind { lexical, parse, configuration, runtime_type, scope, extern_resolution, runtime };

const char* kind_name(ErrorKind k);

class error : public std::runtime_error {
public:
    error(ErrorKind kind, std::string code, const std::string& message, Span span = {}, std::string hint = {})
        : std::runtime_error(message), kind_(kind), code_(std::move(code)), span_(span), hint_(std::move(hint)) {}
    ErrorKind kind() const { return kind_; }
    const std::string& code() const { return code_; }
    Span span() const { return span_; }
    const std::string& hint() const { return hint_; }
    bool has_span() const { return !span_.empty(); }
private:
    ErrorKind kind_;
    std::string code_;
    Span span_;
    std::string hint_;
};

// Codes: L1xx lexical, P2xx parse, C3xx configuration, R4xx runtime type,
// S5xx scope, X6xx extern resolution, R7xx other runtime.
struct lex_error : error {
    lex_error(std::string code, const std::string& msg, Span span, std::string hint = {})
        : error(ErrorKind::lexical, std::move(code), msg, span, std::move(hint)) {}
};
struct parse_error : error {
    parse_error(std::string code, const std::string& msg, Span span, std::string hint = {})
        : error(ErrorKind::parse, std::move(code), msg, span, std::move(hint)) {}
};
struct config_error : error {
    config_error(std::string code, const std::string& msg, std::string hint = {})
        : error(ErrorKind::configuration, std::move(code), msg, Span{}, std::move(hint)) {}
};
struct type_error : error {
    type_error(std::string code, const std::string& msg, Span span = {}, std::string hint = {})
        : error(ErrorKind::runtime_type, std::move(code), msg, span, std::move(hint)) {}
};
struct scope_error : error {
    scope_error(std::string code, const std::string& msg, Span span = {}, std::string hint = {})
        : error(ErrorKind::scope, std::move(code), msg, span, std::move(hint)) {}
};
struct extern_error : error {
    extern_error(std::string code, const std::string& msg, Span span = {}, std::string hint = {})
        : error(ErrorKind::extern_resolution, std::move(code), msg, span, std::move(hint)) {}
};
struct runtime_error : error {
    runtime_error(std::string code, const std::string& msg, Span span = {}, std::string hint = {})
        : error(ErrorKind::runtime, std::move(code), msg, span, std::move(hint)) {}
};

} // namespace weft
