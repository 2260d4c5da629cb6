// diagnostics.hpp - user-facing error records and their JSON form
#pragma once
#include "weft/error.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace weft {

struct RunEnv;

struct Diagnostic {
    ErrorKind kind = ErrorKind::runtime;
    std::string code;
    std::string message;
    std::string hint;
    int line = -1;
    int col = -1;
    Span span{};
};

// Collects diagnostics for one compile/run; shared by the language runners.
struct ErrorReporter {
    std::vector<Diagnostic>* errors = nullptr;
    void emit(const Diagnostic& d){ if(errors) errors->push_back(d); }
    Diagnostic make(const error& e, std::string_view source) const;
};

// Locates the error's span in `source`. Errors without a span get line/col -1.
Diagnostic to_diagnostic(const error& e, std::string_view source);

// "file:line:col: error[CODE]: message" plus an indented hint line when present.
std::string format_diagnostic(const Diagnostic& d, std::string_view filename);

std::string json_escape(const std::string& s);

std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& errors);

// Prints the JSON form to stderr when WEFT_DIAG_JSON=1.
void maybe_print_json(const RunEnv& env, bool success, const std::vector<Diagnostic>& errors);

} // namespace weft
