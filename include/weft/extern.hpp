// Boundary to host capabilities. A selector names an ordered list of candidate
// backends and a capability: "backend1|backend2:cap", or a bare "cap".
#pragma once
#include "weft/value.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace weft {

struct Selector {
    std::vector<std::string> backends; // empty for a bare capability
    std::string capability;

    std::string to_string() const;
};

// Grammar: name ('|' name)* ':' name | name, with name = [A-Za-z0-9_]+.
// Returns nullopt for anything else (including the empty string).
std::optional<Selector> parse_selector(std::string_view text);

struct InvokeResult {
    bool success = false;
    Value value;
    std::string error;

    static InvokeResult ok(Value v){ return InvokeResult{true, std::move(v), {}}; }
    static InvokeResult fail(std::string msg){ return InvokeResult{false, {}, std::move(msg)}; }
};

class ExternDispatcher {
public:
    virtual ~ExternDispatcher() = default;
    // Resolve and call. Named backends are tried left to right; when none provides
    // the capability the call fails and the error names every backend tried.
    // Never substitutes a backend the selector did not name.
    virtual InvokeResult invoke(std::string_view selector, const std::vector<Value>& args) = 0;
};

} // namespace weft
