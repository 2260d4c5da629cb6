#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace weft {

enum class Assoc { left, right, none };
enum class ShortCircuit { none, and_then, or_else };

struct OperatorInfo {
    int precedence = 0;
    Assoc assoc = Assoc::left;
    ShortCircuit short_circuit = ShortCircuit::none;
};

// Binding power of infix and prefix operators, keyed by lexeme. Higher binds tighter.
class OperatorTable {
public:
    // Re-registering an identical entry is a no-op; a different one is a configuration error.
    OperatorTable& add_infix(const std::string& lexeme, OperatorInfo info);
    OperatorTable& add_prefix(const std::string& lexeme, int precedence);

    const OperatorInfo* infix(std::string_view lexeme) const;
    std::optional<int> prefix(std::string_view lexeme) const;

    const std::map<std::string, OperatorInfo, std::less<>>& infix_entries() const { return infix_; }
    const std::map<std::string, int, std::less<>>& prefix_entries() const { return prefix_; }

private:
    std::map<std::string, OperatorInfo, std::less<>> infix_;
    std::map<std::string, int, std::less<>> prefix_;
};

} // namespace weft
