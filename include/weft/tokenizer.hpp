#pragma once
#include "weft/registry.hpp"
#include "weft/token.hpp"
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace weft {

// Language-supplied scanner for open-ended lexemes (identifiers, numbers, strings).
// Returns the matched length and the role to report, or nullopt.
struct ScanMatch {
    size_t length = 0;
    std::string role;
};
using Scanner = std::function<std::optional<ScanMatch>(std::string_view rest)>;

// Maximal munch over `table` and `fallback`: at each position the longer of the
// registered-lexeme match and the scanner match wins; a tie goes to the registered
// lexeme. Skip lexemes and line comments are consumed without being emitted.
// Throws lex_error when nothing matches.
std::vector<Token> tokenize(std::string_view source, const LexemeTable& table, const Scanner& fallback);

} // namespace weft
