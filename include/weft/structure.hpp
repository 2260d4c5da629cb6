// Structural normalizers: turn the flat token stream into the block structure a
// language's parser expects. A language picks one (or supplies its own).
#pragma once
#include "weft/token.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace weft {

using Normalizer = std::function<std::vector<Token>(std::string_view source, std::vector<Token> tokens)>;

struct IndentOptions {
    int width = 4;
    // Newlines between these bracket lexemes are dropped (implicit line joining).
    std::vector<std::pair<std::string, std::string>> brackets;
};

// Offside rule. Emits NEWLINE after every logical line, INDENT when a line is one
// level deeper than the previous, one DEDENT per closed level, and a final EOF.
// Blank and comment-only lines are ignored. Input must contain the newline tokens
// (role "newline"); indentation is measured from the source text.
std::vector<Token> normalize_indentation(std::string_view source, std::vector<Token> tokens, const IndentOptions& opts);

// Checks that every opening delimiter has its matching close, then appends EOF.
std::vector<Token> check_delimiters(std::string_view source, std::vector<Token> tokens,
                                    const std::vector<std::pair<std::string, std::string>>& pairs);

inline Normalizer indentation_normalizer(IndentOptions opts){
    return [opts](std::string_view src, std::vector<Token> toks){ return normalize_indentation(src, std::move(toks), opts); };
}
inline Normalizer delimiter_normalizer(std::vector<std::pair<std::string, std::string>> pairs){
    return [pairs](std::string_view src, std::vector<Token> toks){ return check_delimiters(src, std::move(toks), pairs); };
}

} // namespace weft
