#pragma once
#include "weft/error.hpp"
#include <string>

namespace weft {

// Roles produced by the kernel's structural normalizers.
namespace roles {
inline constexpr const char* newline = "newline";
inline constexpr const char* indent = "indent";
inline constexpr const char* dedent = "dedent";
inline constexpr const char* eof = "eof";
} // namespace roles

struct Token {
    std::string lexeme;
    std::string role;
    Span span;

    bool is(const char* text) const { return lexeme == text; }
    bool is(const std::string& text) const { return lexeme == text; }
    bool has_role(const char* r) const { return role == r; }
    bool has_role(const std::string& r) const { return role == r; }
};

// Short printable form for error messages: the lexeme, or the role for synthetic tokens.
inline std::string describe(const Token& t){
    if(t.role == roles::eof) return "end of input";
    if(t.lexeme.empty() || t.role == roles::newline) return t.role;
    return "'" + t.lexeme + "'";
}

} // namespace weft
