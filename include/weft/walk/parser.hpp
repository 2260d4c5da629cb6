// Handler-driven precedence-climbing parser. The language registers prefix, infix
// and statement rules; the parser knows only token movement and binding power.
#pragma once
#include "weft/operators.hpp"
#include "weft/token.hpp"
#include "weft/walk/node.hpp"
#include <memory>
#include <string>
#include <vector>

namespace weft::walk {

class Parser;

class PrefixRule {
public:
    virtual ~PrefixRule() = default;
    virtual bool matches(const Token& t) const = 0;
    // `t` has already been consumed.
    virtual NodePtr parse(Parser& p, const Token& t) const = 0;
};

class InfixRule {
public:
    virtual ~InfixRule() = default;
    virtual bool matches(const Token& t) const = 0;
    virtual int precedence(const Token& t) const = 0;
    virtual Assoc associativity(const Token& t) const { (void)t; return Assoc::left; }
    // `op` has already been consumed; parse the right side with parse_expr(rhs_min).
    virtual NodePtr parse(Parser& p, NodePtr left, const Token& op, int rhs_min) const = 0;
};

class StatementRule {
public:
    virtual ~StatementRule() = default;
    virtual bool matches(const Parser& p) const = 0;
    virtual NodePtr parse(Parser& p) const = 0;
};

// Structural roles the parser uses for blocks and statement ends.
struct Grammar {
    std::string statement_end = roles::newline;
    std::string block_open = roles::indent;
    std::string block_close = roles::dedent;
};

class Parser {
public:
    Parser(std::vector<Token> tokens, Grammar grammar = {});

    // Rules are consulted in registration order; the first match wins.
    Parser& add_prefix(std::shared_ptr<const PrefixRule> rule);
    Parser& add_infix(std::shared_ptr<const InfixRule> rule);
    Parser& add_statement(std::shared_ptr<const StatementRule> rule);

    const Token& peek() const { return peek_n(0); }
    const Token& peek_n(size_t n) const;
    Token advance();
    bool at(const char* lexeme) const { return peek().is(lexeme); }
    bool at_role(const std::string& role) const { return peek().has_role(role); }
    bool at_end() const { return peek().has_role(roles::eof); }
    // Consumes the token or throws parse_error naming what was expected.
    Token expect(const char* lexeme, const char* context = nullptr);
    Token expect_role(const std::string& role, const char* what);
    // Consumes `close`, or reports the unmatched `open` token.
    Token expect_closing(const char* close, const Token& open);
    bool accept(const char* lexeme);
    void skip_role(const std::string& role);

    NodePtr parse_expr(int min_prec = 0);
    NodePtr parse_statement();
    // statement_end, block_open, statements..., block_close
    std::vector<NodePtr> parse_block();
    // Consumes a statement terminator; the end of a block or input also ends a statement.
    void end_statement();
    std::vector<NodePtr> parse_program();

    const Grammar& grammar() const { return grammar_; }
    [[noreturn]] void fail(const std::string& message, const Token& at, std::string hint = {}) const;

private:
    const InfixRule* find_infix(const Token& t) const;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    Grammar grammar_;
    std::vector<std::shared_ptr<const PrefixRule>> prefix_;
    std::vector<std::shared_ptr<const InfixRule>> infix_;
    std::vector<std::shared_ptr<const StatementRule>> statements_;
};

} // namespace weft::walk
