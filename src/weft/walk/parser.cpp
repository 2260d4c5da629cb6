#include "weft/walk/parser.hpp"
#include "weft/config.hpp"
#include "weft/error.hpp"

namespace weft::walk {

Parser::Parser(std::vector<Token> tokens, Grammar grammar) : tokens_(std::move(tokens)), grammar_(std::move(grammar)) {
    if(tokens_.empty() || !tokens_.back().has_role(roles::eof)){
        size_t end = tokens_.empty() ? 0 : tokens_.back().span.end;
        tokens_.push_back(Token{std::string(), roles::eof, Span{end, end}});
    }
}

Parser& Parser::add_prefix(std::shared_ptr<const PrefixRule> rule){ prefix_.push_back(std::move(rule)); return *this; }
Parser& Parser::add_infix(std::shared_ptr<const InfixRule> rule){ infix_.push_back(std::move(rule)); return *this; }
Parser& Parser::add_statement(std::shared_ptr<const StatementRule> rule){ statements_.push_back(std::move(rule)); return *this; }

const Token& Parser::peek_n(size_t n) const {
    size_t i = pos_ + n;
    return i < tokens_.size() ? tokens_[i] : tokens_.back();
}

Token Parser::advance(){
    Token t = peek();
    if(!t.has_role(roles::eof)) ++pos_;
    return t;
}

void Parser::fail(const std::string& message, const Token& at, std::string hint) const {
    throw parse_error("P201", message, at.span, std::move(hint));
}

Token Parser::expect(const char* lexeme, const char* context){
    if(at(lexeme)) return advance();
    std::string msg = std::string("expected '") + lexeme + "'";
    if(context) msg += std::string(" ") + context;
    fail(msg + ", found " + describe(peek()), peek());
}

Token Parser::expect_role(const std::string& role, const char* what){
    if(at_role(role)) return advance();
    fail(std::string("expected ") + what + ", found " + describe(peek()), peek());
}

Token Parser::expect_closing(const char* close, const Token& open){
    if(at(close)) return advance();
    throw parse_error("P202", "unclosed '" + open.lexeme + "'", open.span,
                      std::string("expected '") + close + "' before " + describe(peek()));
}

bool Parser::accept(const char* lexeme){
    if(!at(lexeme)) return false;
    advance();
    return true;
}

void Parser::skip_role(const std::string& role){ while(at_role(role)) advance(); }

const InfixRule* Parser::find_infix(const Token& t) const {
    for(auto& r : infix_) if(r->matches(t)) return r.get();
    return nullptr;
}

NodePtr Parser::parse_expr(int min_prec){
    Token t = advance();
    const PrefixRule* prefix = nullptr;
    for(auto& r : prefix_) if(r->matches(t)){ prefix = r.get(); break; }
    if(!prefix) fail("expected an expression, found " + describe(t), t);
    NodePtr left = prefix->parse(*this, t);

    int chainedNone = -1;
    for(;;){
        const Token& next = peek();
        const InfixRule* rule = find_infix(next);
        if(!rule) break;
        int prec = rule->precedence(next);
        if(prec < min_prec) break;
        Assoc assoc = rule->associativity(next);
        if(assoc == Assoc::none && prec == chainedNone)
            fail("operator '" + next.lexeme + "' cannot be chained", next, "add parentheses");
        Token op = advance();
        left = rule->parse(*this, left, op, assoc == Assoc::right ? prec : prec + 1);
        chainedNone = assoc == Assoc::none ? prec : -1;
    }
    return left;
}

NodePtr Parser::parse_statement(){
    for(auto& r : statements_) if(r->matches(*this)) return r->parse(*this);
    fail("unexpected " + describe(peek()), peek());
}

void Parser::end_statement(){
    if(at_role(grammar_.statement_end)){ advance(); return; }
    if(at_role(grammar_.block_close) || at_end()) return;
    fail("expected end of statement, found " + describe(peek()), peek());
}

std::vector<NodePtr> Parser::parse_block(){
    skip_role(grammar_.statement_end);
    Token open = expect_role(grammar_.block_open, "an indented block");
    std::vector<NodePtr> body;
    for(;;){
        skip_role(grammar_.statement_end);
        if(at_role(grammar_.block_close)) break;
        if(at_end()) throw parse_error("P202", "unterminated block", open.span, "close the block before the end of input");
        body.push_back(parse_statement());
    }
    advance();
    return body;
}

std::vector<NodePtr> Parser::parse_program(){
    std::vector<NodePtr> program;
    for(;;){
        skip_role(grammar_.statement_end);
        if(at_end()) break;
        program.push_back(parse_statement());
    }
    trace("parse", "%zu top-level statements", program.size());
    return program;
}

} // namespace weft::walk
