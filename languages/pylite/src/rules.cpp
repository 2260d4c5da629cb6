#include "nodes.hpp"
#include "pylite/pylite.hpp"
#include "weft/extern.hpp"
#include <memory>
#include <stdexcept>

namespace pylite {

using namespace weft::walk;
using weft::Span;
using weft::Token;
using weft::Value;

const weft::OperatorTable& operators(){
    static const weft::OperatorTable table = []{
        weft::OperatorTable t;
        t.add_infix("or", {1, weft::Assoc::left, weft::ShortCircuit::or_else});
        t.add_infix("and", {2, weft::Assoc::left, weft::ShortCircuit::and_then});
        for(const char* op : {"==", "!=", "<", "<=", ">", ">="}) t.add_infix(op, {4, weft::Assoc::none});
        t.add_infix("+", {5}).add_infix("-", {5});
        t.add_infix("*", {6}).add_infix("/", {6}).add_infix("%", {6});
        t.add_infix("^", {8, weft::Assoc::right});
        t.add_prefix("not", 3).add_prefix("-", 7);
        return t;
    }();
    return table;
}

namespace {

Span from(const Token& first, const NodePtr& last){ return Span{first.span.start, last ? last->span().end : first.span.end}; }

std::string unescape(const Token& t){
    std::string out;
    const std::string& s = t.lexeme;
    for(size_t i = 1; i + 1 < s.size(); ++i){
        if(s[i] != '\\'){ out += s[i]; continue; }
        char c = s[++i];
        switch(c){
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            default:
                throw weft::lex_error("L103", std::string("unknown escape '\\") + c + "' in string literal", Span{t.span.start + i - 1, t.span.start + i + 1});
        }
    }
    return out;
}

// expr ("," expr)* ")" after the opening token has been consumed. `end` receives
// the end offset of the closing parenthesis.
std::vector<NodePtr> arguments(Parser& p, const Token& open, size_t& end){
    std::vector<NodePtr> args;
    if(!p.at(")")){
        do { args.push_back(p.parse_expr()); } while(p.accept(","));
    }
    end = p.expect_closing(")", open).span.end;
    return args;
}

// Prefix rules

static double number_of(const Token& t){
    try {
        return std::stod(t.lexeme);
    } catch(const std::out_of_range&) {
        throw weft::lex_error("L104", "number literal '" + t.lexeme + "' is out of range", t.span);
    }
}

class LiteralRule : public PrefixRule {
public:
    bool matches(const Token& t) const override {
        return t.has_role("number") || t.has_role("string") || t.has_role("constant");
    }
    NodePtr parse(Parser&, const Token& t) const override {
        Value v;
        if(t.has_role("number")) v = values().number(number_of(t));
        else if(t.has_role("string")) v = values().text(unescape(t));
        else if(t.is("True")) v = values().boolean(true);
        else if(t.is("False")) v = values().boolean(false);
        else v = values().nil();
        return std::make_shared<nodes::Literal>(std::move(v), t.span);
    }
};

class NameRule : public PrefixRule {
public:
    bool matches(const Token& t) const override { return t.has_role("ident"); }
    NodePtr parse(Parser& p, const Token& t) const override {
        if(p.at("(")){
            Token open = p.advance();
            size_t end = 0;
            auto args = arguments(p, open, end);
            return std::make_shared<nodes::Call>(t.lexeme, std::move(args), Span{t.span.start, end});
        }
        return std::make_shared<nodes::Name>(t.lexeme, t.span);
    }
};

class GroupRule : public PrefixRule {
public:
    bool matches(const Token& t) const override { return t.is("("); }
    NodePtr parse(Parser& p, const Token& t) const override {
        NodePtr inner = p.parse_expr(0);
        p.expect_closing(")", t);
        return inner;
    }
};

class PrefixOperatorRule : public PrefixRule {
public:
    bool matches(const Token& t) const override { return t.has_role("op") && operators().prefix(t.lexeme).has_value(); }
    NodePtr parse(Parser& p, const Token& t) const override {
        NodePtr operand = p.parse_expr(*operators().prefix(t.lexeme));
        return std::make_shared<nodes::Unary>(t.lexeme, operand, from(t, operand));
    }
};

class PrintRule : public PrefixRule {
public:
    bool matches(const Token& t) const override { return t.is("print"); }
    NodePtr parse(Parser& p, const Token& t) const override {
        Token open = p.expect("(", "after 'print'");
        size_t end = 0;
        auto args = arguments(p, open, end);
        return std::make_shared<nodes::ExternCall>("io:println", std::move(args), Span{t.span.start, end});
    }
};

class ExternRule : public PrefixRule {
public:
    bool matches(const Token& t) const override { return t.is("extern"); }
    NodePtr parse(Parser& p, const Token& t) const override {
        Token open = p.expect("(", "after 'extern'");
        const Token& sel = p.peek();
        if(!sel.has_role("string"))
            p.fail("extern selector must be a quoted string literal, found " + weft::describe(sel), sel,
                   "write extern(\"backend:capability\", ...)");
        std::string text = unescape(sel);
        if(text.empty()) p.fail("extern selector is empty", sel);
        if(!weft::parse_selector(text))
            p.fail("malformed extern selector \"" + text + "\"", sel, "use backend1|backend2:capability or a bare capability");
        p.advance();
        std::vector<NodePtr> args;
        size_t end = 0;
        if(p.accept(",")) args = arguments(p, open, end);
        else end = p.expect_closing(")", open).span.end;
        return std::make_shared<nodes::ExternCall>(text, std::move(args), Span{t.span.start, end});
    }
};

// Infix rule over the operator table

class BinaryRule : public InfixRule {
public:
    bool matches(const Token& t) const override { return t.has_role("op") && operators().infix(t.lexeme) != nullptr; }
    int precedence(const Token& t) const override { return operators().infix(t.lexeme)->precedence; }
    weft::Assoc associativity(const Token& t) const override { return operators().infix(t.lexeme)->assoc; }
    NodePtr parse(Parser& p, NodePtr left, const Token& op, int rhs_min) const override {
        NodePtr right = p.parse_expr(rhs_min);
        Span span{left->span().start, right->span().end};
        auto sc = operators().infix(op.lexeme)->short_circuit;
        if(sc != weft::ShortCircuit::none)
            return std::make_shared<nodes::Logical>(sc == weft::ShortCircuit::and_then, left, right, span);
        return std::make_shared<nodes::Binary>(op.lexeme, left, right, span);
    }
};

// Statement rules

class KeywordRule : public StatementRule {
public:
    explicit KeywordRule(const char* kw) : kw_(kw) {}
    bool matches(const Parser& p) const override { return p.at(kw_); }
protected:
    const char* kw_;
};

class DefRule : public KeywordRule {
public:
    DefRule() : KeywordRule("def") {}
    NodePtr parse(Parser& p) const override {
        Token kw = p.advance();
        Token name = p.expect_role("ident", "a function name after 'def'");
        Token open = p.expect("(", "after the function name");
        std::vector<std::string> params;
        if(!p.at(")")){
            do {
                Token param = p.expect_role("ident", "a parameter name");
                for(auto& prev : params)
                    if(prev == param.lexeme) p.fail("duplicate parameter '" + param.lexeme + "'", param);
                params.push_back(param.lexeme);
            } while(p.accept(","));
        }
        p.expect_closing(")", open);
        p.expect(":", "before the function body");
        auto body = p.parse_block();
        return std::make_shared<nodes::FunctionDef>(name.lexeme, std::move(params), std::move(body), kw.span);
    }
};

class IfRule : public KeywordRule {
public:
    IfRule() : KeywordRule("if") {}
    NodePtr parse(Parser& p) const override {
        Token kw = p.advance();
        std::vector<nodes::If::Arm> arms;
        NodePtr cond = p.parse_expr();
        p.expect(":", "after the 'if' condition");
        arms.push_back({cond, p.parse_block()});
        while(p.at("elif")){
            p.advance();
            NodePtr c = p.parse_expr();
            p.expect(":", "after the 'elif' condition");
            arms.push_back({c, p.parse_block()});
        }
        nodes::Block otherwise;
        if(p.accept("else")){
            p.expect(":", "after 'else'");
            otherwise = p.parse_block();
        }
        return std::make_shared<nodes::If>(std::move(arms), std::move(otherwise), kw.span);
    }
};

class WhileRule : public KeywordRule {
public:
    WhileRule() : KeywordRule("while") {}
    NodePtr parse(Parser& p) const override {
        Token kw = p.advance();
        NodePtr cond = p.parse_expr();
        p.expect(":", "after the 'while' condition");
        return std::make_shared<nodes::While>(cond, p.parse_block(), kw.span);
    }
};

class ForRule : public KeywordRule {
public:
    ForRule() : KeywordRule("for") {}
    NodePtr parse(Parser& p) const override {
        Token kw = p.advance();
        Token var = p.expect_role("ident", "a loop variable after 'for'");
        p.expect("in", "after the loop variable");
        if(!p.peek().is("range")) p.fail("expected 'range(start, end)' after 'in', found " + weft::describe(p.peek()), p.peek());
        p.advance();
        Token open = p.expect("(", "after 'range'");
        NodePtr lo = p.parse_expr();
        p.expect(",", "between the range bounds");
        NodePtr hi = p.parse_expr();
        p.expect_closing(")", open);
        p.expect(":", "after the range");
        return std::make_shared<nodes::ForRange>(var.lexeme, lo, hi, p.parse_block(), kw.span);
    }
};

class ReturnRule : public KeywordRule {
public:
    ReturnRule() : KeywordRule("return") {}
    NodePtr parse(Parser& p) const override {
        Token kw = p.advance();
        NodePtr value;
        const auto& g = p.grammar();
        if(!p.at_role(g.statement_end) && !p.at_role(g.block_close) && !p.at_end()) value = p.parse_expr();
        p.end_statement();
        return std::make_shared<nodes::Return>(value, from(kw, value));
    }
};

template <typename N>
class BareRule : public KeywordRule {
public:
    using KeywordRule::KeywordRule;
    NodePtr parse(Parser& p) const override {
        Token kw = p.advance();
        p.end_statement();
        return std::make_shared<N>(kw.span);
    }
};

class LetRule : public KeywordRule {
public:
    LetRule() : KeywordRule("let") {}
    NodePtr parse(Parser& p) const override {
        Token kw = p.advance();
        Token name = p.expect_role("ident", "a name after 'let'");
        p.expect("=", "after the name");
        NodePtr value = p.parse_expr();
        p.end_statement();
        return std::make_shared<nodes::Assign>(name.lexeme, value, true, from(kw, value));
    }
};

class AssignRule : public StatementRule {
public:
    bool matches(const Parser& p) const override { return p.at_role("ident") && p.peek_n(1).is("="); }
    NodePtr parse(Parser& p) const override {
        Token name = p.advance();
        p.advance();
        NodePtr value = p.parse_expr();
        p.end_statement();
        return std::make_shared<nodes::Assign>(name.lexeme, value, false, from(name, value));
    }
};

class ExpressionRule : public StatementRule {
public:
    bool matches(const Parser&) const override { return true; }
    NodePtr parse(Parser& p) const override {
        NodePtr e = p.parse_expr();
        if(p.at("=")) p.fail("left side of '=' must be a name", p.peek());
        p.end_statement();
        return e;
    }
};

} // namespace

void install_rules(Parser& p){
    p.add_prefix(std::make_shared<LiteralRule>())
     .add_prefix(std::make_shared<PrintRule>())
     .add_prefix(std::make_shared<ExternRule>())
     .add_prefix(std::make_shared<NameRule>())
     .add_prefix(std::make_shared<GroupRule>())
     .add_prefix(std::make_shared<PrefixOperatorRule>());
    p.add_infix(std::make_shared<BinaryRule>());
    p.add_statement(std::make_shared<DefRule>())
     .add_statement(std::make_shared<IfRule>())
     .add_statement(std::make_shared<WhileRule>())
     .add_statement(std::make_shared<ForRule>())
     .add_statement(std::make_shared<ReturnRule>())
     .add_statement(std::make_shared<BareRule<nodes::Break>>("break"))
     .add_statement(std::make_shared<BareRule<nodes::Continue>>("continue"))
     .add_statement(std::make_shared<LetRule>())
     .add_statement(std::make_shared<AssignRule>())
     .add_statement(std::make_shared<ExpressionRule>());
}

} // namespace pylite
