#include <cassert>
#include <cctype>
#include <iostream>
#include <sstream>
#include "test_values.hpp"
#include "weft/walk/parser.hpp"
#include "weft/walk/program.hpp"

using namespace weft;
using namespace weft::walk;
using weft_test::as_int;

static const weft_test::TSemantics kValues;

namespace {

// Space-separated words; NL, IN and DE stand for the structural roles.
std::vector<Token> toks(const std::string& text){
    std::vector<Token> out;
    std::istringstream in(text);
    std::string w;
    size_t pos = 0;
    while(in >> w){
        std::string role = std::isdigit(static_cast<unsigned char>(w[0])) ? "number" : std::isalpha(static_cast<unsigned char>(w[0])) ? "ident" : "op";
        if(w == "NL") role = roles::newline;
        if(w == "IN") role = roles::indent;
        if(w == "DE") role = roles::dedent;
        out.push_back(Token{w, role, Span{pos, pos + w.size()}});
        pos += w.size() + 1;
    }
    return out;
}

struct Num : Node {
    Num(int64_t v, Span s) : Node(s), v(v) {}
    int64_t v;
    Value evaluate(Runtime& rt) const override { return rt.values().integer(v); }
};

struct Bin : Node {
    Bin(std::string op, NodePtr l, NodePtr r, Span s) : Node(s), op(std::move(op)), l(std::move(l)), r(std::move(r)) {}
    std::string op;
    NodePtr l, r;
    Value evaluate(Runtime& rt) const override {
        int64_t a = as_int(l->evaluate(rt)), b = as_int(r->evaluate(rt));
        if(op == "+") return rt.values().integer(a + b);
        if(op == "*") return rt.values().integer(a * b);
        if(op == "<") return rt.values().boolean(a < b);
        int64_t p = 1;
        for(int64_t i = 0; i < b; ++i) p *= a;
        return rt.values().integer(p);
    }
};

// Sums the values of its block; exists to exercise parse_block.
struct Total : Node {
    Total(std::vector<NodePtr> body, Span s) : Node(s), body(std::move(body)) {}
    std::vector<NodePtr> body;
    Value evaluate(Runtime& rt) const override {
        int64_t sum = 0;
        for(auto& b : body) sum += as_int(b->evaluate(rt));
        return rt.values().integer(sum);
    }
};

struct NumberRule : PrefixRule {
    bool matches(const Token& t) const override { return t.has_role("number"); }
    NodePtr parse(Parser&, const Token& t) const override { return std::make_shared<Num>(std::stoll(t.lexeme), t.span); }
};

struct GroupRule : PrefixRule {
    bool matches(const Token& t) const override { return t.is("("); }
    NodePtr parse(Parser& p, const Token& t) const override {
        NodePtr inner = p.parse_expr(0);
        p.expect_closing(")", t);
        return inner;
    }
};

struct BinaryRule : InfixRule {
    OperatorTable table;
    BinaryRule(){
        table.add_infix("<", {4, Assoc::none}).add_infix("+", {5, Assoc::left}).add_infix("*", {6, Assoc::left})
             .add_infix("^", {8, Assoc::right});
    }
    bool matches(const Token& t) const override { return t.has_role("op") && table.infix(t.lexeme); }
    int precedence(const Token& t) const override { return table.infix(t.lexeme)->precedence; }
    Assoc associativity(const Token& t) const override { return table.infix(t.lexeme)->assoc; }
    NodePtr parse(Parser& p, NodePtr left, const Token& op, int rhs_min) const override {
        NodePtr right = p.parse_expr(rhs_min);
        return std::make_shared<Bin>(op.lexeme, left, right, join(left->span(), right->span()));
    }
};

struct TotalRule : StatementRule {
    bool matches(const Parser& p) const override { return p.at("total"); }
    NodePtr parse(Parser& p) const override {
        Token kw = p.advance();
        p.expect(":", "after 'total'");
        auto body = p.parse_block();
        return std::make_shared<Total>(std::move(body), kw.span);
    }
};

struct ExpressionRule : StatementRule {
    bool matches(const Parser&) const override { return true; }
    NodePtr parse(Parser& p) const override {
        NodePtr e = p.parse_expr();
        p.end_statement();
        return e;
    }
};

Parser calculator(const std::string& text){
    Parser p(toks(text));
    p.add_prefix(std::make_shared<NumberRule>()).add_prefix(std::make_shared<GroupRule>());
    p.add_infix(std::make_shared<BinaryRule>());
    p.add_statement(std::make_shared<TotalRule>()).add_statement(std::make_shared<ExpressionRule>());
    return p;
}

int64_t value_of(const std::string& text){
    auto p = calculator(text);
    auto prog = p.parse_program();
    assert(prog.size() == 1);
    Environment env;
    Runtime rt(env, kValues, nullptr);
    return as_int(prog.front()->evaluate(rt));
}

std::string code_of(const std::string& text){
    try { auto p = calculator(text); (void)p.parse_program(); } catch(const parse_error& e) { return e.code(); }
    return "none";
}

} // namespace

static void test_precedence(){
    assert(value_of("1 + 2 * 3") == 7);
    assert(value_of("( 1 + 2 ) * 3") == 9);
    assert(value_of("2 ^ 3 ^ 2") == 512);
    assert(value_of("2 * 3 ^ 2 + 1") == 19);
    assert(value_of("10 + 1 + 1") == 12);
}

static void test_statements_and_blocks(){
    auto p = calculator("1 + 1 NL NL total : NL IN 1 NL 2 * 3 NL DE 4 NL");
    auto prog = p.parse_program();
    assert(prog.size() == 3);
    Environment env;
    Runtime rt(env, kValues, nullptr);
    assert(as_int(prog[1]->evaluate(rt)) == 7);
    RunOptions opts;
    assert(as_int(execute_program(rt, prog, opts)) == 4);
}

static void test_parse_errors(){
    assert(code_of("1 < 2 < 3") == "P201");
    assert(code_of("1 +") == "P201");
    assert(code_of("( 1 + 2") == "P202");
    assert(code_of("1 2") == "P201");
    assert(code_of("total : NL IN 1 NL") == "P202");
    assert(code_of("total NL IN 1 NL DE") == "P201");
    assert(code_of("1 < 2 + 3") == "none");
}

void run_parser_tests(){
    test_precedence();
    test_statements_and_blocks();
    test_parse_errors();
    std::cout << "[walk] precedence parser tests passed\n";
}
