#include <cassert>
#include <cctype>
#include <iostream>
#include "weft/error.hpp"
#include "weft/registry.hpp"
#include "weft/tokenizer.hpp"

using namespace weft;

// Identifiers and digit runs, the shape every bundled language uses.
static std::optional<ScanMatch> word_scanner(std::string_view rest){
    size_t n = 0;
    if(std::isalpha(static_cast<unsigned char>(rest[0])) || rest[0] == '_'){
        while(n < rest.size() && (std::isalnum(static_cast<unsigned char>(rest[n])) || rest[n] == '_')) ++n;
        return ScanMatch{n, "ident"};
    }
    while(n < rest.size() && std::isdigit(static_cast<unsigned char>(rest[n]))) ++n;
    if(n) return ScanMatch{n, "number"};
    return std::nullopt;
}

static LexemeTable small_table(){
    LexemeTable t;
    t.add("=", "punct").add("==", "op").add("<", "op").add("<=", "op").add("if", "keyword");
    t.add_skip(" ");
    t.add_line_comment("#");
    t.freeze();
    return t;
}

static void test_maximal_munch(){
    auto t = small_table();
    auto toks = tokenize("a == b = c <= 1", t, word_scanner);
    assert(toks.size() == 7);
    assert(toks[1].lexeme == "==" && toks[1].role == "op");
    assert(toks[3].lexeme == "=" && toks[3].role == "punct");
    assert(toks[5].lexeme == "<=");
    assert(toks[1].span.start == 2 && toks[1].span.end == 4);

    auto kw = tokenize("if iffy", t, word_scanner);
    assert(kw.size() == 2);
    assert(kw[0].role == "keyword" && "a tie goes to the registered lexeme");
    assert(kw[1].lexeme == "iffy" && kw[1].role == "ident");
}

static void test_skip_and_comments(){
    auto t = small_table();
    auto toks = tokenize("x # = ignored\ny", t, [](std::string_view rest) -> std::optional<ScanMatch> {
        if(rest[0] == '\n') return ScanMatch{1, "nl"};
        return word_scanner(rest);
    });
    assert(toks.size() == 3);
    assert(toks[0].lexeme == "x" && toks[1].role == "nl" && toks[2].lexeme == "y");
}

static void test_comment_competes_by_length(){
    LexemeTable t;
    t.add("/", "op").add("//=", "op");
    t.add_skip(" ");
    t.add_line_comment("//");
    t.freeze();
    auto toks = tokenize("a //= b / c // d", t, word_scanner);
    assert(toks.size() == 5);
    assert(toks[1].lexeme == "//=" && toks[3].lexeme == "/" && toks[4].lexeme == "c");

    LexemeTable clash;
    clash.add("//", "op").add_line_comment("//");
    bool threw = false;
    try { clash.freeze(); } catch(const config_error& e) { threw = true; assert(e.code() == "C303"); }
    assert(threw && !clash.frozen());
}

static void test_unknown_character(){
    auto t = small_table();
    bool threw = false;
    try { (void)tokenize("a $ b", t, word_scanner); }
    catch(const lex_error& e) {
        threw = true;
        assert(e.code() == "L101");
        assert(e.span().start == 2 && e.span().end == 3);
    }
    assert(threw);
}

static void test_registry_conflicts(){
    LexemeTable t;
    t.add("+", "op");
    t.add("+", "op"); // idempotent
    bool threw = false;
    try { t.add("+", "punct"); } catch(const config_error& e) { threw = true; assert(e.code() == "C304"); }
    assert(threw && "conflicting role");

    t.add_skip(" ");
    threw = false;
    try { t.add(" ", "space"); } catch(const config_error& e) { threw = true; assert(e.code() == "C303"); }
    assert(threw && "skip and emitted");

    threw = false;
    try { t.add_skip("+"); } catch(const config_error& e) { threw = true; assert(e.code() == "C303"); }
    assert(threw && "emitted and skip");

    t.freeze();
    threw = false;
    try { t.add("-", "op"); } catch(const config_error& e) { threw = true; assert(e.code() == "C301"); }
    assert(threw && "frozen table");
    assert(t.contains("+") && t.role_of("+") == "op" && t.role_of(" ").empty());
}

void run_tokenizer_tests(){
    test_maximal_munch();
    test_skip_and_comments();
    test_comment_competes_by_length();
    test_unknown_character();
    test_registry_conflicts();
    std::cout << "[lex] registry/tokenizer tests passed\n";
}
