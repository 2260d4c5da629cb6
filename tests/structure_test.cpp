#include <cassert>
#include <cctype>
#include <iostream>
#include <string>
#include "weft/error.hpp"
#include "weft/structure.hpp"
#include "weft/tokenizer.hpp"

using namespace weft;

static LexemeTable layout_table(){
    LexemeTable t;
    t.add("\n", roles::newline).add(":", "punct").add("(", "punct").add(")", "punct").add(",", "punct")
     .add("{", "punct").add("}", "punct").add("[", "punct").add("]", "punct");
    t.add_skip(" ");
    t.add_skip("\t");
    t.add_line_comment("#");
    t.freeze();
    return t;
}

static std::optional<ScanMatch> words(std::string_view rest){
    size_t n = 0;
    while(n < rest.size() && std::isalnum(static_cast<unsigned char>(rest[n]))) ++n;
    if(n) return ScanMatch{n, "ident"};
    return std::nullopt;
}

static std::string roles_of(const std::vector<Token>& toks){
    std::string out;
    for(auto& t : toks){
        if(!out.empty()) out += ' ';
        if(t.role == roles::newline) out += "NL";
        else if(t.role == roles::indent) out += "IN";
        else if(t.role == roles::dedent) out += "DE";
        else if(t.role == roles::eof) out += "EOF";
        else out += t.lexeme;
    }
    return out;
}

static std::vector<Token> indent(const std::string& src){
    static const LexemeTable t = layout_table();
    IndentOptions opts;
    opts.brackets = {{"(", ")"}};
    return normalize_indentation(src, tokenize(src, t, words), opts);
}

static void test_offside_rule(){
    auto toks = indent("a:\n    b\n    c:\n        d\n\n    # note\ne\n");
    assert(roles_of(toks) == "a : NL IN b NL c : NL IN d NL DE DE e NL EOF");

    auto open = indent("a:\n    b");
    assert(roles_of(open) == "a : NL IN b NL DE EOF" && "blocks still open at the end are closed");

    auto joined = indent("f(a,\n  b)\nc\n");
    assert(roles_of(joined) == "f ( a , b ) NL c NL EOF" && "newlines inside brackets join lines");
}

static void test_indentation_errors(){
    auto code_of = [](const std::string& src){
        try { (void)indent(src); } catch(const parse_error& e) { return e.code(); }
        return std::string("none");
    };
    assert(code_of("a:\n\tb\n") == "P211");
    assert(code_of("a:\n  b\n") == "P212");
    assert(code_of("  a\n") == "P212");
    assert(code_of("a:\n    b:\n        c\n  d\n") == "P213");
}

static void test_delimiters(){
    static const LexemeTable t = layout_table();
    std::vector<std::pair<std::string, std::string>> pairs{{"{", "}"}, {"(", ")"}, {"[", "]"}};
    auto run = [&](const std::string& src){ return check_delimiters(src, tokenize(src, t, words), pairs); };

    auto ok = run("a { b ( c ) [ d ] }");
    assert(ok.back().role == roles::eof);

    auto code_of = [&](const std::string& src){
        try { (void)run(src); } catch(const parse_error& e) { return e.code(); }
        return std::string("none");
    };
    assert(code_of("a { b ( c }") == "P203");
    assert(code_of("a )") == "P203");
    assert(code_of("a { b") == "P202");
}

void run_structure_tests(){
    test_offside_rule();
    test_indentation_errors();
    test_delimiters();
    std::cout << "[structure] indentation/delimiter tests passed\n";
}
