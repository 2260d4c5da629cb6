#include "pylite/pylite.hpp"
#include "weft/host/capabilities.hpp"
#include <iostream>

namespace pylite {

namespace {

std::shared_ptr<const weft::LexemeTable> lexemes(){
    auto t = std::make_shared<weft::LexemeTable>();
    for(const char* kw : {"def", "if", "elif", "else", "while", "for", "in", "return", "break", "continue", "let", "print", "extern"})
        t->add(kw, "keyword");
    for(const char* c : {"True", "False", "None"}) t->add(c, "constant");
    for(auto& [op, info] : operators().infix_entries()) t->add(op, "op");
    for(auto& [op, prec] : operators().prefix_entries()) t->add(op, "op");
    for(const char* p : {"(", ")", ",", ":", "="}) t->add(p, "punct");
    t->add("\n", weft::roles::newline);
    t->add_skip(" ");
    t->add_skip("\t");
    t->add_skip("\r");
    t->add_line_comment("#");
    t->freeze();
    return t;
}

} // namespace

const weft::walk::Language& language(){
    static const weft::walk::Language lang = []{
        weft::walk::Language l;
        l.name = "pylite";
        l.lexemes = lexemes();
        l.scanner = scanner();
        weft::IndentOptions indent;
        indent.width = 4;
        indent.brackets = {{"(", ")"}};
        l.normalize = weft::indentation_normalizer(indent);
        l.install_rules = install_rules;
        l.values = &values();
        return l;
    }();
    return lang;
}

weft::RunResult run(std::string_view source, const weft::RunOptions& opts){
    if(opts.dispatcher) return weft::walk::run(language(), source, opts);
    weft::RunOptions withHost = opts;
    withHost.dispatcher = weft::host::default_registry(values(), opts.out ? *opts.out : std::cout, opts.err ? *opts.err : std::cerr);
    return weft::walk::run(language(), source, withHost);
}

} // namespace pylite
