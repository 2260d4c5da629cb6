#include "weft/walk/program.hpp"
#include "weft/config.hpp"
#include "weft/diagnostics.hpp"

namespace weft::walk {

Value Node::evaluate(Runtime&) const {
    throw runtime_error("R701", "statement used where a value is required", span_);
}

Exec execute_all(Runtime& rt, const std::vector<NodePtr>& statements){
    Exec last = Exec::normal();
    for(auto& s : statements){
        last = s->execute(rt);
        if(last.interrupted()) return last;
    }
    return last;
}

Value Function::call(Runtime& rt, const std::vector<Value>& args, Span span) const {
    return rt.call(*this, args, span, [&]{ return execute_all(rt, body_); });
}

std::vector<NodePtr> compile(const Language& lang, std::string_view source){
    if(!lang.lexemes || !lang.lexemes->frozen())
        throw config_error("C305", "language '" + lang.name + "' has no frozen lexeme table");
    auto tokens = tokenize(source, *lang.lexemes, lang.scanner);
    if(lang.normalize) tokens = lang.normalize(source, std::move(tokens));
    Parser parser(std::move(tokens), lang.grammar);
    if(lang.install_rules) lang.install_rules(parser);
    return parser.parse_program();
}

Value execute_program(Runtime& rt, const std::vector<NodePtr>& program, const RunOptions& opts){
    Value last = rt.values().nil();
    for(size_t i = 0; i < program.size(); ++i){
        if(opts.between_statements) opts.between_statements(i);
        Exec r = program[i]->execute(rt);
        rt.check_top_level(r, program[i]->span());
        if(!r.value.empty()) last = r.value;
    }
    return last;
}

RunResult run(const Language& lang, std::string_view source, const RunOptions& opts){
    RunResult res;
    ErrorReporter reporter{&res.diagnostics};
    if(!lang.values){
        reporter.emit(reporter.make(config_error("C306", "language '" + lang.name + "' has no value factory"), source));
        return res;
    }
    try {
        auto program = compile(lang, source);
        Environment env;
        Runtime rt(env, *lang.values, opts.dispatcher.get(), opts.env.maxDepth);
        res.value = execute_program(rt, program, opts);
        res.success = true;
    } catch(const weft::error& e) {
        trace("exec", "run failed: %s", e.what());
        reporter.emit(reporter.make(e, source));
    }
    maybe_print_json(opts.env, res.success, res.diagnostics);
    return res;
}

} // namespace weft::walk
