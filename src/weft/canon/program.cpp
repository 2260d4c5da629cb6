#include "weft/canon/program.hpp"
#include "weft/canon/edn_form.hpp"
#include "weft/config.hpp"
#include "weft/diagnostics.hpp"
#include <iostream>

namespace weft::canon {

namespace {

std::vector<Token> scan(const Language& lang, std::string_view source){
    if(!lang.schema || !lang.schema->lexemes.frozen())
        throw config_error("C305", "language '" + lang.name + "' has no finalized schema");
    auto tokens = tokenize(source, lang.schema->lexemes, lang.scanner);
    if(lang.normalize) return lang.normalize(source, std::move(tokens));
    return check_delimiters(source, std::move(tokens), lang.schema->delimiter_pairs());
}

} // namespace

edn::node_ptr lower(const Language& lang, std::string_view source){
    Reducer reducer(lang.schema, lang.desugar);
    return reducer.lower(scan(lang, source));
}

InstrPtr compile(const Language& lang, std::string_view source){
    auto form = lower(lang, source);
    if(process_env().tracing("canon")) trace("canon", "%s", edn::to_pretty_string(form).c_str());
    return from_edn(form);
}

Value execute_program(Executor& ex, const Instruction& program, const RunOptions& opts){
    Runtime& rt = ex.runtime();
    if(program.tag != Tag::Sequence){
        Exec r = ex.execute(program);
        rt.check_top_level(r, program.span);
        return r.value.empty() ? rt.values().nil() : r.value;
    }
    Value last = rt.values().nil();
    for(size_t i = 0; i < program.children.size(); ++i){
        if(opts.between_statements) opts.between_statements(i);
        const Instruction& stmt = *program.children[i];
        Exec r = ex.execute(stmt);
        rt.check_top_level(r, stmt.span);
        if(!r.value.empty()) last = r.value;
    }
    return last;
}

RunResult run(const Language& lang, std::string_view source, const RunOptions& opts){
    RunResult res;
    ErrorReporter reporter{&res.diagnostics};
    if(!lang.semantics){
        reporter.emit(reporter.make(config_error("C306", "language '" + lang.name + "' has no semantics"), source));
        return res;
    }
    try {
        auto program = compile(lang, source);
        if(opts.env.dumpCanon){
            std::ostream& err = opts.err ? *opts.err : std::cerr;
            err << edn::to_pretty_string(to_edn(program)) << "\n";
        }
        Environment env;
        Runtime rt(env, *lang.semantics, opts.dispatcher.get(), opts.env.maxDepth);
        Executor ex(rt, *lang.semantics, lang.schema);
        res.value = execute_program(ex, *program, opts);
        res.success = true;
    } catch(const weft::error& e) {
        trace("exec", "run failed: %s", e.what());
        reporter.emit(reporter.make(e, source));
    }
    maybe_print_json(opts.env, res.success, res.diagnostics);
    return res;
}

} // namespace weft::canon
