#include "curlite/curlite.hpp"
#include "curlite/schema_text.hpp"
#include "weft/host/capabilities.hpp"
#include <iostream>

namespace curlite {

std::shared_ptr<const weft::canon::Schema> schema(){
    static const std::shared_ptr<const weft::canon::Schema> s = weft::canon::load_schema(kSchemaText);
    return s;
}

const weft::canon::Language& language(){
    static const weft::canon::Language lang = []{
        weft::canon::Language l;
        l.name = "curlite";
        l.schema = schema();
        l.scanner = scanner();
        l.normalize = weft::delimiter_normalizer(l.schema->delimiter_pairs());
        l.desugar = desugar();
        l.semantics = &semantics();
        return l;
    }();
    return lang;
}

weft::RunResult run(std::string_view source, const weft::RunOptions& opts){
    const weft::canon::Language* lang = nullptr;
    try {
        lang = &language();
    } catch(const weft::error& e) {
        weft::RunResult res;
        weft::ErrorReporter reporter{&res.diagnostics};
        reporter.emit(reporter.make(e, source));
        weft::maybe_print_json(opts.env, false, res.diagnostics);
        return res;
    }
    if(opts.dispatcher) return weft::canon::run(*lang, source, opts);
    weft::RunOptions withHost = opts;
    withHost.dispatcher = weft::host::default_registry(semantics(), opts.out ? *opts.out : std::cout, opts.err ? *opts.err : std::cerr);
    return weft::canon::run(*lang, source, withHost);
}

} // namespace curlite
