#pragma once
#include "weft/registry.hpp"
#include "weft/runtime.hpp"
#include "weft/structure.hpp"
#include "weft/tokenizer.hpp"
#include "weft/walk/parser.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace weft::walk {

// Everything a tree-walking language supplies to the kernel.
struct Language {
    std::string name;
    std::shared_ptr<const LexemeTable> lexemes; // frozen
    Scanner scanner;
    Normalizer normalize;
    Grammar grammar;
    std::function<void(Parser&)> install_rules;
    const ValueFactory* values = nullptr;
};

// Tokenize, normalize and parse. Throws lexical/parse errors; no partial tree.
std::vector<NodePtr> compile(const Language& lang, std::string_view source);

// Executes top-level statements in order; signals reaching the top level are scope errors.
Value execute_program(Runtime& rt, const std::vector<NodePtr>& program, const RunOptions& opts);

// compile + execute with a fresh Environment. Errors become diagnostics.
// opts.dispatcher is used as-is; a null dispatcher makes every extern call fail.
RunResult run(const Language& lang, std::string_view source, const RunOptions& opts = {});

} // namespace weft::walk
