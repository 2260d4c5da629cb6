#pragma once
#include "weft/canon/executor.hpp"
#include "weft/canon/reducer.hpp"
#include "weft/runtime.hpp"
#include "weft/structure.hpp"
#include "weft/tokenizer.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace weft::canon {

// Everything a schema-driven language supplies to the kernel.
struct Language {
    std::string name;
    std::shared_ptr<const Schema> schema; // finalized
    Scanner scanner;
    Normalizer normalize;
    std::shared_ptr<const edn::Transformer> desugar;
    const Semantics* semantics = nullptr;
};

// Canonical EDN form of `source` (after macro expansion).
edn::node_ptr lower(const Language& lang, std::string_view source);
InstrPtr compile(const Language& lang, std::string_view source);

// Runs the children of a top-level (seq ...) in the global frame.
Value execute_program(Executor& ex, const Instruction& program, const RunOptions& opts);

RunResult run(const Language& lang, std::string_view source, const RunOptions& opts = {});

} // namespace weft::canon
