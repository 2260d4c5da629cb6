// curlite: brace-structured language hosted on the schema-driven variant.
// The grammar is languages/curlite/curlite.edn; loops are desugared by macros.
#pragma once
#include "curlite/values.hpp"
#include "weft/canon/program.hpp"
#include <memory>
#include <string_view>

namespace curlite {

// Identifiers, integers and double-quoted strings (PEGTL rules).
weft::Scanner scanner();

// Loaded from the embedded curlite.edn on first use.
std::shared_ptr<const weft::canon::Schema> schema();

// Macros lowering the surface forms `while`, `until` and `for-range` to
// repeating scopes.
std::shared_ptr<const weft::edn::Transformer> desugar();

const weft::canon::Language& language();

// Runs with the default host backends when opts.dispatcher is null.
weft::RunResult run(std::string_view source, const weft::RunOptions& opts = {});

} // namespace curlite
