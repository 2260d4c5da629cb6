// pylite: indentation-structured language hosted on the tree-walking variant.
#pragma once
#include "pylite/values.hpp"
#include "weft/walk/program.hpp"
#include <string_view>

namespace pylite {

// Identifiers, numbers and double-quoted strings (PEGTL rules).
weft::Scanner scanner();

const weft::OperatorTable& operators();

// Registers pylite's prefix, infix and statement rules on `p`.
void install_rules(weft::walk::Parser& p);

const weft::walk::Language& language();

// Runs with the default host backends when opts.dispatcher is null.
weft::RunResult run(std::string_view source, const weft::RunOptions& opts = {});

} // namespace pylite
