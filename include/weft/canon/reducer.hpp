// Schema-driven reduction: tokens -> surface EDN (statement templates filled in)
// -> desugared canonical EDN (language macros) -> Instruction tree.
#pragma once
#include "weft/canon/instruction.hpp"
#include "weft/canon/schema.hpp"
#include "weft/token.hpp"
#include "weft/transform.hpp"
#include <memory>
#include <vector>

namespace weft::canon {

class Reducer {
public:
    Reducer(std::shared_ptr<const Schema> schema, std::shared_ptr<const edn::Transformer> desugar = nullptr);

    // Surface program form (seq ...) before macro expansion.
    edn::node_ptr reduce(std::vector<Token> tokens) const;
    // reduce + macro expansion: the canonical EDN form.
    edn::node_ptr lower(std::vector<Token> tokens) const;
    InstrPtr compile(std::vector<Token> tokens) const;

private:
    std::shared_ptr<const Schema> schema_;
    std::shared_ptr<const edn::Transformer> desugar_;
};

} // namespace weft::canon
