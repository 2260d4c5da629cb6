#pragma once
#include "weft/canon/instruction.hpp"
#include "weft/canon/schema.hpp"
#include "weft/runtime.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace weft::canon {

// Operator meanings and literal conversion supplied by the language.
class Semantics : public ValueFactory {
public:
    // `text` is the literal's source lexeme (strings keep their quotes).
    virtual Value literal(const std::string& role, const std::string& text, Span span) const = 0;
    // One operand for prefix operators, two for infix operators.
    virtual Value apply(const std::string& op, const std::vector<Value>& operands, Span span) const = 0;
};

class Executor;

class Function : public Callable {
public:
    Function(std::string name, std::vector<std::string> params, InstrPtr body)
        : Callable(std::move(name), std::move(params)), body_(std::move(body)) {}
    std::shared_ptr<const ValueObject> clone() const override { return std::make_shared<Function>(*this); }
    const InstrPtr& body() const { return body_; }
    Value call(Executor& ex, const std::vector<Value>& args, Span span) const;
private:
    InstrPtr body_;
};

// Single dispatch over the seven canonical tags.
class Executor {
public:
    Executor(Runtime& rt, const Semantics& sem, std::shared_ptr<const Schema> schema = nullptr)
        : rt_(rt), sem_(sem), schema_(std::move(schema)) {}

    Exec execute(const Instruction& in);
    // Value of an expression instruction; a control transfer here is a scope error.
    Value evaluate(const Instruction& in);

    Runtime& runtime() { return rt_; }

private:
    Exec scope(const Instruction& in);
    Exec branch(const Instruction& in);
    Exec assign(const Instruction& in);
    Value invoke(const Instruction& in);
    Value operate(const Instruction& in);
    Value literal(const Instruction& in);
    bool condition(const Instruction& in, const char* what);

    Runtime& rt_;
    const Semantics& sem_;
    std::shared_ptr<const Schema> schema_;
    std::unordered_map<const Instruction*, Value> literals_;
};

} // namespace weft::canon
