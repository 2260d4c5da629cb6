// Canonical instruction set of the schema-driven variant. Every executable
// construct is expressed with these seven tags and nothing else.
#pragma once
#include "weft/error.hpp"
#include <memory>
#include <string>
#include <vector>

namespace weft::canon {

enum class Tag { Sequence, Scope, Branch, Assign, Invoke, Operate, Transfer };
enum class AssignMode { set, bind };
enum class TransferKind { Return, Break, Continue };

const char* tag_name(Tag t);

struct Instruction;
using InstrPtr = std::shared_ptr<const Instruction>;

// Reserved Operate operators: leaves of the tree.
namespace ops {
inline constexpr const char* constant = "const"; // literal: role + text
inline constexpr const char* load = "load";      // name lookup
inline constexpr const char* lambda = "lambda";  // function value: params + body
} // namespace ops

struct Instruction {
    Tag tag = Tag::Sequence;
    Span span{};

    // Sequence: statements. Scope: one body. Branch: condition, then, optional else.
    // Assign: value. Invoke: arguments. Operate: operands (lambda: body).
    // Transfer: optional value.
    std::vector<InstrPtr> children;

    // Assign target, Invoke callee name or selector, Operate operator, load name.
    std::string name;

    bool repeat = false;              // Scope: loop boundary, one frame per iteration
    AssignMode mode = AssignMode::set;
    bool external = false;            // Invoke: `name` is an extern selector
    TransferKind transfer = TransferKind::Return;

    // Operate const: literal role and text.
    std::string literal_role;
    std::string literal_text;
    // Operate lambda: parameter names.
    std::vector<std::string> params;

    bool is_operate(const char* op) const { return tag == Tag::Operate && name == op; }
};

InstrPtr make_sequence(std::vector<InstrPtr> items, Span span = {});
InstrPtr make_scope(InstrPtr body, bool repeat = false, Span span = {});
InstrPtr make_branch(InstrPtr cond, InstrPtr then, InstrPtr otherwise = nullptr, Span span = {});
InstrPtr make_assign(AssignMode mode, std::string name, InstrPtr value, Span span = {});
InstrPtr make_invoke(std::string callee, std::vector<InstrPtr> args, bool external, Span span = {});
InstrPtr make_operate(std::string op, std::vector<InstrPtr> operands, Span span = {});
InstrPtr make_const(std::string role, std::string text, Span span = {});
InstrPtr make_load(std::string name, Span span = {});
InstrPtr make_lambda(std::vector<std::string> params, InstrPtr body, Span span = {});
InstrPtr make_transfer(TransferKind kind, InstrPtr value = nullptr, Span span = {});

// Structural equality; spans are ignored.
bool equal(const InstrPtr& a, const InstrPtr& b);

} // namespace weft::canon
