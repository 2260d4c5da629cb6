// pylite executable nodes.
#pragma once
#include "pylite/values.hpp"
#include "weft/walk/node.hpp"
#include <string>
#include <utility>
#include <vector>

namespace pylite::nodes {

using weft::Exec;
using weft::Runtime;
using weft::Span;
using weft::Value;
using weft::walk::Node;
using weft::walk::NodePtr;

using Block = std::vector<NodePtr>;

// Expressions

class Literal : public Node {
public:
    Literal(Value v, Span span) : Node(span), v_(std::move(v)) {}
    Value evaluate(Runtime&) const override { return v_; }
private:
    Value v_;
};

class Name : public Node {
public:
    Name(std::string name, Span span) : Node(span), name_(std::move(name)) {}
    Value evaluate(Runtime& rt) const override { return rt.env().get(name_, span()); }
    const std::string& name() const { return name_; }
private:
    std::string name_;
};

class Unary : public Node {
public:
    Unary(std::string op, NodePtr operand, Span span) : Node(span), op_(std::move(op)), operand_(std::move(operand)) {}
    Value evaluate(Runtime& rt) const override;
private:
    std::string op_;
    NodePtr operand_;
};

class Binary : public Node {
public:
    Binary(std::string op, NodePtr l, NodePtr r, Span span)
        : Node(span), op_(std::move(op)), l_(std::move(l)), r_(std::move(r)) {}
    Value evaluate(Runtime& rt) const override;
private:
    std::string op_;
    NodePtr l_, r_;
};

// `and` / `or`: the right operand runs only when the left does not decide.
class Logical : public Node {
public:
    Logical(bool is_and, NodePtr l, NodePtr r, Span span)
        : Node(span), and_(is_and), l_(std::move(l)), r_(std::move(r)) {}
    Value evaluate(Runtime& rt) const override;
private:
    bool and_;
    NodePtr l_, r_;
};

class Call : public Node {
public:
    Call(std::string callee, std::vector<NodePtr> args, Span span)
        : Node(span), callee_(std::move(callee)), args_(std::move(args)) {}
    Value evaluate(Runtime& rt) const override;
private:
    std::string callee_;
    std::vector<NodePtr> args_;
};

// extern("selector", args...) and print(args...), which routes to io:println.
class ExternCall : public Node {
public:
    ExternCall(std::string selector, std::vector<NodePtr> args, Span span)
        : Node(span), selector_(std::move(selector)), args_(std::move(args)) {}
    Value evaluate(Runtime& rt) const override;
private:
    std::string selector_;
    std::vector<NodePtr> args_;
};

// Statements

class Assign : public Node {
public:
    Assign(std::string name, NodePtr value, bool local, Span span)
        : Node(span), name_(std::move(name)), value_(std::move(value)), local_(local) {}
    Exec execute(Runtime& rt) const override;
private:
    std::string name_;
    NodePtr value_;
    bool local_;
};

class FunctionDef : public Node {
public:
    FunctionDef(std::string name, std::vector<std::string> params, Block body, Span span)
        : Node(span), name_(std::move(name)), params_(std::move(params)), body_(std::move(body)) {}
    Exec execute(Runtime& rt) const override;
private:
    std::string name_;
    std::vector<std::string> params_;
    Block body_;
};

class If : public Node {
public:
    struct Arm { NodePtr condition; Block body; };
    If(std::vector<Arm> arms, Block otherwise, Span span)
        : Node(span), arms_(std::move(arms)), else_(std::move(otherwise)) {}
    Exec execute(Runtime& rt) const override;
private:
    std::vector<Arm> arms_;
    Block else_;
};

class While : public Node {
public:
    While(NodePtr condition, Block body, Span span) : Node(span), cond_(std::move(condition)), body_(std::move(body)) {}
    Exec execute(Runtime& rt) const override;
private:
    NodePtr cond_;
    Block body_;
};

// for name in range(lo, hi)
class ForRange : public Node {
public:
    ForRange(std::string var, NodePtr lo, NodePtr hi, Block body, Span span)
        : Node(span), var_(std::move(var)), lo_(std::move(lo)), hi_(std::move(hi)), body_(std::move(body)) {}
    Exec execute(Runtime& rt) const override;
private:
    std::string var_;
    NodePtr lo_, hi_;
    Block body_;
};

class Return : public Node {
public:
    Return(NodePtr value, Span span) : Node(span), value_(std::move(value)) {}
    Exec execute(Runtime& rt) const override;
private:
    NodePtr value_;
};

class Break : public Node {
public:
    using Node::Node;
    Exec execute(Runtime&) const override { return Exec::brk(); }
};

class Continue : public Node {
public:
    using Node::Node;
    Exec execute(Runtime&) const override { return Exec::cont(); }
};

} // namespace pylite::nodes
