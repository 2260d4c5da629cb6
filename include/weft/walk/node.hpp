#pragma once
#include "weft/runtime.hpp"
#include <memory>
#include <vector>

namespace weft::walk {

// Executable node built by language handlers. Expression nodes override
// evaluate(); statement nodes override execute() when they can raise signals.
class Node {
public:
    explicit Node(Span span) : span_(span) {}
    virtual ~Node() = default;

    virtual Value evaluate(Runtime& rt) const;
    virtual Exec execute(Runtime& rt) const { return Exec::normal(evaluate(rt)); }

    Span span() const { return span_; }

private:
    Span span_;
};

using NodePtr = std::shared_ptr<const Node>;

// Statement list sharing the enclosing frame. Stops at the first signal.
Exec execute_all(Runtime& rt, const std::vector<NodePtr>& statements);

// User function whose body is a node tree; defined by the language's function statement.
class Function : public Callable {
public:
    Function(std::string name, std::vector<std::string> params, std::vector<NodePtr> body)
        : Callable(std::move(name), std::move(params)), body_(std::move(body)) {}
    std::shared_ptr<const ValueObject> clone() const override { return std::make_shared<Function>(*this); }
    Value call(Runtime& rt, const std::vector<Value>& args, Span span) const;
private:
    std::vector<NodePtr> body_;
};

} // namespace weft::walk
