#include "nodes.hpp"
#include "weft/env.hpp"

namespace pylite::nodes {

namespace {

bool condition(Runtime& rt, const Node& n, const char* what){
    Value v = n.evaluate(rt);
    auto t = v.truth();
    if(!t) throw weft::type_error("R402", std::string(what) + " must be a boolean, found " + v.type_name(), n.span());
    return *t;
}

std::vector<Value> evaluate_all(Runtime& rt, const std::vector<NodePtr>& xs){
    std::vector<Value> out;
    out.reserve(xs.size());
    for(auto& x : xs) out.push_back(x->evaluate(rt));
    return out;
}

Exec run_block(Runtime& rt, const Block& body){
    weft::ScopeGuard frame(rt.env());
    return weft::walk::execute_all(rt, body);
}

} // namespace

Value Unary::evaluate(Runtime& rt) const { return unary(op_, operand_->evaluate(rt), span()); }

Value Binary::evaluate(Runtime& rt) const {
    Value l = l_->evaluate(rt);
    Value r = r_->evaluate(rt);
    return binary(op_, l, r, span());
}

Value Logical::evaluate(Runtime& rt) const {
    const char* name = and_ ? "operand of 'and'" : "operand of 'or'";
    bool left = condition(rt, *l_, name);
    if(and_ ? !left : left) return values().boolean(left);
    return values().boolean(condition(rt, *r_, name));
}

Value Call::evaluate(Runtime& rt) const {
    Value callee = rt.env().get(callee_, span());
    auto* fn = callee.as<weft::walk::Function>();
    if(!fn) throw weft::type_error("R403", "'" + callee_ + "' is not callable (found " + callee.type_name() + ")", span());
    return fn->call(rt, evaluate_all(rt, args_), span());
}

Value ExternCall::evaluate(Runtime& rt) const { return rt.invoke_extern(selector_, evaluate_all(rt, args_), span()); }

Exec Assign::execute(Runtime& rt) const {
    Value v = value_->evaluate(rt);
    if(local_) rt.env().bind(name_, std::move(v));
    else rt.env().set(name_, std::move(v));
    return Exec::normal();
}

Exec FunctionDef::execute(Runtime& rt) const {
    rt.env().bind(name_, Value::make<weft::walk::Function>(name_, params_, body_));
    return Exec::normal();
}

Exec If::execute(Runtime& rt) const {
    for(auto& arm : arms_)
        if(condition(rt, *arm.condition, "condition")) return run_block(rt, arm.body);
    if(!else_.empty()) return run_block(rt, else_);
    return Exec::normal();
}

Exec While::execute(Runtime& rt) const {
    return rt.loop([&]{
        if(!condition(rt, *cond_, "loop condition")) return Exec::brk();
        return weft::walk::execute_all(rt, body_);
    });
}

Exec ForRange::execute(Runtime& rt) const {
    double i = lo_->evaluate(rt).expect<Number>("a number for the range start", lo_->span()).value();
    double hi = hi_->evaluate(rt).expect<Number>("a number for the range end", hi_->span()).value();
    return rt.loop([&]{
        if(i >= hi) return Exec::brk();
        rt.env().bind(var_, values().number(i));
        i += 1;
        return weft::walk::execute_all(rt, body_);
    });
}

Exec Return::execute(Runtime& rt) const {
    return Exec::ret(value_ ? value_->evaluate(rt) : values().nil());
}

} // namespace pylite::nodes
