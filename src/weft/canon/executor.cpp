#include "weft/canon/executor.hpp"
#include "weft/config.hpp"
#include "weft/error.hpp"

namespace weft::canon {

Value Function::call(Executor& ex, const std::vector<Value>& args, Span span) const {
    return ex.runtime().call(*this, args, span, [&]{ return ex.execute(*body_); });
}

Exec Executor::execute(const Instruction& in){
    switch(in.tag){
        case Tag::Sequence: {
            Exec last = Exec::normal();
            for(auto& ch : in.children){
                last = execute(*ch);
                if(last.interrupted()) return last;
            }
            return last;
        }
        case Tag::Scope:
            return scope(in);
        case Tag::Branch:
            return branch(in);
        case Tag::Assign:
            return assign(in);
        case Tag::Invoke:
            return Exec::normal(invoke(in));
        case Tag::Operate:
            return Exec::normal(operate(in));
        case Tag::Transfer:
            switch(in.transfer){
                case TransferKind::Break: return Exec::brk();
                case TransferKind::Continue: return Exec::cont();
                case TransferKind::Return:
                    return Exec::ret(in.children.empty() ? rt_.values().nil() : evaluate(*in.children.front()));
            }
            break;
    }
    throw runtime_error("R799", std::string("unhandled instruction '") + tag_name(in.tag) + "'", in.span);
}

Value Executor::evaluate(const Instruction& in){
    Exec r = execute(in);
    if(r.interrupted())
        throw scope_error("S505", std::string("'") + signal_name(r.signal) + "' used inside an expression", in.span);
    return r.value.empty() ? rt_.values().nil() : r.value;
}

Exec Executor::scope(const Instruction& in){
    const Instruction& body = *in.children.front();
    if(in.repeat) return rt_.loop([&]{ return execute(body); });
    ScopeGuard frame(rt_.env());
    return execute(body);
}

bool Executor::condition(const Instruction& in, const char* what){
    Value v = evaluate(in);
    auto t = v.truth();
    if(!t) throw type_error("R402", std::string(what) + " must be a boolean, found " + v.type_name(), in.span);
    return *t;
}

Exec Executor::branch(const Instruction& in){
    if(condition(*in.children[0], "condition")) return execute(*in.children[1]);
    if(in.children.size() > 2) return execute(*in.children[2]);
    return Exec::normal(rt_.values().nil());
}

Exec Executor::assign(const Instruction& in){
    Value v = evaluate(*in.children.front());
    // Anonymous function values take the name they are first assigned to.
    if(auto* fn = v.as<Function>(); fn && fn->name().empty())
        v = Value::make<Function>(in.name, fn->params(), fn->body());
    if(in.mode == AssignMode::bind) rt_.env().bind(in.name, std::move(v));
    else rt_.env().set(in.name, std::move(v));
    return Exec::normal(rt_.values().nil());
}

Value Executor::invoke(const Instruction& in){
    std::vector<Value> args;
    args.reserve(in.children.size());
    for(auto& ch : in.children) args.push_back(evaluate(*ch));
    if(in.external) return rt_.invoke_extern(in.name, args, in.span);
    Value callee = rt_.env().get(in.name, in.span);
    auto* fn = callee.as<Function>();
    if(!fn) throw type_error("R403", "'" + in.name + "' is not callable (found " + callee.type_name() + ")", in.span);
    return fn->call(*this, args, in.span);
}

Value Executor::literal(const Instruction& in){
    auto it = literals_.find(&in);
    if(it != literals_.end()) return it->second;
    Value v = sem_.literal(in.literal_role, in.literal_text, in.span);
    literals_.emplace(&in, v);
    return v;
}

Value Executor::operate(const Instruction& in){
    if(in.name == ops::constant) return literal(in);
    if(in.name == ops::load) return rt_.env().get(in.literal_text, in.span);
    if(in.name == ops::lambda) return Value::make<Function>(std::string(), in.params, in.children.front());

    const OperatorInfo* info = schema_ ? schema_->operators.infix(in.name) : nullptr;
    if(info && info->short_circuit != ShortCircuit::none && in.children.size() == 2){
        Value left = evaluate(*in.children[0]);
        auto t = left.truth();
        if(!t) throw type_error("R402", "operand of '" + in.name + "' must be a boolean, found " + left.type_name(), in.children[0]->span);
        bool decided = info->short_circuit == ShortCircuit::and_then ? !*t : *t;
        if(decided) return left;
        Value right = evaluate(*in.children[1]);
        if(!right.truth())
            throw type_error("R402", "operand of '" + in.name + "' must be a boolean, found " + right.type_name(), in.children[1]->span);
        return right;
    }

    std::vector<Value> operands;
    operands.reserve(in.children.size());
    for(auto& ch : in.children) operands.push_back(evaluate(*ch));
    return sem_.apply(in.name, operands, in.span);
}

} // namespace weft::canon
