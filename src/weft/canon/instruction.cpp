#include "weft/canon/instruction.hpp"

namespace weft::canon {

const char* tag_name(Tag t){
    switch(t){
        case Tag::Sequence: return "seq";
        case Tag::Scope: return "scope";
        case Tag::Branch: return "branch";
        case Tag::Assign: return "assign";
        case Tag::Invoke: return "invoke";
        case Tag::Operate: return "operate";
        case Tag::Transfer: return "transfer";
    }
    return "?";
}

static std::shared_ptr<Instruction> blank(Tag tag, Span span){
    auto i = std::make_shared<Instruction>();
    i->tag = tag;
    i->span = span;
    return i;
}

InstrPtr make_sequence(std::vector<InstrPtr> items, Span span){
    auto i = blank(Tag::Sequence, span);
    i->children = std::move(items);
    return i;
}

InstrPtr make_scope(InstrPtr body, bool repeat, Span span){
    auto i = blank(Tag::Scope, span);
    i->children.push_back(std::move(body));
    i->repeat = repeat;
    return i;
}

InstrPtr make_branch(InstrPtr cond, InstrPtr then, InstrPtr otherwise, Span span){
    auto i = blank(Tag::Branch, span);
    i->children.push_back(std::move(cond));
    i->children.push_back(std::move(then));
    if(otherwise) i->children.push_back(std::move(otherwise));
    return i;
}

InstrPtr make_assign(AssignMode mode, std::string name, InstrPtr value, Span span){
    auto i = blank(Tag::Assign, span);
    i->mode = mode;
    i->name = std::move(name);
    i->children.push_back(std::move(value));
    return i;
}

InstrPtr make_invoke(std::string callee, std::vector<InstrPtr> args, bool external, Span span){
    auto i = blank(Tag::Invoke, span);
    i->name = std::move(callee);
    i->children = std::move(args);
    i->external = external;
    return i;
}

InstrPtr make_operate(std::string op, std::vector<InstrPtr> operands, Span span){
    auto i = blank(Tag::Operate, span);
    i->name = std::move(op);
    i->children = std::move(operands);
    return i;
}

InstrPtr make_const(std::string role, std::string text, Span span){
    auto i = blank(Tag::Operate, span);
    i->name = ops::constant;
    i->literal_role = std::move(role);
    i->literal_text = std::move(text);
    return i;
}

InstrPtr make_load(std::string name, Span span){
    auto i = blank(Tag::Operate, span);
    i->name = ops::load;
    i->literal_text = std::move(name);
    return i;
}

InstrPtr make_lambda(std::vector<std::string> params, InstrPtr body, Span span){
    auto i = blank(Tag::Operate, span);
    i->name = ops::lambda;
    i->params = std::move(params);
    i->children.push_back(std::move(body));
    return i;
}

InstrPtr make_transfer(TransferKind kind, InstrPtr value, Span span){
    auto i = blank(Tag::Transfer, span);
    i->transfer = kind;
    if(value) i->children.push_back(std::move(value));
    return i;
}

bool equal(const InstrPtr& a, const InstrPtr& b){
    if(a.get() == b.get()) return true;
    if(!a || !b) return false;
    if(a->tag != b->tag || a->name != b->name || a->repeat != b->repeat || a->mode != b->mode ||
       a->external != b->external || a->transfer != b->transfer || a->literal_role != b->literal_role ||
       a->literal_text != b->literal_text || a->params != b->params || a->children.size() != b->children.size())
        return false;
    for(size_t i = 0; i < a->children.size(); ++i) if(!equal(a->children[i], b->children[i])) return false;
    return true;
}

} // namespace weft::canon
