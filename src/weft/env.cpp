#include "weft/env.hpp"
#include "weft/config.hpp"
#include "weft/error.hpp"

namespace weft {

Environment::Environment(){ frames_.push_back(Frame{FrameKind::call, {}}); }

void Environment::push_scope(FrameKind kind){
    frames_.push_back(Frame{kind, {}});
    trace("exec", "push %s frame -> depth %zu", kind == FrameKind::call ? "call" : "block", frames_.size());
}

void Environment::pop_scope(){
    // Only reachable through an unbalanced manual pop; ScopeGuard never pops the global frame.
    if(frames_.size() <= 1) return;
    frames_.pop_back();
    trace("exec", "pop frame -> depth %zu", frames_.size());
}

const Value* Environment::find(const std::string& name) const {
    for(size_t i = frames_.size(); i-- > 0;){
        auto it = frames_[i].vars.find(name);
        if(it != frames_[i].vars.end()) return &it->second;
        if(frames_[i].kind == FrameKind::call && i > 0){
            auto g = frames_[0].vars.find(name);
            return g == frames_[0].vars.end() ? nullptr : &g->second;
        }
    }
    return nullptr;
}

Value* Environment::find(const std::string& name){
    return const_cast<Value*>(static_cast<const Environment*>(this)->find(name));
}

std::optional<Value> Environment::lookup(const std::string& name) const {
    if(auto* v = find(name)) return *v;
    return std::nullopt;
}

Value Environment::get(const std::string& name, Span span) const {
    if(auto* v = find(name)) return *v;
    throw scope_error("S501", "undefined variable '" + name + "'", span);
}

void Environment::set(const std::string& name, Value v){
    if(auto* slot = find(name)){ *slot = std::move(v); return; }
    frames_.back().vars[name] = std::move(v);
}

void Environment::bind(const std::string& name, Value v){ frames_.back().vars[name] = std::move(v); }

} // namespace weft
