#include "weft/runtime.hpp"

namespace weft {

int RunResult::exit_code() const {
    if(success) return 0;
    if(diagnostics.empty()) return 3;
    switch(diagnostics.front().kind){
        case ErrorKind::lexical:
        case ErrorKind::parse:
        case ErrorKind::configuration:
            return 2;
        default:
            return 3;
    }
}

Value Runtime::invoke_extern(const std::string& selector, const std::vector<Value>& args, Span span){
    if(!externs_) throw extern_error("X602", "no extern dispatcher is configured", span);
    trace("extern", "invoke '%s' with %zu argument(s)", selector.c_str(), args.size());
    auto r = externs_->invoke(selector, args);
    if(!r.success) throw extern_error("X601", r.error, span);
    return r.value.empty() ? values_.nil() : r.value;
}

void Runtime::check_call(const Callable& fn, const std::vector<Value>& args, Span span) const {
    if(args.size() != fn.params().size()){
        std::string who = fn.name().empty() ? "function" : "function '" + fn.name() + "'";
        throw runtime_error("R702", who + " expects " + std::to_string(fn.params().size()) + " argument(s), got " +
                            std::to_string(args.size()), span);
    }
    if(maxDepth_ && callDepth_ >= maxDepth_)
        throw runtime_error("R703", "call depth exceeded (limit " + std::to_string(maxDepth_) + ")", span,
                            "raise WEFT_MAX_DEPTH or bound the recursion");
}

Value Runtime::finish_call(const Exec& r, Span span) const {
    switch(r.signal){
        case Signal::Return: return r.value.empty() ? values_.nil() : r.value;
        case Signal::Break: throw scope_error("S502", "'break' outside of a loop", span, "break reached a function boundary");
        case Signal::Continue: throw scope_error("S503", "'continue' outside of a loop", span, "continue reached a function boundary");
        case Signal::None: break;
    }
    return values_.nil();
}

void Runtime::check_top_level(const Exec& r, Span span) const {
    switch(r.signal){
        case Signal::Break: throw scope_error("S502", "'break' outside of a loop", span);
        case Signal::Continue: throw scope_error("S503", "'continue' outside of a loop", span);
        case Signal::Return: throw scope_error("S504", "'return' outside of a function", span);
        case Signal::None: break;
    }
}

} // namespace weft
