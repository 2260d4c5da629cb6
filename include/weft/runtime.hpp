// Execution state shared by both execution variants: the environment, the extern
// dispatcher, and the call/loop protocols that keep frames and signals balanced.
#pragma once
#include "weft/config.hpp"
#include "weft/diagnostics.hpp"
#include "weft/env.hpp"
#include "weft/extern.hpp"
#include "weft/signal.hpp"
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace weft {

struct RunOptions {
    RunEnv env = process_env();
    // Null: the language installs its default host backends.
    std::shared_ptr<ExternDispatcher> dispatcher;
    // Output streams for the default host backends (std::cout / std::cerr when null).
    std::ostream* out = nullptr;
    std::ostream* err = nullptr;
    // Called with the statement index before each top-level statement; may throw to stop.
    std::function<void(size_t)> between_statements;
};

struct RunResult {
    bool success = false;
    Value value;
    std::vector<Diagnostic> diagnostics;

    // 0 success, 2 lexical/parse/configuration error, 3 runtime error.
    int exit_code() const;
};

class Runtime {
public:
    Runtime(Environment& env, const ValueFactory& values, ExternDispatcher* externs, size_t maxDepth = 0)
        : env_(env), values_(values), externs_(externs), maxDepth_(maxDepth) {}

    Environment& env() { return env_; }
    const ValueFactory& values() const { return values_; }
    size_t call_depth() const { return callDepth_; }

    // Resolves through the dispatcher; a failed resolution or a failing backend
    // becomes an extern_error at `span`.
    Value invoke_extern(const std::string& selector, const std::vector<Value>& args, Span span);

    // Runs `body` in a fresh call frame with the parameters bound. Return ends the
    // call with its value; Break/Continue reaching the call boundary is a scope error.
    template <typename Body>
    Value call(const Callable& fn, const std::vector<Value>& args, Span span, Body&& body){
        check_call(fn, args, span);
        DepthGuard depth(callDepth_);
        ScopeGuard frame(env_, FrameKind::call);
        for(size_t i = 0; i < args.size(); ++i) env_.bind(fn.params()[i], args[i]);
        Exec r = body();
        return finish_call(r, span);
    }

    // Runs iterations, each in its own block frame, until one raises Break.
    // Break and Continue stop here; Return propagates to the caller.
    template <typename Iteration>
    Exec loop(Iteration&& iteration){
        for(;;){
            Exec r;
            {
                ScopeGuard frame(env_);
                r = iteration();
            }
            if(r.signal == Signal::Break) return Exec::normal(values_.nil());
            if(r.signal == Signal::Return) return r;
        }
    }

    // Signals that reach the program's top level are scope errors.
    void check_top_level(const Exec& r, Span span) const;

private:
    struct DepthGuard {
        explicit DepthGuard(size_t& d) : d_(d) { ++d_; }
        ~DepthGuard() { --d_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
        size_t& d_;
    };
    void check_call(const Callable& fn, const std::vector<Value>& args, Span span) const;
    Value finish_call(const Exec& r, Span span) const;

    Environment& env_;
    const ValueFactory& values_;
    ExternDispatcher* externs_;
    size_t maxDepth_;
    size_t callDepth_ = 0;
};

} // namespace weft
