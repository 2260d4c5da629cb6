#pragma once
#include "weft/value.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace weft {

enum class FrameKind { block, call };

// Stack of scope frames. The bottom frame is the global frame and is never popped.
// A call frame hides its caller's frames: lookups walk from the innermost frame
// down to the nearest call frame, then fall back to the global frame.
class Environment {
public:
    Environment();

    // Prefer ScopeGuard; these are public for the guard and for tests.
    void push_scope(FrameKind kind = FrameKind::block);
    void pop_scope();

    // Visible binding or nullopt.
    std::optional<Value> lookup(const std::string& name) const;
    // Visible binding; throws scope_error("undefined variable ...") when absent.
    Value get(const std::string& name, Span span = {}) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Flat scoping: update the innermost visible binding, or create the name in
    // the current frame when nothing is visible.
    void set(const std::string& name, Value v);
    // Block-local scoping: create (or replace) the name in the current frame only.
    void bind(const std::string& name, Value v);

    size_t depth() const { return frames_.size(); }

private:
    struct Frame {
        FrameKind kind;
        std::unordered_map<std::string, Value> vars;
    };
    Value* find(const std::string& name);
    const Value* find(const std::string& name) const;
    std::vector<Frame> frames_;
};

// Pushes a frame on construction and pops it exactly once on destruction,
// on every exit path including exceptions.
class ScopeGuard {
public:
    explicit ScopeGuard(Environment& env, FrameKind kind = FrameKind::block) : env_(env) { env_.push_scope(kind); }
    ~ScopeGuard() { env_.pop_scope(); }
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;
private:
    Environment& env_;
};

} // namespace weft
