// Minimal value set for kernel tests that run without a bundled language.
#pragma once
#include "weft/canon/executor.hpp"
#include <cstdint>
#include <string>

namespace weft_test {

struct TInt : weft::ValueObject {
    explicit TInt(int64_t v) : v(v) {}
    int64_t v;
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<TInt>(v); }
    std::string display() const override { return std::to_string(v); }
    bool equals(const weft::ValueObject& o) const override { auto* p = dynamic_cast<const TInt*>(&o); return p && p->v == v; }
    std::string type_name() const override { return "int"; }
};

struct TBool : weft::ValueObject {
    explicit TBool(bool v) : v(v) {}
    bool v;
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<TBool>(v); }
    std::string display() const override { return v ? "true" : "false"; }
    bool equals(const weft::ValueObject& o) const override { auto* p = dynamic_cast<const TBool*>(&o); return p && p->v == v; }
    std::string type_name() const override { return "bool"; }
    std::optional<bool> truth() const override { return v; }
};

struct TText : weft::ValueObject {
    explicit TText(std::string v) : v(std::move(v)) {}
    std::string v;
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<TText>(v); }
    std::string display() const override { return v; }
    bool equals(const weft::ValueObject& o) const override { auto* p = dynamic_cast<const TText*>(&o); return p && p->v == v; }
    std::string type_name() const override { return "text"; }
};

struct TNil : weft::ValueObject {
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<TNil>(); }
    std::string display() const override { return "nil"; }
    bool equals(const weft::ValueObject& o) const override { return dynamic_cast<const TNil*>(&o) != nullptr; }
    std::string type_name() const override { return "nil"; }
};

// Integer arithmetic and comparison; enough to drive the canonical executor.
struct TSemantics : weft::canon::Semantics {
    weft::Value nil() const override { return weft::Value::make<TNil>(); }
    weft::Value boolean(bool b) const override { return weft::Value::make<TBool>(b); }
    weft::Value integer(int64_t i) const override { return weft::Value::make<TInt>(i); }
    weft::Value text(std::string s) const override { return weft::Value::make<TText>(std::move(s)); }

    weft::Value literal(const std::string& role, const std::string& text, weft::Span) const override {
        if(role == "number") return integer(std::stoll(text));
        if(text == "true" || text == "false") return boolean(text == "true");
        return this->text(text);
    }
    weft::Value apply(const std::string& op, const std::vector<weft::Value>& xs, weft::Span span) const override {
        if(xs.size() == 1) return integer(-xs[0].expect<TInt>("an int", span).v);
        int64_t a = xs[0].expect<TInt>("an int", span).v;
        int64_t b = xs[1].expect<TInt>("an int", span).v;
        if(op == "+") return integer(a + b);
        if(op == "-") return integer(a - b);
        if(op == "*") return integer(a * b);
        if(op == "<") return boolean(a < b);
        if(op == "==") return boolean(a == b);
        throw weft::runtime_error("R799", "unknown operator " + op, span);
    }
};

inline int64_t as_int(const weft::Value& v){ return v.expect<TInt>("an int").v; }

} // namespace weft_test
