#pragma once
#include "weft/canon/executor.hpp"
#include <cstdint>
#include <string>

namespace curlite {

class Int : public weft::ValueObject {
public:
    explicit Int(int64_t v) : v_(v) {}
    int64_t value() const { return v_; }
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<Int>(v_); }
    std::string display() const override { return std::to_string(v_); }
    bool equals(const weft::ValueObject& other) const override;
    std::string type_name() const override { return "int"; }
private:
    int64_t v_;
};

class Bool : public weft::ValueObject {
public:
    explicit Bool(bool v) : v_(v) {}
    bool value() const { return v_; }
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<Bool>(v_); }
    std::string display() const override { return v_ ? "true" : "false"; }
    bool equals(const weft::ValueObject& other) const override;
    std::string type_name() const override { return "bool"; }
    std::optional<bool> truth() const override { return v_; }
private:
    bool v_;
};

class Str : public weft::ValueObject {
public:
    explicit Str(std::string s) : s_(std::move(s)) {}
    const std::string& value() const { return s_; }
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<Str>(s_); }
    std::string display() const override { return s_; }
    std::string debug_display() const override;
    bool equals(const weft::ValueObject& other) const override;
    std::string type_name() const override { return "string"; }
private:
    std::string s_;
};

class Nil : public weft::ValueObject {
public:
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<Nil>(); }
    std::string display() const override { return "nil"; }
    bool equals(const weft::ValueObject& other) const override { return dynamic_cast<const Nil*>(&other) != nullptr; }
    std::string type_name() const override { return "nil"; }
};

// Literal conversion and operator meanings for the canonical executor.
class Semantics : public weft::canon::Semantics {
public:
    weft::Value nil() const override { return weft::Value::make<Nil>(); }
    weft::Value boolean(bool b) const override { return weft::Value::make<Bool>(b); }
    weft::Value integer(int64_t i) const override { return weft::Value::make<Int>(i); }
    weft::Value text(std::string s) const override { return weft::Value::make<Str>(std::move(s)); }

    weft::Value literal(const std::string& role, const std::string& text, weft::Span span) const override;
    weft::Value apply(const std::string& op, const std::vector<weft::Value>& operands, weft::Span span) const override;
};

const Semantics& semantics();

} // namespace curlite
