#pragma once
#include "weft/value.hpp"
#include <string>

namespace pylite {

class Number : public weft::ValueObject {
public:
    explicit Number(double v) : v_(v) {}
    double value() const { return v_; }
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<Number>(v_); }
    // Integral values print without a fraction: 3, not 3.0.
    std::string display() const override;
    bool equals(const weft::ValueObject& other) const override;
    std::string type_name() const override { return "number"; }
private:
    double v_;
};

class Bool : public weft::ValueObject {
public:
    explicit Bool(bool v) : v_(v) {}
    bool value() const { return v_; }
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<Bool>(v_); }
    std::string display() const override { return v_ ? "True" : "False"; }
    bool equals(const weft::ValueObject& other) const override;
    std::string type_name() const override { return "bool"; }
    std::optional<bool> truth() const override { return v_; }
private:
    bool v_;
};

class Text : public weft::ValueObject {
public:
    explicit Text(std::string s) : s_(std::move(s)) {}
    const std::string& value() const { return s_; }
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<Text>(s_); }
    std::string display() const override { return s_; }
    std::string debug_display() const override;
    bool equals(const weft::ValueObject& other) const override;
    std::string type_name() const override { return "text"; }
private:
    std::string s_;
};

class Nil : public weft::ValueObject {
public:
    std::shared_ptr<const weft::ValueObject> clone() const override { return std::make_shared<Nil>(); }
    std::string display() const override { return "None"; }
    bool equals(const weft::ValueObject& other) const override { return dynamic_cast<const Nil*>(&other) != nullptr; }
    std::string type_name() const override { return "none"; }
};

class Values : public weft::ValueFactory {
public:
    weft::Value nil() const override { return weft::Value::make<Nil>(); }
    weft::Value boolean(bool b) const override { return weft::Value::make<Bool>(b); }
    weft::Value integer(int64_t i) const override { return weft::Value::make<Number>(static_cast<double>(i)); }
    weft::Value text(std::string s) const override { return weft::Value::make<Text>(std::move(s)); }
    weft::Value number(double d) const { return weft::Value::make<Number>(d); }
};

const Values& values();

// Operator meanings. Arithmetic on numbers, `+` also concatenates text,
// comparisons on numbers or texts, equality on anything.
weft::Value binary(const std::string& op, const weft::Value& l, const weft::Value& r, weft::Span span);
weft::Value unary(const std::string& op, const weft::Value& v, weft::Span span);

} // namespace pylite
