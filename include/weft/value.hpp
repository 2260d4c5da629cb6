// Opaque value handles. The kernel never inspects a value's representation; it only
// uses the capabilities below. Concrete value classes belong to the hosted language.
#pragma once
#include "weft/error.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace weft {

class ValueObject {
public:
    virtual ~ValueObject() = default;
    virtual std::shared_ptr<const ValueObject> clone() const = 0;
    virtual std::string display() const = 0;
    virtual std::string debug_display() const { return display(); }
    virtual bool equals(const ValueObject& other) const = 0;
    virtual std::string type_name() const = 0;
    // Boolean capability; std::nullopt when the value has no truth value.
    virtual std::optional<bool> truth() const { return std::nullopt; }
};

class Value {
public:
    Value() = default;
    explicit Value(std::shared_ptr<const ValueObject> obj) : obj_(std::move(obj)) {}

    template <typename T, typename... Args>
    static Value make(Args&&... args){ return Value(std::make_shared<const T>(std::forward<Args>(args)...)); }

    bool empty() const { return !obj_; }
    explicit operator bool() const { return static_cast<bool>(obj_); }

    const ValueObject* get() const { return obj_.get(); }

    Value clone() const { return obj_ ? Value(obj_->clone()) : Value(); }
    std::string display() const { return obj_ ? obj_->display() : std::string("<none>"); }
    std::string debug_display() const { return obj_ ? obj_->debug_display() : std::string("<none>"); }
    std::string type_name() const { return obj_ ? obj_->type_name() : std::string("none"); }
    std::optional<bool> truth() const { return obj_ ? obj_->truth() : std::nullopt; }

    bool equals(const Value& other) const {
        if(!obj_ || !other.obj_) return !obj_ && !other.obj_;
        return obj_->equals(*other.obj_);
    }

    // Downcast; nullptr when the value is not a T.
    template <typename T>
    const T* as() const { return dynamic_cast<const T*>(obj_.get()); }

    // Downcast or throw a runtime type error naming `what`.
    template <typename T>
    const T& expect(const char* what, Span span = {}) const {
        if(auto* p = as<T>()) return *p;
        throw type_error("R401", std::string("expected ") + what + ", found " + type_name(), span);
    }

private:
    std::shared_ptr<const ValueObject> obj_;
};

// Constructors for the values host capabilities and the kernel must create
// (function results, extern results). Each language implements it for its own types.
class ValueFactory {
public:
    virtual ~ValueFactory() = default;
    virtual Value nil() const = 0;
    virtual Value boolean(bool b) const = 0;
    virtual Value integer(int64_t i) const = 0;
    virtual Value text(std::string s) const = 0;
};

// Callable values: user functions of either execution variant.
class Callable : public ValueObject {
public:
    Callable(std::string name, std::vector<std::string> params)
        : name_(std::move(name)), params_(std::move(params)) {}
    const std::string& name() const { return name_; }
    const std::vector<std::string>& params() const { return params_; }
    std::string display() const override { return name_.empty() ? "<fn>" : "<fn " + name_ + ">"; }
    std::string type_name() const override { return "function"; }
    bool equals(const ValueObject& other) const override { return &other == this; }
private:
    std::string name_;
    std::vector<std::string> params_;
};

} // namespace weft
