#include "pylite/values.hpp"
#include <cmath>
#include <cstdio>

namespace pylite {

using weft::Span;
using weft::Value;

std::string Number::display() const {
    if(std::isfinite(v_) && std::floor(v_) == v_ && std::fabs(v_) < 1e15)
        return std::to_string(static_cast<long long>(v_));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", v_);
    return buf;
}

bool Number::equals(const weft::ValueObject& other) const {
    auto* o = dynamic_cast<const Number*>(&other);
    return o && o->v_ == v_;
}

bool Bool::equals(const weft::ValueObject& other) const {
    auto* o = dynamic_cast<const Bool*>(&other);
    return o && o->v_ == v_;
}

std::string Text::debug_display() const {
    std::string out = "\"";
    for(char c : s_){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    return out + "\"";
}

bool Text::equals(const weft::ValueObject& other) const {
    auto* o = dynamic_cast<const Text*>(&other);
    return o && o->s_ == s_;
}

const Values& values(){
    static const Values v;
    return v;
}

namespace {

[[noreturn]] void unsupported(const std::string& op, const Value& l, const Value& r, Span span){
    throw weft::type_error("R401", "unsupported operand types for '" + op + "': " + l.type_name() + " and " + r.type_name(), span);
}

template <typename Cmp>
Value compare(const std::string& op, const Value& l, const Value& r, Span span, Cmp cmp){
    if(auto* a = l.as<Number>()) if(auto* b = r.as<Number>()) return values().boolean(cmp(a->value(), b->value()));
    if(auto* a = l.as<Text>()) if(auto* b = r.as<Text>()) return values().boolean(cmp(a->value(), b->value()));
    unsupported(op, l, r, span);
}

} // namespace

Value binary(const std::string& op, const Value& l, const Value& r, Span span){
    if(op == "==") return values().boolean(l.equals(r));
    if(op == "!=") return values().boolean(!l.equals(r));
    if(op == "<") return compare(op, l, r, span, [](const auto& a, const auto& b){ return a < b; });
    if(op == "<=") return compare(op, l, r, span, [](const auto& a, const auto& b){ return a <= b; });
    if(op == ">") return compare(op, l, r, span, [](const auto& a, const auto& b){ return a > b; });
    if(op == ">=") return compare(op, l, r, span, [](const auto& a, const auto& b){ return a >= b; });

    if(op == "+"){
        if(auto* a = l.as<Text>()) if(auto* b = r.as<Text>()) return values().text(a->value() + b->value());
    }
    auto* a = l.as<Number>();
    auto* b = r.as<Number>();
    if(!a || !b) unsupported(op, l, r, span);
    double x = a->value(), y = b->value();
    if(op == "+") return values().number(x + y);
    if(op == "-") return values().number(x - y);
    if(op == "*") return values().number(x * y);
    if(op == "/" || op == "%"){
        if(y == 0) throw weft::runtime_error("R704", "division by zero", span);
        return values().number(op == "/" ? x / y : std::fmod(x, y));
    }
    if(op == "^") return values().number(std::pow(x, y));
    throw weft::runtime_error("R799", "unknown operator '" + op + "'", span);
}

Value unary(const std::string& op, const Value& v, Span span){
    if(op == "-") return values().number(-v.expect<Number>("a number", span).value());
    if(op == "not"){
        auto t = v.truth();
        if(!t) throw weft::type_error("R402", "operand of 'not' must be a boolean, found " + v.type_name(), span);
        return values().boolean(!*t);
    }
    throw weft::runtime_error("R799", "unknown operator '" + op + "'", span);
}

} // namespace pylite
