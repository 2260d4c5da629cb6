#include "curlite/values.hpp"
#include <limits>
#include <stdexcept>

namespace curlite {

using weft::Span;
using weft::Value;

bool Int::equals(const weft::ValueObject& other) const {
    auto* o = dynamic_cast<const Int*>(&other);
    return o && o->v_ == v_;
}

bool Bool::equals(const weft::ValueObject& other) const {
    auto* o = dynamic_cast<const Bool*>(&other);
    return o && o->v_ == v_;
}

std::string Str::debug_display() const {
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

bool Str::equals(const weft::ValueObject& other) const {
    auto* o = dynamic_cast<const Str*>(&other);
    return o && o->s_ == s_;
}

const Semantics& semantics(){
    static const Semantics s;
    return s;
}

namespace {

std::string unquote(const std::string& text, Span span){
    std::string out;
    for(size_t i = 1; i + 1 < text.size(); ++i){
        if(text[i] != '\\'){ out += text[i]; continue; }
        char c = text[++i];
        switch(c){
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            default: throw weft::lex_error("L103", std::string("unknown escape '\\") + c + "' in string literal", span);
        }
    }
    return out;
}

[[noreturn]] void unsupported(const std::string& op, const std::vector<Value>& xs, Span span){
    std::string types;
    for(size_t i = 0; i < xs.size(); ++i){ if(i) types += " and "; types += xs[i].type_name(); }
    throw weft::type_error("R401", "unsupported operand types for '" + op + "': " + types, span);
}

[[noreturn]] void overflow(const std::string& op, Span span){
    throw weft::runtime_error("R705", "integer overflow in '" + op + "'", span);
}

using Limits = std::numeric_limits<int64_t>;

// Checked arithmetic: true on overflow, otherwise the result is stored in out.
bool add_overflows(int64_t a, int64_t b, int64_t& out){
    if((b > 0 && a > Limits::max() - b) || (b < 0 && a < Limits::min() - b)) return true;
    out = a + b;
    return false;
}

bool sub_overflows(int64_t a, int64_t b, int64_t& out){
    if((b < 0 && a > Limits::max() + b) || (b > 0 && a < Limits::min() + b)) return true;
    out = a - b;
    return false;
}

bool mul_overflows(int64_t a, int64_t b, int64_t& out){
    if(a > 0){
        if(b > 0 ? a > Limits::max() / b : b < Limits::min() / a) return true;
    } else if(a < 0){
        if(b > 0 ? a < Limits::min() / b : b < Limits::max() / a) return true;
    }
    out = a * b;
    return false;
}

int64_t power(int64_t base, int64_t exp, Span span){
    if(exp < 0) throw weft::runtime_error("R706", "negative exponent in '**'", span);
    if(base == 0 || base == 1) return exp == 0 ? 1 : base;
    if(base == -1) return exp % 2 == 0 ? 1 : -1;
    if(exp > 63) overflow("**", span);
    int64_t r = 1;
    while(exp-- > 0){
        if(mul_overflows(r, base, r)) overflow("**", span);
    }
    return r;
}

} // namespace

Value Semantics::literal(const std::string& role, const std::string& text, Span span) const {
    if(role == "number"){
        try {
            return integer(std::stoll(text));
        } catch(const std::out_of_range&) {
            throw weft::lex_error("L104", "integer literal '" + text + "' is out of range", span);
        }
    }
    if(role == "string") return this->text(unquote(text, span));
    if(text == "true") return boolean(true);
    if(text == "false") return boolean(false);
    if(text == "nil") return nil();
    throw weft::runtime_error("R799", "unknown literal '" + text + "' (role " + role + ")", span);
}

Value Semantics::apply(const std::string& op, const std::vector<Value>& xs, Span span) const {
    if(xs.size() == 1){
        if(op == "-"){
            int64_t v = xs[0].expect<Int>("an int operand for '-'", span).value();
            if(v == std::numeric_limits<int64_t>::min()) overflow(op, span);
            return integer(-v);
        }
        if(op == "!"){
            auto t = xs[0].truth();
            if(!t) throw weft::type_error("R402", "operand of '!' must be a boolean, found " + xs[0].type_name(), span);
            return boolean(!*t);
        }
        unsupported(op, xs, span);
    }
    if(xs.size() != 2) throw weft::runtime_error("R702", "operator '" + op + "' expects 2 operands", span);
    const Value& l = xs[0];
    const Value& r = xs[1];
    if(op == "==") return boolean(l.equals(r));
    if(op == "!=") return boolean(!l.equals(r));

    if(auto* a = l.as<Str>()){
        auto* b = r.as<Str>();
        if(!b) unsupported(op, xs, span);
        if(op == "+") return text(a->value() + b->value());
        if(op == "<") return boolean(a->value() < b->value());
        if(op == "<=") return boolean(a->value() <= b->value());
        if(op == ">") return boolean(a->value() > b->value());
        if(op == ">=") return boolean(a->value() >= b->value());
        unsupported(op, xs, span);
    }

    auto* a = l.as<Int>();
    auto* b = r.as<Int>();
    if(!a || !b) unsupported(op, xs, span);
    int64_t x = a->value(), y = b->value(), out = 0;
    if(op == "<") return boolean(x < y);
    if(op == "<=") return boolean(x <= y);
    if(op == ">") return boolean(x > y);
    if(op == ">=") return boolean(x >= y);
    if(op == "+"){ if(add_overflows(x, y, out)) overflow(op, span); return integer(out); }
    if(op == "-"){ if(sub_overflows(x, y, out)) overflow(op, span); return integer(out); }
    if(op == "*"){ if(mul_overflows(x, y, out)) overflow(op, span); return integer(out); }
    if(op == "/" || op == "%"){
        if(y == 0) throw weft::runtime_error("R704", "division by zero", span);
        if(x == std::numeric_limits<int64_t>::min() && y == -1) overflow(op, span);
        return integer(op == "/" ? x / y : x % y);
    }
    if(op == "**") return integer(power(x, y, span));
    unsupported(op, xs, span);
}

} // namespace curlite
