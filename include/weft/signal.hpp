#pragma once
#include "weft/value.hpp"

namespace weft {

enum class Signal { None, Break, Continue, Return };

inline const char* signal_name(Signal s){
    switch(s){
        case Signal::None: return "none";
        case Signal::Break: return "break";
        case Signal::Continue: return "continue";
        case Signal::Return: return "return";
    }
    return "?";
}

// Result of executing a statement or instruction: its value plus the control
// signal it raised. A Return carries the returned value in `value`.
struct Exec {
    Value value;
    Signal signal = Signal::None;

    static Exec normal(Value v = {}){ return Exec{std::move(v), Signal::None}; }
    static Exec brk(){ return Exec{{}, Signal::Break}; }
    static Exec cont(){ return Exec{{}, Signal::Continue}; }
    static Exec ret(Value v){ return Exec{std::move(v), Signal::Return}; }
    bool interrupted() const { return signal != Signal::None; }
};

} // namespace weft
