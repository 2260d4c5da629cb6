#include "weft/operators.hpp"
#include "weft/error.hpp"

namespace weft {

OperatorTable& OperatorTable::add_infix(const std::string& lexeme, OperatorInfo info){
    if(info.precedence <= 0) throw config_error("C321", "operator '" + lexeme + "' needs a positive precedence");
    auto [it, inserted] = infix_.emplace(lexeme, info);
    if(!inserted){
        const auto& prev = it->second;
        if(prev.precedence != info.precedence || prev.assoc != info.assoc || prev.short_circuit != info.short_circuit)
            throw config_error("C322", "operator '" + lexeme + "' registered twice with different binding");
    }
    return *this;
}

OperatorTable& OperatorTable::add_prefix(const std::string& lexeme, int precedence){
    if(precedence <= 0) throw config_error("C321", "prefix operator '" + lexeme + "' needs a positive precedence");
    auto [it, inserted] = prefix_.emplace(lexeme, precedence);
    if(!inserted && it->second != precedence)
        throw config_error("C322", "prefix operator '" + lexeme + "' registered twice with different precedence");
    return *this;
}

const OperatorInfo* OperatorTable::infix(std::string_view lexeme) const {
    auto it = infix_.find(lexeme);
    return it == infix_.end() ? nullptr : &it->second;
}

std::optional<int> OperatorTable::prefix(std::string_view lexeme) const {
    auto it = prefix_.find(lexeme);
    if(it == prefix_.end()) return std::nullopt;
    return it->second;
}

} // namespace weft
