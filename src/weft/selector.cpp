#include "weft/extern.hpp"
#include <tao/pegtl.hpp>

namespace weft {

namespace selector_grammar {
using namespace tao::pegtl;

struct name : plus< sor< alnum, one<'_'> > > {};
struct backend : name {};
struct capability : name {};
struct backend_list : list< backend, one<'|'> > {};
// at<> runs without actions, so backends are recorded only for a qualified selector.
struct qualified : seq< at< backend_list, one<':'> >, backend_list, one<':'>, capability > {};
struct grammar : seq< sor< qualified, capability >, eof > {};

template<typename Rule> struct action : nothing<Rule> {};

template<> struct action<backend> {
    template<typename Input> static void apply(const Input& in, Selector& s){ s.backends.push_back(in.string()); }
};
template<> struct action<capability> {
    template<typename Input> static void apply(const Input& in, Selector& s){ s.capability = in.string(); }
};

} // namespace selector_grammar

std::optional<Selector> parse_selector(std::string_view text){
    tao::pegtl::memory_input in(text.data(), text.size(), "selector");
    Selector s;
    try {
        if(!tao::pegtl::parse< selector_grammar::grammar, selector_grammar::action >(in, s)) return std::nullopt;
    } catch (const tao::pegtl::parse_error&) {
        return std::nullopt;
    }
    if(s.capability.empty()) return std::nullopt;
    return s;
}

std::string Selector::to_string() const {
    std::string out;
    for(size_t i = 0; i < backends.size(); ++i){ if(i) out += '|'; out += backends[i]; }
    if(!backends.empty()) out += ':';
    return out + capability;
}

} // namespace weft
