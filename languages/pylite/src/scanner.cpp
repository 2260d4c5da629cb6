#include "pylite/pylite.hpp"
#include <tao/pegtl.hpp>

namespace pylite {

namespace grammar {
using namespace tao::pegtl;

struct ident : identifier {};
struct number : seq<plus<digit>, opt<one<'.'>, plus<digit>>> {};
struct escaped : seq<one<'\\'>, any> {};
struct string_char : sor<escaped, not_one<'"', '\n'>> {};
struct string_lit : seq<one<'"'>, star<string_char>, one<'"'>> {};

} // namespace grammar

namespace {

template <typename Rule>
size_t match_length(std::string_view rest){
    tao::pegtl::memory_input in(rest.data(), rest.size(), "pylite");
    if(!tao::pegtl::parse<Rule>(in)) return 0;
    return static_cast<size_t>(in.current() - rest.data());
}

} // namespace

weft::Scanner scanner(){
    return [](std::string_view rest) -> std::optional<weft::ScanMatch> {
        if(size_t n = match_length<grammar::ident>(rest)) return weft::ScanMatch{n, "ident"};
        if(size_t n = match_length<grammar::number>(rest)) return weft::ScanMatch{n, "number"};
        if(size_t n = match_length<grammar::string_lit>(rest)) return weft::ScanMatch{n, "string"};
        return std::nullopt;
    };
}

} // namespace pylite
