#include "weft/tokenizer.hpp"
#include "weft/config.hpp"
#include "weft/error.hpp"

namespace weft {

std::vector<Token> tokenize(std::string_view source, const LexemeTable& table, const Scanner& fallback){
    std::vector<Token> out;
    size_t pos = 0;
    while(pos < source.size()){
        std::string_view rest = source.substr(pos);

        const auto* lexeme = table.longest_match(rest);
        std::optional<ScanMatch> scanned;
        if(fallback) scanned = fallback(rest);
        if(scanned && scanned->length == 0) scanned.reset();

        size_t lexLen = lexeme ? lexeme->pattern.size() : 0;
        // A comment prefix competes by length like any lexeme; "//=" beats a "//" comment.
        size_t c = table.comment_prefix(rest);
        if(c && c >= lexLen && (!scanned || c >= scanned->length)){
            size_t nl = rest.find('\n', c);
            pos += (nl == std::string_view::npos) ? rest.size() : nl;
            continue;
        }
        if(scanned && scanned->length > lexLen){
            if(scanned->length > rest.size())
                throw lex_error("L102", "scanner overran the input", Span{pos, source.size()});
            out.push_back(Token{std::string(rest.substr(0, scanned->length)), scanned->role, Span{pos, pos + scanned->length}});
            pos += scanned->length;
            continue;
        }
        if(lexeme){
            if(!lexeme->skip) out.push_back(Token{lexeme->pattern, lexeme->role, Span{pos, pos + lexLen}});
            pos += lexLen;
            continue;
        }
        if(rest.front() == '"'){
            size_t nl = rest.find('\n');
            throw lex_error("L101", "unterminated string literal", Span{pos, nl == std::string_view::npos ? source.size() : pos + nl});
        }
        unsigned char bad = static_cast<unsigned char>(rest.front());
        std::string shown = (bad >= 0x20 && bad < 0x7f) ? std::string(1, static_cast<char>(bad)) : "\\x" + std::to_string(bad);
        throw lex_error("L101", "unrecognized character '" + shown + "'", Span{pos, pos + 1});
    }
    trace("lex", "%zu tokens from %zu bytes", out.size(), source.size());
    return out;
}

} // namespace weft
