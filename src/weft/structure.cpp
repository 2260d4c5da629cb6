#include "weft/structure.hpp"
#include "weft/config.hpp"
#include "weft/error.hpp"

namespace weft {

namespace {

bool is_layout(const Token& t){
    return t.role == roles::newline || t.role == roles::indent || t.role == roles::dedent;
}

size_t line_start(std::string_view source, size_t offset){
    if(offset == 0) return 0;
    size_t nl = source.rfind('\n', offset - 1);
    return nl == std::string_view::npos ? 0 : nl + 1;
}

Token synthetic(const char* role, Span span){ return Token{std::string(), role, span}; }

} // namespace

std::vector<Token> normalize_indentation(std::string_view source, std::vector<Token> tokens, const IndentOptions& opts){
    std::vector<Token> out;
    out.reserve(tokens.size() + 8);
    std::vector<int> levels{0};
    int bracketDepth = 0;
    bool atLineStart = true;

    for(auto& t : tokens){
        if(t.role == roles::newline){
            if(bracketDepth > 0) continue;
            if(!out.empty() && !is_layout(out.back())) out.push_back(synthetic(roles::newline, t.span));
            atLineStart = true;
            continue;
        }
        if(atLineStart && bracketDepth == 0){
            size_t ls = line_start(source, t.span.start);
            int width = 0;
            for(size_t i = ls; i < t.span.start; ++i){
                char c = source[i];
                if(c == ' ') ++width;
                else if(c == '\t')
                    throw parse_error("P211", "tab in indentation at line " + std::to_string(locate(source, i).line), Span{i, i + 1},
                                      "indent with " + std::to_string(opts.width) + " spaces");
                else break;
            }
            int line = locate(source, t.span.start).line;
            if(out.empty() && width != 0)
                throw parse_error("P212", "unexpected indentation at line " + std::to_string(line), Span{ls, t.span.start});
            if(width > levels.back()){
                if(width != levels.back() + opts.width)
                    throw parse_error("P212", "invalid indentation at line " + std::to_string(line), Span{ls, t.span.start},
                                      "expected " + std::to_string(levels.back() + opts.width) + " spaces");
                levels.push_back(width);
                out.push_back(synthetic(roles::indent, Span{ls, t.span.start}));
            } else {
                while(width < levels.back()){
                    levels.pop_back();
                    out.push_back(synthetic(roles::dedent, Span{t.span.start, t.span.start}));
                }
                if(width != levels.back())
                    throw parse_error("P213", "indentation mismatch at line " + std::to_string(line), Span{ls, t.span.start},
                                      "dedent to an enclosing block's level");
            }
            atLineStart = false;
        }
        for(auto& br : opts.brackets){
            if(t.lexeme == br.first) ++bracketDepth;
            else if(t.lexeme == br.second && bracketDepth > 0) --bracketDepth;
        }
        out.push_back(std::move(t));
    }

    Span end{source.size(), source.size()};
    if(!out.empty() && !is_layout(out.back())) out.push_back(synthetic(roles::newline, end));
    while(levels.size() > 1){ levels.pop_back(); out.push_back(synthetic(roles::dedent, end)); }
    out.push_back(synthetic(roles::eof, end));
    trace("lex", "indentation pass: %zu structured tokens", out.size());
    return out;
}

std::vector<Token> check_delimiters(std::string_view source, std::vector<Token> tokens,
                                    const std::vector<std::pair<std::string, std::string>>& pairs){
    std::vector<std::pair<size_t, size_t>> open; // (token index, pair index)
    for(size_t i = 0; i < tokens.size(); ++i){
        const auto& t = tokens[i];
        for(size_t p = 0; p < pairs.size(); ++p){
            if(t.lexeme == pairs[p].first){ open.emplace_back(i, p); break; }
            if(t.lexeme == pairs[p].second){
                if(open.empty())
                    throw parse_error("P203", "unexpected '" + t.lexeme + "' with no matching '" + pairs[p].first + "'", t.span);
                if(open.back().second != p){
                    const auto& opener = tokens[open.back().first];
                    throw parse_error("P203", "'" + t.lexeme + "' closes '" + opener.lexeme + "' opened at line " +
                                      std::to_string(locate(source, opener.span.start).line), t.span,
                                      "expected '" + pairs[open.back().second].second + "'");
                }
                open.pop_back();
                break;
            }
        }
    }
    if(!open.empty()){
        const auto& opener = tokens[open.back().first];
        throw parse_error("P202", "unclosed '" + opener.lexeme + "'", opener.span,
                          "add the matching '" + pairs[open.back().second].second + "'");
    }
    tokens.push_back(synthetic(roles::eof, Span{source.size(), source.size()}));
    return tokens;
}

} // namespace weft
