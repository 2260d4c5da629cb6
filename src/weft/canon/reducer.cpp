#include "weft/canon/reducer.hpp"
#include "weft/canon/edn_form.hpp"
#include "weft/config.hpp"
#include "weft/error.hpp"
#include "weft/extern.hpp"
#include <map>

namespace weft::canon {

using namespace weft::edn;

namespace {

node_ptr spanned(node_ptr n, Span span){ set_span(*n, span); return n; }

// Deep copy of `tmpl` with ?placeholders replaced by their captures.
node_ptr instantiate(const node_ptr& tmpl, const std::map<std::string, node_ptr>& binds){
    if(auto* s = as_symbol(*tmpl)){
        if(s->name.size() > 1 && s->name[0] == '?'){
            auto it = binds.find(s->name);
            return it == binds.end() ? n_nil() : it->second;
        }
        return n_sym(s->name);
    }
    if(auto* l = as_list(*tmpl)){
        std::vector<node_ptr> xs;
        for(auto& ch : l->elems) xs.push_back(instantiate(ch, binds));
        return node_list(std::move(xs));
    }
    if(auto* v = as_vector(*tmpl)){
        std::vector<node_ptr> xs;
        for(auto& ch : v->elems) xs.push_back(instantiate(ch, binds));
        return node_vec(std::move(xs));
    }
    return std::make_shared<node>(node{tmpl->data, {}});
}

class Cursor {
public:
    Cursor(const Schema& schema, std::vector<Token> tokens) : s_(schema), toks_(std::move(tokens)) {
        if(toks_.empty() || !toks_.back().has_role(roles::eof)){
            size_t end = toks_.empty() ? 0 : toks_.back().span.end;
            toks_.push_back(Token{std::string(), roles::eof, Span{end, end}});
        }
    }

    node_ptr program(){
        std::vector<node_ptr> items{n_sym("seq")};
        size_t start = peek().span.start;
        while(!at_end()) items.push_back(statement());
        trace("parse", "reduced %zu top-level statements", items.size() - 1);
        return spanned(node_list(std::move(items)), Span{start, peek().span.end});
    }

private:
    const Schema& s_;
    std::vector<Token> toks_;
    size_t pos_ = 0;
    size_t lastEnd_ = 0;

    const Token& peek() const { return pos_ < toks_.size() ? toks_[pos_] : toks_.back(); }
    bool at(const std::string& lexeme) const { return !lexeme.empty() && peek().is(lexeme); }
    bool at_end() const { return peek().has_role(roles::eof); }
    Token advance(){
        Token t = peek();
        if(!at_end()){ ++pos_; lastEnd_ = t.span.end; }
        return t;
    }
    bool accept(const std::string& lexeme){ if(!at(lexeme)) return false; advance(); return true; }

    [[noreturn]] void fail(const std::string& msg, const Token& t, std::string hint = {}) const {
        throw parse_error("P201", msg, t.span, std::move(hint));
    }
    Token expect(const std::string& lexeme, const char* context){
        if(at(lexeme)) return advance();
        fail("expected '" + lexeme + "' " + context + ", found " + describe(peek()), peek());
    }
    Token expect_closing(const std::string& close, const Token& open){
        if(at(close)) return advance();
        throw parse_error("P202", "unclosed '" + open.lexeme + "'", open.span, "expected '" + close + "' before " + describe(peek()));
    }
    Token expect_name(const char* context){
        if(peek().has_role(s_.identifier_role)) return advance();
        fail(std::string("expected a name ") + context + ", found " + describe(peek()), peek());
    }

    node_ptr block(){
        Token open = advance();
        std::vector<node_ptr> items{n_sym("seq")};
        while(!at(s_.block_close)){
            if(at_end()) throw parse_error("P202", "unclosed '" + open.lexeme + "'", open.span, "add '" + s_.block_close + "'");
            items.push_back(statement());
        }
        advance();
        Span span{open.span.start, lastEnd_};
        return spanned(node_list({n_sym("scope"), spanned(node_list(std::move(items)), span)}), span);
    }

    node_ptr statement(){
        if(at(s_.block_open)) return block();
        if(auto* pattern = s_.statement_for(peek().lexeme)) return apply(*pattern);

        size_t start = peek().span.start;
        Token first = peek();
        node_ptr e = expr(0);
        if(!s_.assign.empty() && at(s_.assign)){
            Token op = advance();
            if(head_name(*e) != "operate" || as_list(*e)->elems.size() != 3 || !as_symbol(*as_list(*e)->elems[1]) ||
               as_symbol(*as_list(*e)->elems[1])->name != ops::load)
                fail("left side of '" + op.lexeme + "' must be a name", first);
            node_ptr target = as_list(*e)->elems[2];
            node_ptr value = expr(0);
            expect(s_.terminator, "after assignment");
            return spanned(node_list({n_sym("assign"), n_kw("set"), target, value}), Span{start, lastEnd_});
        }
        expect(s_.terminator, "after expression");
        return e;
    }

    node_ptr apply(const StatementPattern& p){
        size_t start = peek().span.start;
        std::map<std::string, node_ptr> binds;
        for(const auto& f : p.fields){
            switch(f.role){
                case FieldRole::literal:
                    expect(f.text, ("in '" + p.keyword + "' statement").c_str());
                    break;
                case FieldRole::optional_literal:
                    accept(f.text);
                    break;
                case FieldRole::expr:
                    binds[f.capture] = expr(0);
                    break;
                case FieldRole::optional_expr:
                    binds[f.capture] = (at(s_.terminator) || at(s_.block_close) || at_end()) ? n_nil() : expr(0);
                    break;
                case FieldRole::block:
                    if(!at(s_.block_open))
                        fail("expected '" + s_.block_open + "' to open the '" + p.keyword + "' body, found " + describe(peek()), peek());
                    binds[f.capture] = block();
                    break;
                case FieldRole::name: {
                    Token n = expect_name(("in '" + p.keyword + "' statement").c_str());
                    binds[f.capture] = spanned(n_sym(n.lexeme), n.span);
                    break;
                }
                case FieldRole::names: {
                    Token open = expect(s_.call_open.empty() ? s_.group_open : s_.call_open, "before parameter list");
                    const std::string& close = s_.call_open.empty() ? s_.group_close : s_.call_close;
                    std::vector<node_ptr> names;
                    if(!at(close)){
                        do {
                            Token n = expect_name("in parameter list");
                            for(auto& prev : names)
                                if(as_symbol(*prev)->name == n.lexeme) fail("duplicate parameter '" + n.lexeme + "'", n);
                            names.push_back(n_sym(n.lexeme));
                        } while(accept(s_.call_separator));
                    }
                    expect_closing(close, open);
                    binds[f.capture] = node_vec(std::move(names));
                    break;
                }
                case FieldRole::else_branch:
                    if(!accept(f.text)){ binds[f.capture] = n_nil(); break; }
                    binds[f.capture] = at(s_.block_open) ? block() : statement();
                    break;
            }
        }
        node_ptr out = instantiate(p.action, binds);
        return spanned(out, Span{start, lastEnd_});
    }

    node_ptr expr(int min_prec){
        node_ptr left = prefix_term();
        size_t start = span_of(*left).start;
        int chainedNone = -1;
        for(;;){
            const Token& next = peek();
            if(next.role == s_.identifier_role || s_.literal_roles.count(next.role)) break;
            const OperatorInfo* info = s_.operators.infix(next.lexeme);
            if(!info || info->precedence < min_prec) break;
            if(info->assoc == Assoc::none && info->precedence == chainedNone)
                fail("operator '" + next.lexeme + "' cannot be chained", next, "add parentheses");
            Token op = advance();
            node_ptr right = expr(info->assoc == Assoc::right ? info->precedence : info->precedence + 1);
            left = spanned(node_list({n_sym("operate"), op_node(op.lexeme), left, right}), Span{start, lastEnd_});
            chainedNone = info->assoc == Assoc::none ? info->precedence : -1;
        }
        return left;
    }

    static node_ptr op_node(const std::string& lexeme){ return name_form(lexeme); }

    std::vector<node_ptr> call_args(const Token& open){
        std::vector<node_ptr> args;
        if(!at(s_.call_close)){
            do { args.push_back(expr(0)); } while(accept(s_.call_separator));
        }
        expect_closing(s_.call_close, open);
        return args;
    }

    node_ptr prefix_term(){
        Token t = advance();
        if(t.has_role(roles::eof)) fail("expected an expression, found end of input", t);

        // Literal and name tokens never act as operators, even when they share a lexeme.
        bool plain = s_.literal_roles.count(t.role) || t.role == s_.identifier_role;
        if(!plain){
            if(auto prec = s_.operators.prefix(t.lexeme)){
                node_ptr operand = expr(*prec);
                return spanned(node_list({n_sym("operate"), op_node(t.lexeme), operand}), Span{t.span.start, lastEnd_});
            }
            if(at_open_group(t)){
                node_ptr inner = expr(0);
                expect_closing(s_.group_close, t);
                return inner;
            }
            if(!s_.extern_keyword.empty() && t.is(s_.extern_keyword)) return extern_call(t);
        }

        if(s_.literal_roles.count(t.role))
            return spanned(node_list({n_sym("operate"), n_sym(ops::constant), n_kw(t.role), n_str(t.lexeme)}), t.span);

        if(t.role == s_.identifier_role){
            if(!s_.call_open.empty() && at(s_.call_open)){
                Token open = advance();
                std::vector<node_ptr> items{n_sym("invoke"), n_sym(t.lexeme)};
                for(auto& a : call_args(open)) items.push_back(a);
                return spanned(node_list(std::move(items)), Span{t.span.start, lastEnd_});
            }
            return spanned(node_list({n_sym("operate"), n_sym(ops::load), n_sym(t.lexeme)}), t.span);
        }
        fail("expected an expression, found " + describe(t), t);
    }

    bool at_open_group(const Token& t) const { return !s_.group_open.empty() && t.is(s_.group_open); }

    node_ptr extern_call(const Token& kw){
        if(s_.call_open.empty()) fail("schema has no call syntax for '" + kw.lexeme + "'", kw);
        Token open = expect(s_.call_open, ("after '" + kw.lexeme + "'").c_str());
        const Token& sel = peek();
        if(sel.lexeme.size() < 2 || s_.literal_roles.count(sel.role) == 0 || (sel.lexeme.front() != '"' && sel.lexeme.front() != '\'') ||
           sel.lexeme.back() != sel.lexeme.front())
            fail("extern selector must be a quoted string literal", sel, "write " + kw.lexeme + "(\"backend:capability\", ...)");
        std::string text = sel.lexeme.substr(1, sel.lexeme.size() - 2);
        if(text.empty()) fail("extern selector is empty", sel);
        if(!parse_selector(text))
            fail("malformed extern selector \"" + text + "\"", sel, "use backend1|backend2:capability or a bare capability");
        advance();
        std::vector<node_ptr> items{n_sym("invoke"), n_str(text)};
        if(accept(s_.call_separator)){
            for(auto& a : call_args(open)) items.push_back(a);
        } else {
            expect_closing(s_.call_close, open);
        }
        return spanned(node_list(std::move(items)), Span{kw.span.start, lastEnd_});
    }
};

} // namespace

Reducer::Reducer(std::shared_ptr<const Schema> schema, std::shared_ptr<const Transformer> desugar)
    : schema_(std::move(schema)), desugar_(std::move(desugar)) {
    if(!schema_) throw config_error("C342", "reducer needs a schema");
}

node_ptr Reducer::reduce(std::vector<Token> tokens) const {
    Cursor c(*schema_, std::move(tokens));
    return c.program();
}

node_ptr Reducer::lower(std::vector<Token> tokens) const {
    auto surface = reduce(std::move(tokens));
    return desugar_ ? desugar_->expand(surface) : surface;
}

InstrPtr Reducer::compile(std::vector<Token> tokens) const { return from_edn(lower(std::move(tokens))); }

} // namespace weft::canon
