// EDN reader, printers and structural equality.
#include "weft/edn.hpp"
#include <cctype>
#include <functional>
#include <sstream>

namespace weft::edn {

namespace {

struct reader {
    std::string_view d;
    size_t p = 0;
    int line = 1, col = 1;
    explicit reader(std::string_view s) : d(s) {}
    bool eof() const { return p >= d.size(); }
    char peek() const { return eof() ? '\0' : d[p]; }
    char get(){
        if(eof()) return '\0';
        char c = d[p++];
        if(c == '\n'){ ++line; col = 1; } else ++col;
        return c;
    }
    [[noreturn]] void fail(const std::string& msg) const { throw read_error(msg, line, col); }
    void skip_ws(){
        while(!eof()){
            char c = peek();
            if(c == ';'){ while(!eof() && get() != '\n') continue; continue; }
            if(c == ',' || std::isspace(static_cast<unsigned char>(c))){ get(); continue; }
            break;
        }
    }
};

bool is_digit(char c){ return c >= '0' && c <= '9'; }
bool is_symbol_start(char c){
    return std::isalpha(static_cast<unsigned char>(c)) || c=='*' || c=='!' || c=='_' || c=='?' || c=='-' || c=='+' ||
           c=='/' || c=='<' || c=='>' || c=='=' || c=='$' || c=='%' || c=='&' || c=='|' || c=='.' || c=='^';
}
bool is_symbol_char(char c){ return is_symbol_start(c) || is_digit(c) || c=='#' || c==':'; }

void attach_pos(node& n, int l, int c){ n.metadata["line"] = n_i64(l); n.metadata["col"] = n_i64(c); }

node_ptr read_value(reader& r);

node_ptr read_seq(reader& r, char end, int sl, int sc){
    std::vector<node_ptr> elems;
    r.skip_ws();
    while(!r.eof() && r.peek() != end){
        elems.push_back(read_value(r));
        r.skip_ws();
    }
    if(r.get() != end) r.fail(std::string("unterminated collection, expected '") + end + "'");
    node_ptr out;
    if(end == ')') out = make_node(list{std::move(elems)});
    else if(end == ']') out = make_node(vector_t{std::move(elems)});
    else {
        if(elems.size() % 2) r.fail("map requires an even number of forms");
        map m;
        for(size_t i = 0; i < elems.size(); i += 2) m.entries.emplace_back(elems[i], elems[i+1]);
        out = make_node(std::move(m));
    }
    attach_pos(*out, sl, sc);
    return out;
}

node_ptr read_string(reader& r){
    int sl = r.line, sc = r.col;
    r.get();
    std::string out;
    bool closed = false;
    while(!r.eof()){
        char c = r.get();
        if(c == '"'){ closed = true; break; }
        if(c != '\\'){ out += c; continue; }
        if(r.eof()) r.fail("bad escape at end of input");
        char e = r.get();
        switch(e){
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            default: out += e; break;
        }
    }
    if(!closed) r.fail("unterminated string");
    auto n = make_node(std::move(out));
    attach_pos(*n, sl, sc);
    return n;
}

node_ptr read_number(reader& r){
    int sl = r.line, sc = r.col;
    std::string num;
    if(r.peek() == '+' || r.peek() == '-') num += r.get();
    bool is_float = false;
    while(is_digit(r.peek())) num += r.get();
    if(r.peek() == '.'){
        is_float = true; num += r.get();
        while(is_digit(r.peek())) num += r.get();
    }
    if(r.peek() == 'e' || r.peek() == 'E'){
        is_float = true; num += r.get();
        if(r.peek() == '+' || r.peek() == '-') num += r.get();
        while(is_digit(r.peek())) num += r.get();
    }
    node_ptr n;
    try {
        n = is_float ? make_node(std::stod(num)) : make_node(static_cast<int64_t>(std::stoll(num)));
    } catch(const std::logic_error&) {
        r.fail("invalid number '" + num + "'");
    }
    attach_pos(*n, sl, sc);
    return n;
}

node_ptr read_word(reader& r){
    int sl = r.line, sc = r.col;
    bool kw = false;
    if(r.peek() == ':'){ kw = true; r.get(); }
    std::string s;
    while(is_symbol_char(r.peek())) s += r.get();
    if(s.empty()) r.fail("empty symbol");
    node_ptr n;
    if(kw) n = n_kw(s);
    else if(s == "nil") n = n_nil();
    else if(s == "true") n = n_bool(true);
    else if(s == "false") n = n_bool(false);
    else n = n_sym(s);
    attach_pos(*n, sl, sc);
    return n;
}

node_ptr read_value(reader& r){
    r.skip_ws();
    char c = r.peek();
    int sl = r.line, sc = r.col;
    switch(c){
        case '"': return read_string(r);
        case '(': r.get(); return read_seq(r, ')', sl, sc);
        case '[': r.get(); return read_seq(r, ']', sl, sc);
        case '{': r.get(); return read_seq(r, '}', sl, sc);
        default: break;
    }
    if(is_digit(c) || ((c == '+' || c == '-') && r.p + 1 < r.d.size() && is_digit(r.d[r.p+1]))) return read_number(r);
    if(c == ':' || is_symbol_start(c)) return read_word(r);
    if(r.eof()) r.fail("unexpected end of input");
    r.fail(std::string("unexpected character '") + c + "'");
}

std::string quote(const std::string& s){
    std::string out = "\"";
    for(char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    return out + '"';
}

std::string atom_string(const node& n){
    struct V {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { std::ostringstream oss; oss << d; return oss.str(); }
        std::string operator()(const std::string& s) const { return quote(s); }
        std::string operator()(const keyword& k) const { return ':' + k.name; }
        std::string operator()(const symbol& s) const { return s.name; }
        std::string operator()(const list&) const { return {}; }
        std::string operator()(const vector_t&) const { return {}; }
        std::string operator()(const map&) const { return {}; }
    };
    return std::visit(V{}, n.data);
}

bool is_atomic(const node& n){ return !is_list(n) && !is_vector(n) && !is_map(n); }

} // namespace

node_ptr parse(std::string_view src){
    reader r(src);
    auto v = read_value(r);
    r.skip_ws();
    if(!r.eof()) r.fail("unexpected trailing characters");
    return v;
}

std::string to_string(const node& n){
    auto join = [](const std::vector<node_ptr>& xs, char open, char close){
        std::string out(1, open);
        for(size_t i = 0; i < xs.size(); ++i){ if(i) out += ' '; out += to_string(xs[i]); }
        return out + close;
    };
    if(auto* l = as_list(n)) return join(l->elems, '(', ')');
    if(auto* v = as_vector(n)) return join(v->elems, '[', ']');
    if(auto* m = as_map(n)){
        std::string out = "{";
        for(size_t i = 0; i < m->entries.size(); ++i){
            if(i) out += ' ';
            out += to_string(m->entries[i].first) + ' ' + to_string(m->entries[i].second);
        }
        return out + '}';
    }
    return atom_string(n);
}

std::string to_pretty_string(const node& n, int indentWidth){
    const size_t MAX_INLINE_LEN = 72;
    std::function<std::string(const node&, int)> pp = [&](const node& x, int indent) -> std::string {
        if(is_atomic(x)) return atom_string(x);
        std::string flat = to_string(x);
        std::string head = head_name(x);
        bool control = head == "seq" || head == "scope" || head == "branch";
        if(flat.size() <= MAX_INLINE_LEN && !control) return flat;
        if(is_map(x)) return flat;
        const auto& elems = is_list(x) ? as_list(x)->elems : as_vector(x)->elems;
        if(elems.empty()) return flat;
        char open = is_list(x) ? '(' : '[', close = is_list(x) ? ')' : ']';
        std::string pad(static_cast<size_t>(indent + indentWidth), ' ');
        // Head and leading atoms stay on the opening line.
        std::string out(1, open);
        size_t i = 0;
        for(; i < elems.size() && is_atomic(*elems[i]); ++i){ if(i) out += ' '; out += atom_string(*elems[i]); }
        for(; i < elems.size(); ++i) out += '\n' + pad + pp(*elems[i], indent + indentWidth);
        return out + close;
    };
    return pp(n, 0);
}

node_ptr lookup(const map& m, std::string_view k){
    for(auto& kv : m.entries){
        if(auto* kw = as_keyword(*kv.first); kw && kw->name == k) return kv.second;
    }
    return nullptr;
}

int64_t meta_int(const node& n, const std::string& k, int64_t def){
    auto it = n.metadata.find(k);
    if(it == n.metadata.end()) return def;
    if(auto* v = std::get_if<int64_t>(&it->second->data)) return *v;
    return def;
}

static bool equal_impl(const node_ptr& a, const node_ptr& b, bool ignore_meta){
    if(a.get() == b.get()) return true;
    if(!a || !b) return false;
    if(a->data.index() != b->data.index()) return false;
    if(!ignore_meta){
        if(a->metadata.size() != b->metadata.size()) return false;
        for(const auto& kv : a->metadata){
            auto it = b->metadata.find(kv.first);
            if(it == b->metadata.end() || !equal_impl(kv.second, it->second, ignore_meta)) return false;
        }
    }
    auto same_elems = [&](const std::vector<node_ptr>& l, const std::vector<node_ptr>& r){
        if(l.size() != r.size()) return false;
        for(size_t i = 0; i < l.size(); ++i) if(!equal_impl(l[i], r[i], ignore_meta)) return false;
        return true;
    };
    if(auto* l = as_list(*a)) return same_elems(l->elems, as_list(*b)->elems);
    if(auto* v = as_vector(*a)) return same_elems(v->elems, as_vector(*b)->elems);
    if(auto* m = as_map(*a)){
        const auto& rm = as_map(*b)->entries;
        if(m->entries.size() != rm.size()) return false;
        for(size_t i = 0; i < rm.size(); ++i){
            if(!equal_impl(m->entries[i].first, rm[i].first, ignore_meta) || !equal_impl(m->entries[i].second, rm[i].second, ignore_meta)) return false;
        }
        return true;
    }
    if(auto* s = as_symbol(*a)) return s->name == as_symbol(*b)->name;
    if(auto* k = as_keyword(*a)) return k->name == as_keyword(*b)->name;
    if(auto* s = as_string(*a)) return *s == *as_string(*b);
    if(auto* i = std::get_if<int64_t>(&a->data)) return *i == std::get<int64_t>(b->data);
    if(auto* d = std::get_if<double>(&a->data)) return *d == std::get<double>(b->data);
    if(auto* f = std::get_if<bool>(&a->data)) return *f == std::get<bool>(b->data);
    return true;
}

bool equal(const node_ptr& a, const node_ptr& b, bool ignore_metadata){ return equal_impl(a, b, ignore_metadata); }

} // namespace weft::edn
