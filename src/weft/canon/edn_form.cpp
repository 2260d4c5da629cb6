#include "weft/canon/edn_form.hpp"
#include "weft/error.hpp"
#include <cctype>

namespace weft::canon {

using namespace weft::edn;

Span span_of(const node& n){
    auto s = meta_int(n, "start"), e = meta_int(n, "end");
    if(s < 0 || e < s) return Span{};
    return Span{static_cast<size_t>(s), static_cast<size_t>(e)};
}

void set_span(node& n, Span span){
    n.metadata["start"] = n_i64(static_cast<int64_t>(span.start));
    n.metadata["end"] = n_i64(static_cast<int64_t>(span.end));
}

namespace {

// Operators that read back as EDN symbols are printed bare, anything else as a string.
bool symbol_safe(const std::string& s){
    if(s.empty() || std::isdigit(static_cast<unsigned char>(s[0])) || s[0] == ':' || s == "nil" || s == "true" || s == "false") return false;
    if((s[0] == '-' || s[0] == '+') && s.size() > 1 && std::isdigit(static_cast<unsigned char>(s[1]))) return false;
    for(char c : s){
        if(std::isalnum(static_cast<unsigned char>(c))) continue;
        if(std::string_view("*!_?-+/<>=$%&|.^#").find(c) == std::string_view::npos) return false;
    }
    return true;
}

const char* transfer_name(TransferKind k){
    switch(k){
        case TransferKind::Return: return "return";
        case TransferKind::Break: return "break";
        case TransferKind::Continue: return "continue";
    }
    return "?";
}

[[noreturn]] void malformed(const node& n, const std::string& what){
    throw parse_error("P221", "malformed canonical form: " + what + " in " + to_string(n), span_of(n));
}

// Symbol or string text at position i of a list form.
std::string text_at(const node& form, const list& l, size_t i, const char* what){
    if(i >= l.elems.size()) malformed(form, std::string("missing ") + what);
    if(auto* s = as_symbol(*l.elems[i])) return s->name;
    if(auto* s = as_string(*l.elems[i])) return *s;
    malformed(form, std::string("expected ") + what);
}

} // namespace

node_ptr name_form(const std::string& text){ return symbol_safe(text) ? n_sym(text) : n_str(text); }

node_ptr to_edn(const InstrPtr& instr){
    if(!instr) return n_nil();
    const auto& in = *instr;
    std::vector<node_ptr> out{n_sym(tag_name(in.tag))};
    switch(in.tag){
        case Tag::Sequence:
            break;
        case Tag::Scope:
            if(in.repeat) out.push_back(n_kw("repeat"));
            break;
        case Tag::Branch:
            break;
        case Tag::Assign:
            out.push_back(n_kw(in.mode == AssignMode::bind ? "bind" : "set"));
            out.push_back(name_form(in.name));
            break;
        case Tag::Invoke:
            out.push_back(in.external ? n_str(in.name) : name_form(in.name));
            break;
        case Tag::Operate:
            out.push_back(name_form(in.name));
            if(in.name == ops::constant){
                out.push_back(n_kw(in.literal_role));
                out.push_back(n_str(in.literal_text));
                return node_list(std::move(out));
            }
            if(in.name == ops::load){
                out.push_back(name_form(in.literal_text));
                return node_list(std::move(out));
            }
            if(in.name == ops::lambda){
                std::vector<node_ptr> ps;
                for(auto& p : in.params) ps.push_back(name_form(p));
                out.push_back(node_vec(std::move(ps)));
            }
            break;
        case Tag::Transfer:
            out.push_back(n_sym(transfer_name(in.transfer)));
            break;
    }
    for(auto& ch : in.children) out.push_back(to_edn(ch));
    return node_list(std::move(out));
}

InstrPtr from_edn(const node_ptr& form){
    if(!form) throw parse_error("P221", "malformed canonical form: null node", Span{});
    const node& n = *form;
    auto* l = as_list(n);
    if(!l || l->elems.empty() || !as_symbol(*l->elems.front())) malformed(n, "expected a tagged list");
    const std::string head = as_symbol(*l->elems.front())->name;
    const auto& el = l->elems;
    Span span = span_of(n);

    auto rest = [&](size_t from){
        std::vector<InstrPtr> xs;
        for(size_t i = from; i < el.size(); ++i) xs.push_back(from_edn(el[i]));
        return xs;
    };

    if(head == "seq") return make_sequence(rest(1), span);
    if(head == "scope"){
        bool repeat = el.size() == 3 && as_keyword(*el[1]) && as_keyword(*el[1])->name == "repeat";
        if(el.size() != (repeat ? 3u : 2u)) malformed(n, "scope takes one body");
        return make_scope(from_edn(el.back()), repeat, span);
    }
    if(head == "branch"){
        if(el.size() < 3 || el.size() > 4) malformed(n, "branch takes a condition, a then arm and an optional else arm");
        InstrPtr otherwise = (el.size() == 4 && !is_nil(*el[3])) ? from_edn(el[3]) : nullptr;
        return make_branch(from_edn(el[1]), from_edn(el[2]), otherwise, span);
    }
    if(head == "assign"){
        if(el.size() != 4 || !as_keyword(*el[1])) malformed(n, "assign takes a mode, a name and a value");
        const auto& mode = as_keyword(*el[1])->name;
        if(mode != "set" && mode != "bind") malformed(n, "unknown assign mode :" + mode);
        return make_assign(mode == "bind" ? AssignMode::bind : AssignMode::set, text_at(n, *l, 2, "name"), from_edn(el[3]), span);
    }
    if(head == "invoke"){
        if(el.size() < 2) malformed(n, "invoke needs a callee");
        bool external = is_string(*el[1]);
        return make_invoke(text_at(n, *l, 1, "callee"), rest(2), external, span);
    }
    if(head == "operate"){
        std::string op = text_at(n, *l, 1, "operator");
        if(op == ops::constant){
            if(el.size() != 4 || !as_keyword(*el[2]) || !as_string(*el[3])) malformed(n, "const takes :role \"text\"");
            return make_const(as_keyword(*el[2])->name, *as_string(*el[3]), span);
        }
        if(op == ops::load){
            if(el.size() != 3) malformed(n, "load takes one name");
            return make_load(text_at(n, *l, 2, "name"), span);
        }
        if(op == ops::lambda){
            if(el.size() != 4 || !as_vector(*el[2])) malformed(n, "lambda takes [params] and a body");
            std::vector<std::string> params;
            for(auto& p : as_vector(*el[2])->elems){
                if(auto* s = as_symbol(*p)) params.push_back(s->name);
                else malformed(n, "lambda parameter must be a symbol");
            }
            return make_lambda(std::move(params), from_edn(el[3]), span);
        }
        if(el.size() < 3) malformed(n, "operate '" + op + "' needs operands");
        return make_operate(op, rest(2), span);
    }
    if(head == "transfer"){
        std::string kind = text_at(n, *l, 1, "transfer kind");
        TransferKind k;
        if(kind == "return") k = TransferKind::Return;
        else if(kind == "break") k = TransferKind::Break;
        else if(kind == "continue") k = TransferKind::Continue;
        else malformed(n, "unknown transfer kind '" + kind + "'");
        if(el.size() > 3) malformed(n, "transfer takes at most one value");
        InstrPtr value = (el.size() == 3 && !is_nil(*el[2])) ? from_edn(el[2]) : nullptr;
        if(value && k != TransferKind::Return) malformed(n, kind + " carries no value");
        return make_transfer(k, value, span);
    }
    malformed(n, "unknown instruction '" + head + "'");
}

} // namespace weft::canon
