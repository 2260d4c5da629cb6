#include "weft/canon/schema.hpp"
#include "weft/error.hpp"
#include <functional>

namespace weft::canon {

using namespace weft::edn;

Schema& Schema::add_statement(StatementPattern p){
    if(p.keyword.empty()) throw config_error("C331", "statement pattern without a leading keyword");
    if(byKeyword_.count(p.keyword))
        throw config_error("C332", "ambiguous schema: two statement patterns start with '" + p.keyword + "'");
    byKeyword_.emplace(p.keyword, statements_.size());
    statements_.push_back(std::move(p));
    return *this;
}

const StatementPattern* Schema::statement_for(std::string_view keyword) const {
    auto it = byKeyword_.find(keyword);
    return it == byKeyword_.end() ? nullptr : &statements_[it->second];
}

std::vector<std::pair<std::string, std::string>> Schema::delimiter_pairs() const {
    std::vector<std::pair<std::string, std::string>> out;
    auto add = [&](const std::string& o, const std::string& c){
        if(o.empty() || c.empty()) return;
        for(auto& p : out) if(p.first == o) return;
        out.emplace_back(o, c);
    };
    add(block_open, block_close);
    add(group_open, group_close);
    add(call_open, call_close);
    return out;
}

static void collect_placeholders(const node_ptr& n, std::set<std::string>& out){
    if(auto* s = as_symbol(*n)){ if(s->name.size() > 1 && s->name[0] == '?') out.insert(s->name); return; }
    if(auto* l = as_list(*n)) for(auto& ch : l->elems) collect_placeholders(ch, out);
    if(auto* v = as_vector(*n)) for(auto& ch : v->elems) collect_placeholders(ch, out);
}

void Schema::validate() const {
    auto need = [&](const std::string& v, const char* what){
        if(v.empty()) throw config_error("C333", "schema '" + name + "' is missing " + what);
    };
    need(block_open, ":block open delimiter");
    need(block_close, ":block close delimiter");
    need(terminator, ":terminator");
    need(identifier_role, ":identifier role");
    if(literal_roles.empty()) throw config_error("C333", "schema '" + name + "' declares no :literals roles");
    if(statements_.empty()) throw config_error("C334", "schema '" + name + "' has no statement patterns");
    if(!assign.empty() && operators.infix(assign))
        throw config_error("C335", "assignment lexeme '" + assign + "' is also an infix operator");

    for(auto& p : statements_){
        if(operators.infix(p.keyword) || operators.prefix(p.keyword))
            throw config_error("C335", "statement keyword '" + p.keyword + "' is also an operator");
        if(!lexemes.contains(p.keyword))
            throw config_error("C336", "statement keyword '" + p.keyword + "' is not a registered lexeme");
        if(!p.action || !is_list(*p.action))
            throw config_error("C337", "statement '" + p.keyword + "' has no canonical template");
        std::set<std::string> bound;
        for(auto& f : p.fields){
            if(f.capture.empty()) continue;
            if(!bound.insert(f.capture).second)
                throw config_error("C338", "statement '" + p.keyword + "' captures " + f.capture + " twice");
        }
        std::set<std::string> used;
        collect_placeholders(p.action, used);
        for(auto& u : used)
            if(!bound.count(u))
                throw config_error("C339", "statement '" + p.keyword + "' template uses unbound placeholder " + u);
    }
}

void Schema::finalize(){
    validate();
    lexemes.freeze();
}

namespace {

[[noreturn]] void bad(const std::string& what){ throw config_error("C340", "invalid schema description: " + what); }

std::string string_of(const node_ptr& n, const char* key){
    if(!n) return {};
    if(auto* s = as_string(*n)) return *s;
    bad(std::string(key) + " must be a string");
}

std::string role_of(const node_ptr& n, const char* key){
    if(auto* k = as_keyword(*n)) return k->name;
    bad(std::string(key) + " entries must be keywords");
}

std::vector<std::string> strings_of(const node_ptr& n, const char* key){
    std::vector<std::string> out;
    if(!n) return out;
    auto* v = as_vector(*n);
    if(!v) bad(std::string(key) + " must be a vector of strings");
    for(auto& e : v->elems) out.push_back(string_of(e, key));
    return out;
}

Assoc assoc_of(const std::string& s){
    if(s == "left") return Assoc::left;
    if(s == "right") return Assoc::right;
    if(s == "none") return Assoc::none;
    bad("unknown associativity :" + s);
}

Field field_of(const node_ptr& n, const std::string& keyword){
    if(auto* s = as_string(*n)) return Field{FieldRole::literal, *s, {}};
    auto* l = as_list(*n);
    std::string head = head_name(*n);
    if(!l || head.empty()) bad("pattern element in '" + keyword + "' must be a string or a role form");
    auto capture = [&](size_t i){
        if(i >= l->elems.size() || !as_symbol(*l->elems[i]) || as_symbol(*l->elems[i])->name[0] != '?')
            bad("(" + head + " ...) in '" + keyword + "' needs a ?placeholder");
        return as_symbol(*l->elems[i])->name;
    };
    auto text = [&](size_t i){
        if(i >= l->elems.size() || !as_string(*l->elems[i])) bad("(" + head + " ...) in '" + keyword + "' needs a lexeme string");
        return *as_string(*l->elems[i]);
    };
    if(head == "opt") return Field{FieldRole::optional_literal, text(1), {}};
    if(head == "expr") return Field{FieldRole::expr, {}, capture(1)};
    if(head == "expr?") return Field{FieldRole::optional_expr, {}, capture(1)};
    if(head == "block") return Field{FieldRole::block, {}, capture(1)};
    if(head == "name") return Field{FieldRole::name, {}, capture(1)};
    if(head == "names") return Field{FieldRole::names, {}, capture(1)};
    if(head == "else") return Field{FieldRole::else_branch, text(1), capture(2)};
    bad("unknown pattern role '" + head + "' in '" + keyword + "'");
}

} // namespace

std::shared_ptr<const Schema> load_schema(const node_ptr& description){
    auto* m = description ? as_map(*description) : nullptr;
    if(!m) bad("top level must be a map");
    auto s = std::make_shared<Schema>();
    s->name = string_of(lookup(*m, "name"), ":name");
    if(s->name.empty()) s->name = "<schema>";

    if(auto lx = lookup(*m, "lexemes")){
        auto* lm = as_map(*lx);
        if(!lm) bad(":lexemes must be a map of string to role keyword");
        for(auto& kv : lm->entries) s->lexemes.add(string_of(kv.first, ":lexemes"), role_of(kv.second, ":lexemes"));
    }
    for(auto& sk : strings_of(lookup(*m, "skip"), ":skip")) s->lexemes.add_skip(sk);
    for(auto& c : strings_of(lookup(*m, "line-comment"), ":line-comment")) s->lexemes.add_line_comment(c);

    auto ensure = [&](const std::string& lexeme, const char* role){
        if(!lexeme.empty() && !s->lexemes.contains(lexeme)) s->lexemes.add(lexeme, role);
    };
    auto pair_of = [&](const char* key, std::string& open, std::string& close){
        auto xs = strings_of(lookup(*m, key), key);
        if(xs.empty()) return;
        if(xs.size() != 2) bad(std::string(":") + key + " must be [open close]");
        open = xs[0]; close = xs[1];
        ensure(open, "punct"); ensure(close, "punct");
    };
    pair_of("block", s->block_open, s->block_close);
    pair_of("group", s->group_open, s->group_close);
    {
        auto xs = strings_of(lookup(*m, "call"), ":call");
        if(!xs.empty()){
            if(xs.size() != 3) bad(":call must be [open close separator]");
            s->call_open = xs[0]; s->call_close = xs[1]; s->call_separator = xs[2];
            for(auto& x : xs) ensure(x, "punct");
        }
    }
    s->terminator = string_of(lookup(*m, "terminator"), ":terminator");
    ensure(s->terminator, "punct");
    s->assign = string_of(lookup(*m, "assign"), ":assign");
    ensure(s->assign, "punct");
    s->extern_keyword = string_of(lookup(*m, "extern"), ":extern");
    ensure(s->extern_keyword, "keyword");
    if(auto id = lookup(*m, "identifier")) s->identifier_role = role_of(id, ":identifier");
    if(auto lits = lookup(*m, "literals")){
        auto* v = as_vector(*lits);
        if(!v) bad(":literals must be a vector of role keywords");
        for(auto& e : v->elems) s->literal_roles.insert(role_of(e, ":literals"));
    }

    if(auto ops = lookup(*m, "operators")){
        auto* om = as_map(*ops);
        if(!om) bad(":operators must be a map");
        for(auto& kv : om->entries){
            std::string lexeme = string_of(kv.first, ":operators");
            auto* entry = as_vector(*kv.second);
            if(!entry || entry->elems.size() < 2 || !std::holds_alternative<int64_t>(entry->elems[0]->data))
                bad("operator '" + lexeme + "' must be [precedence assoc short-circuit?]");
            OperatorInfo info;
            info.precedence = static_cast<int>(std::get<int64_t>(entry->elems[0]->data));
            info.assoc = assoc_of(role_of(entry->elems[1], ":operators"));
            if(entry->elems.size() > 2){
                std::string sc = role_of(entry->elems[2], ":operators");
                if(sc == "and") info.short_circuit = ShortCircuit::and_then;
                else if(sc == "or") info.short_circuit = ShortCircuit::or_else;
                else bad("operator '" + lexeme + "' has unknown short-circuit :" + sc);
            }
            s->operators.add_infix(lexeme, info);
            ensure(lexeme, "operator");
        }
    }
    if(auto ops = lookup(*m, "prefix-operators")){
        auto* om = as_map(*ops);
        if(!om) bad(":prefix-operators must be a map");
        for(auto& kv : om->entries){
            std::string lexeme = string_of(kv.first, ":prefix-operators");
            if(!std::holds_alternative<int64_t>(kv.second->data)) bad("prefix operator '" + lexeme + "' needs an integer precedence");
            s->operators.add_prefix(lexeme, static_cast<int>(std::get<int64_t>(kv.second->data)));
            ensure(lexeme, "operator");
        }
    }

    if(auto sts = lookup(*m, "statements")){
        auto* v = as_vector(*sts);
        if(!v) bad(":statements must be a vector of maps");
        for(auto& e : v->elems){
            auto* sm = as_map(*e);
            if(!sm) bad("statement entries must be maps");
            auto pat = lookup(*sm, "pattern");
            auto* pv = pat ? as_vector(*pat) : nullptr;
            if(!pv || pv->elems.empty() || !as_string(*pv->elems.front())) bad("statement :pattern must start with a keyword string");
            StatementPattern p;
            p.keyword = *as_string(*pv->elems.front());
            for(auto& f : pv->elems){
                p.fields.push_back(field_of(f, p.keyword));
                const auto& fld = p.fields.back();
                if(!fld.text.empty()) ensure(fld.text, "keyword");
            }
            p.action = lookup(*sm, "emit");
            s->add_statement(std::move(p));
        }
    }

    s->finalize();
    return s;
}

std::shared_ptr<const Schema> load_schema(std::string_view edn_text){
    node_ptr description;
    try {
        description = parse(edn_text);
    } catch(const read_error& e) {
        throw config_error("C341", std::string("schema is not valid EDN: ") + e.what() + " at line " + std::to_string(e.line) +
                                   ", col " + std::to_string(e.col));
    }
    return load_schema(description);
}

} // namespace weft::canon
