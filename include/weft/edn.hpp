// EDN node tree used for schema files and for the printed canonical form.
#pragma once
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace weft::edn
{

    struct read_error : std::runtime_error
    {
        read_error(const std::string &msg, int line, int col)
            : std::runtime_error(msg), line(line), col(col) {}
        int line;
        int col;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct list;
    struct vector_t;
    struct map;
    struct node;

    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t, map>;

    struct node
    {
        node_data data;
        // Reader positions ("line", "col") and source spans ("start", "end") live here.
        std::map<std::string, node_ptr> metadata;
    };

    // Read exactly one form; trailing content is an error.
    node_ptr parse(std::string_view src);

    // Structural deep equality. Metadata is ignored unless ignore_metadata is false.
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_metadata = true);

    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return to_string(*p); }
    // Multi-line rendering; control heads (seq, scope, branch) always break.
    std::string to_pretty_string(const node &n, int indentWidth = 2);
    inline std::string to_pretty_string(const node_ptr &p, int indentWidth = 2) { return to_pretty_string(*p, indentWidth); }

    inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }

    inline node_ptr n_nil() { return make_node(std::monostate{}); }
    inline node_ptr n_sym(std::string name) { return make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return make_node(v); }
    inline node_ptr n_bool(bool b) { return make_node(b); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs = {})
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return make_node(std::move(l));
    }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs = {})
    {
        vector_t v;
        v.elems.assign(xs.begin(), xs.end());
        return make_node(std::move(v));
    }
    inline node_ptr node_list(std::vector<node_ptr> xs) { return make_node(list{std::move(xs)}); }
    inline node_ptr node_vec(std::vector<node_ptr> xs) { return make_node(vector_t{std::move(xs)}); }

    inline bool is_nil(const node &n) { return std::holds_alternative<std::monostate>(n.data); }
    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_string(const node &n) { return std::holds_alternative<std::string>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline bool is_map(const node &n) { return std::holds_alternative<map>(n.data); }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const vector_t *as_vector(const node &n) { return is_vector(n) ? &std::get<vector_t>(n.data) : nullptr; }
    inline const map *as_map(const node &n) { return is_map(n) ? &std::get<map>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    inline const keyword *as_keyword(const node &n) { return is_keyword(n) ? &std::get<keyword>(n.data) : nullptr; }
    inline const std::string *as_string(const node &n) { return is_string(n) ? &std::get<std::string>(n.data) : nullptr; }

    // Head symbol name of a list form, or "" when the node is not a symbol-headed list.
    inline std::string head_name(const node &n)
    {
        auto *l = as_list(n);
        if (!l || l->elems.empty())
            return {};
        auto *s = as_symbol(*l->elems.front());
        return s ? s->name : std::string{};
    }

    // Value of key `k` in a map whose keys are keywords; nullptr when absent.
    node_ptr lookup(const map &m, std::string_view k);

    int64_t meta_int(const node &n, const std::string &k, int64_t def = -1);

} // namespace weft::edn
