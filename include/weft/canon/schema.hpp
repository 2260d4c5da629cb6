// Declarative language schema for the schema-driven variant: lexemes, operator
// binding, block/call punctuation and statement patterns with their canonical
// action templates. Pure data; built once and shared read-only.
#pragma once
#include "weft/edn.hpp"
#include "weft/operators.hpp"
#include "weft/registry.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace weft::canon {

enum class FieldRole {
    literal,          // "text": required lexeme
    optional_literal, // (opt "text")
    expr,             // (expr ?x)
    optional_expr,    // (expr? ?x): absent before a terminator or block close
    block,            // (block ?x)
    name,             // (name ?x): one identifier
    names,            // (names ?x): parenthesized, separator-delimited identifiers
    else_branch,      // (else "kw" ?x): kw followed by a block or a nested statement
};

struct Field {
    FieldRole role = FieldRole::literal;
    std::string text;    // lexeme for literal / optional_literal / else_branch
    std::string capture; // "?x" placeholder name
};

struct StatementPattern {
    std::string keyword; // leading lexeme, the pattern's first field
    std::vector<Field> fields;
    edn::node_ptr action; // canonical template with ?placeholders
};

class Schema {
public:
    std::string name;
    LexemeTable lexemes;
    OperatorTable operators;

    std::string block_open, block_close;
    std::string group_open, group_close;
    std::string call_open, call_close, call_separator;
    std::string terminator;
    std::string assign;
    std::string extern_keyword;
    std::string identifier_role = "ident";
    std::set<std::string> literal_roles;

    // A second pattern with the same leading keyword is a configuration error.
    Schema& add_statement(StatementPattern p);
    const StatementPattern* statement_for(std::string_view keyword) const;
    const std::vector<StatementPattern>& statements() const { return statements_; }

    // Delimiter pairs for check_delimiters().
    std::vector<std::pair<std::string, std::string>> delimiter_pairs() const;

    // Throws config_error describing the first inconsistency.
    void validate() const;
    // validate() then freeze the lexeme table.
    void finalize();

private:
    std::vector<StatementPattern> statements_;
    std::map<std::string, size_t, std::less<>> byKeyword_;
};

// Build a schema from its EDN description. Keys:
//   :name :lexemes {"lexeme" :role ...} :skip [...] :line-comment [...]
//   :block [open close] :group [open close] :call [open close separator]
//   :terminator :assign :extern :identifier :role :literals [:role ...]
//   :operators {"op" [prec :left|:right|:none :and|:or?] ...} :prefix-operators {"op" prec ...}
//   :statements [{:pattern [...] :emit template} ...]
// Operator, punctuation and statement-keyword lexemes are registered automatically.
std::shared_ptr<const Schema> load_schema(std::string_view edn_text);
std::shared_ptr<const Schema> load_schema(const edn::node_ptr& description);

} // namespace weft::canon
