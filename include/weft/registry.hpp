#pragma once
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace weft {

// Registered literal lexemes of one language. Written during setup, frozen, then
// shared read-only by every tokenizer run.
class LexemeTable {
public:
    struct Entry {
        std::string pattern;
        std::string role;
        bool skip = false;
    };

    // Idempotent for an identical (pattern, role); a different role for the same
    // pattern, or a pattern already marked skip, is a configuration error.
    LexemeTable& add(std::string pattern, std::string role);
    LexemeTable& add_skip(std::string pattern);
    // Consumes from the prefix to the end of the line without emitting anything.
    LexemeTable& add_line_comment(std::string prefix);

    // Sorts entries by descending pattern length; further registration throws.
    void freeze();
    bool frozen() const { return frozen_; }

    // Longest entry matching at the start of `text`; nullptr when none does.
    const Entry* longest_match(std::string_view text) const;
    // Length of a line-comment prefix matching at the start of `text`, 0 when none.
    size_t comment_prefix(std::string_view text) const;

    bool contains(std::string_view pattern) const;
    // Role of a registered lexeme; empty when not registered.
    std::string role_of(std::string_view pattern) const;
    const std::vector<Entry>& entries() const { return entries_; }

private:
    void check_open(const std::string& what) const;
    std::vector<Entry> entries_;
    std::map<std::string, size_t, std::less<>> index_;
    std::vector<std::string> comments_;
    bool frozen_ = false;
};

} // namespace weft
