#include "weft/registry.hpp"
#include "weft/error.hpp"
#include <algorithm>

namespace weft {

void LexemeTable::check_open(const std::string& what) const {
    if(frozen_) throw config_error("C301", "lexeme table is frozen; cannot register " + what);
}

LexemeTable& LexemeTable::add(std::string pattern, std::string role){
    check_open("'" + pattern + "'");
    if(pattern.empty()) throw config_error("C302", "empty lexeme pattern");
    if(role.empty()) throw config_error("C302", "lexeme '" + pattern + "' registered without a role");
    auto it = index_.find(pattern);
    if(it != index_.end()){
        const auto& prev = entries_[it->second];
        if(prev.skip) throw config_error("C303", "lexeme '" + pattern + "' is already registered as skipped");
        if(prev.role != role)
            throw config_error("C304", "lexeme '" + pattern + "' registered with conflicting roles '" + prev.role + "' and '" + role + "'");
        return *this;
    }
    index_.emplace(pattern, entries_.size());
    entries_.push_back(Entry{std::move(pattern), std::move(role), false});
    return *this;
}

LexemeTable& LexemeTable::add_skip(std::string pattern){
    check_open("skip '" + pattern + "'");
    if(pattern.empty()) throw config_error("C302", "empty skip pattern");
    auto it = index_.find(pattern);
    if(it != index_.end()){
        if(entries_[it->second].skip) return *this;
        throw config_error("C303", "lexeme '" + pattern + "' is both emitted and skipped");
    }
    index_.emplace(pattern, entries_.size());
    entries_.push_back(Entry{std::move(pattern), "skip", true});
    return *this;
}

LexemeTable& LexemeTable::add_line_comment(std::string prefix){
    check_open("comment '" + prefix + "'");
    if(prefix.empty()) throw config_error("C302", "empty line-comment prefix");
    if(std::find(comments_.begin(), comments_.end(), prefix) == comments_.end()) comments_.push_back(std::move(prefix));
    return *this;
}

void LexemeTable::freeze(){
    if(frozen_) return;
    for(const auto& c : comments_)
        if(index_.count(c)) throw config_error("C303", "lexeme '" + c + "' is also a line-comment prefix");
    std::stable_sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b){ return a.pattern.size() > b.pattern.size(); });
    index_.clear();
    for(size_t i = 0; i < entries_.size(); ++i) index_.emplace(entries_[i].pattern, i);
    std::stable_sort(comments_.begin(), comments_.end(), [](const std::string& a, const std::string& b){ return a.size() > b.size(); });
    frozen_ = true;
}

const LexemeTable::Entry* LexemeTable::longest_match(std::string_view text) const {
    // Entries are length-sorted once frozen, so the first hit is the longest.
    const Entry* best = nullptr;
    for(const auto& e : entries_){
        if(best && e.pattern.size() <= best->pattern.size()){
            if(frozen_) break;
            continue;
        }
        if(text.substr(0, e.pattern.size()) == e.pattern) best = &e;
    }
    return best;
}

size_t LexemeTable::comment_prefix(std::string_view text) const {
    for(const auto& c : comments_) if(text.substr(0, c.size()) == c) return c.size();
    return 0;
}

bool LexemeTable::contains(std::string_view pattern) const { return index_.find(pattern) != index_.end(); }

std::string LexemeTable::role_of(std::string_view pattern) const {
    auto it = index_.find(pattern);
    if(it == index_.end() || entries_[it->second].skip) return {};
    return entries_[it->second].role;
}

} // namespace weft
