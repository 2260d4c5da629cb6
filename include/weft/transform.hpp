#pragma once
#include "weft/edn.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace weft::edn {

// Rewrites EDN trees by macro expansion: a list whose head symbol has a registered
// macro is replaced by the macro's result, which is expanded again (macros may
// expand to macros).
//
// Macros return std::nullopt when a form does not apply (e.g. arity mismatch), which
// leaves the form unchanged.
class Transformer {
public:
    using MacroFn = std::function<std::optional<node_ptr>(const list&)>;

    Transformer& add_macro(std::string name, MacroFn fn){ macros_[std::move(name)] = std::move(fn); return *this; }

    // Expanded deep copy; the input tree is left untouched.
    node_ptr expand(const node_ptr& n) const { return expand_impl(n); }

private:
    std::unordered_map<std::string, MacroFn> macros_;

    static node_ptr shallow_copy(const node_ptr& n, node_data d){
        auto out = std::make_shared<node>();
        out->data = std::move(d);
        out->metadata = n->metadata;
        return out;
    }

    node_ptr expand_children(const node_ptr& n) const {
        if(auto* l = as_list(*n)){
            list out; for(auto& ch : l->elems) out.elems.push_back(expand_impl(ch));
            return shallow_copy(n, std::move(out));
        }
        if(auto* v = as_vector(*n)){
            vector_t out; for(auto& ch : v->elems) out.elems.push_back(expand_impl(ch));
            return shallow_copy(n, std::move(out));
        }
        if(auto* m = as_map(*n)){
            map out; for(auto& kv : m->entries) out.entries.emplace_back(expand_impl(kv.first), expand_impl(kv.second));
            return shallow_copy(n, std::move(out));
        }
        return n;
    }

    node_ptr expand_impl(const node_ptr& n) const {
        node_ptr current = n;
        for(;;){
            auto it = macros_.find(head_name(*current));
            if(it == macros_.end()) break;
            auto replaced = it->second(*as_list(*current));
            if(!replaced) break;
            // Keep the source position of the form being replaced.
            if((*replaced)->metadata.empty()) (*replaced)->metadata = current->metadata;
            current = *replaced;
        }
        return expand_children(current);
    }
};

} // namespace weft::edn
