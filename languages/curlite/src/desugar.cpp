#include "curlite/curlite.hpp"
#include "weft/canon/instruction.hpp"

using namespace weft::edn;

namespace curlite {

namespace {

node_ptr sym(const std::string& s){ return n_sym(s); }
node_ptr load(const std::string& name){ return node_list({sym("operate"), sym(weft::canon::ops::load), sym(name)}); }

// (scope :repeat (seq guard body)): one frame per iteration.
node_ptr repeat(node_ptr guard, node_ptr body){
    return node_list({sym("scope"), n_kw("repeat"), node_list({sym("seq"), std::move(guard), std::move(body)})});
}

node_ptr exit_unless(node_ptr cond){
    return node_list({sym("branch"), std::move(cond), node_list({sym("seq")}), node_list({sym("transfer"), sym("break")})});
}

node_ptr exit_when(node_ptr cond){
    return node_list({sym("branch"), std::move(cond), node_list({sym("transfer"), sym("break")}), node_list({sym("seq")})});
}

} // namespace

std::shared_ptr<const Transformer> desugar(){
    static const std::shared_ptr<const Transformer> tx = []{
        auto t = std::make_shared<Transformer>();

        // (while c body)
        t->add_macro("while", [](const list& form) -> std::optional<node_ptr> {
            if(form.elems.size() != 3) return std::nullopt;
            return repeat(exit_unless(form.elems[1]), form.elems[2]);
        });

        // (until c body)
        t->add_macro("until", [](const list& form) -> std::optional<node_ptr> {
            if(form.elems.size() != 3) return std::nullopt;
            return repeat(exit_when(form.elems[1]), form.elems[2]);
        });

        // (for-range i lo hi body): bounds are evaluated once; the counter lives in
        // hidden bindings so `continue` cannot skip the increment.
        t->add_macro("for-range", [](const list& form) -> std::optional<node_ptr> {
            if(form.elems.size() != 5 || !as_symbol(*form.elems[1])) return std::nullopt;
            const std::string next = "%next", end = "%end";
            auto step = node_list({sym("assign"), n_kw("set"), sym(next),
                                   node_list({sym("operate"), sym("+"), load(next),
                                              node_list({sym("operate"), sym(weft::canon::ops::constant), n_kw("number"), n_str("1")})})});
            auto iteration = node_list({sym("seq"),
                                        exit_unless(node_list({sym("operate"), sym("<"), load(next), load(end)})),
                                        node_list({sym("assign"), n_kw("bind"), form.elems[1], load(next)}),
                                        step,
                                        form.elems[4]});
            return node_list({sym("scope"),
                              node_list({sym("seq"),
                                         node_list({sym("assign"), n_kw("bind"), sym(next), form.elems[2]}),
                                         node_list({sym("assign"), n_kw("bind"), sym(end), form.elems[3]}),
                                         node_list({sym("scope"), n_kw("repeat"), iteration})})});
        });
        return std::shared_ptr<const Transformer>(t);
    }();
    return tx;
}

} // namespace curlite
