#include <cassert>
#include <iostream>
#include "weft/edn.hpp"
#include "weft/transform.hpp"

using namespace weft::edn;

static void test_reader_basics(){
    auto n = parse("(scope :repeat [1 -2 3.5 \"a\\nb\" nil true x?] {:k \"v\"}) ; trailing comment");
    auto* l = as_list(*n);
    assert(l && l->elems.size() == 4);
    assert(head_name(*n) == "scope");
    assert(as_keyword(*l->elems[1]) && as_keyword(*l->elems[1])->name == "repeat");
    auto* v = as_vector(*l->elems[2]);
    assert(v && v->elems.size() == 7);
    assert(std::get<int64_t>(v->elems[1]->data) == -2);
    assert(std::get<double>(v->elems[2]->data) == 3.5);
    assert(*as_string(*v->elems[3]) == "a\nb");
    assert(is_nil(*v->elems[4]));
    assert(as_symbol(*v->elems[6])->name == "x?");
    auto* m = as_map(*l->elems[3]);
    assert(m && lookup(*m, "k") && *as_string(*lookup(*m, "k")) == "v");
}

static void test_positions_and_errors(){
    auto n = parse("(seq\n  (operate load x))");
    auto inner = as_list(*n)->elems[1];
    assert(meta_int(*inner, "line") == 2);
    assert(meta_int(*inner, "col") == 3);

    bool threw = false;
    try { (void)parse("(seq (branch x)"); } catch(const read_error& e) { threw = true; assert(e.line >= 1); }
    assert(threw && "unclosed list must not parse");

    threw = false;
    try { (void)parse("(a) (b)"); } catch(const read_error&) { threw = true; }
    assert(threw && "trailing forms are rejected");
}

static void test_print_and_equal(){
    auto a = parse("(assign :set \"a b\" (operate + 1 2))");
    auto b = parse(to_string(a));
    assert(equal(a, b));
    assert(!equal(a, parse("(assign :set \"a b\" (operate + 1 3))")));
    auto pretty = to_pretty_string(parse("(seq (scope (seq (transfer break))))"));
    assert(pretty.find('\n') != std::string::npos);
    assert(equal(parse(pretty), parse("(seq (scope (seq (transfer break))))")));
}

static void test_transformer(){
    Transformer tx;
    // (twice e) -> (seq e e)
    tx.add_macro("twice", [](const list& form) -> std::optional<node_ptr> {
        if(form.elems.size() != 2) return std::nullopt;
        return node_list({n_sym("seq"), form.elems[1], form.elems[1]});
    });
    // (unless c b) -> (branch c (seq) b), expanding into a macro-free form
    tx.add_macro("unless", [](const list& form) -> std::optional<node_ptr> {
        if(form.elems.size() != 3) return std::nullopt;
        return node_list({n_sym("branch"), form.elems[1], node_list({n_sym("seq")}), form.elems[2]});
    });
    auto src = parse("(seq (twice (unless c (transfer break))) (twice))");
    auto out = tx.expand(src);
    assert(equal(out, parse("(seq (seq (branch c (seq) (transfer break)) (branch c (seq) (transfer break))) (twice))")));
    assert(equal(src, parse("(seq (twice (unless c (transfer break))) (twice))")) && "input is untouched");

    auto positioned = parse("(seq\n (twice x))");
    auto expanded = tx.expand(positioned);
    assert(meta_int(*as_list(*expanded)->elems[1], "line") == 2 && "expansion keeps the form's position");
}

void run_edn_tests(){
    test_reader_basics();
    test_positions_and_errors();
    test_print_and_equal();
    test_transformer();
    std::cout << "[edn] reader/printer/transformer tests passed\n";
}
