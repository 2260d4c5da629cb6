#include <cassert>
#include <cctype>
#include <iostream>
#include "test_values.hpp"
#include "weft/canon/edn_form.hpp"
#include "weft/canon/program.hpp"

using namespace weft;
using namespace weft::canon;
using weft_test::as_int;

static const weft_test::TSemantics kSem;

static const char* kMiniHead = R"EDN({:name "mini"
 :skip [" " "\n"]
 :literals [:number :literal]
 :lexemes {"true" :literal "false" :literal}
 :block ["{" "}"]
 :group ["(" ")"]
 :call ["(" ")" ","]
 :assign "="
 :operators {"+" [5 :left] "*" [6 :left] "<" [4 :none] "^" [8 :right] "&&" [2 :left :and]}
 :prefix-operators {"-" 7}
)EDN";

static const char* kMiniStatements = R"EDN(
 :statements [{:pattern ["let" (name ?n) "=" (expr ?v) ";"] :emit (assign :bind ?n ?v)}
              {:pattern ["ret" (expr? ?v) ";"] :emit (transfer return ?v)}]}
)EDN";

static std::string mini_text(){ return std::string(kMiniHead) + " :terminator \";\"" + kMiniStatements; }

static std::optional<ScanMatch> words(std::string_view rest){
    size_t n = 0;
    if(std::isalpha(static_cast<unsigned char>(rest[0]))){
        while(n < rest.size() && std::isalnum(static_cast<unsigned char>(rest[n]))) ++n;
        return ScanMatch{n, "ident"};
    }
    while(n < rest.size() && std::isdigit(static_cast<unsigned char>(rest[n]))) ++n;
    if(n) return ScanMatch{n, "number"};
    return std::nullopt;
}

static Language mini_language(){
    static auto schema = load_schema(mini_text());
    Language lang;
    lang.name = "mini";
    lang.schema = schema;
    lang.scanner = words;
    lang.semantics = &kSem;
    return lang;
}

static InstrPtr form(const char* text){ return from_edn(edn::parse(text)); }

static void test_round_trip(){
    auto prog = make_sequence({
        make_assign(AssignMode::bind, "f", make_lambda({"a", "b"}, make_sequence({
            make_transfer(TransferKind::Return, make_operate("+", {make_load("a"), make_load("b")}))}))),
        make_scope(make_sequence({
            make_branch(make_operate("<", {make_load("i"), make_const("number", "3")}), make_sequence({}),
                        make_transfer(TransferKind::Break)),
            make_invoke("io|debug:println", {make_const("string", "\"hi\"")}, true),
            make_assign(AssignMode::set, "i", make_invoke("f", {make_load("i"), make_const("number", "1")}, false))}),
            true),
    });
    auto printed = edn::to_string(to_edn(prog));
    auto back = from_edn(edn::parse(printed));
    assert(equal(prog, back));
    assert(back->children[1]->repeat && back->children[1]->children[0]->children[1]->external);
    assert(!equal(prog, make_sequence({})));
    assert(printed.find("(invoke \"io|debug:println\"") != std::string::npos);
    assert(printed.find("(invoke f") != std::string::npos && "internal callees print as symbols");
}

static void test_malformed_forms(){
    for(const char* bad : {"(frobnicate 1)", "(scope)", "(assign :maybe x (seq))", "(transfer break (seq))",
                           "(operate const 1)", "(operate lambda (a) (seq))", "[seq]", "(branch (seq))"}){
        bool threw = false;
        try { (void)form(bad); } catch(const parse_error& e) { threw = true; assert(e.code() == "P221"); }
        assert(threw);
    }
}

static void test_executor(){
    Environment env;
    Runtime rt(env, kSem, nullptr);
    Executor ex(rt, kSem);

    auto fact = form(R"((seq
        (assign :bind fact (operate lambda [n] (seq
            (branch (operate < (operate load n) (operate const :number "2"))
                    (transfer return (operate const :number "1")))
            (transfer return (operate * (operate load n)
                (invoke fact (operate - (operate load n) (operate const :number "1"))))))))
        (invoke fact (operate const :number "5"))))");
    RunOptions opts;
    assert(as_int(execute_program(ex, *fact, opts)) == 120);
    assert(env.get("fact").display() == "<fn fact>" && "anonymous functions take their first name");

    auto counting = form(R"((seq
        (assign :bind i (operate const :number "0"))
        (scope :repeat (seq
            (branch (operate < (operate load i) (operate const :number "3")) (seq) (transfer break))
            (assign :bind tmp (operate load i))
            (assign :set i (operate + (operate load i) (operate const :number "1")))))
        (operate load i)))");
    size_t visited = 0;
    opts.between_statements = [&](size_t){ ++visited; };
    assert(as_int(execute_program(ex, *counting, opts)) == 3);
    assert(visited == 3 && !env.contains("tmp") && env.depth() == 1);

    // The executor caches literals by instruction address; keep every tree alive.
    std::vector<InstrPtr> keep;
    auto code_of = [&](const char* text){
        keep.push_back(form(text));
        try { (void)execute_program(ex, *keep.back(), RunOptions{}); } catch(const error& e) { return e.code(); }
        return std::string("none");
    };
    assert(code_of("(assign :set x (seq (transfer break)))") == "S505");
    assert(code_of("(seq (transfer continue))") == "S503");
    assert(code_of("(branch (operate const :number \"1\") (seq))") == "R402");
    assert(code_of("(invoke i)") == "R403");
    assert(code_of("(invoke nothing)") == "S501");
    assert(code_of("(invoke \"io:println\")") == "X602");
    assert(code_of("(seq (assign :bind g (operate lambda [] (seq (transfer break)))) (invoke g))") == "S502");
    assert(env.depth() == 1);
}

static void test_short_circuit(){
    auto lang = mini_language();
    Environment env;
    Runtime rt(env, kSem, nullptr);
    Executor ex(rt, kSem, lang.schema);
    // The right operand would fail if it were evaluated.
    auto skip = form(R"((operate && (operate const :literal "false") (invoke boom)))");
    assert(ex.evaluate(*skip).display() == "false");
    auto strict = form(R"((operate && (operate const :literal "true") (operate const :number "1")))");
    bool threw = false;
    try { (void)ex.evaluate(*strict); } catch(const type_error& e) { threw = true; assert(e.code() == "R402"); }
    assert(threw);
}

static void test_reducer(){
    auto lang = mini_language();
    auto lowered = compile(lang, "let x = 1 + 2 * 3 ^ 2 ^ 1;\n-x;");
    auto expected = form(R"((seq
        (assign :bind x (operate + (operate const :number "1")
            (operate * (operate const :number "2")
                (operate ^ (operate const :number "3") (operate ^ (operate const :number "2") (operate const :number "1"))))))
        (operate - (operate load x))))");
    assert(equal(lowered, expected));
    assert(lowered->children[0]->span.start == 0 && lowered->children[1]->span.start == 27);

    auto grouped = compile(lang, "(1 + 2) * 3;");
    assert(equal(grouped, form(R"((seq (operate * (operate + (operate const :number "1") (operate const :number "2")) (operate const :number "3"))))")));

    auto code_of = [&](const char* src){
        try { (void)compile(lang, src); } catch(const error& e) { return e.code(); }
        return std::string("none");
    };
    assert(code_of("let y = 1 < 2 < 3;") == "P201");
    assert(code_of("let = 1;") == "P201");
    assert(code_of("let y = (1 + 2;") == "P202");
    assert(code_of("1 + 2") == "P201");
    assert(code_of("1 } 2;") == "P203");
}

static void test_run(){
    auto lang = mini_language();
    auto ok = run(lang, "let x = 2 + 3;\nx * x;");
    assert(ok.success && as_int(ok.value) == 25 && ok.exit_code() == 0);

    auto top = run(lang, "let x = 1;\nret x;");
    assert(!top.success && top.exit_code() == 3);
    assert(top.diagnostics.size() == 1 && top.diagnostics[0].code == "S504");
    assert(top.diagnostics[0].line == 2);

    auto syntax = run(lang, "let x = ;");
    assert(syntax.exit_code() == 2);

    Language bare = lang;
    bare.semantics = nullptr;
    auto none = run(bare, "1;");
    assert(!none.success && none.diagnostics[0].code == "C306");
}

static void test_schema_errors(){
    auto code_of = [](const std::string& text){
        try { (void)load_schema(text); } catch(const config_error& e) { return e.code(); }
        return std::string("none");
    };
    assert(code_of(mini_text()) == "none");
    assert(code_of("{:name \"x\"") == "C341");
    assert(code_of("[1 2]") == "C340");
    assert(code_of(std::string(kMiniHead) + kMiniStatements) == "C333");
    assert(code_of(std::string(kMiniHead) + R"( :terminator ";" :statements
        [{:pattern ["let" (name ?n) ";"] :emit (assign :bind ?n ?v)}]})") == "C339");
    assert(code_of(std::string(kMiniHead) + R"( :terminator ";" :statements
        [{:pattern ["let" (name ?n) ";"] :emit (seq)} {:pattern ["let" (expr ?v) ";"] :emit (seq)}]})") == "C332");
    assert(code_of(std::string(kMiniHead) + R"( :terminator ";" :statements
        [{:pattern ["+" (expr ?v) ";"] :emit (seq)}]})") == "C335");
    assert(code_of(std::string(kMiniHead) + R"( :terminator ";" :statements
        [{:pattern ["let" (frob ?v)] :emit (seq)}]})") == "C340");
}

void run_canon_tests(){
    test_round_trip();
    test_malformed_forms();
    test_executor();
    test_short_circuit();
    test_reducer();
    test_run();
    test_schema_errors();
    std::cout << "[canon] instruction/executor/reducer tests passed\n";
}
