#include <cassert>
#include <functional>
#include <iostream>
#include "test_values.hpp"
#include "weft/env.hpp"
#include "weft/runtime.hpp"

using namespace weft;
using weft_test::as_int;

static const weft_test::TSemantics kValues;

// Parameter list only; the body is supplied at the call site.
struct TFn : Callable {
    using Callable::Callable;
    std::shared_ptr<const ValueObject> clone() const override { return std::make_shared<TFn>(name(), params()); }
};

static void test_set_and_bind(){
    Environment env;
    env.set("x", kValues.integer(1));
    {
        ScopeGuard block(env);
        env.set("x", kValues.integer(2));   // updates the visible global
        env.set("y", kValues.integer(3));   // nothing visible: created here
        env.bind("x", kValues.integer(9));  // shadows in this frame
        assert(as_int(env.get("x")) == 9);
        assert(env.depth() == 2);
    }
    assert(env.depth() == 1);
    assert(as_int(env.get("x")) == 2);
    assert(!env.contains("y") && "block-local names do not outlive the block");
    assert(!env.lookup("y").has_value());

    bool threw = false;
    try { (void)env.get("y", Span{4, 5}); }
    catch(const scope_error& e) { threw = true; assert(e.code() == "S501"); assert(e.span().start == 4); }
    assert(threw);
}

static void test_call_frame_visibility(){
    Environment env;
    env.bind("g", kValues.integer(1));
    ScopeGuard outer(env);
    env.bind("local", kValues.integer(2));
    {
        ScopeGuard call(env, FrameKind::call);
        assert(env.depth() == 3);
        assert(env.contains("g") && "globals are visible from a call");
        assert(!env.contains("local") && "the caller's locals are not");
        env.set("local", kValues.integer(5));
        assert(as_int(env.get("local")) == 5);
    }
    assert(as_int(env.get("local")) == 2 && "callee assignment stayed in its own frame");
}

static void test_guard_unwinds_on_throw(){
    Environment env;
    try {
        ScopeGuard a(env);
        ScopeGuard b(env, FrameKind::call);
        assert(env.depth() == 3);
        throw runtime_error("R799", "boom");
    } catch(const error&) {}
    assert(env.depth() == 1);
    env.pop_scope(); // the global frame stays
    assert(env.depth() == 1);
}

static void test_runtime_call_protocol(){
    Environment env;
    Runtime rt(env, kValues, nullptr, 4);
    TFn fn("f", {"a", "b"});

    Value v = rt.call(fn, {kValues.integer(2), kValues.integer(3)}, Span{}, [&]{
        assert(rt.call_depth() == 1 && env.depth() == 2);
        return Exec::ret(kValues.integer(as_int(env.get("a")) * as_int(env.get("b"))));
    });
    assert(as_int(v) == 6);
    assert(env.depth() == 1 && rt.call_depth() == 0);

    Value none = rt.call(fn, {kValues.integer(0), kValues.integer(0)}, Span{}, []{ return Exec::normal(); });
    assert(none.type_name() == "nil");

    auto code_of = [&](auto&& body, std::vector<Value> args){
        try { (void)rt.call(fn, args, Span{}, body); } catch(const error& e) { return e.code(); }
        return std::string("none");
    };
    std::vector<Value> two{kValues.integer(1), kValues.integer(1)};
    assert(code_of([]{ return Exec::brk(); }, two) == "S502");
    assert(code_of([]{ return Exec::cont(); }, two) == "S503");
    assert(code_of([]{ return Exec::normal(); }, {kValues.integer(1)}) == "R702");
    assert(env.depth() == 1);

    // Depth limit: recursion through rt.call stops at 4 active calls.
    TFn rec("rec", {});
    std::function<Exec()> body = [&]{ return Exec::ret(rt.call(rec, {}, Span{}, body)); };
    bool limited = false;
    try { (void)rt.call(rec, {}, Span{}, body); } catch(const runtime_error& e) { limited = e.code() == "R703"; }
    assert(limited);
    assert(env.depth() == 1 && rt.call_depth() == 0);
}

static void test_runtime_loop_protocol(){
    Environment env;
    Runtime rt(env, kValues, nullptr);
    int n = 0;
    Exec r = rt.loop([&]{
        assert(env.depth() == 2 && "each iteration has its own frame");
        env.bind("tmp", kValues.integer(n));
        ++n;
        if(n == 2) return Exec::cont();
        if(n == 5) return Exec::brk();
        return Exec::normal();
    });
    assert(n == 5 && r.signal == Signal::None);
    assert(!env.contains("tmp") && env.depth() == 1);

    Exec ret = rt.loop([&]{ return Exec::ret(kValues.integer(7)); });
    assert(ret.signal == Signal::Return && as_int(ret.value) == 7);

    bool threw = false;
    try { (void)rt.invoke_extern("io:println", {}, Span{}); }
    catch(const extern_error& e) { threw = true; assert(e.code() == "X602"); }
    assert(threw);

    threw = false;
    try { rt.check_top_level(Exec::ret(kValues.nil()), Span{}); }
    catch(const scope_error& e) { threw = true; assert(e.code() == "S504"); }
    assert(threw);
}

void run_env_tests(){
    test_set_and_bind();
    test_call_frame_visibility();
    test_guard_unwinds_on_throw();
    test_runtime_call_protocol();
    test_runtime_loop_protocol();
    std::cout << "[env] environment/runtime protocol tests passed\n";
}
