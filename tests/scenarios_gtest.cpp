#include <gtest/gtest.h>
#include <array>
#include <cstdio>
#include <sstream>
#include <string>
#include "curlite/curlite.hpp"
#include "pylite/pylite.hpp"
#include "weft/canon/edn_form.hpp"
#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace {

struct Captured {
    weft::RunResult result;
    std::string out;
};

template <typename Run>
Captured capture(Run run, const std::string& src){
    std::ostringstream out, err;
    weft::RunOptions opts;
    opts.out = &out;
    opts.err = &err;
    Captured c{run(src, opts), {}};
    c.out = out.str();
    return c;
}

Captured py(const std::string& src){ return capture([](const std::string& s, const weft::RunOptions& o){ return pylite::run(s, o); }, src); }
Captured cur(const std::string& src){ return capture([](const std::string& s, const weft::RunOptions& o){ return curlite::run(s, o); }, src); }

std::string first_code(const weft::RunResult& r){ return r.diagnostics.empty() ? std::string() : r.diagnostics.front().code; }

} // namespace

TEST(Scenarios, PrecedenceAgreesAcrossVariants){
    auto a = py("print(1 + 2 * 3)\nprint((1 + 2) * 3)\nprint(2 ^ 3 ^ 2)\n");
    auto b = cur("print 1 + 2 * 3;\nprint (1 + 2) * 3;\nprint 2 ** 3 ** 2;\n");
    ASSERT_TRUE(a.result.success);
    ASSERT_TRUE(b.result.success);
    EXPECT_EQ(a.out, "7\n9\n512\n");
    EXPECT_EQ(b.out, a.out);
}

TEST(Scenarios, CounterPrintsZeroOneTwo){
    auto a = py("x = 0\nwhile x < 3:\n    print(x)\n    x = x + 1\n");
    auto b = cur("x = 0;\nwhile x < 3 {\n    print x;\n    x = x + 1;\n}\n");
    EXPECT_EQ(a.out, "0\n1\n2\n");
    EXPECT_EQ(b.out, "0\n1\n2\n");
}

TEST(Scenarios, EarlyReturnLeavesNoFrames){
    const char* pysrc =
        "def find(limit):\n"
        "    while True:\n"
        "        let probe = 1\n"
        "        return limit\n"
        "print(find(1))\n"
        "print(find(2))\n"
        "print(probe)\n";
    auto a = py(pysrc);
    EXPECT_EQ(a.out, "1\n2\n");
    EXPECT_EQ(first_code(a.result), "S501");

    auto b = cur("fn find(limit) { while true { let probe = 1; return limit; } }\nprint find(1);\nprint find(2);\nprint probe;\n");
    EXPECT_EQ(b.out, "1\n2\n");
    EXPECT_EQ(first_code(b.result), "S501");
}

TEST(Scenarios, ErrorMidLoopReportsAndStops){
    auto a = py("i = 0\nwhile i < 5:\n    print(i)\n    if i == 2:\n        print(missing)\n    i = i + 1\nprint(\"after\")\n");
    EXPECT_FALSE(a.result.success);
    EXPECT_EQ(a.out, "0\n1\n2\n");
    EXPECT_EQ(first_code(a.result), "S501");
    EXPECT_EQ(a.result.diagnostics.front().line, 5);
}

TEST(Scenarios, SignalsStayInsideTheirConstruct){
    EXPECT_EQ(first_code(py("def f():\n    continue\nf()\n").result), "S503");
    EXPECT_EQ(first_code(cur("fn f() { break; } f();").result), "S502");
    EXPECT_EQ(first_code(py("return 0\n").result), "S504");
    EXPECT_EQ(first_code(cur("return 0;").result), "S504");
}

TEST(Scenarios, SelectorNeverFallsBackSilently){
    auto a = py("extern(\"backendX:println\", \"hi\")\n");
    auto b = cur("extern(\"backendX:println\", \"hi\");");
    for(const auto* r : {&a, &b}){
        EXPECT_TRUE(r->out.empty()) << "nothing may be printed by a substitute backend";
        ASSERT_EQ(first_code(r->result), "X601");
        EXPECT_NE(r->result.diagnostics.front().message.find("backendX (not registered)"), std::string::npos)
            << r->result.diagnostics.front().message;
    }
}

TEST(Scenarios, CanonicalFormRoundTrips){
    auto form = weft::canon::lower(curlite::language(), "fn add(a, b) { return a + b; }\nfor i in 0..3 { print add(i, 1); }");
    auto instr = weft::canon::from_edn(form);
    auto reread = weft::canon::from_edn(weft::edn::parse(weft::edn::to_string(weft::canon::to_edn(instr))));
    EXPECT_TRUE(weft::canon::equal(instr, reread));
    EXPECT_NE(weft::edn::to_string(form).find("(operate lambda [a b]"), std::string::npos);
}

#if defined(WEFT_RUN_PATH) && defined(WEFT_EXAMPLES_DIR)
static int run_driver(const std::string& args, std::string& out){
    std::string cmd = std::string(WEFT_RUN_PATH) + " " + args + " 2>&1";
    std::array<char, 512> buf{};
#if defined(_WIN32)
    FILE* p = _popen(cmd.c_str(), "r");
#else
    FILE* p = popen(cmd.c_str(), "r");
#endif
    if(!p) return -1;
    while(fgets(buf.data(), static_cast<int>(buf.size()), p)) out += buf.data();
#if defined(_WIN32)
    int status = _pclose(p);
#else
    int status = pclose(p);
    if(WIFEXITED(status)) status = WEXITSTATUS(status);
#endif
    return status;
}

TEST(Driver, RunsExamplesByExtension){
    for(const char* name : {"counter.pyl", "counter.crl"}){
        std::string out;
        int rc = run_driver(std::string(WEFT_EXAMPLES_DIR) + "/" + name, out);
        EXPECT_EQ(rc, 0) << out;
        EXPECT_EQ(out, "0\n1\n2\n") << name;
    }

    std::string out;
    EXPECT_EQ(run_driver(std::string(WEFT_EXAMPLES_DIR) + "/functions.pyl", out), 0) << out;
    EXPECT_EQ(out, "0 0\n2 1\n4 3\n6 8\n8 21\n8\n512 9\nvia extern\n");

    out.clear();
    EXPECT_EQ(run_driver(std::string(WEFT_EXAMPLES_DIR) + "/functions.crl", out), 0) << out;
    EXPECT_EQ(out, "0 0\n2 1\n4 3\n6 8\n8 21\nnegative\n512\nlen 4\n");
}

TEST(Driver, ReportsDiagnosticsWithExitCode){
    std::string out;
    int rc = run_driver("--lang curlite " + std::string(WEFT_EXAMPLES_DIR) + "/counter.pyl", out);
    EXPECT_EQ(rc, 2) << out;
    EXPECT_NE(out.find("lexical error[L101]"), std::string::npos) << out;

    out.clear();
    EXPECT_EQ(run_driver("", out), 1) << out;
}
#endif
