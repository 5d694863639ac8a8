#include <gtest/gtest.h>
#include "tupl/analyzer.hpp"

using namespace tupl;

namespace {
struct AnalyzerTest : ::testing::Test {
    TypeContext ctx;
    Options opts;
    AnalysisResult run(const char* src){
        TupleAnalyzer an(ctx, opts);
        return an.analyze(parse_one(src));
    }
    std::string bound(const AnalysisResult& r, const std::string& name){
        auto it = r.bindings.find(name);
        return it == r.bindings.end() ? std::string("<unbound>") : ctx.to_string(it->second);
    }
};
}

TEST_F(AnalyzerTest, MixedProgram){
    auto r = run(R"((tuples
  (def %p (tuple int str))
  (index %a %p 0)
  (index %b %p 5)
  (destructure [%x (rest %y)] (tuple int int int))
  (assign (tuple int int int) (tuple int int str))
  (generic split :params [AnyStr] :args (tuple AnyStr) :ret (tuple AnyStr AnyStr))
  (call %s split (tuple str))))");
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.diagnostics.size(), 2u);

    EXPECT_EQ(r.diagnostics[0].code, "E2103");
    EXPECT_EQ(r.diagnostics[0].kind, FailureKind::IndexOutOfRange);
    EXPECT_EQ(r.diagnostics[0].line, 4);
    EXPECT_EQ(r.diagnostics[0].col, 3);
    EXPECT_EQ(r.diagnostics[0].failure.position, 5);

    EXPECT_EQ(r.diagnostics[1].code, "E2102");
    EXPECT_EQ(r.diagnostics[1].line, 6);
    EXPECT_EQ(r.diagnostics[1].failure.position, 2);

    EXPECT_EQ(bound(r, "%p"), "tuple[int, str]");
    EXPECT_EQ(bound(r, "%a"), "int");
    EXPECT_EQ(bound(r, "%b"), "int | str");
    EXPECT_EQ(bound(r, "%x"), "int");
    EXPECT_EQ(bound(r, "%y"), "list[int]");
    EXPECT_EQ(bound(r, "%s"), "tuple[str, str]");
}

TEST_F(AnalyzerTest, CleanProgramSucceeds){
    auto r = run("(tuples (def %t (tuple int ...)) (index %e %t -100) (assign (tuple bool) %t))");
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.diagnostics.empty());
    EXPECT_EQ(bound(r, "%e"), "int");
}

TEST_F(AnalyzerTest, MalformedAnnotationBindsUnknown){
    auto r = run("(tuples\n (def %m (tuple (unpack (tuple int ...)) (unpack (tuple str ...)))))");
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].code, "E2100");
    EXPECT_EQ(r.diagnostics[0].kind, FailureKind::MalformedShape);
    EXPECT_EQ(r.diagnostics[0].failure.position, 1);
    EXPECT_EQ(r.diagnostics[0].line, 2);
    EXPECT_EQ(bound(r, "%m"), "Unknown");
}

TEST_F(AnalyzerTest, FunctionWithUnpackedArgs){
    auto r = run(R"((tuples
  (fn f :generics [(variadic Ts)] :params [(param x int) (args rest (tuple (unpack Ts)) :unpack)] :ret (tuple (unpack Ts)))
  (call %r f (tuple int str bytes))
  (call %bad f (tuple str))
  (call %n f int)))");
    EXPECT_EQ(bound(r, "%r"), "tuple[str, bytes]");
    EXPECT_EQ(bound(r, "%bad"), "Unknown");
    EXPECT_EQ(bound(r, "%n"), "Unknown");
    ASSERT_EQ(r.diagnostics.size(), 2u);
    EXPECT_EQ(r.diagnostics[0].code, "E2102");
    EXPECT_EQ(r.diagnostics[0].failure.position, 0);
    EXPECT_EQ(r.diagnostics[1].code, "E2104");
}

TEST_F(AnalyzerTest, TwoRestTargets){
    auto r = run("(tuples (destructure [(rest %a) (rest %b)] (tuple int)))");
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].code, "E2105");
    EXPECT_EQ(bound(r, "%a"), "Unknown");
    EXPECT_EQ(bound(r, "%b"), "Unknown");
}

TEST_F(AnalyzerTest, UnionIndexReportsPerAlternative){
    auto r = run("(tuples (index %r (union (tuple int) (tuple str str) (tuple int ...)) 2))");
    ASSERT_EQ(r.diagnostics.size(), 2u);
    EXPECT_EQ(r.diagnostics[0].failure.alternative, 0);
    EXPECT_EQ(r.diagnostics[1].failure.alternative, 1);
    EXPECT_EQ(bound(r, "%r"), "int");
}

TEST_F(AnalyzerTest, NarrowPolicyFromOptions){
    opts.index_policy = IndexPolicy::Narrow;
    auto r = run("(tuples (def %t (tuple int (unpack (tuple str ...)) float)) (index %l %t -1) (index %m %t 1))");
    EXPECT_EQ(bound(r, "%l"), "float");
    EXPECT_EQ(bound(r, "%m"), "str | float");
}

TEST_F(AnalyzerTest, RepeatedQueriesHitTheCache){
    TupleAnalyzer an(ctx, opts);
    an.analyze(parse_one("(tuples (index %a (tuple int str) 1) (index %b (tuple int str) 1) (assign (tuple int) (tuple float)) (assign (tuple int) (tuple float)))"));
    EXPECT_EQ(an.cache().hits(), 2u);
    EXPECT_EQ(an.cache().misses(), 2u);
}

TEST_F(AnalyzerTest, MalformedSignatureIsLocal){
    auto r = run(R"((tuples
  (generic f :params [(variadic Ts)] :args (tuple (unpack Ts) (unpack Ts)) :ret int)
  (def %a (tuple int))
  (call %r f (tuple int str))))");
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].code, "E2100");
    EXPECT_EQ(r.diagnostics[0].line, 2);
    EXPECT_EQ(r.diagnostics[0].failure.position, 1);
    EXPECT_EQ(bound(r, "%a"), "tuple[int]");
    EXPECT_EQ(bound(r, "%r"), "Unknown");
}

TEST_F(AnalyzerTest, MalformedFnParamsAreLocal){
    auto r = run(R"((tuples
  (fn g :params [(args rest int :unpack)] :ret int)
  (call %r g (tuple int))
  (fn g :params [(param x int)] :ret str)
  (call %s g (tuple int))))");
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].code, "E2100");
    EXPECT_EQ(bound(r, "%r"), "Unknown");
    // a later well-formed redefinition replaces the malformed one
    EXPECT_EQ(bound(r, "%s"), "str");
}

TEST_F(AnalyzerTest, MalformedStatementsThrow){
    EXPECT_THROW(run("(module)"), parse_error);
    EXPECT_THROW(run("(tuples (frob %a))"), parse_error);
    EXPECT_THROW(run("(tuples int)"), parse_error);
    EXPECT_THROW(run("(tuples (index %a (tuple int) x))"), parse_error);
    EXPECT_THROW(run("(tuples (call %a nope (tuple)))"), parse_error);
    EXPECT_THROW(run("(tuples (def %a))"), parse_error);
    EXPECT_THROW(run("(tuples (generic :params [T] :ret T))"), parse_error);
    EXPECT_THROW(run("(tuples (fn f :params [(param x int)]))"), parse_error);
}
