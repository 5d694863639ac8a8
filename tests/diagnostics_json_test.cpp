#include <gtest/gtest.h>
#include "tupl/diagnostics_json.hpp"

using namespace tupl;

TEST(DiagnosticsJson, Escapes){
    EXPECT_EQ(json_escape("plain"), "\"plain\"");
    EXPECT_EQ(json_escape("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(DiagnosticsJson, SerializesResult){
    TypeContext ctx;
    TupleAnalyzer an(ctx, Options{});
    auto r = an.analyze(parse_one("(tuples\n (def %p (tuple int str))\n (index %b %p 5))"));
    auto js = diagnostics_to_json(r, ctx);
    EXPECT_NE(js.find("\"success\":false"), std::string::npos);
    EXPECT_NE(js.find("\"code\":\"E2103\""), std::string::npos);
    EXPECT_NE(js.find("\"kind\":\"IndexOutOfRange\""), std::string::npos);
    EXPECT_NE(js.find("\"line\":3"), std::string::npos);
    EXPECT_NE(js.find("\"position\":5"), std::string::npos);
    EXPECT_NE(js.find("\"source\":\"tuple[int, str]\""), std::string::npos);
    EXPECT_NE(js.find("\"%b\":\"int | str\""), std::string::npos);
}

TEST(DiagnosticsJson, EmptyResult){
    TypeContext ctx;
    AnalysisResult r;
    EXPECT_EQ(diagnostics_to_json(r, ctx), "{\"success\":true,\"diagnostics\":[],\"bindings\":{}}");
}

TEST(DiagnosticsJson, PrintsOnlyWhenEnabled){
    TypeContext ctx;
    AnalysisResult r;
    Options opts;
    ::testing::internal::CaptureStderr();
    maybe_print_json(r, ctx, opts);
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");
    opts.diag_json = true;
    ::testing::internal::CaptureStderr();
    maybe_print_json(r, ctx, opts);
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "{\"success\":true,\"diagnostics\":[],\"bindings\":{}}\n");
}
