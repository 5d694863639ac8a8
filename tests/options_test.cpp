#include <gtest/gtest.h>
#include "tupl/analyzer.hpp"
#include "tupl/options.hpp"
#include "tupl/trace.hpp"
#include "test_env.hpp"

using namespace tupl;
using tupl_test::ScopedEnv;

TEST(Options, Defaults){
    ScopedEnv a("TUPL_INDEX_POLICY", ""), b("TUPL_CACHE", ""), c("TUPL_PROMOTIONS", "");
    Options o = detect_options();
    EXPECT_EQ(o.index_policy, IndexPolicy::Conservative);
    EXPECT_TRUE(o.enable_cache);
    EXPECT_TRUE(o.promotions.empty());
}

TEST(Options, ReadsEnvironment){
    ScopedEnv a("TUPL_INDEX_POLICY", "Narrow"), b("TUPL_CACHE", "0"), c("TUPL_DIAG_JSON", "1"),
              d("TUPL_PROMOTIONS", "myint>int");
    Options o = detect_options();
    EXPECT_EQ(o.index_policy, IndexPolicy::Narrow);
    EXPECT_STREQ(index_policy_name(o.index_policy), "narrow");
    EXPECT_FALSE(o.enable_cache);
    EXPECT_TRUE(o.diag_json);
    ASSERT_EQ(o.promotions.size(), 1u);
    EXPECT_EQ(o.promotions[0].first, "myint");
}

TEST(Options, ParsePromotions){
    auto p = parse_promotions("a>b, c > d ,bad,>x,y>");
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[0], std::make_pair(std::string("a"), std::string("b")));
    EXPECT_EQ(p[1], std::make_pair(std::string("c"), std::string("d")));
    EXPECT_TRUE(parse_promotions("").empty());
}

TEST(Options, ExtraPromotionsChain){
    TypeContext ctx;
    Options o;
    o.promotions = parse_promotions("myint>int");
    TupleAnalyzer an(ctx, o);
    AnalysisResult r;
    node n;
    EXPECT_TRUE(an.assign(r, tupl_test::ty(ctx, "(tuple myint)"), tupl_test::ty(ctx, "(tuple float)"), n));
    EXPECT_TRUE(r.success);
}

TEST(Options, TraceToggle){
    bool before = trace_enabled();
    set_trace_enabled(true);
    EXPECT_TRUE(trace_enabled());
    trace("test", "trace line");
    set_trace_enabled(before);
    EXPECT_EQ(trace_enabled(), before);
}

TEST(Options, FatalHandlerInstalledOnRequest){
    ScopedEnv env("TUPL_INSTALL_FATAL_HANDLER", "1");
    Options o = detect_options();
    EXPECT_TRUE(o.install_fatal_handler);
    TypeContext ctx;
    TupleAnalyzer an(ctx);
    EXPECT_TRUE(an.options().install_fatal_handler);
    // once installed it stays installed; asking again is harmless
    EXPECT_TRUE(install_fatal_handler_if_requested(Options{}));
    EXPECT_TRUE(install_fatal_handler_if_requested(o));
}
