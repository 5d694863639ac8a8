#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include "tupl/cache.hpp"
#include "test_env.hpp"

using namespace tupl;
using tupl_test::ty;

TEST(ShapeCache, ConcurrentCallersComputeOnce){
    TypeContext ctx;
    IndexResolver resolver(ctx);
    ShapeCache cache;
    TypeId t = ty(ctx, "(tuple int str)");
    std::atomic<int> calls{0};
    std::vector<TypeId> seen(8, 0);
    std::vector<std::thread> threads;
    for(size_t i=0;i<seen.size(); ++i){
        threads.emplace_back([&, i]{
            auto r = cache.index(t, 1, resolver.policy(), [&]{
                ++calls;
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                return resolver.resolve(t, 1);
            });
            seen[i] = r.type;
        });
    }
    for(auto& th : threads) th.join();
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(cache.hits(), seen.size() - 1);
    for(TypeId id : seen) EXPECT_EQ(id, ctx.get_named("str"));
}

TEST(ShapeCache, KeysIncludePolicy){
    TypeContext ctx;
    IndexResolver conservative(ctx), narrow(ctx, IndexPolicy::Narrow);
    ShapeCache cache;
    TypeId t = ty(ctx, "(tuple int (unpack (tuple str ...)) float)");
    auto a = cache.index(t, -1, conservative.policy(), [&]{ return conservative.resolve(t, -1); });
    auto b = cache.index(t, -1, narrow.policy(), [&]{ return narrow.resolve(t, -1); });
    EXPECT_NE(a.type, b.type);
    EXPECT_EQ(cache.misses(), 2u);
}

TEST(ShapeCache, AssignResultsAreMemoized){
    TypeContext ctx;
    StructuralRelation rel(ctx);
    AssignabilityChecker checker(ctx, rel);
    ShapeCache cache;
    TypeId s = ty(ctx, "(tuple int int)"), d = ty(ctx, "(tuple int str)");
    int calls = 0;
    for(int i=0;i<3; ++i){
        auto r = cache.assign(s, d, [&]{ ++calls; return checker.check(s, d); });
        EXPECT_EQ(r.failures.size(), 1u);
    }
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cache.hits(), 2u);
    cache.clear();
    EXPECT_EQ(cache.hits(), 0u);
    cache.assign(s, d, [&]{ ++calls; return checker.check(s, d); });
    EXPECT_EQ(calls, 2);
}

TEST(ShapeCache, DisabledCacheAlwaysComputes){
    ShapeCache cache(false);
    int calls = 0;
    for(int i=0;i<3; ++i) cache.index(5, 0, IndexPolicy::Conservative, [&]{ ++calls; return IndexResult{}; });
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(cache.hits(), 0u);
}

TEST(ShapeCache, FailedComputationIsRetried){
    ShapeCache cache;
    EXPECT_THROW(cache.index(7, 0, IndexPolicy::Conservative, []() -> IndexResult { throw std::runtime_error("boom"); }),
                 std::runtime_error);
    int calls = 0;
    cache.index(7, 0, IndexPolicy::Conservative, [&]{ ++calls; return IndexResult{}; });
    EXPECT_EQ(calls, 1);
}
