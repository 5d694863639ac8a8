#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "tupl/failure.hpp"
#include "tupl/types.hpp"
#include "test_env.hpp"

using namespace tupl;
using tupl_test::ty;

TEST(TypeContext, InterningGivesStructuralIdentity){
    TypeContext ctx;
    EXPECT_EQ(ty(ctx, "(tuple int str)"), ty(ctx, "(tuple int str)"));
    EXPECT_NE(ty(ctx, "(tuple int str)"), ty(ctx, "(tuple str int)"));
    EXPECT_EQ(ty(ctx, "(tuple int ...)"), ctx.get_tuple(TupleShape::homogeneous(ctx.get_named("int"))));
    EXPECT_EQ(ctx.unknown(), 0u);
    EXPECT_EQ(ty(ctx, "?"), ctx.unknown());
}

TEST(TypeContext, UnionsIgnoreMemberOrder){
    TypeContext ctx;
    TypeId a = ty(ctx, "(union int str)");
    TypeId b = ty(ctx, "(union str int)");
    EXPECT_EQ(a, b);
    EXPECT_EQ(ctx.to_string(a), "int | str");
    EXPECT_EQ(ty(ctx, "(union int (union str int) never)"), a);
    EXPECT_EQ(ty(ctx, "(union int never)"), ctx.get_named("int"));
    EXPECT_EQ(ctx.get_union({}), ctx.never());
}

TEST(TypeContext, RendersShapes){
    TypeContext ctx;
    EXPECT_EQ(ctx.to_string(ty(ctx, "(tuple)")), "tuple[()]");
    EXPECT_EQ(ctx.to_string(ty(ctx, "(tuple int ...)")), "tuple[int, ...]");
    EXPECT_EQ(ctx.to_string(ty(ctx, "tuple")), "tuple[Unknown, ...]");
    EXPECT_EQ(ctx.to_string(ty(ctx, "(tuple int (unpack (tuple str ...)) float)")), "tuple[int, *tuple[str, ...], float]");
    EXPECT_EQ(ctx.to_string(ty(ctx, "(seq (iter bytes))")), "list[Iterable[bytes]]");
}

TEST(TypeContext, UnpackedExactTupleSplices){
    TypeContext ctx;
    EXPECT_EQ(ty(ctx, "(tuple int (unpack (tuple str float)))"), ty(ctx, "(tuple int str float)"));
    EXPECT_EQ(ty(ctx, "(tuple (unpack (tuple int ...)))"), ty(ctx, "(tuple int ...)"));
}

TEST(TypeContext, VariadicParameters){
    TypeContext ctx;
    TypeScope scope;
    TypeId Ts = ctx.get_variadic_param("Ts");
    scope.params["Ts"] = Ts;
    TypeId t = ty(ctx, "(tuple int (unpack Ts) float)", &scope);
    const TupleShape* s = ctx.shape_of(t);
    ASSERT_NE(s, nullptr);
    ASSERT_TRUE(s->variadic.has_value());
    EXPECT_TRUE(s->variadic->is_param());
    EXPECT_EQ(s->variadic->type, Ts);
    EXPECT_EQ(ctx.to_string(t), "tuple[int, *Ts, float]");
    EXPECT_EQ(ctx.to_string(ty(ctx, "(union (unpack Ts) int)", &scope)), "Union[*Ts] | int");
    EXPECT_THROW(ty(ctx, "(tuple Ts)", &scope), shape_error);
    EXPECT_THROW(ty(ctx, "(union (unpack int))", &scope), shape_error);
}

TEST(TypeContext, TwoOpenSegmentsAreMalformed){
    TypeContext ctx;
    try {
        ty(ctx, "(tuple int (unpack (tuple int ...)) (unpack (tuple str ...)))");
        FAIL() << "expected shape_error";
    } catch(const shape_error& e){
        EXPECT_EQ(e.kind, FailureKind::MalformedShape);
        EXPECT_EQ(e.position, 2);
    }
    TypeScope scope;
    scope.params["Ts"] = ctx.get_variadic_param("Ts");
    EXPECT_THROW(ty(ctx, "(tuple (unpack Ts) (unpack (tuple int ...)))", &scope), shape_error);
}

TEST(TypeContext, EllipsisPlacement){
    TypeContext ctx;
    try {
        ty(ctx, "(tuple int str ...)");
        FAIL() << "expected shape_error";
    } catch(const shape_error& e){
        EXPECT_EQ(e.position, 2);
    }
    EXPECT_THROW(ty(ctx, "(tuple ...)"), shape_error);
    EXPECT_THROW(ty(ctx, "(tuple ... int)"), shape_error);
    EXPECT_THROW(ty(ctx, "..."), shape_error);
}

TEST(TypeContext, UnknownFormsThrowParseError){
    TypeContext ctx;
    EXPECT_THROW(ty(ctx, "(frob int)"), parse_error);
    EXPECT_THROW(ty(ctx, "(seq int str)"), parse_error);
    EXPECT_THROW(ty(ctx, "42"), parse_error);
    EXPECT_THROW(ty(ctx, "(unpack int)"), shape_error);
}

TEST(TypeContext, LiteralShapes){
    TypeContext ctx;
    EXPECT_EQ(ty(ctx, "(literal int str)"), ty(ctx, "(tuple int str)"));
    EXPECT_EQ(ctx.to_string(ty(ctx, "(literal int (star (seq str)) float)")), "tuple[int, *tuple[str, ...], float]");
    EXPECT_EQ(ty(ctx, "(literal int (star (tuple str bytes)))"), ty(ctx, "(tuple int str bytes)"));
    // several open regions collapse into one
    EXPECT_EQ(ctx.to_string(ty(ctx, "(literal int (star (seq str)) bool (star (iter bytes)) float)")),
              "tuple[int, *tuple[str | bool | bytes, ...], float]");
    EXPECT_EQ(ctx.to_string(ty(ctx, "(literal (star ?))")), "tuple[Unknown, ...]");
}

TEST(TypeContext, TupleConstructor){
    TypeContext ctx;
    EXPECT_EQ(ctx.to_string(ty(ctx, "(tuple-from (seq int))")), "tuple[int, ...]");
    EXPECT_EQ(ty(ctx, "(tuple-from (tuple int str))"), ty(ctx, "(tuple int str)"));
    EXPECT_EQ(ctx.to_string(ty(ctx, "(tuple-from int)")), "tuple[Unknown, ...]");
    EXPECT_EQ(ty(ctx, "(tuple-from (union (tuple int) (iter str)))"), ty(ctx, "(union (tuple int) (tuple str ...))"));
}

TEST(TypeContext, ConcurrentInterningAgrees){
    TypeContext ctx;
    std::vector<TypeId> ids(8);
    std::vector<std::thread> threads;
    for(size_t t=0;t<ids.size(); ++t){
        threads.emplace_back([&, t]{
            TypeId last = 0;
            for(int i=0;i<200; ++i)
                last = ctx.get_tuple(TupleShape::exact({ctx.get_named("int"), ctx.get_named("n" + std::to_string(i))}));
            ids[t] = last;
        });
    }
    for(auto& th : threads) th.join();
    for(TypeId id : ids) EXPECT_EQ(id, ids[0]);
    EXPECT_EQ(ctx.to_string(ids[0]), "tuple[int, n199]");
}
