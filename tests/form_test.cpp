#include <gtest/gtest.h>
#include "tupl/form.hpp"

using namespace tupl;

TEST(Form, ReadsNestedForms){
    auto n = parse_one("(tuple int (unpack (tuple str ...)) :tag 42 \"s\" [a b])");
    ASSERT_TRUE(is_list(*n));
    EXPECT_EQ(head_of(*n), "tuple");
    const auto& l = as_list(*n)->elems;
    ASSERT_EQ(l.size(), 7u);
    EXPECT_EQ(as_symbol(*l[1])->name, "int");
    EXPECT_EQ(head_of(*l[2]), "unpack");
    EXPECT_TRUE(is_keyword(*l[3]));
    EXPECT_EQ(std::get<int64_t>(l[4]->data), 42);
    EXPECT_EQ(std::get<std::string>(l[5]->data), "s");
    EXPECT_TRUE(is_vector(*l[6]));
}

TEST(Form, EllipsisAndSigilsAreSymbols){
    auto n = parse_one("(%a ... ? *Ts)");
    const auto& l = as_list(*n)->elems;
    EXPECT_EQ(as_symbol(*l[0])->name, "%a");
    EXPECT_EQ(as_symbol(*l[1])->name, "...");
    EXPECT_EQ(as_symbol(*l[2])->name, "?");
    EXPECT_EQ(as_symbol(*l[3])->name, "*Ts");
}

TEST(Form, RecordsLineAndColumn){
    auto n = parse_one("(tuples\n  (def %a int))");
    const auto& l = as_list(*n)->elems;
    EXPECT_EQ(line(*n), 1);
    EXPECT_EQ(col(*n), 1);
    EXPECT_EQ(line(*l[1]), 2);
    EXPECT_EQ(col(*l[1]), 3);
}

TEST(Form, EqualityIgnoresPositionsByDefault){
    auto a = parse_one("(tuple int str)");
    auto b = parse_one("(tuple\n   int str)");
    EXPECT_TRUE(equal(a, b));
    EXPECT_FALSE(equal(a, b, false));
    EXPECT_FALSE(equal(a, parse_one("(tuple int bytes)")));
    EXPECT_TRUE(equal(a, node_list({n_sym("tuple"), n_sym("int"), n_sym("str")})));
}

TEST(Form, PrintsBack){
    EXPECT_EQ(to_string(parse_one("(generic :params [T] :ret (tuple T -1 nil true))")),
              "(generic :params [T] :ret (tuple T -1 nil true))");
}

TEST(Form, RejectsMalformedInput){
    EXPECT_THROW(parse_one("(tuple int"), parse_error);
    EXPECT_THROW(parse_one("12ab"), parse_error);
    EXPECT_THROW(parse_one("a b"), parse_error);
    EXPECT_THROW(parse_one("\"open"), parse_error);
    EXPECT_THROW(parse_one(""), parse_error);
    EXPECT_THROW(parse_one("99999999999999999999"), parse_error);
}
