#include "toon_value.hpp"
#include <gtest/gtest.h>

using namespace toonpp;

// ============================================================================
// Factories
// ============================================================================

TEST(ValueTest, ScalarFactories) {
    EXPECT_EQ(Value::make_null()->kind, ValueKind::V_NULL);
    EXPECT_TRUE(Value::make_bool(true)->bool_val);
    EXPECT_EQ(Value::make_int(-7)->int_val, -7);
    EXPECT_DOUBLE_EQ(Value::make_float(2.5)->float_val, 2.5);
    EXPECT_EQ(Value::make_string("abc")->string_val, "abc");
    EXPECT_EQ(Value::make_string(std::string_view("xyz"))->kind, ValueKind::V_STRING);
}

TEST(ValueTest, ContainerFactories) {
    auto list = Value::make_list({Value::make_int(1), Value::make_int(2)});
    EXPECT_TRUE(list->is_list());
    EXPECT_EQ(list->size(), 2u);

    auto map = Value::make_map({{"a", Value::make_int(1)}, {"b", Value::make_null()}});
    EXPECT_TRUE(map->is_map());
    EXPECT_EQ(map->size(), 2u);
    EXPECT_EQ(map->map_items[0].first, "a");
    EXPECT_EQ(map->map_items[1].first, "b");

    EXPECT_EQ(Value::make_int(1)->size(), 0u);
    EXPECT_TRUE(Value::make_string("s")->is_scalar());
    EXPECT_FALSE(list->is_scalar());
}

// ============================================================================
// Map access
// ============================================================================

TEST(ValueTest, GetAndContains) {
    auto map = Value::make_map({{"x", Value::make_int(3)}});
    ASSERT_NE(map->get("x"), nullptr);
    EXPECT_EQ(map->get("x")->int_val, 3);
    EXPECT_EQ(map->get("missing"), nullptr);
    EXPECT_TRUE(map->contains("x"));
    EXPECT_FALSE(map->contains("y"));
}

TEST(ValueTest, SetReplacesInPlace) {
    auto map = Value::make_map();
    map->set("a", Value::make_int(1));
    map->set("b", Value::make_int(2));
    map->set("a", Value::make_int(10));

    ASSERT_EQ(map->size(), 2u);
    EXPECT_EQ(map->map_items[0].first, "a");
    EXPECT_EQ(map->map_items[0].second->int_val, 10);
}

TEST(ValueTest, MakeMapWithRepeatedKeyKeepsLast) {
    auto map = Value::make_map({{"k", Value::make_int(1)}, {"k", Value::make_int(2)}});
    ASSERT_EQ(map->size(), 1u);
    EXPECT_EQ(map->get("k")->int_val, 2);
}

TEST(ValueTest, NullPointersBecomeNullValues) {
    auto map = Value::make_map();
    map->set("n", nullptr);
    ASSERT_NE(map->get("n"), nullptr);
    EXPECT_TRUE(map->get("n")->is_null());

    auto list = Value::make_list();
    list->push_back(nullptr);
    ASSERT_EQ(list->size(), 1u);
    EXPECT_TRUE(list->list_items[0]->is_null());
}

// ============================================================================
// Equality
// ============================================================================

TEST(ValueTest, EqualityIsStructural) {
    auto a = Value::make_map({{"xs", Value::make_list({Value::make_int(1), Value::make_string("s")})}});
    auto b = Value::make_map({{"xs", Value::make_list({Value::make_int(1), Value::make_string("s")})}});
    EXPECT_TRUE(*a == *b);
    EXPECT_TRUE(equal(a, b));
}

TEST(ValueTest, EqualityDistinguishesKinds) {
    EXPECT_TRUE(*Value::make_int(1) != *Value::make_float(1.0));
    EXPECT_TRUE(*Value::make_string("1") != *Value::make_int(1));
    EXPECT_TRUE(*Value::make_map() != *Value::make_list());
    EXPECT_TRUE(*Value::make_null() == *Value::make_null());
}

TEST(ValueTest, EqualityRespectsMapKeyOrder) {
    auto a = Value::make_map({{"a", Value::make_int(1)}, {"b", Value::make_int(2)}});
    auto b = Value::make_map({{"b", Value::make_int(2)}, {"a", Value::make_int(1)}});
    EXPECT_FALSE(*a == *b);
}

TEST(ValueTest, EqualityRespectsListOrder) {
    auto a = Value::make_list({Value::make_int(1), Value::make_int(2)});
    auto b = Value::make_list({Value::make_int(2), Value::make_int(1)});
    EXPECT_FALSE(*a == *b);
}

TEST(ValueTest, EqualHandlesNullPointers) {
    EXPECT_TRUE(equal(nullptr, nullptr));
    EXPECT_FALSE(equal(nullptr, Value::make_null()));
}

TEST(ValueTest, KindNames) {
    EXPECT_STREQ(kind_name(ValueKind::V_MAP), "map");
    EXPECT_STREQ(kind_name(ValueKind::V_FLOAT), "float");
}
