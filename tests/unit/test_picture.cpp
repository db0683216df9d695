#include "../framework/test_framework.hpp"
#include "copyddl/copybook/copybook.hpp"

using namespace copyddl;
using namespace copyddl::copybook;
using namespace copyddl::test;

void test_decimal_with_literal_scale() {
    SqlType type = interpret_picture("9(5)V99");
    ASSERT_EQ(type.category, SqlCategory::DECIMAL);
    ASSERT_EQ(type.to_string(), "DECIMAL(7,2)");
    ASSERT_EQ(type.length, 7u);
    ASSERT_EQ(type.scale, 2u);
}

void test_decimal_with_repeat_counts() {
    SqlType type = interpret_picture("9(7)V9(3)");
    ASSERT_EQ(type.to_string(), "DECIMAL(10,3)");
    ASSERT_EQ(type.length, 10u);
}

void test_signed_decimal() {
    SqlType type = interpret_picture("S9(13)V99");
    ASSERT_EQ(type.to_string(), "DECIMAL(15,2)");
    ASSERT_EQ(type.length, 15u);
}

void test_decimal_is_lowercase_tolerant() {
    ASSERT_EQ(interpret_picture("s9(3)v9(2)").to_string(), "DECIMAL(5,2)");
}

void test_integer_threshold() {
    SqlType nine = interpret_picture("9(9)");
    ASSERT_EQ(nine.to_string(), "INTEGER");
    ASSERT_EQ(nine.category, SqlCategory::INTEGER);
    ASSERT_EQ(nine.length, 9u);

    SqlType ten = interpret_picture("9(10)");
    ASSERT_EQ(ten.to_string(), "BIGINT");
    ASSERT_EQ(ten.category, SqlCategory::BIGINT);
    ASSERT_EQ(ten.length, 10u);
}

void test_signed_integer() {
    SqlType type = interpret_picture("S9(4)");
    ASSERT_EQ(type.to_string(), "INTEGER");
    ASSERT_EQ(type.length, 4u);
}

void test_character_types() {
    SqlType alnum = interpret_picture("X(30)");
    ASSERT_EQ(alnum.to_string(), "VARCHAR(30)");
    ASSERT_EQ(alnum.length, 30u);
    ASSERT_EQ(alnum.category, SqlCategory::CHARACTER);

    SqlType alpha = interpret_picture("A(12)");
    ASSERT_EQ(alpha.to_string(), "VARCHAR(12)");
    ASSERT_EQ(alpha.length, 12u);

    ASSERT_EQ(interpret_picture("x(8)").to_string(), "VARCHAR(8)");
}

void test_usage_suffix_falls_back() {
    SqlType type = interpret_picture("S9(4)COMP");
    ASSERT_EQ(type.to_string(), "VARCHAR(255)");
    ASSERT_EQ(type.length, 255u);
    ASSERT_TRUE(type.is_fallback());

    ASSERT_TRUE(interpret_picture("S9(7)V99COMP-3").is_fallback());
    ASSERT_TRUE(interpret_picture("9(4)BINARY").is_fallback());
}

void test_unrecognized_falls_back() {
    ASSERT_TRUE(interpret_picture("XXX").is_fallback());
    ASSERT_TRUE(interpret_picture("999").is_fallback());
    ASSERT_TRUE(interpret_picture("Z(5)").is_fallback());
    ASSERT_TRUE(interpret_picture("").is_fallback());
    ASSERT_EQ(interpret_picture("$$$,$$9").to_string(), "VARCHAR(255)");
}

void test_oversized_count_falls_back() {
    ASSERT_TRUE(interpret_picture("X(99999999999999999999)").is_fallback());
}

void test_very_long_clauses() {
    const String nines(200000, '9');

    SqlType wide = interpret_picture(nines + "V9");
    ASSERT_EQ(wide.to_string(), "DECIMAL(200001,1)");
    ASSERT_EQ(wide.length, 200001u);

    ASSERT_TRUE(interpret_picture(nines).is_fallback());
    ASSERT_TRUE(interpret_picture("X(" + nines + ")").is_fallback());
    ASSERT_TRUE(interpret_picture(String(200000, 'X')).is_fallback());
    ASSERT_EQ(interpret_picture(String(200000, 'Z') + "9(4)").to_string(), "INTEGER");
}

void test_matchers_individually() {
    ASSERT_TRUE(match_decimal("9(5)V99").has_value());
    ASSERT_FALSE(match_decimal("9(5)").has_value());
    ASSERT_TRUE(match_integer("9(5)V99").has_value());
    ASSERT_FALSE(match_integer("X(5)").has_value());
    ASSERT_TRUE(match_character("X(5)").has_value());
    ASSERT_FALSE(match_character("9(5)").has_value());
}

void test_usage_suffix_detection() {
    ASSERT_TRUE(has_usage_suffix("S9(4)COMP"));
    ASSERT_TRUE(has_usage_suffix("9(9)COMP-5"));
    ASSERT_TRUE(has_usage_suffix("S9(5)PACKED-DECIMAL"));
    ASSERT_FALSE(has_usage_suffix("S9(13)V99"));
    ASSERT_FALSE(has_usage_suffix("X(30)"));
}

void test_sql_type_factories() {
    ASSERT_EQ(SqlType::decimal(5, 2), (SqlType{SqlCategory::DECIMAL, 7, 2}));
    ASSERT_EQ(SqlType::integer(9).category, SqlCategory::INTEGER);
    ASSERT_EQ(SqlType::integer(18).category, SqlCategory::BIGINT);
    ASSERT_EQ(SqlType::fallback().to_string(), "VARCHAR(255)");
    ASSERT_EQ(to_string(SqlCategory::CHARACTER), "CHARACTER");
}

int main() {
    TestSuite suite("Picture Clause Tests");

    suite.add_test("Decimal 9(5)V99", test_decimal_with_literal_scale);
    suite.add_test("Decimal 9(7)V9(3)", test_decimal_with_repeat_counts);
    suite.add_test("Signed decimal", test_signed_decimal);
    suite.add_test("Lowercase clause", test_decimal_is_lowercase_tolerant);
    suite.add_test("Integer/BIGINT threshold", test_integer_threshold);
    suite.add_test("Signed integer", test_signed_integer);
    suite.add_test("Character types", test_character_types);
    suite.add_test("Usage suffix fallback", test_usage_suffix_falls_back);
    suite.add_test("Unrecognized fallback", test_unrecognized_falls_back);
    suite.add_test("Oversized count", test_oversized_count_falls_back);
    suite.add_test("200000-character clauses", test_very_long_clauses);
    suite.add_test("Individual matchers", test_matchers_individually);
    suite.add_test("Usage suffix detection", test_usage_suffix_detection);
    suite.add_test("SqlType factories", test_sql_type_factories);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
