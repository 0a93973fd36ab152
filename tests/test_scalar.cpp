#include "toon_scalar.hpp"
#include "toon_errors.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace toonpp;

// ============================================================================
// Literal patterns
// ============================================================================

TEST(ScalarTest, IntPattern) {
    EXPECT_TRUE(matches_int_pattern("0"));
    EXPECT_TRUE(matches_int_pattern("-0"));
    EXPECT_TRUE(matches_int_pattern("42"));
    EXPECT_TRUE(matches_int_pattern("-17"));
    EXPECT_FALSE(matches_int_pattern("007"));
    EXPECT_FALSE(matches_int_pattern("1.5"));
    EXPECT_FALSE(matches_int_pattern("-"));
    EXPECT_FALSE(matches_int_pattern(""));
    EXPECT_FALSE(matches_int_pattern("+1"));
}

TEST(ScalarTest, FloatPattern) {
    EXPECT_TRUE(matches_float_pattern("1.5"));
    EXPECT_TRUE(matches_float_pattern("-0.25"));
    EXPECT_TRUE(matches_float_pattern("1.0e10"));
    EXPECT_TRUE(matches_float_pattern("1.0E-3"));
    EXPECT_TRUE(matches_float_pattern("2.5e+7"));
    EXPECT_FALSE(matches_float_pattern("1."));
    EXPECT_FALSE(matches_float_pattern(".5"));
    EXPECT_FALSE(matches_float_pattern("1e5"));
    EXPECT_FALSE(matches_float_pattern("1.0e"));
    EXPECT_FALSE(matches_float_pattern("nan"));
}

TEST(ScalarTest, ClassifyToken) {
    EXPECT_EQ(classify_token("null"), ScalarKind::NULL_LITERAL);
    EXPECT_EQ(classify_token("true"), ScalarKind::BOOL);
    EXPECT_EQ(classify_token("false"), ScalarKind::BOOL);
    EXPECT_EQ(classify_token("42"), ScalarKind::INT);
    EXPECT_EQ(classify_token("3.14"), ScalarKind::FLOAT);
    EXPECT_EQ(classify_token("hello"), ScalarKind::STRING);
    EXPECT_EQ(classify_token("\"x\""), ScalarKind::QUOTED);
    EXPECT_EQ(classify_token("1e5"), ScalarKind::STRING);
    EXPECT_EQ(classify_token("007"), ScalarKind::STRING);
    EXPECT_EQ(classify_token("True"), ScalarKind::STRING);
    EXPECT_EQ(classify_token("Null"), ScalarKind::STRING);
}

TEST(ScalarTest, OversizedIntegerIsFloat) {
    EXPECT_EQ(classify_token("99999999999999999999"), ScalarKind::FLOAT);
    auto v = parse_scalar("99999999999999999999");
    EXPECT_EQ(v->kind, ValueKind::V_FLOAT);
    EXPECT_DOUBLE_EQ(v->float_val, 1e20);
}

TEST(ScalarTest, Int64Limits) {
    auto max = parse_scalar("9223372036854775807");
    EXPECT_EQ(max->kind, ValueKind::V_INT);
    EXPECT_EQ(max->int_val, std::numeric_limits<int64_t>::max());

    auto min = parse_scalar("-9223372036854775808");
    EXPECT_EQ(min->kind, ValueKind::V_INT);
    EXPECT_EQ(min->int_val, std::numeric_limits<int64_t>::min());
}

// ============================================================================
// Decoding scalars
// ============================================================================

TEST(ScalarTest, ParseScalarKinds) {
    EXPECT_TRUE(parse_scalar("null")->is_null());
    EXPECT_FALSE(parse_scalar("false")->bool_val);
    EXPECT_EQ(parse_scalar("42")->int_val, 42);
    EXPECT_DOUBLE_EQ(parse_scalar("-0.5")->float_val, -0.5);
    EXPECT_EQ(parse_scalar("  hi there ")->string_val, "hi there");
}

TEST(ScalarTest, QuotedNumberStaysString) {
    auto v = parse_scalar("\"42\"");
    EXPECT_EQ(v->kind, ValueKind::V_STRING);
    EXPECT_EQ(v->string_val, "42");
}

TEST(ScalarTest, EmptyTokenStrictVsLenient) {
    EXPECT_THROW(parse_scalar("", true, 3), SyntaxError);
    EXPECT_TRUE(parse_scalar("", false)->is_null());
}

TEST(ScalarTest, UnquoteEscapes) {
    EXPECT_EQ(unquote(R"("a\"b\\c\nd\te\/f")"), "a\"b\\c\nd\te/f");
    EXPECT_EQ(unquote(R"("\u00e9")"), "\xc3\xa9");
    EXPECT_EQ(unquote(R"("\ud83d\ude00")"), "\xf0\x9f\x98\x80");
    EXPECT_EQ(unquote("\"\""), "");
}

TEST(ScalarTest, UnquoteErrors) {
    EXPECT_THROW(unquote("\"abc"), SyntaxError);
    EXPECT_THROW(unquote("\"abc\" x"), SyntaxError);
    EXPECT_THROW(unquote("abc"), SyntaxError);
    EXPECT_THROW(unquote(R"("\q")", true), SyntaxError);
    EXPECT_EQ(unquote(R"("\q")", false), "\\q");
}

TEST(ScalarTest, UnpairedSurrogates) {
    EXPECT_THROW(unquote(R"("\ud800")", true), SyntaxError);
    EXPECT_THROW(unquote(R"("\ude00x")", true), SyntaxError);
    EXPECT_THROW(unquote(R"("\ud83d\u0041")", true), SyntaxError);

    EXPECT_EQ(unquote(R"("\ud800")", false), "\xef\xbf\xbd");
    EXPECT_EQ(unquote(R"("a\ude00b")", false), "a\xef\xbf\xbd" "b");
    EXPECT_EQ(unquote(R"("\ud83d\u0041")", false), "\xef\xbf\xbd" "A");
}

TEST(ScalarTest, UnterminatedQuoteCarriesLine) {
    try {
        parse_scalar("\"oops", true, 7);
        FAIL() << "Expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.line(), 7u);
        EXPECT_EQ(e.type(), ErrorType::SYNTAX_ERROR);
    }
}

// ============================================================================
// Encoding scalars
// ============================================================================

TEST(ScalarTest, NeedsQuotes) {
    EXPECT_TRUE(needs_quotes(""));
    EXPECT_TRUE(needs_quotes(" lead"));
    EXPECT_TRUE(needs_quotes("trail "));
    EXPECT_TRUE(needs_quotes("a,b"));
    EXPECT_TRUE(needs_quotes("a:b"));
    EXPECT_TRUE(needs_quotes("[x]"));
    EXPECT_TRUE(needs_quotes("{x}"));
    EXPECT_TRUE(needs_quotes("say \"hi\""));
    EXPECT_TRUE(needs_quotes("back\\slash"));
    EXPECT_TRUE(needs_quotes("#tag"));
    EXPECT_TRUE(needs_quotes("a//b"));
    EXPECT_TRUE(needs_quotes("line\nbreak"));
    EXPECT_TRUE(needs_quotes("-"));
    EXPECT_TRUE(needs_quotes("- item"));
    EXPECT_TRUE(needs_quotes("true"));
    EXPECT_TRUE(needs_quotes("null"));
    EXPECT_TRUE(needs_quotes("42"));
    EXPECT_TRUE(needs_quotes("-1.5"));

    EXPECT_FALSE(needs_quotes("hello world"));
    EXPECT_FALSE(needs_quotes("Hello-World"));
    EXPECT_FALSE(needs_quotes("-x"));
    EXPECT_FALSE(needs_quotes("gpt-4"));
    EXPECT_FALSE(needs_quotes("1e5"));
    EXPECT_FALSE(needs_quotes("caf\xc3\xa9"));
}

TEST(ScalarTest, FormatStringEscapes) {
    EXPECT_EQ(format_string("He said, \"hi\""), R"("He said, \"hi\"")");
    EXPECT_EQ(format_string("42"), "\"42\"");
    EXPECT_EQ(format_string("plain"), "plain");
    EXPECT_EQ(format_string("a\tb"), R"("a\tb")");
    EXPECT_EQ(format_string(std::string("\x01", 1)), R"("\u0001")");
}

TEST(ScalarTest, FormatKey) {
    EXPECT_EQ(format_key("name"), "name");
    EXPECT_EQ(format_key("first.name"), "first.name");
    EXPECT_EQ(format_key("_private"), "_private");
    EXPECT_EQ(format_key("a1_b2"), "a1_b2");
    EXPECT_EQ(format_key("1abc"), "\"1abc\"");
    EXPECT_EQ(format_key("first name"), "\"first name\"");
    EXPECT_EQ(format_key("x-y"), "\"x-y\"");
    EXPECT_EQ(format_key(""), "\"\"");
}

TEST(ScalarTest, FormatFloatKeepsFloatShape) {
    EXPECT_EQ(format_float(100.0), "100.0");
    EXPECT_EQ(format_float(0.5), "0.5");
    EXPECT_EQ(format_float(-2.5), "-2.5");
    EXPECT_EQ(format_float(1e20), "1.0e+20");

    for (double d : {0.1, 1.0 / 3.0, 1e20, -2.5e-8, 123456789.125, 1.7976931348623157e308}) {
        std::string text = format_float(d);
        EXPECT_TRUE(matches_float_pattern(text)) << text;
        auto back = parse_float(text);
        ASSERT_TRUE(back.has_value()) << text;
        EXPECT_EQ(*back, d) << text;
    }
}

TEST(ScalarTest, FormatScalar) {
    EXPECT_EQ(format_scalar(*Value::make_null()), "null");
    EXPECT_EQ(format_scalar(*Value::make_bool(true)), "true");
    EXPECT_EQ(format_scalar(*Value::make_int(-12)), "-12");
    EXPECT_EQ(format_scalar(*Value::make_float(3.0)), "3.0");
    EXPECT_EQ(format_scalar(*Value::make_string("true")), "\"true\"");
}

TEST(ScalarTest, FormatScalarRejectsNonScalars) {
    EXPECT_THROW(format_scalar(*Value::make_list()), ToonError);
    EXPECT_THROW(format_scalar(*Value::make_float(std::nan(""))), ToonError);
    EXPECT_THROW(format_scalar(*Value::make_float(std::numeric_limits<double>::infinity())),
                 ToonError);
}

// ============================================================================
// Quote-aware scanning
// ============================================================================

TEST(ScalarTest, SplitDelimitedRespectsQuotes) {
    auto fields = split_delimited("a, \"b,c\" ,d", ',');
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "\"b,c\"");
    EXPECT_EQ(fields[2], "d");
}

TEST(ScalarTest, SplitDelimitedEscapedQuote) {
    auto fields = split_delimited(R"("x\",y",z)", ',');
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0], R"("x\",y")");
    EXPECT_EQ(fields[1], "z");
}

TEST(ScalarTest, SplitDelimitedKeepsEmptyFields) {
    auto fields = split_delimited("1,,3", ',');
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_TRUE(fields[1].empty());
}

TEST(ScalarTest, SplitDelimitedUnterminated) {
    EXPECT_THROW(split_delimited("a,\"b", ',', 4), SyntaxError);
}

TEST(ScalarTest, FindUnquoted) {
    EXPECT_EQ(find_unquoted("\"a:b\": c", ':'), 5u);
    EXPECT_EQ(find_unquoted("\"a:b\"", ':'), std::string_view::npos);
    EXPECT_EQ(find_closing_quote(R"("a\"b" rest)", 0), 5u);
}
