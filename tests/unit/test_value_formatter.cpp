/**
 * @file test_value_formatter.cpp
 * @brief Unit tests for format specifiers, Python-style stringification and time formatting
 */

#include <gtest/gtest.h>
#include "core/TimeFormat.hpp"
#include "core/ValueFormatter.hpp"
#include "core/XdiErrors.hpp"

#include <limits>

using namespace xdi;

TEST(FormatSpecTest, ParsesEveryComponent) {
    FormatSpec spec = FormatSpec::parse("*^+#010,.3f");

    EXPECT_EQ(spec.fill, '*');
    EXPECT_EQ(spec.align, '^');
    EXPECT_EQ(spec.sign, '+');
    EXPECT_TRUE(spec.alternate);
    EXPECT_TRUE(spec.zero_pad);
    EXPECT_EQ(spec.width, 10);
    EXPECT_EQ(spec.grouping, ',');
    ASSERT_TRUE(spec.precision.has_value());
    EXPECT_EQ(*spec.precision, 3);
    EXPECT_EQ(spec.type, 'f');
}

TEST(FormatSpecTest, RejectsMalformedSpecifiers) {
    EXPECT_THROW(FormatSpec::parse(".f"), RenderError);
    EXPECT_THROW(FormatSpec::parse("10.2fx"), RenderError);
}

TEST(FormatValueTest, FixedPoint) {
    EXPECT_EQ(format_value(Json(3.14159), ".2f"), "3.14");
    EXPECT_EQ(format_value(Json(2), ".3f"), "2.000");
    EXPECT_EQ(format_value(Json(-0.5), "+.1f"), "-0.5");
    EXPECT_EQ(format_value(Json(3.14159), "*^10.3f"), "**3.142***");
}

TEST(FormatValueTest, Integers) {
    EXPECT_EQ(format_value(Json(42), "05d"), "00042");
    EXPECT_EQ(format_value(Json(7), "+d"), "+7");
    EXPECT_EQ(format_value(Json(-7), "+d"), "-7");
    EXPECT_EQ(format_value(Json(1234567), ","), "1,234,567");
    EXPECT_EQ(format_value(Json(true), "d"), "1");
}

TEST(FormatValueTest, GeneralAndExponent) {
    EXPECT_EQ(format_value(Json(3.0), "g"), "3");
    EXPECT_EQ(format_value(Json(1.5e-7), "e"), "1.500000e-07");
    EXPECT_EQ(format_value(Json(2.0), ".3"), "2.0");
    EXPECT_EQ(format_value(Json(12345.678), ".3"), "1.23e+04");
    EXPECT_EQ(format_value(Json(0.5), ".1%"), "50.0%");
}

TEST(FormatValueTest, Strings) {
    EXPECT_EQ(format_value(Json("abc"), ">5"), "  abc");
    EXPECT_EQ(format_value(Json("abc"), "^7"), "  abc  ");
    EXPECT_EQ(format_value(Json("abcdef"), ".3"), "abc");
    EXPECT_EQ(format_value(Json("abc"), ""), "abc");
}

TEST(FormatValueTest, WrongTypesAreRenderErrors) {
    EXPECT_THROW(format_value(Json("Cu"), ".2f"), RenderError);
    EXPECT_THROW(format_value(Json(2.5), "d"), RenderError);
    EXPECT_THROW(format_value(Json(5), ".2"), RenderError);
    EXPECT_THROW(format_value(Json(nullptr), ".2f"), RenderError);
    EXPECT_THROW(format_value(Json("abc"), "+"), RenderError);
}

TEST(PythonReprTest, Scalars) {
    EXPECT_EQ(python_repr(Json("abc")), "'abc'");
    EXPECT_EQ(python_repr(Json("it's")), "\"it's\"");
    EXPECT_EQ(python_repr(Json(true)), "True");
    EXPECT_EQ(python_repr(Json(nullptr)), "None");
    EXPECT_EQ(python_repr(Json(12)), "12");
    EXPECT_EQ(python_str(Json("abc")), "abc");
    EXPECT_EQ(python_str(Json(false)), "False");
}

TEST(PythonReprTest, Containers) {
    Json list = Json::array({"a", 1});
    EXPECT_EQ(python_repr(list), "['a', 1]");

    Json object = Json::object();
    object["k"] = "v";
    object["n"] = nullptr;
    EXPECT_EQ(python_repr(object), "{'k': 'v', 'n': None}");
}

TEST(ReprDoubleTest, MatchesPythonLayout) {
    EXPECT_EQ(repr_double(1.0), "1.0");
    EXPECT_EQ(repr_double(0.1), "0.1");
    EXPECT_EQ(repr_double(123.456), "123.456");
    EXPECT_EQ(repr_double(-2.5), "-2.5");
    EXPECT_EQ(repr_double(1e16), "1e+16");
    EXPECT_EQ(repr_double(1e-5), "1e-05");
    EXPECT_EQ(repr_double(0.0001), "0.0001");
}

TEST(TimeFormatTest, Iso8601) {
    EXPECT_EQ(format_iso8601(0.0), "1970-01-01T00:00:00");
    EXPECT_EQ(format_iso8601(1.25), "1970-01-01T00:00:01.250000");
    EXPECT_EQ(format_iso8601(86400.0 + 3661.0), "1970-01-02T01:01:01");
}

TEST(TimeFormatTest, StrftimePattern) {
    EXPECT_EQ(format_timestamp(3600.0, "%H-%M"), "01-00");
    EXPECT_EQ(format_timestamp(0.0, "%Y-%m-%d"), "1970-01-01");
}

TEST(TimeFormatTest, UnrepresentableTimestamps) {
    EXPECT_THROW(format_iso8601(1e20), RenderError);
    EXPECT_THROW(format_iso8601(-1e20), RenderError);
    EXPECT_THROW(format_timestamp(1e300, "%Y"), RenderError);
    EXPECT_THROW(format_iso8601(std::numeric_limits<double>::infinity()), RenderError);
}
