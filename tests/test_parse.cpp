/**
 * @file test_parse.cpp
 * @brief Unit tests for VALUE argument conversion (GoogleTest)
 */

#include <gtest/gtest.h>
#include "docpath/Parse.hpp"
#include "docpath/Resolver.hpp"

using namespace docpath;

TEST(ParseValue, JsonScalars) {
    EXPECT_EQ(parse_value("42"), 42);
    EXPECT_TRUE(parse_value("42").is_number_integer());
    EXPECT_DOUBLE_EQ(parse_value("-1.5e3").get<double>(), -1500.0);
    EXPECT_EQ(parse_value("true"), true);
    EXPECT_TRUE(parse_value("null").is_null());
}

TEST(ParseValue, JsonContainers) {
    EXPECT_EQ(parse_value("[1, \"two\", {}]"), Value::parse(R"([1, "two", {}])"));
    EXPECT_EQ(parse_value(R"( {"k": [null]} )"), Value::parse(R"({"k": [null]})"));
}

TEST(ParseValue, QuotedTextIsUnquoted) {
    EXPECT_EQ(parse_value("\"007\""), "007");
    EXPECT_EQ(parse_value(R"("a\tb")"), "a\tb");
}

TEST(ParseValue, NonJsonIsKeptVerbatim) {
    EXPECT_EQ(parse_value("hello"), "hello");
    EXPECT_EQ(parse_value("True"), "True");
    EXPECT_EQ(parse_value("{broken"), "{broken");
    EXPECT_EQ(parse_value("1 2"), "1 2");
    EXPECT_EQ(parse_value(""), "");
}

TEST(ParseValue, StringModeNeverConverts) {
    EXPECT_EQ(parse_value("42", ValueMode::String), "42");
    EXPECT_EQ(parse_value("[1]", ValueMode::String), "[1]");
    EXPECT_EQ(parse_value("\"q\"", ValueMode::String), "\"q\"");
}

TEST(ParseValue, ParsedObjectIsAddressable) {
    Value doc = Value::object();
    create_path(doc, "cfg", parse_value(R"({"hosts": ["a", "b"]})"));
    EXPECT_EQ(get_path(doc, "cfg.hosts[1]"), "b");
}
