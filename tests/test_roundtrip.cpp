/**
 * @file test_roundtrip.cpp
 * @brief End-to-end serialize/parse tests (GoogleTest)
 *
 * Tests cover:
 * - The reference encodings for common shapes
 * - parse(serialize(v)) == v across option sets
 * - Tabular selection reacting to nested values
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "toon/Parser.hpp"
#include "toon/Writer.hpp"

#include <limits>
#include <vector>

using namespace toon;

namespace {

Value sample_document() {
    return Object{
        {"name", "toon"},
        {"version", 3},
        {"ratio", -0.25},
        {"tiny", 1e-7},
        {"huge", 1e19},
        {"min", std::numeric_limits<std::int64_t>::min()},
        {"big", *BigInt::parse("123456789012345678901234567890")},
        {"enabled", false},
        {"missing", nullptr},
        {"full name", "Ada Lovelace"},
        {"", "empty key"},
        {"looks", Array{"true", "42", "1e5", "1.", "-", "- x", "[3]", "null", "", " pad "}},
        {"escapes", "tab\tquote\"slash\\line\nend"},
        {"unicode", "caf\xC3\xA9 \xE6\x97\xA5\xE6\x9C\xAC"},
        {"owner", Object{{"id", 7}, {"contact", Object{{"email", "ada@example.com"}}}}},
        {"empty_obj", Object{}},
        {"empty_arr", Array{}},
        {"users", Array{
            Object{{"id", 1}, {"name", "Alice"}, {"note", "a,b"}},
            Object{{"id", 2}, {"name", "Bob"}, {"note", "x|y"}},
        }},
        {"mixed", Array{
            1,
            Object{{"k", "v"}, {"rows", Array{Object{{"a", 1}}, Object{{"a", 2}}}}},
            Array{Array{1, 2}, Array{}},
            Object{},
            Object{{"deep", Object{{"deeper", Array{"z"}}}}},
            "tail",
        }},
    };
}

} // anonymous namespace

// ============================================================================
// Reference encodings
// ============================================================================

TEST(Scenario, UniformObjectsUseSortedTable) {
    Value v = Array{
        Object{{"id", 1}, {"name", "Alice"}, {"active", true}},
        Object{{"id", 2}, {"name", "Bob"}, {"active", true}},
    };
    EXPECT_EQ(serialize(v), "[2]{active,id,name}:\n  true,1,Alice\n  true,2,Bob");
}

TEST(Scenario, PrimitiveArrayInline) {
    EXPECT_EQ(serialize(Value(Array{1, 2, 3, 4, 5})), "[5]: 1,2,3,4,5");
}

TEST(Scenario, FlatObjectBothWays) {
    Value v = Object{{"x", 1}, {"y", 2}};
    std::string text = serialize(v);
    EXPECT_EQ(text, "x: 1\ny: 2");
    EXPECT_EQ(parse(text), v);
}

TEST(Scenario, EmptyArray) {
    EXPECT_EQ(serialize(Value::array()), "[0]:");
}

TEST(Scenario, CommaQuotedOnlyUnderComma) {
    Value s("hello,world");
    EXPECT_EQ(serialize(s), "\"hello,world\"");
    EXPECT_EQ(serialize(s, Options{}.with_delimiter(Delimiter::Pipe)), "hello,world");
}

TEST(Scenario, MixedArrayUsesList) {
    Value v = Array{1, Object{{"name", "Alice"}}, "text"};
    EXPECT_EQ(serialize(v), "[3]:\n  - 1\n  - name: Alice\n  - text");
}

// ============================================================================
// Round-trip
// ============================================================================

TEST(RoundTrip, DefaultOptions) {
    Value doc = sample_document();
    std::string text = serialize(doc);
    EXPECT_EQ(parse(text), doc) << text;
}

TEST(RoundTrip, EveryOptionSet) {
    const std::vector<Options> option_sets = {
        Options{},
        Options{}.with_delimiter(Delimiter::Pipe),
        Options{}.with_delimiter(Delimiter::Tab),
        Options{}.with_length_marker('#'),
        Options{}.with_indent(4),
        Options::pretty_print(),
        Options::pretty_print().with_delimiter(Delimiter::Pipe).with_length_marker('#'),
    };

    Value doc = sample_document();
    for (const auto& opts : option_sets) {
        std::string text = serialize(doc, opts);
        EXPECT_EQ(parse(text), doc) << text;
    }
}

TEST(RoundTrip, RootScalars) {
    const std::vector<Value> scalars = {
        Value(), Value(true), Value(0), Value(-3.5), Value("plain"),
        Value("x: y"), Value("42"), Value(BigInt(-9)),
    };
    for (const auto& v : scalars) {
        EXPECT_EQ(parse(serialize(v)), v) << serialize(v);
    }
}

TEST(RoundTrip, WholeFloatReadsBackEqual) {
    Value v = Object{{"f", 2.0}};
    Value back = parse(serialize(v));
    EXPECT_EQ(back, v);
    EXPECT_TRUE(back.at("f").as_number()->is_integer());
}

TEST(RoundTrip, SpecialFloatsNeedTheFlag) {
    Value v = Array{Number::infinity(), Number::negative_infinity(), 1};
    EXPECT_EQ(parse(serialize(v)), Value(Array{Value(), Value(), 1}));

    Value back = parse(serialize(v, Options{}.with_special_floats(true)));
    EXPECT_EQ(back, v);
}

TEST(RoundTrip, TabDelimiterKeepsCommasBare) {
    Value v = Array{"a,b", "c d"};
    std::string text = serialize(v, Options{}.with_delimiter(Delimiter::Tab));
    EXPECT_EQ(text.find('"'), std::string::npos);
    EXPECT_EQ(parse(text), v);
}

// ============================================================================
// Tabular selection
// ============================================================================

TEST(TabularSelection, NestedValueSwitchesToList) {
    Array rows{
        Object{{"id", 1}, {"tag", "a"}},
        Object{{"id", 2}, {"tag", "b"}},
    };
    std::string tabular = serialize(Value(rows));
    EXPECT_EQ(tabular.rfind("[2]{id,tag}:", 0), 0u);

    rows[1] = Object{{"id", 2}, {"tag", Array{"b"}}};
    std::string list = serialize(Value(rows));
    EXPECT_EQ(list, "[2]:\n  - id: 1\n    tag: a\n  - id: 2\n    tag: [1]: b");
    EXPECT_EQ(parse(list), Value(rows));
}
