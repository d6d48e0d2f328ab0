/**
 * @file test_binding.cpp
 * @brief Unit tests for host type binding (GoogleTest)
 *
 * Tests cover:
 * - Built-in conversions in both directions
 * - Range and type checks with located errors
 * - User types bound through to_toon / from_toon
 * - encode / decode entry points
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "toon/Binding.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace toon;

namespace app {

struct User {
    int id = 0;
    std::string name;
    std::optional<std::string> email;
    bool active = true;
};

void to_toon(toon::Value& v, const User& u) {
    toon::set_field(v, "id", u.id);
    toon::set_field(v, "name", u.name);
    toon::set_field(v, "email", u.email);
    toon::set_field(v, "active", u.active);
}

void from_toon(const toon::Value& v, User& u) {
    toon::get_field(v, "id", u.id);
    toon::get_field(v, "name", u.name);
    toon::get_field(v, "email", u.email);
    toon::get_field_or(v, "active", u.active, true);
}

struct Team {
    std::string title;
    std::vector<User> members;
};

void to_toon(toon::Value& v, const Team& t) {
    toon::set_field(v, "title", t.title);
    toon::set_field(v, "members", t.members);
}

void from_toon(const toon::Value& v, Team& t) {
    toon::get_field(v, "title", t.title);
    toon::get_field(v, "members", t.members);
}

} // namespace app

// ============================================================================
// Built-in types
// ============================================================================

TEST(ToValue, Scalars) {
    EXPECT_EQ(to_value(true), Value(true));
    EXPECT_EQ(to_value(42), Value(42));
    EXPECT_EQ(to_value(std::uint8_t{200}), Value(200));
    EXPECT_EQ(to_value(1.5f), Value(1.5));
    EXPECT_EQ(to_value(std::string("s")), Value("s"));
    EXPECT_EQ(to_value("lit"), Value("lit"));
}

TEST(ToValue, LargeUnsignedBecomesBigInt) {
    Value v = to_value(std::numeric_limits<std::uint64_t>::max());
    ASSERT_TRUE(v.is_bigint());
    EXPECT_EQ(v.as_bigint()->to_string(), "18446744073709551615");
}

TEST(ToValue, Containers) {
    EXPECT_EQ(to_value(std::vector<int>{1, 2}), Value(Array{1, 2}));
    EXPECT_EQ(to_value(std::optional<int>{}), Value());
    EXPECT_EQ(to_value(std::optional<int>{3}), Value(3));

    std::map<std::string, int> m{{"b", 2}, {"a", 1}};
    Value v = to_value(m);
    EXPECT_EQ(v.as_object()->keys(), (std::vector<std::string>{"a", "b"}));
}

TEST(ToValue, NonStringMapKeysUnsupported) {
    std::map<int, int> m{{1, 2}};
    EXPECT_THROW(to_value(m), UnsupportedType);
}

TEST(FromValue, Scalars) {
    EXPECT_TRUE(from_value<bool>(Value(true)));
    EXPECT_EQ(from_value<int>(Value(-7)), -7);
    EXPECT_EQ(from_value<int>(Value(3.0)), 3);
    EXPECT_DOUBLE_EQ(from_value<double>(Value(4)), 4.0);
    EXPECT_EQ(from_value<std::string>(Value("x")), "x");
}

TEST(FromValue, RangeChecks) {
    EXPECT_THROW(from_value<std::uint8_t>(Value(300)), TypeMismatch);
    EXPECT_THROW(from_value<unsigned>(Value(-1)), TypeMismatch);
    EXPECT_THROW(from_value<int>(Value(1.5)), TypeMismatch);

    Value big = BigInt::from_unsigned(18446744073709551615ULL);
    EXPECT_EQ(from_value<std::uint64_t>(big), 18446744073709551615ULL);
    EXPECT_THROW(from_value<std::uint32_t>(big), TypeMismatch);
}

TEST(FromValue, TypeMismatchNamesBothTypes) {
    try {
        from_value<std::string>(Value(5));
        FAIL() << "expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.expected(), "string");
        EXPECT_EQ(e.found(), "integer");
        EXPECT_TRUE(e.path().empty());
    }
}

TEST(FromValue, DatesAndBigInts) {
    Date d = from_value<Date>(Value("2024-01-15T10:30:00Z"));
    EXPECT_EQ(d, Date::from_civil(2024, 1, 15, 10, 30, 0));
    EXPECT_THROW(from_value<Date>(Value("yesterday")), TypeMismatch);

    EXPECT_EQ(from_value<BigInt>(Value(5)), BigInt(5));
    EXPECT_EQ(from_value<BigInt>(Value("123456789012345678901")).to_string(),
              "123456789012345678901");
}

TEST(FromValue, ContainersReportElementPath) {
    Value v = Array{1, 2, "three"};
    try {
        from_value<std::vector<int>>(v);
        FAIL() << "expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.path(), "2");
    }

    Value m = Object{{"a", 1}, {"b", true}};
    try {
        from_value<std::map<std::string, int>>(m);
        FAIL() << "expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.path(), "b");
        EXPECT_EQ(e.expected(), "integer");
        EXPECT_EQ(e.found(), "bool");
    }
}

TEST(FromValue, OptionalNull) {
    EXPECT_FALSE(from_value<std::optional<int>>(Value()).has_value());
    EXPECT_EQ(from_value<std::optional<int>>(Value(4)), std::optional<int>(4));
}

// ============================================================================
// User types
// ============================================================================

TEST(UserTypes, EncodeTabular) {
    std::vector<app::User> users{{1, "Alice", std::nullopt, true}, {2, "Bob", "bob@x.io", false}};
    EXPECT_EQ(encode(users),
              "[2]{active,email,id,name}:\n  true,null,1,Alice\n  false,bob@x.io,2,Bob");
}

TEST(UserTypes, DecodeFromTable) {
    auto users = decode<std::vector<app::User>>("[2]{id,name}:\n  1,Alice\n  2,Bob");
    ASSERT_EQ(users.size(), 2u);
    EXPECT_EQ(users[1].id, 2);
    EXPECT_EQ(users[1].name, "Bob");
    EXPECT_FALSE(users[1].email.has_value());
    EXPECT_TRUE(users[1].active);
}

TEST(UserTypes, NestedRoundTrip) {
    app::Team team{"core", {{1, "Ada", "ada@x.io", true}, {2, "Lin", std::nullopt, false}}};
    std::string text = encode(team, Options{}.with_delimiter(Delimiter::Pipe));
    app::Team back = decode<app::Team>(text);

    EXPECT_EQ(back.title, "core");
    ASSERT_EQ(back.members.size(), 2u);
    EXPECT_EQ(back.members[0].email, std::optional<std::string>("ada@x.io"));
    EXPECT_FALSE(back.members[1].email.has_value());
    EXPECT_FALSE(back.members[1].active);
}

TEST(UserTypes, ErrorPathThroughFields) {
    try {
        decode<app::Team>("title: t\nmembers: [1]{id,name}:\n  x,Ada");
        FAIL() << "expected TypeMismatch";
    } catch (const TypeMismatch& e) {
        EXPECT_EQ(e.path(), "members.0.id");
        EXPECT_STREQ(e.what(), "Type mismatch at 'members.0.id': expected integer, found string");
    }
}

TEST(UserTypes, MissingField) {
    EXPECT_THROW(decode<app::User>("id: 1"), CustomError);
    EXPECT_THROW(decode<app::User>("[1]: 2"), TypeMismatch);
}
