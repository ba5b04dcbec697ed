// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <tyde/decode/decode_errc.hpp>
#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/decoder.hpp>
#include <tyde/decode/value.hpp>
#include <tyde/schema/schema.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace tyde;

namespace
{
    Decoder<Value> compiled(char const *const schema)
    {
        auto result = schema::compile(Value::parse(schema));
        if (result.has_error()) {
            ADD_FAILURE() << result.error().render();
            return fail<Value>("schema did not compile");
        }
        return std::move(result).value();
    }

    DecodeError schema_error(char const *const schema)
    {
        auto const result = schema::compile(Value::parse(schema));
        if (!result.has_error()) {
            ADD_FAILURE() << "schema compiled: " << schema;
            return DecodeError{};
        }
        return result.error();
    }
}

TEST(Schema, named_types)
{
    for (auto const *const name :
         {"null",
          "bool",
          "string",
          "any",
          "float",
          "double",
          "int8",
          "int16",
          "int32",
          "int64",
          "uint8",
          "uint16",
          "uint32",
          "uint64",
          "?string"}) {
        EXPECT_FALSE(schema::named_type(name).has_error()) << name;
    }

    auto const unknown = schema::named_type("int128");
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(
        unknown.error(),
        DecodeError(CustomError{"unknown type name \"int128\""}));
    EXPECT_TRUE(schema::named_type("?").has_error());
}

TEST(Schema, primitive)
{
    auto const decoder = compiled(R"("int8")");

    auto const ok = decoder.decode(Value(12));
    ASSERT_FALSE(ok.has_error());
    EXPECT_EQ(ok.value(), Value(12));

    auto const over = decoder.decode(Value(300));
    ASSERT_TRUE(over.has_error());
    EXPECT_EQ(over.error().code(), DecodeErrc::NumericRange);

    auto const integral = decoder.decode(Value(4.0));
    ASSERT_FALSE(integral.has_error());
    EXPECT_TRUE(integral.value().is_number_integer());
}

TEST(Schema, nullable_primitive)
{
    auto const decoder = compiled(R"("?string")");

    auto const null = decoder.decode(Value(nullptr));
    ASSERT_FALSE(null.has_error());
    EXPECT_TRUE(null.value().is_null());

    auto const text = decoder.decode(Value("a"));
    ASSERT_FALSE(text.has_error());
    EXPECT_EQ(text.value(), Value("a"));

    EXPECT_TRUE(decoder.decode(Value(1)).has_error());
}

TEST(Schema, record)
{
    auto const decoder = compiled(R"({
        "name": "string",
        "port": "uint16",
        "tags?": ["string"]
    })");

    auto const ok = decoder.decode(
        Value::parse(R"({"name": "db", "port": 5432, "extra": true})"));
    ASSERT_FALSE(ok.has_error());
    EXPECT_EQ(ok.value(), Value::parse(R"({"name": "db", "port": 5432})"));

    auto const tagged = decoder.decode(Value::parse(
        R"({"name": "db", "port": 5432, "tags": ["a", "b"]})"));
    ASSERT_FALSE(tagged.has_error());
    EXPECT_EQ(tagged.value()["tags"], Value::array({"a", "b"}));

    auto const null_tags = decoder.decode(
        Value::parse(R"({"name": "db", "port": 1, "tags": null})"));
    ASSERT_FALSE(null_tags.has_error());
    EXPECT_FALSE(null_tags.value().contains("tags"));
}

TEST(Schema, record_reports_every_error)
{
    auto const decoder = compiled(R"({
        "name": "string",
        "port": "uint16",
        "tags?": ["string"]
    })");

    auto const bad = decoder.decode(
        Value::parse(R"({"port": 70000, "tags": ["a", 2, "c", false]})"));
    ASSERT_TRUE(bad.has_error());
    EXPECT_EQ(
        bad.error().render(),
        "name: missing field: required key \"name\" is not present\n"
        "port: numeric value out of range: 70000 does not fit in uint16_t\n"
        "tags[1]: type mismatch: expected string, found number\n"
        "tags[3]: type mismatch: expected string, found bool");

    auto const not_map = decoder.decode(Value::array());
    ASSERT_TRUE(not_map.has_error());
    EXPECT_EQ(
        not_map.error(),
        DecodeError(TypeMismatch{Shape::Map, Shape::Sequence}));
}

TEST(Schema, empty_record)
{
    auto const decoder = compiled("{}");

    auto const ok = decoder.decode(Value::object({{"a", 1}}));
    ASSERT_FALSE(ok.has_error());
    EXPECT_EQ(ok.value(), Value::object());

    EXPECT_TRUE(decoder.decode(Value(1)).has_error());
}

TEST(Schema, dict)
{
    auto const decoder = compiled(R"({"$dict": {"weight": "double"}})");

    auto const ok = decoder.decode(
        Value::parse(R"({"a": {"weight": 1.5}, "b": {"weight": 2}})"));
    ASSERT_FALSE(ok.has_error());
    EXPECT_EQ(ok.value()["b"]["weight"], Value(2.0));

    auto const bad =
        decoder.decode(Value::parse(R"({"a": {}, "b": {"weight": "x"}})"));
    ASSERT_TRUE(bad.has_error());
    ASSERT_EQ(bad.error().leaves().size(), 2);
    EXPECT_EQ(
        bad.error().leaves()[0].path,
        (Path{std::string{"a"}, std::string{"weight"}}));
    EXPECT_EQ(
        bad.error().leaves()[1].path,
        (Path{std::string{"b"}, std::string{"weight"}}));
}

TEST(Schema, nested_sequences)
{
    auto const decoder = compiled(R"([["?int32"]])");

    auto const ok = decoder.decode(Value::parse("[[1, null], [], [3]]"));
    ASSERT_FALSE(ok.has_error());
    EXPECT_EQ(ok.value(), Value::parse("[[1, null], [], [3]]"));

    auto const bad = decoder.decode(Value::parse(R"([[1], [2, "x"]])"));
    ASSERT_TRUE(bad.has_error());
    EXPECT_EQ(bad.error().path(), (Path{size_t{1}, size_t{1}}));
}

TEST(Schema, unknown_type_pathed_into_schema)
{
    auto const error =
        schema_error(R"({"servers": [{"host": "string", "port": "port"}]})");
    EXPECT_EQ(
        error,
        DecodeError(
            Path{std::string{"servers"}, size_t{0}, std::string{"port"}},
            CustomError{"unknown type name \"port\""}));
}

TEST(Schema, every_schema_error_reported)
{
    auto const error = schema_error(R"({"a": "text", "b": 3, "?": "bool"})");
    ASSERT_EQ(error.leaves().size(), 3);
    for (auto const &leaf : error.leaves()) {
        EXPECT_EQ(errc_of(leaf.cause), DecodeErrc::Custom);
        ASSERT_EQ(leaf.path.size(), 1);
    }
}

TEST(Schema, malformed)
{
    EXPECT_EQ(schema_error("[]").code(), DecodeErrc::Custom);
    EXPECT_EQ(schema_error(R"(["int8", "int16"])").code(), DecodeErrc::Custom);
    EXPECT_EQ(schema_error("null").code(), DecodeErrc::Custom);
    EXPECT_EQ(schema_error("true").code(), DecodeErrc::Custom);
    EXPECT_EQ(
        schema_error(R"({"$dict": "int8", "x": "int8"})").code(),
        DecodeErrc::Custom);
    EXPECT_EQ(
        schema_error(R"({"$dict": "nope"})").path(),
        Path{std::string{"$dict"}});
}

TEST(Schema, recursive_use_across_threads)
{
    auto const decoder = compiled(R"({"rows": [{"$dict": "int64"}]})");
    Value input = Value::object({{"rows", Value::array()}});
    for (int i = 0; i < 64; ++i) {
        input["rows"].push_back(Value::object({{"k", i}}));
    }

    std::vector<std::thread> threads;
    std::vector<int> failures(4, 0);
    for (size_t t = 0; t < failures.size(); ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 100; ++i) {
                auto const result = decoder.decode(input);
                if (result.has_error() || result.value() != input) {
                    ++failures[t];
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }
    for (auto const f : failures) {
        EXPECT_EQ(f, 0);
    }
}
