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

#include <tyde/core/result.hpp>
#include <tyde/decode/combinator.hpp>
#include <tyde/decode/container.hpp>
#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/decoder.hpp>
#include <tyde/decode/field.hpp>
#include <tyde/decode/numeric.hpp>
#include <tyde/decode/primitive.hpp>
#include <tyde/decode/value.hpp>
#include <tyde/schema/config.hpp>
#include <tyde/schema/schema.hpp>

#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

TYDE_SCHEMA_ANONYMOUS_NAMESPACE_BEGIN

constexpr char const dict_key[] = "$dict";

template <DecoderLike D>
Decoder<Value> to_value(D decoder)
{
    return map(std::move(decoder), [](decoded_t<D> v) { return Value(v); });
}

std::map<std::string, Decoder<Value>, std::less<>> const &primitives()
{
    static std::map<std::string, Decoder<Value>, std::less<>> const table{
        {"null",
         map(null_decoder(), [](std::monostate) { return Value(nullptr); })},
        {"bool", to_value(bool_decoder())},
        {"string", to_value(string_decoder())},
        {"any", value_decoder()},
        {"float", to_value(float_decoder<float>())},
        {"double", to_value(float_decoder<double>())},
        {"int8", to_value(integer_decoder<int8_t>())},
        {"int16", to_value(integer_decoder<int16_t>())},
        {"int32", to_value(integer_decoder<int32_t>())},
        {"int64", to_value(integer_decoder<int64_t>())},
        {"uint8", to_value(unsigned_integer_decoder<uint8_t>())},
        {"uint16", to_value(unsigned_integer_decoder<uint16_t>())},
        {"uint32", to_value(unsigned_integer_decoder<uint32_t>())},
        {"uint64", to_value(unsigned_integer_decoder<uint64_t>())},
    };
    return table;
}

Decoder<Value> sequence_schema(Decoder<Value> element)
{
    return map(sequence_of(std::move(element)), [](std::vector<Value> items) {
        Value out = Value::array();
        for (auto &item : items) {
            out.push_back(std::move(item));
        }
        return out;
    });
}

Decoder<Value> dict_schema(Decoder<Value> member)
{
    return map(
        dict_of(std::move(member)),
        [](std::map<std::string, Value> members) {
            Value out = Value::object();
            for (auto &[key, value] : members) {
                out[key] = std::move(value);
            }
            return out;
        });
}

/// Each record member decodes to a one-member object, or an empty object
/// for an absent optional member; the record merges them.
Decoder<Decoder<Value>> member_schema(std::string const &key)
{
    bool const optional = key.ends_with('?');
    std::string name = optional ? key.substr(0, key.size() - 1) : key;
    if (name.empty()) {
        return field(key, fail<Decoder<Value>>("record key names no member"));
    }
    return map(
        field(key, lazy(&schema_decoder)),
        [name = std::move(name), optional](Decoder<Value> inner) {
            if (optional) {
                return map(
                    optional_field(name, std::move(inner)),
                    [name](std::optional<Value> v) {
                        Value out = Value::object();
                        if (v.has_value()) {
                            out[name] = std::move(*v);
                        }
                        return out;
                    });
            }
            return map(field(name, std::move(inner)), [name](Value v) {
                Value out = Value::object();
                out[name] = std::move(v);
                return out;
            });
        });
}

Decoder<Value> record_schema(std::vector<Decoder<Value>> members)
{
    auto const is_map = Decoder<std::monostate>{
        [](Value const &value) -> DecodeResult<std::monostate> {
            if (!value.is_object()) {
                return outcome::failure(type_mismatch(Shape::Map, value));
            }
            return outcome::success(std::monostate{});
        }};
    auto merged =
        map(combine(std::move(members)), [](std::vector<Value> parts) {
            Value out = Value::object();
            for (auto const &part : parts) {
                out.update(part);
            }
            return out;
        });
    return and_then(is_map, [merged = std::move(merged)](std::monostate) {
        return merged;
    });
}

Decoder<Decoder<Value>> record_schema_decoder(Value const &schema)
{
    std::vector<Decoder<Decoder<Value>>> members;
    for (auto const &item : schema.items()) {
        members.push_back(member_schema(item.key()));
    }
    return map(combine(std::move(members)), &record_schema);
}

Decoder<Decoder<Value>> schema_for(Value const &schema)
{
    switch (shape_of(schema)) {
    case Shape::String:
        return Decoder<Decoder<Value>>{
            [](Value const &value) {
                return named_type(value.get<std::string>());
            }};
    case Shape::Sequence:
        if (schema.size() != 1) {
            return fail<Decoder<Value>>(
                "sequence schema must hold exactly one element schema");
        }
        return map(at_index(0, lazy(&schema_decoder)), &sequence_schema);
    case Shape::Map:
        if (schema.contains(dict_key)) {
            if (schema.size() != 1) {
                return fail<Decoder<Value>>(std::format(
                    "\"{}\" schema must not have other members", dict_key));
            }
            return map(
                field(std::string{dict_key}, lazy(&schema_decoder)),
                &dict_schema);
        }
        return record_schema_decoder(schema);
    default:
        return fail<Decoder<Value>>(std::format(
            "schema must be a type name, a sequence or a map, not a {}",
            shape_of(schema)));
    }
}

TYDE_SCHEMA_ANONYMOUS_NAMESPACE_END

TYDE_SCHEMA_NAMESPACE_BEGIN

DecodeResult<Decoder<Value>> named_type(std::string const &name)
{
    std::string_view base = name;
    bool const is_nullable = base.starts_with('?');
    if (is_nullable) {
        base.remove_prefix(1);
    }
    auto const &table = primitives();
    auto const it = table.find(base);
    if (it == table.end()) {
        return outcome::failure(DecodeError{
            CustomError{std::format("unknown type name \"{}\"", name)}});
    }
    if (!is_nullable) {
        return outcome::success(it->second);
    }
    return outcome::success(
        map(nullable(it->second), [](std::optional<Value> v) {
            return v.has_value() ? std::move(*v) : Value(nullptr);
        }));
}

Decoder<Decoder<Value>> schema_decoder()
{
    return and_then(value_decoder(), &schema_for);
}

DecodeResult<Decoder<Value>> compile(Value const &schema)
{
    return schema_decoder().decode(schema);
}

TYDE_SCHEMA_NAMESPACE_END
