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

#include <tyde/core/config.hpp>
#include <tyde/core/likely.h>
#include <tyde/core/result.hpp>
#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/decoder.hpp>
#include <tyde/decode/primitive.hpp>
#include <tyde/decode/value.hpp>

#include <string>
#include <variant>

TYDE_NAMESPACE_BEGIN

DecodeError type_mismatch(Shape const expected, Value const &actual)
{
    return DecodeError{TypeMismatch{expected, shape_of(actual)}};
}

Decoder<std::monostate> null_decoder()
{
    return Decoder<std::monostate>{
        [](Value const &value) -> DecodeResult<std::monostate> {
            if (TYDE_UNLIKELY(!value.is_null())) {
                return outcome::failure(type_mismatch(Shape::Null, value));
            }
            return outcome::success(std::monostate{});
        }};
}

Decoder<bool> bool_decoder()
{
    return Decoder<bool>{[](Value const &value) -> DecodeResult<bool> {
        if (TYDE_UNLIKELY(!value.is_boolean())) {
            return outcome::failure(type_mismatch(Shape::Bool, value));
        }
        return outcome::success(value.get<bool>());
    }};
}

Decoder<std::string> string_decoder()
{
    return Decoder<std::string>{
        [](Value const &value) -> DecodeResult<std::string> {
            if (TYDE_UNLIKELY(!value.is_string())) {
                return outcome::failure(type_mismatch(Shape::String, value));
            }
            return outcome::success(value.get<std::string>());
        }};
}

Decoder<Value> value_decoder()
{
    return Decoder<Value>{[](Value const &value) -> DecodeResult<Value> {
        return outcome::success(value);
    }};
}

TYDE_NAMESPACE_END
