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

#pragma once

#include <tyde/core/config.hpp>
#include <tyde/core/likely.h>
#include <tyde/core/result.hpp>
#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/decoder.hpp>
#include <tyde/decode/primitive.hpp>
#include <tyde/decode/value.hpp>

#include <cmath>
#include <concepts>
#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

TYDE_NAMESPACE_BEGIN

/// Integer types with a fixed width and signedness. Character and boolean
/// types are excluded; they are not numbers in the source tree.
template <typename T>
concept FixedWidthInteger =
    std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool> &&
    !std::same_as<std::remove_cv_t<T>, char> &&
    !std::same_as<std::remove_cv_t<T>, wchar_t> &&
    !std::same_as<std::remove_cv_t<T>, char8_t> &&
    !std::same_as<std::remove_cv_t<T>, char16_t> &&
    !std::same_as<std::remove_cv_t<T>, char32_t>;

/// e.g. "int8_t", "uint64_t"
template <FixedWidthInteger T>
std::string integer_type_name()
{
    return std::format(
        "{}int{}_t",
        std::is_signed_v<T> ? "" : "u",
        std::numeric_limits<T>::digits + (std::is_signed_v<T> ? 1 : 0));
}

template <std::floating_point T>
constexpr char const *float_type_name() noexcept
{
    if constexpr (std::same_as<T, float>) {
        return "float";
    }
    else if constexpr (std::same_as<T, double>) {
        return "double";
    }
    else {
        return "long double";
    }
}

/*! \brief Checked narrowing of a Number into `T`.

The single conversion every integer decoder goes through. Integers stored in
the value as signed or unsigned 64-bit are range checked against `T`; numbers
stored as floating point are accepted only when finite, integral, and in
range. Anything else fails with `NumericRangeError`, never wrapping or
truncating. Non-numbers fail with `TypeMismatch`.
*/
template <FixedWidthInteger T>
DecodeResult<T> checked_integer_cast(Value const &value)
{
    using value_t = Value::value_t;

    switch (value.type()) {
    case value_t::number_integer: {
        auto const n = value.get<Value::number_integer_t>();
        if (TYDE_LIKELY(std::in_range<T>(n))) {
            return outcome::success(static_cast<T>(n));
        }
        break;
    }
    case value_t::number_unsigned: {
        auto const n = value.get<Value::number_unsigned_t>();
        if (TYDE_LIKELY(std::in_range<T>(n))) {
            return outcome::success(static_cast<T>(n));
        }
        break;
    }
    case value_t::number_float: {
        auto const d = value.get<Value::number_float_t>();
        // bounds are powers of two, so both convert to double exactly
        double const lo = static_cast<double>(std::numeric_limits<T>::min());
        double const hi = std::ldexp(1.0, std::numeric_limits<T>::digits);
        if (std::isfinite(d) && std::trunc(d) == d && d >= lo && d < hi) {
            return outcome::success(static_cast<T>(d));
        }
        break;
    }
    default:
        return outcome::failure(type_mismatch(Shape::Number, value));
    }
    return outcome::failure(DecodeError{
        NumericRangeError{value.dump(), integer_type_name<T>()}});
}

template <FixedWidthInteger T>
    requires std::is_signed_v<T>
Decoder<T> integer_decoder()
{
    return Decoder<T>{
        [](Value const &value) { return checked_integer_cast<T>(value); }};
}

template <FixedWidthInteger T>
    requires std::is_unsigned_v<T>
Decoder<T> unsigned_integer_decoder()
{
    return Decoder<T>{
        [](Value const &value) { return checked_integer_cast<T>(value); }};
}

/// Any Number. Finite values beyond the range of `T` fail with
/// `NumericRangeError` instead of becoming infinity.
template <std::floating_point T>
Decoder<T> float_decoder()
{
    return Decoder<T>{[](Value const &value) -> DecodeResult<T> {
        if (TYDE_UNLIKELY(!value.is_number())) {
            return outcome::failure(type_mismatch(Shape::Number, value));
        }
        auto const d = value.get<Value::number_float_t>();
        if constexpr (
            std::numeric_limits<T>::max() <
            std::numeric_limits<Value::number_float_t>::max()) {
            if (TYDE_UNLIKELY(
                    std::isfinite(d) &&
                    std::fabs(d) > std::numeric_limits<T>::max())) {
                return outcome::failure(DecodeError{
                    NumericRangeError{value.dump(), float_type_name<T>()}});
            }
        }
        return outcome::success(static_cast<T>(d));
    }};
}

TYDE_NAMESPACE_END
