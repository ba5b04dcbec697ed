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
#include <tyde/core/result.hpp>
#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/decoder.hpp>
#include <tyde/decode/numeric.hpp>
#include <tyde/decode/value.hpp>

#include <nlohmann/json.hpp>

#include <concepts>

TYDE_NAMESPACE_BEGIN

/*! \brief Decodes through nlohmann's own conversion (`from_json` /
`get<T>()`) for types that already have one.

The library reports failures by throwing; they come back here as a
`CustomError` at the current path. Integer and floating point `T` go through
`checked_integer_cast` and `float_decoder` instead, since nlohmann narrows
numbers with a plain cast. Numbers converted inside a user's own `from_json`
are not range checked.
*/
template <typename T>
Decoder<T> from_json()
{
    if constexpr (FixedWidthInteger<T>) {
        return Decoder<T>{
            [](Value const &value) { return checked_integer_cast<T>(value); }};
    }
    else if constexpr (std::floating_point<T>) {
        return float_decoder<T>();
    }
    else {
        return Decoder<T>{[](Value const &value) -> DecodeResult<T> {
            try {
                return outcome::success(value.get<T>());
            }
            catch (nlohmann::json::exception const &e) {
                return outcome::failure(DecodeError{CustomError{e.what()}});
            }
        }};
    }
}

TYDE_NAMESPACE_END
