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

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

TYDE_NAMESPACE_BEGIN

/*! \brief Decodes every element of a Sequence with `inner`.

Elements are decoded in order and all of them are attempted: the error holds
one group of leaves per failing element, each prefixed with that element's
index.
*/
template <DecoderLike D>
Decoder<std::vector<decoded_t<D>>> sequence_of(D inner)
{
    using T = decoded_t<D>;
    return Decoder<std::vector<T>>{
        [inner = std::move(inner)](
            Value const &value) -> DecodeResult<std::vector<T>> {
            if (TYDE_UNLIKELY(!value.is_array())) {
                return outcome::failure(type_mismatch(Shape::Sequence, value));
            }
            std::vector<T> out;
            out.reserve(value.size());
            std::vector<DecodeError> errors;
            size_t index = 0;
            for (auto const &element : value) {
                auto result = inner.decode(element);
                if (result.has_error()) {
                    errors.push_back(std::move(result).assume_error().prefixed(
                        PathSegment{index}));
                }
                else if (errors.empty()) {
                    out.push_back(std::move(result).assume_value());
                }
                ++index;
            }
            if (!errors.empty()) {
                return outcome::failure(
                    DecodeError::aggregate(std::move(errors)));
            }
            return outcome::success(std::move(out));
        }};
}

/// Decodes every member of a Map with `inner`, keyed by member name.
/// Failures are prefixed with the member name.
template <DecoderLike D>
Decoder<std::map<std::string, decoded_t<D>>> dict_of(D inner)
{
    using T = decoded_t<D>;
    using R = std::map<std::string, T>;
    return Decoder<R>{
        [inner = std::move(inner)](Value const &value) -> DecodeResult<R> {
            if (TYDE_UNLIKELY(!value.is_object())) {
                return outcome::failure(type_mismatch(Shape::Map, value));
            }
            R out;
            std::vector<DecodeError> errors;
            for (auto const &item : value.items()) {
                auto result = inner.decode(item.value());
                if (result.has_error()) {
                    errors.push_back(std::move(result).assume_error().prefixed(
                        PathSegment{item.key()}));
                }
                else if (errors.empty()) {
                    out.emplace(item.key(), std::move(result).assume_value());
                }
            }
            if (!errors.empty()) {
                return outcome::failure(
                    DecodeError::aggregate(std::move(errors)));
            }
            return outcome::success(std::move(out));
        }};
}

/// Null decodes to `std::nullopt`; anything else goes to `inner`.
template <DecoderLike D>
Decoder<std::optional<decoded_t<D>>> nullable(D inner)
{
    using R = std::optional<decoded_t<D>>;
    return Decoder<R>{
        [inner = std::move(inner)](Value const &value) -> DecodeResult<R> {
            if (value.is_null()) {
                return outcome::success(R{std::nullopt});
            }
            auto result = inner.decode(value);
            if (result.has_error()) {
                return outcome::failure(std::move(result).assume_error());
            }
            return outcome::success(R{std::move(result).assume_value()});
        }};
}

/// Decodes the element at `index` of a Sequence.
template <DecoderLike D>
Decoder<decoded_t<D>> at_index(size_t const index, D inner)
{
    using T = decoded_t<D>;
    return Decoder<T>{
        [index, inner = std::move(inner)](Value const &value)
            -> DecodeResult<T> {
            if (TYDE_UNLIKELY(!value.is_array())) {
                return outcome::failure(type_mismatch(Shape::Sequence, value));
            }
            if (TYDE_UNLIKELY(index >= value.size())) {
                return outcome::failure(DecodeError{
                    Path{PathSegment{index}},
                    IndexOutOfRange{index, value.size()}});
            }
            auto result = inner.decode(value[index]);
            if (result.has_error()) {
                return outcome::failure(
                    std::move(result).assume_error().prefixed(
                        PathSegment{index}));
            }
            return result;
        }};
}

TYDE_NAMESPACE_END
