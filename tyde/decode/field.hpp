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
#include <tyde/core/tyde_exception.hpp>
#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/decoder.hpp>
#include <tyde/decode/primitive.hpp>
#include <tyde/decode/value.hpp>

#include <optional>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

TYDE_NAMESPACE_BEGIN

/*! \brief Decodes the member `name` of a Map with an inner decoder.

- value is not a Map: `TypeMismatch` at the current path
- key absent: `MissingField(name)` at path `[name]`
- inner failure: the inner error with `name` prepended to every leaf
*/
template <typename T>
class FieldDecoder
{
public:
    using value_type = T;

    FieldDecoder(std::string name, Decoder<T> inner)
        : name_{std::move(name)}
        , inner_{std::move(inner)}
    {
        TYDE_THROW(!name_.empty(), "field name must not be empty");
    }

    std::string const &name() const noexcept
    {
        return name_;
    }

    Decoder<T> const &inner() const noexcept
    {
        return inner_;
    }

    DecodeResult<T> decode(Value const &value) const
    {
        if (TYDE_UNLIKELY(!value.is_object())) {
            return outcome::failure(type_mismatch(Shape::Map, value));
        }
        auto const it = value.find(name_);
        if (it == value.end()) {
            return outcome::failure(
                DecodeError{Path{PathSegment{name_}}, MissingField{name_}});
        }
        auto result = inner_.decode(*it);
        if (result.has_error()) {
            return outcome::failure(
                std::move(result).assume_error().prefixed(PathSegment{name_}));
        }
        return result;
    }

    operator Decoder<T>() const
    {
        return as_decoder(*this);
    }

private:
    std::string name_;
    Decoder<T> inner_;
};

template <DecoderLike D>
FieldDecoder<decoded_t<D>> field(std::string name, D inner)
{
    return FieldDecoder<decoded_t<D>>{
        std::move(name), as_decoder(std::move(inner))};
}

/// Like `field`, but an absent key or a Null member yields `std::nullopt`.
template <DecoderLike D>
Decoder<std::optional<decoded_t<D>>> optional_field(std::string name, D inner)
{
    using R = std::optional<decoded_t<D>>;
    TYDE_THROW(!name.empty(), "field name must not be empty");
    return Decoder<R>{
        [name = std::move(name),
         inner = std::move(inner)](Value const &value) -> DecodeResult<R> {
            if (TYDE_UNLIKELY(!value.is_object())) {
                return outcome::failure(type_mismatch(Shape::Map, value));
            }
            auto const it = value.find(name);
            if (it == value.end() || it->is_null()) {
                return outcome::success(R{std::nullopt});
            }
            auto result = inner.decode(*it);
            if (result.has_error()) {
                return outcome::failure(
                    std::move(result).assume_error().prefixed(
                        PathSegment{name}));
            }
            return outcome::success(R{std::move(result).assume_value()});
        }};
}

/// Nested fields: `field_path({"a", "b"}, d)` is `field("a", field("b", d))`.
template <DecoderLike D>
Decoder<decoded_t<D>> field_path(std::vector<std::string> names, D inner)
{
    TYDE_THROW(!names.empty(), "field path must not be empty");
    auto decoder = as_decoder(std::move(inner));
    for (auto &name : names | std::views::reverse) {
        decoder = as_decoder(field(std::move(name), std::move(decoder)));
    }
    return decoder;
}

TYDE_NAMESPACE_END
