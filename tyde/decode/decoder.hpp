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
#include <tyde/core/tyde_exception.hpp>
#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/value.hpp>

#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

TYDE_NAMESPACE_BEGIN

/*! \brief A pure function from an untyped `Value` to a `T` or a
`DecodeError`.

Decoders hold no mutable state and never retain the values they are applied
to. Copies share the same immutable decode function, so a decoder can be
passed around by value and applied from many threads at once.
*/
template <typename T>
class Decoder
{
public:
    using value_type = T;
    using function_type = std::function<DecodeResult<T>(Value const &)>;

    explicit Decoder(function_type fn)
        : fn_{std::make_shared<function_type const>(std::move(fn))}
    {
        TYDE_THROW(static_cast<bool>(*fn_), "decoder requires a callable");
    }

    DecodeResult<T> decode(Value const &value) const
    {
        return (*fn_)(value);
    }

private:
    std::shared_ptr<function_type const> fn_;
};

/// Anything with a `value_type` and a `decode(Value)` returning
/// `DecodeResult<value_type>`: a `Decoder<T>` or a `FieldDecoder<T>`.
template <typename D>
concept DecoderLike = requires(D const &d, Value const &value) {
    typename D::value_type;
    {
        d.decode(value)
    } -> std::same_as<DecodeResult<typename D::value_type>>;
};

template <DecoderLike D>
using decoded_t = typename D::value_type;

/// Entry point: apply `decoder` to the root `value`.
template <DecoderLike D>
DecodeResult<decoded_t<D>> decode(D const &decoder, Value const &value)
{
    return decoder.decode(value);
}

template <DecoderLike D>
Decoder<decoded_t<D>> as_decoder(D decoder)
{
    if constexpr (std::same_as<D, Decoder<decoded_t<D>>>) {
        return decoder;
    }
    else {
        return Decoder<decoded_t<D>>{
            [decoder = std::move(decoder)](Value const &value) {
                return decoder.decode(value);
            }};
    }
}

/// Ignores the input and always produces `value`.
template <typename T>
Decoder<std::decay_t<T>> succeed(T &&value)
{
    using R = std::decay_t<T>;
    return Decoder<R>{
        [value = R{std::forward<T>(value)}](Value const &) -> DecodeResult<R> {
            return outcome::success(value);
        }};
}

/// Ignores the input and always fails with a custom error at the current
/// path. Typically returned from an `and_then` continuation to reject a
/// value that has the right shape but the wrong content.
template <typename T>
Decoder<T> fail(std::string message)
{
    return Decoder<T>{
        [message = std::move(message)](Value const &) -> DecodeResult<T> {
            return outcome::failure(DecodeError{CustomError{message}});
        }};
}

/// Defers construction of a decoder until it is applied; needed for
/// decoders of recursive structures.
template <typename F>
    requires DecoderLike<std::invoke_result_t<F const &>>
auto lazy(F make)
{
    using R = decoded_t<std::invoke_result_t<F const &>>;
    return Decoder<R>{[make = std::move(make)](Value const &value) {
        return std::invoke(make).decode(value);
    }};
}

TYDE_NAMESPACE_END
