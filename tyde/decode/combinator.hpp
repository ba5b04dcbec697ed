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
#include <tyde/decode/decoder.hpp>
#include <tyde/decode/value.hpp>

#include <boost/outcome/try.hpp>

#include <concepts>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

TYDE_NAMESPACE_BEGIN

/// Transforms a successful result with `f`; errors pass through untouched.
template <DecoderLike D, typename F>
    requires std::invocable<F const &, decoded_t<D>>
auto map(D d, F f)
{
    using R = std::invoke_result_t<F const &, decoded_t<D>>;
    static_assert(!std::is_void_v<R>);
    return Decoder<R>{[d = std::move(d), f = std::move(f)](
                          Value const &value) -> DecodeResult<R> {
        auto result = d.decode(value);
        if (result.has_error()) {
            return outcome::failure(std::move(result).assume_error());
        }
        return outcome::success(
            std::invoke(f, std::move(result).assume_value()));
    }};
}

/// Decodes with `d`, then applies the decoder chosen by `f` from that result
/// to the same value. `f` is not called when `d` fails.
template <DecoderLike D, typename F>
    requires std::invocable<F const &, decoded_t<D>> &&
             DecoderLike<std::invoke_result_t<F const &, decoded_t<D>>>
auto and_then(D d, F f)
{
    using Next = std::invoke_result_t<F const &, decoded_t<D>>;
    using R = decoded_t<Next>;
    return Decoder<R>{[d = std::move(d), f = std::move(f)](
                          Value const &value) -> DecodeResult<R> {
        auto first = BOOST_OUTCOME_TRYX(d.decode(value));
        return std::invoke(f, std::move(first)).decode(value);
    }};
}

namespace detail
{
    template <typename T>
    void collect_error(
        std::vector<DecodeError> &errors, DecodeResult<T> const &result)
    {
        if (result.has_error()) {
            errors.push_back(result.assume_error());
        }
    }
}

/*! \brief Lifts an N-argument function into a decoder, one sub-decoder per
argument.

Every sub-decoder is applied to the same value, in declaration order, and
all of them run even after a failure. If all succeed `f` is called once with
the results in declaration order. Otherwise the result is one error holding
the leaves of every failing sub-decoder, in declaration order, so a record
with several bad fields reports all of them at once.
*/
template <typename F, DecoderLike... Ds>
    requires(sizeof...(Ds) > 0) && std::invocable<F const &, decoded_t<Ds>...>
auto map_n(F f, Ds... decoders)
{
    using R = std::invoke_result_t<F const &, decoded_t<Ds>...>;
    static_assert(!std::is_void_v<R>);
    return Decoder<R>{[f = std::move(f), ... decoders = std::move(decoders)](
                          Value const &value) -> DecodeResult<R> {
        // braced initialization sequences the decodes left to right
        std::tuple<DecodeResult<decoded_t<Ds>>...> results{
            decoders.decode(value)...};
        std::vector<DecodeError> errors;
        std::apply(
            [&errors](auto const &...result) {
                (detail::collect_error(errors, result), ...);
            },
            results);
        if (!errors.empty()) {
            return outcome::failure(DecodeError::aggregate(std::move(errors)));
        }
        return outcome::success(std::apply(
            [&f](auto &&...result) {
                return std::invoke(
                    f, std::move(result).assume_value()...);
            },
            std::move(results)));
    }};
}

/// Runtime-length counterpart of `map_n`: applies every decoder to the same
/// value and collects the results in order, or every failure.
template <typename T>
Decoder<std::vector<T>> combine(std::vector<Decoder<T>> decoders)
{
    return Decoder<std::vector<T>>{
        [decoders = std::move(decoders)](
            Value const &value) -> DecodeResult<std::vector<T>> {
            std::vector<T> out;
            out.reserve(decoders.size());
            std::vector<DecodeError> errors;
            for (auto const &decoder : decoders) {
                auto result = decoder.decode(value);
                if (result.has_error()) {
                    errors.push_back(std::move(result).assume_error());
                }
                else if (errors.empty()) {
                    out.push_back(std::move(result).assume_value());
                }
            }
            if (!errors.empty()) {
                return outcome::failure(
                    DecodeError::aggregate(std::move(errors)));
            }
            return outcome::success(std::move(out));
        }};
}

/// First alternative that succeeds; if none does, every alternative's
/// failure.
template <DecoderLike D, DecoderLike... Ds>
    requires(std::same_as<decoded_t<D>, decoded_t<Ds>> && ...)
Decoder<decoded_t<D>> one_of(D first, Ds... rest)
{
    using T = decoded_t<D>;
    std::vector<Decoder<T>> alternatives{
        as_decoder(std::move(first)), as_decoder(std::move(rest))...};
    return Decoder<T>{[alternatives = std::move(alternatives)](
                          Value const &value) -> DecodeResult<T> {
        std::vector<DecodeError> errors;
        for (auto const &alternative : alternatives) {
            auto result = alternative.decode(value);
            if (result.has_value()) {
                return result;
            }
            errors.push_back(std::move(result).assume_error());
        }
        return outcome::failure(DecodeError::aggregate(std::move(errors)));
    }};
}

TYDE_NAMESPACE_END
