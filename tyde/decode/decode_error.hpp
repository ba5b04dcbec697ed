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
#include <tyde/decode/decode_errc.hpp>
#include <tyde/decode/value.hpp>

#include <cstddef>
#include <format>
#include <string>
#include <variant>
#include <vector>

TYDE_NAMESPACE_BEGIN

/// A field name or a sequence index.
using PathSegment = std::variant<std::string, size_t>;

/// Root-relative location inside the decoded value. Empty means the root.
using Path = std::vector<PathSegment>;

/// Renders `a.b[2].c`; names that would be ambiguous in dotted form are
/// quoted, e.g. `a["x.y"]`, with `"` and `\` escaped by a backslash. The
/// empty path renders as `(root)`.
std::string format_path(Path const &);

struct TypeMismatch
{
    Shape expected;
    Shape actual;

    bool operator==(TypeMismatch const &) const = default;
};

struct MissingField
{
    std::string name;

    bool operator==(MissingField const &) const = default;
};

struct IndexOutOfRange
{
    size_t index;
    size_t length;

    bool operator==(IndexOutOfRange const &) const = default;
};

/// A number that cannot be represented in the destination type. `value` is
/// the number as written in the source tree, `target` the destination type.
struct NumericRangeError
{
    std::string value;
    std::string target;

    bool operator==(NumericRangeError const &) const = default;
};

/// Open extension point for validation failures raised outside the core.
struct CustomError
{
    std::string message;

    bool operator==(CustomError const &) const = default;
};

using Cause = std::variant<
    TypeMismatch, MissingField, IndexOutOfRange, NumericRangeError,
    CustomError>;

DecodeErrc errc_of(Cause const &) noexcept;

/// Detail text for a cause, without the category, e.g.
/// "expected string, found number".
std::string describe(Cause const &);

struct LeafError
{
    Path path;
    Cause cause;

    bool operator==(LeafError const &) const = default;
};

/// One or more localized decode failures. Never empty. Values are immutable;
/// adding path context produces a new error.
class DecodeError
{
public:
    /// A single root-level `CustomError` with an empty message.
    DecodeError();
    explicit DecodeError(Cause cause);
    DecodeError(Path path, Cause cause);

    /// Flattens the leaves of every error, in order, keeping only the first
    /// of several identical leaves. Throws `TydeException` if `errors` is
    /// empty.
    static DecodeError aggregate(std::vector<DecodeError> errors);

    /// Path and cause of the first leaf; for a single failure, the failure.
    Path const &path() const noexcept;
    Cause const &cause() const noexcept;
    DecodeErrc code() const noexcept;

    std::vector<LeafError> const &leaves() const noexcept;
    bool is_aggregate() const noexcept;

    /// Copy of this error with `segment` prepended to every leaf's path.
    DecodeError prefixed(PathSegment const &segment) const &;
    DecodeError prefixed(PathSegment const &segment) &&;

    /// One line per leaf: `<path>: <category>: <detail>`.
    std::string render() const;

    bool operator==(DecodeError const &) const = default;

private:
    explicit DecodeError(std::vector<LeafError> leaves);

    std::vector<LeafError> leaves_;
};

template <typename T>
using DecodeResult = Result<T, DecodeError>;

TYDE_NAMESPACE_END

template <>
struct std::formatter<tyde::DecodeError>
{
    constexpr auto parse(std::format_parse_context &ctx)
    {
        return ctx.begin();
    }

    auto format(tyde::DecodeError const &error, std::format_context &ctx) const
    {
        return std::format_to(ctx.out(), "{}", error.render());
    }
};
