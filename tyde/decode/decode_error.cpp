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
#include <tyde/core/tyde_exception.hpp>
#include <tyde/decode/decode_errc.hpp>
#include <tyde/decode/decode_error.hpp>

#include <algorithm>
#include <cstddef>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

TYDE_ANONYMOUS_NAMESPACE_BEGIN

bool is_plain_name(std::string_view const name)
{
    return !name.empty() && std::ranges::none_of(name, [](char const c) {
        return c == '.' || c == '[' || c == ']' || c == '"' || c == '\\' ||
               c == ' ';
    });
}

void append_quoted(std::string &out, std::string_view const name)
{
    out += "[\"";
    for (char const c : name) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += "\"]";
}

struct CauseErrc
{
    DecodeErrc operator()(TypeMismatch const &) const noexcept
    {
        return DecodeErrc::TypeMismatch;
    }

    DecodeErrc operator()(MissingField const &) const noexcept
    {
        return DecodeErrc::MissingField;
    }

    DecodeErrc operator()(IndexOutOfRange const &) const noexcept
    {
        return DecodeErrc::IndexOutOfRange;
    }

    DecodeErrc operator()(NumericRangeError const &) const noexcept
    {
        return DecodeErrc::NumericRange;
    }

    DecodeErrc operator()(CustomError const &) const noexcept
    {
        return DecodeErrc::Custom;
    }
};

struct CauseDescription
{
    std::string operator()(TypeMismatch const &c) const
    {
        return std::format("expected {}, found {}", c.expected, c.actual);
    }

    std::string operator()(MissingField const &c) const
    {
        return std::format("required key \"{}\" is not present", c.name);
    }

    std::string operator()(IndexOutOfRange const &c) const
    {
        return std::format(
            "index {} is out of range for sequence of length {}",
            c.index,
            c.length);
    }

    std::string operator()(NumericRangeError const &c) const
    {
        return std::format("{} does not fit in {}", c.value, c.target);
    }

    std::string operator()(CustomError const &c) const
    {
        return c.message;
    }
};

TYDE_ANONYMOUS_NAMESPACE_END

TYDE_NAMESPACE_BEGIN

std::string format_path(Path const &path)
{
    if (path.empty()) {
        return "(root)";
    }
    std::string out;
    for (auto const &segment : path) {
        if (auto const *const index = std::get_if<size_t>(&segment)) {
            std::format_to(std::back_inserter(out), "[{}]", *index);
            continue;
        }
        auto const &name = std::get<std::string>(segment);
        if (!is_plain_name(name)) {
            append_quoted(out, name);
        }
        else if (out.empty()) {
            out += name;
        }
        else {
            std::format_to(std::back_inserter(out), ".{}", name);
        }
    }
    return out;
}

DecodeErrc errc_of(Cause const &cause) noexcept
{
    return std::visit(CauseErrc{}, cause);
}

std::string describe(Cause const &cause)
{
    return std::visit(CauseDescription{}, cause);
}

DecodeError::DecodeError()
    : DecodeError{CustomError{}}
{
}

DecodeError::DecodeError(Cause cause)
    : DecodeError{Path{}, std::move(cause)}
{
}

DecodeError::DecodeError(Path path, Cause cause)
    : leaves_{LeafError{std::move(path), std::move(cause)}}
{
}

DecodeError::DecodeError(std::vector<LeafError> leaves)
    : leaves_{std::move(leaves)}
{
    TYDE_THROW(!leaves_.empty(), "decode error must have at least one leaf");
}

DecodeError DecodeError::aggregate(std::vector<DecodeError> errors)
{
    TYDE_THROW(!errors.empty(), "cannot aggregate zero decode errors");
    if (errors.size() == 1) {
        return std::move(errors.front());
    }
    std::vector<LeafError> leaves;
    for (auto &error : errors) {
        for (auto &leaf : error.leaves_) {
            // siblings that read the same value can fail identically
            if (std::ranges::find(leaves, leaf) == leaves.end()) {
                leaves.push_back(std::move(leaf));
            }
        }
    }
    return DecodeError{std::move(leaves)};
}

Path const &DecodeError::path() const noexcept
{
    return leaves_.front().path;
}

Cause const &DecodeError::cause() const noexcept
{
    return leaves_.front().cause;
}

DecodeErrc DecodeError::code() const noexcept
{
    return errc_of(cause());
}

std::vector<LeafError> const &DecodeError::leaves() const noexcept
{
    return leaves_;
}

bool DecodeError::is_aggregate() const noexcept
{
    return leaves_.size() > 1;
}

DecodeError DecodeError::prefixed(PathSegment const &segment) const &
{
    return DecodeError{*this}.prefixed(segment);
}

DecodeError DecodeError::prefixed(PathSegment const &segment) &&
{
    for (auto &leaf : leaves_) {
        leaf.path.insert(leaf.path.begin(), segment);
    }
    return std::move(*this);
}

std::string DecodeError::render() const
{
    std::string out;
    for (auto const &leaf : leaves_) {
        if (!out.empty()) {
            out += '\n';
        }
        std::format_to(
            std::back_inserter(out),
            "{}: {}: {}",
            format_path(leaf.path),
            errc_message(errc_of(leaf.cause)),
            describe(leaf.cause));
    }
    return out;
}

TYDE_NAMESPACE_END
