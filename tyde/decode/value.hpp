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

#include <nlohmann/json.hpp>

#include <cstdint>
#include <format>
#include <string_view>

TYDE_NAMESPACE_BEGIN

/// The untyped tree being decoded. Decoders only read it.
using Value = nlohmann::json;

enum class Shape : uint8_t
{
    Null,
    Bool,
    Number,
    String,
    Sequence,
    Map,
};

/// Throws `TydeException` for the binary and discarded json types, which are
/// never produced by parsing json text.
Shape shape_of(Value const &);

std::string_view shape_name(Shape) noexcept;

TYDE_NAMESPACE_END

template <>
struct std::formatter<tyde::Shape> : std::formatter<std::string_view>
{
    auto format(tyde::Shape const shape, std::format_context &ctx) const
    {
        return std::formatter<std::string_view>::format(
            tyde::shape_name(shape), ctx);
    }
};
