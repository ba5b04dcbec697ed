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

#include <tyde/core/basic_formatter.hpp>
#include <tyde/decode/decode_error.hpp>

#include <quill/Quill.h>

template <>
struct quill::copy_loggable<tyde::DecodeError> : std::true_type
{
};

template <>
struct fmt::formatter<tyde::DecodeError> : public tyde::BasicFormatter
{
    template <typename FormatContext>
    auto format(tyde::DecodeError const &value, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "{}", value.render());
        return ctx.out();
    }
};
