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

#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/fmt/decode_error_fmt.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <string>

using namespace tyde;

TEST(DecodeErrorFmt, matches_render)
{
    auto const error = DecodeError::aggregate(
        {DecodeError{Path{std::string{"a"}}, MissingField{"a"}},
         DecodeError{
             Path{std::string{"b"}, size_t{0}},
             TypeMismatch{Shape::Bool, Shape::Null}}});
    EXPECT_EQ(fmt::format("{}", error), error.render());
    EXPECT_EQ(
        fmt::format("[{}]", DecodeError{CustomError{"bad"}}),
        "[(root): invalid value: bad]");
}
