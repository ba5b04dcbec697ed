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
#include <tyde/decode/value.hpp>

#include <string_view>

TYDE_NAMESPACE_BEGIN

Shape shape_of(Value const &value)
{
    using value_t = Value::value_t;

    switch (value.type()) {
    case value_t::null:
        return Shape::Null;
    case value_t::boolean:
        return Shape::Bool;
    case value_t::number_integer:
    case value_t::number_unsigned:
    case value_t::number_float:
        return Shape::Number;
    case value_t::string:
        return Shape::String;
    case value_t::array:
        return Shape::Sequence;
    case value_t::object:
        return Shape::Map;
    case value_t::binary:
    case value_t::discarded:
        break;
    }
    TYDE_THROW(false, "value has no decodable shape");
    return Shape::Null;
}

std::string_view shape_name(Shape const shape) noexcept
{
    switch (shape) {
    case Shape::Null:
        return "null";
    case Shape::Bool:
        return "bool";
    case Shape::Number:
        return "number";
    case Shape::String:
        return "string";
    case Shape::Sequence:
        return "sequence";
    case Shape::Map:
        return "map";
    }
    return "unknown";
}

TYDE_NAMESPACE_END
