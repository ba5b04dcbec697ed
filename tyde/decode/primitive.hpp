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
#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/decoder.hpp>
#include <tyde/decode/value.hpp>

#include <string>
#include <variant>

TYDE_NAMESPACE_BEGIN

/// TypeMismatch at the current path.
DecodeError type_mismatch(Shape expected, Value const &actual);

Decoder<std::monostate> null_decoder();

Decoder<bool> bool_decoder();

Decoder<std::string> string_decoder();

/// Copy of the value itself; never fails.
Decoder<Value> value_decoder();

TYDE_NAMESPACE_END
