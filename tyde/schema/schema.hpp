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

#include <tyde/decode/decode_error.hpp>
#include <tyde/decode/decoder.hpp>
#include <tyde/decode/value.hpp>
#include <tyde/schema/config.hpp>

TYDE_SCHEMA_NAMESPACE_BEGIN

// A schema is itself a json document:
//
//   "int32", "uint8", "string", ...   a named primitive, see `named_type`
//   "?int32"                          the primitive, or null
//   [S]                               a sequence of S
//   {"a": S, "b?": T}                 a record; `b` may be absent or null
//   {"$dict": S}                      a map with arbitrary keys, values S
//
// A compiled schema decodes a document into a normalized copy of it:
// integers range checked and re-emitted, absent optional fields dropped,
// members not named by the schema dropped.

/// Decoder for one of the primitive names: null, bool, string, any, float,
/// double, int8, int16, int32, int64, uint8, uint16, uint32, uint64.
/// Unknown names fail with a custom error.
DecodeResult<Decoder<Value>> named_type(std::string const &name);

/// Decoder from a schema document to the decoder it describes. Errors in the
/// schema are reported with their path inside the schema document.
Decoder<Decoder<Value>> schema_decoder();

DecodeResult<Decoder<Value>> compile(Value const &schema);

TYDE_SCHEMA_NAMESPACE_END
