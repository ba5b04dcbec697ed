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

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <string>

TYDE_NAMESPACE_BEGIN

/// Kind of a single decode failure.
enum class DecodeErrc
{
    Success = 0,
    TypeMismatch,
    MissingField,
    IndexOutOfRange,
    NumericRange,
    Custom,
};

using DecodeStatusCode = BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::
    quick_status_code_from_enum_code<DecodeErrc>;

/// Category text for a failure kind, e.g. "missing field".
std::string errc_message(DecodeErrc);

TYDE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<tyde::DecodeErrc>
    : quick_status_code_from_enum_defaults<tyde::DecodeErrc>
{
    static constexpr auto const domain_name = "Decode Error";
    static constexpr auto const domain_uuid =
        "4f0e1c2a-7b3d-4e59-9a61-2c8d5f0b7e13";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
