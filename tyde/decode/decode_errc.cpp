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

#include <tyde/decode/decode_errc.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <string>

TYDE_NAMESPACE_BEGIN

std::string errc_message(DecodeErrc const errc)
{
    DecodeStatusCode const code{errc};
    auto const message = code.message();
    return std::string{message.data(), message.size()};
}

TYDE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<tyde::DecodeErrc>::mapping> const &
quick_status_code_from_enum<tyde::DecodeErrc>::value_mappings()
{
    using tyde::DecodeErrc;

    static std::initializer_list<mapping> const v = {
        {DecodeErrc::Success, "success", {errc::success}},
        {DecodeErrc::TypeMismatch, "type mismatch", {errc::invalid_argument}},
        {DecodeErrc::MissingField, "missing field", {}},
        {DecodeErrc::IndexOutOfRange,
         "index out of range",
         {errc::result_out_of_range}},
        {DecodeErrc::NumericRange,
         "numeric value out of range",
         {errc::value_too_large}},
        {DecodeErrc::Custom, "invalid value", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
