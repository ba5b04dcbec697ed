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

#include <cstdio>
#include <cstring>

extern char const *__progname;

TYDE_NAMESPACE_BEGIN

TydeException::TydeException(
    char const *const message,
    char const *const expr,
    char const *const function,
    char const *const file,
    long const line)
    : expr_{expr}
    , function_{function}
    , file_{file}
    , line_{line}
{
    (void)std::strncpy(message_, message, message_buffer_size - 1);
    message_[message_buffer_size - 1] = '\0';
}

char const *TydeException::message() const noexcept
{
    return message_;
}

char const *TydeException::expression() const noexcept
{
    return expr_;
}

void TydeException::print(int fd) const noexcept
{
    dprintf(
        fd,
        "%s: %s:%ld: %s: Tyde throw '%s' failed: '%s'\n",
        __progname,
        file_,
        line_,
        function_,
        expr_,
        message_);
}

TYDE_NAMESPACE_END
