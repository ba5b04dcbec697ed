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

#include <tyde/core/tyde_exception.hpp>

#include <gtest/gtest.h>

#include <cstring>
#include <unistd.h>

using namespace tyde;

namespace
{
    TEST(TydeExceptionTest, message_empty)
    {
        try {
            TYDE_THROW(false, "");
        }
        catch (TydeException const &e) {
            ASSERT_TRUE(std::strcmp(e.message(), "") == 0);
            return;
        }
        FAIL();
    }

    TEST(TydeExceptionTest, no_throw_when_true)
    {
        EXPECT_NO_THROW({ TYDE_THROW(1 + 1 == 2, "arithmetic"); });
    }

    TEST(TydeExceptionTest, records_expression)
    {
        try {
            int const n = 0;
            TYDE_THROW(n > 0, "n must be positive");
        }
        catch (TydeException const &e) {
            EXPECT_STREQ(e.expression(), "n > 0");
            EXPECT_STREQ(e.message(), "n must be positive");
            return;
        }
        FAIL();
    }

    TEST(TydeExceptionTest, message_size_out_of_bound)
    {
        char message[TydeException::message_buffer_size + 1];
        for (size_t i = 0; i < sizeof(message) - 1; ++i) {
            message[i] = static_cast<char>('0' + i % 10);
        }
        message[TydeException::message_buffer_size] = '\0';
        try {
            TYDE_THROW(false, message);
        }
        catch (TydeException const &e) {
            message[TydeException::message_buffer_size - 1] = '\0';
            ASSERT_TRUE(std::strcmp(e.message(), message) == 0);
            return;
        }
        FAIL();
    }

    TEST(TydeExceptionTest, print)
    {
        try {
            TYDE_THROW(false, "hello world");
        }
        catch (TydeException const &e) {
            int fds[2];
            int r = ::pipe(fds);
            ASSERT_NE(r, -1);

            e.print(fds[1]);

            char buffer[4096];
            ssize_t const n = ::read(fds[0], buffer, sizeof(buffer) - 1);

            ASSERT_GT(n, 0);

            buffer[static_cast<size_t>(n)] = '\0';

            ASSERT_NE(nullptr, strstr(buffer, "hello world"));
            ASSERT_NE(nullptr, strstr(buffer, "/test/tyde_exception.cpp"));

            ::close(fds[0]);
            ::close(fds[1]);
            return;
        }
        FAIL();
    }
}
