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

#include <susu/core/config.hpp>
#include <susu/core/likely.h>

#include <cstddef>

#include <unistd.h>

SUSU_NAMESPACE_BEGIN

/// Exception for `SUSU_ASSERT_THROW` failure. Raised when an internal
/// invariant of the engine no longer holds, such as a pot underflowing.
class SusuException
{
public:
    SusuException(
        char const *message, char const *expr, char const *function,
        char const *file, long line);

    char const *message() const noexcept;
    void print(int fd = STDERR_FILENO) const noexcept;

    static constexpr size_t message_buffer_size = 128;

private:
    char const *expr_;
    char const *function_;
    char const *file_;
    long line_;
    char message_[message_buffer_size];
};

static_assert(sizeof(SusuException) < 512);

SUSU_NAMESPACE_END

#define SUSU_ASSERT_THROW(expr, message)                                       \
    if (SUSU_LIKELY(expr)) { /* likeliest */                                   \
    }                                                                          \
    else {                                                                     \
        throw susu::SusuException(                                             \
            (message),                                                         \
            #expr,                                                             \
            __extension__ __PRETTY_FUNCTION__,                                 \
            __FILE__,                                                          \
            __LINE__);                                                         \
    }
