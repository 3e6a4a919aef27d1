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

#include <susu/execution/rosca/config.hpp>
#include <susu/execution/state/state.hpp>

#include <quill/Quill.h>

#include <utility>

SUSU_ROSCA_NAMESPACE_BEGIN

// Runs one engine call inside its own state checkpoint. A call that returns
// an error or throws leaves storage, balances and logs untouched.
template <typename F>
auto execute_call(State &state, char const *const name, F &&fn)
    -> decltype(std::forward<F>(fn)())
{
    state.push();
    try {
        auto res = std::forward<F>(fn)();
        if (res.has_error()) {
            LOG_DEBUG("{} reverted: {}", name, res.error().message().c_str());
            state.pop_reject();
        }
        else {
            state.pop_accept();
        }
        return res;
    }
    catch (...) {
        state.pop_reject();
        throw;
    }
}

SUSU_ROSCA_NAMESPACE_END
