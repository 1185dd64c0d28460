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

#include <gravity/epoch/epoch_error.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<gravity::ReconfigurationError>::mapping> const &
quick_status_code_from_enum<gravity::ReconfigurationError>::value_mappings()
{
    using gravity::ReconfigurationError;

    static std::initializer_list<mapping> const v = {
        {ReconfigurationError::Success, "success", {errc::success}},
        {ReconfigurationError::NotInitialized, "not initialized", {}},
        {ReconfigurationError::AlreadyInitialized, "already initialized", {}},
        {ReconfigurationError::TransitionInProgress,
         "epoch transition in progress",
         {}},
        {ReconfigurationError::NoTransitionInProgress,
         "no epoch transition in progress",
         {}},
    };

    return v;
}

std::initializer_list<
    quick_status_code_from_enum<gravity::BlockError>::mapping> const &
quick_status_code_from_enum<gravity::BlockError>::value_mappings()
{
    using gravity::BlockError;

    static std::initializer_list<mapping> const v = {
        {BlockError::Success, "success", {errc::success}},
        {BlockError::ProposerNotInSet, "proposer not in validator set", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
