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

#include <gravity/core/config.hpp>
#include <gravity/core/status_code.hpp>

#include <initializer_list>

GRAVITY_NAMESPACE_BEGIN

// Lifecycle and state-precondition errors of the epoch state machine and the
// components bootstrapped with it
enum class ReconfigurationError
{
    Success = 0,
    NotInitialized,
    AlreadyInitialized,
    TransitionInProgress,
    NoTransitionInProgress,
};

enum class BlockError
{
    Success = 0,
    ProposerNotInSet,
};

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<gravity::ReconfigurationError>
    : quick_status_code_from_enum_defaults<gravity::ReconfigurationError>
{
    static constexpr auto const domain_name = "Reconfiguration Error";
    static constexpr auto const domain_uuid =
        "4c9a1e26-8b3f-47d5-a0e2-93f6c5b1d870";

    static std::initializer_list<mapping> const &value_mappings();
};

template <>
struct quick_status_code_from_enum<gravity::BlockError>
    : quick_status_code_from_enum_defaults<gravity::BlockError>
{
    static constexpr auto const domain_name = "Block Error";
    static constexpr auto const domain_uuid =
        "91d04f7b-c6a2-4e38-b15d-2f8e7a6c3b19";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
