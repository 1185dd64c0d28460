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

#include <gravity/core/status_code.hpp>
#include <gravity/staking/config.hpp>

#include <initializer_list>

GRAVITY_STAKING_NAMESPACE_BEGIN

enum class StakingError
{
    Success = 0,
    UnknownStakePool,
    StakePoolExists,
    StakePoolAlreadyRegistered,
    InsufficientBond,
    ExcessiveBond,
    InvalidMoniker,
    InvalidConsensusKey,
    InvalidProofOfPossession,
    ConsensusKeyInUse,
    UnknownValidator,
    ValidatorSetChangeDisabled,
    ReconfigurationInProgress,
    InvalidStatus,
    LastValidator,
    MaxValidatorSetSizeReached,
    VotingPowerIncreaseLimitExceeded,
    AlreadyInitialized,
    EmptyValidatorSet,
};

GRAVITY_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<gravity::staking::StakingError>
    : quick_status_code_from_enum_defaults<gravity::staking::StakingError>
{
    static constexpr auto const domain_name = "Staking Error";
    static constexpr auto const domain_uuid =
        "f5a8d2c1-0b7e-4d93-86f4-c13e9a27b5d6";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
