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

#include <gravity/staking/staking_error.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<gravity::staking::StakingError>::mapping> const &
quick_status_code_from_enum<gravity::staking::StakingError>::value_mappings()
{
    using gravity::staking::StakingError;

    static std::initializer_list<mapping> const v = {
        {StakingError::Success, "success", {errc::success}},
        {StakingError::UnknownStakePool, "unknown stake pool", {}},
        {StakingError::StakePoolExists, "stake pool exists", {}},
        {StakingError::StakePoolAlreadyRegistered,
         "stake pool already registered as validator",
         {}},
        {StakingError::InsufficientBond, "insufficient bond", {}},
        {StakingError::ExcessiveBond, "bond above maximum", {}},
        {StakingError::InvalidMoniker, "invalid moniker", {}},
        {StakingError::InvalidConsensusKey, "invalid consensus key", {}},
        {StakingError::InvalidProofOfPossession,
         "invalid proof of possession",
         {}},
        {StakingError::ConsensusKeyInUse, "consensus key in use", {}},
        {StakingError::UnknownValidator, "unknown validator", {}},
        {StakingError::ValidatorSetChangeDisabled,
         "validator set change disabled",
         {}},
        {StakingError::ReconfigurationInProgress,
         "reconfiguration in progress",
         {}},
        {StakingError::InvalidStatus, "invalid validator status", {}},
        {StakingError::LastValidator, "cannot remove last validator", {}},
        {StakingError::MaxValidatorSetSizeReached,
         "max validator set size reached",
         {}},
        {StakingError::VotingPowerIncreaseLimitExceeded,
         "voting power increase limit exceeded",
         {}},
        {StakingError::AlreadyInitialized, "already initialized", {}},
        {StakingError::EmptyValidatorSet, "empty validator set", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
