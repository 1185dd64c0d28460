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

#include <gravity/core/likely.h>
#include <gravity/epoch/params.hpp>

#include <initializer_list>

GRAVITY_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

Result<void> validate_config(EpochParams const &value, EpochParams const &)
{
    if (GRAVITY_UNLIKELY(value.interval_micros == 0)) {
        return ConfigError::ZeroEpochInterval;
    }
    return success();
}

Result<void>
validate_config(RandomnessParams const &value, RandomnessParams const &)
{
    if (!value.enabled()) {
        return success();
    }
    if (GRAVITY_UNLIKELY(
            value.reconstruction_threshold == 0 ||
            value.secrecy_threshold > value.reconstruction_threshold)) {
        return ConfigError::InvalidRandomnessThresholds;
    }
    return success();
}

Result<void>
validate_config(ValidatorParams const &value, ValidatorParams const &)
{
    if (GRAVITY_UNLIKELY(
            value.minimum_bond == 0 ||
            value.minimum_bond > value.maximum_bond)) {
        return ConfigError::InvalidBondRange;
    }
    if (GRAVITY_UNLIKELY(
            value.voting_power_increase_limit_pct <
                MIN_VOTING_POWER_INCREASE_LIMIT_PCT ||
            value.voting_power_increase_limit_pct >
                MAX_VOTING_POWER_INCREASE_LIMIT_PCT)) {
        return ConfigError::InvalidVotingPowerIncreaseLimit;
    }
    if (GRAVITY_UNLIKELY(value.max_validator_set_size == 0)) {
        return ConfigError::InvalidValidatorSetSize;
    }
    return success();
}

Result<void> validate_config(StakingParams const &, StakingParams const &)
{
    return success();
}

Result<void>
validate_config(GovernanceParams const &, GovernanceParams const &)
{
    return success();
}

Result<void>
validate_config(VersionParams const &value, VersionParams const &current)
{
    if (GRAVITY_UNLIKELY(value.major < current.major)) {
        return ConfigError::VersionDowngrade;
    }
    return success();
}

Result<void> validate_config(OpaqueParams const &value, OpaqueParams const &)
{
    if (GRAVITY_UNLIKELY(value.data.empty())) {
        return ConfigError::EmptyConfig;
    }
    return success();
}

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<gravity::ConfigError>::mapping> const &
quick_status_code_from_enum<gravity::ConfigError>::value_mappings()
{
    using gravity::ConfigError;

    static std::initializer_list<mapping> const v = {
        {ConfigError::Success, "success", {errc::success}},
        {ConfigError::InvalidBondRange, "invalid bond range", {}},
        {ConfigError::InvalidVotingPowerIncreaseLimit,
         "invalid voting power increase limit",
         {}},
        {ConfigError::InvalidValidatorSetSize,
         "invalid validator set size",
         {}},
        {ConfigError::ZeroEpochInterval, "zero epoch interval", {}},
        {ConfigError::VersionDowngrade, "version downgrade", {}},
        {ConfigError::InvalidRandomnessThresholds,
         "invalid randomness thresholds",
         {}},
        {ConfigError::EmptyConfig, "empty config", {}},
        {ConfigError::AlreadyInitialized, "config already initialized", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
