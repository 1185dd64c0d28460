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

#include <gravity/core/byte_string.hpp>
#include <gravity/core/config.hpp>
#include <gravity/core/int.hpp>
#include <gravity/core/result.hpp>
#include <gravity/core/status_code.hpp>

#include <cstdint>
#include <initializer_list>
#include <string_view>

GRAVITY_NAMESPACE_BEGIN

enum class ConfigError
{
    Success = 0,
    InvalidBondRange,
    InvalidVotingPowerIncreaseLimit,
    InvalidValidatorSetSize,
    ZeroEpochInterval,
    VersionDowngrade,
    InvalidRandomnessThresholds,
    EmptyConfig,
    AlreadyInitialized,
};

inline constexpr uint64_t MIN_VOTING_POWER_INCREASE_LIMIT_PCT = 1;
inline constexpr uint64_t MAX_VOTING_POWER_INCREASE_LIMIT_PCT = 50;

struct EpochParams
{
    uint64_t interval_micros{2 * 60 * 60 * 1'000'000ull};

    bool operator==(EpochParams const &) const = default;
};

enum class RandomnessVariant : uint8_t
{
    Off = 0,
    V2 = 1,
};

constexpr std::string_view randomness_variant_name(RandomnessVariant const v)
{
    return v == RandomnessVariant::Off ? "off" : "v2";
}

// Thresholds are fixed point fractions of the total voting power
struct RandomnessParams
{
    RandomnessVariant variant{RandomnessVariant::Off};
    uint128_t secrecy_threshold{0};
    uint128_t reconstruction_threshold{0};
    uint128_t fast_path_secrecy_threshold{0};

    bool enabled() const noexcept
    {
        return variant != RandomnessVariant::Off;
    }

    bool operator==(RandomnessParams const &) const = default;
};

struct ValidatorParams
{
    uint256_t minimum_bond{1};
    uint256_t maximum_bond{UINT256_MAX};
    uint64_t unbonding_delay_micros{0};
    bool allow_validator_set_change{true};
    uint64_t voting_power_increase_limit_pct{20};
    uint64_t max_validator_set_size{100};
    bool auto_evict_enabled{false};
    uint64_t auto_evict_threshold{0};

    bool operator==(ValidatorParams const &) const = default;
};

struct StakingParams
{
    uint256_t minimum_stake{0};
    uint64_t lockup_duration_micros{0};
    uint64_t unbonding_delay_micros{0};
    uint256_t minimum_proposal_stake{0};

    bool operator==(StakingParams const &) const = default;
};

struct GovernanceParams
{
    uint128_t min_voting_threshold{0};
    uint256_t required_proposer_stake{0};
    uint64_t voting_duration_micros{0};
    uint64_t execution_delay_micros{0};
    uint64_t execution_window_micros{0};

    bool operator==(GovernanceParams const &) const = default;
};

struct VersionParams
{
    uint64_t major{1};

    bool operator==(VersionParams const &) const = default;
};

// Consensus and execution parameters are interpreted outside of this code
// base and are carried as raw bytes
struct OpaqueParams
{
    byte_string data;

    bool operator==(OpaqueParams const &) const = default;
};

// validate_config(value, current) is the admission check applied by
// StagedConfig::stage and StagedConfig::initialize
Result<void> validate_config(EpochParams const &, EpochParams const &);
Result<void> validate_config(RandomnessParams const &, RandomnessParams const &);
Result<void> validate_config(ValidatorParams const &, ValidatorParams const &);
Result<void> validate_config(StakingParams const &, StakingParams const &);
Result<void>
validate_config(GovernanceParams const &, GovernanceParams const &);
Result<void> validate_config(VersionParams const &, VersionParams const &);
Result<void> validate_config(OpaqueParams const &, OpaqueParams const &);

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<gravity::ConfigError>
    : quick_status_code_from_enum_defaults<gravity::ConfigError>
{
    static constexpr auto const domain_name = "Config Error";
    static constexpr auto const domain_uuid =
        "b8e3c0a2-71f4-4e0d-8f5b-2a9c6d4e1f07";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
