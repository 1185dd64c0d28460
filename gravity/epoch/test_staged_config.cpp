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

#include <gravity/core/address.hpp>
#include <gravity/core/int.hpp>
#include <gravity/epoch/access_control.hpp>
#include <gravity/epoch/event.hpp>
#include <gravity/epoch/params.hpp>
#include <gravity/epoch/staged_config.hpp>

#include <gtest/gtest.h>

using namespace gravity;

namespace
{
    struct StagedConfigTest : public ::testing::Test
    {
        AccessControl access;
        EventLog events;
        ValidatorConfig validator_config{"validator", access, events};
        VersionConfig version_config{"version", access, events};
        ConsensusConfig consensus_config{"consensus", access, events};
    };
}

TEST_F(StagedConfigTest, staged_value_invisible_until_commit)
{
    ValidatorParams params = validator_config.current();
    params.minimum_bond = 10;
    params.maximum_bond = 20;

    ASSERT_FALSE(validator_config.stage(GOVERNANCE_ADDRESS, params).has_error());
    EXPECT_TRUE(validator_config.has_pending());
    EXPECT_EQ(validator_config.current().minimum_bond, 1);
    EXPECT_EQ(events.count<ConfigStagedEvent>(), 1u);

    auto const committed = validator_config.commit(RECONFIGURATION_ADDRESS);
    ASSERT_FALSE(committed.has_error());
    EXPECT_TRUE(committed.value());
    EXPECT_EQ(validator_config.current().minimum_bond, 10);
    EXPECT_FALSE(validator_config.has_pending());

    auto const again = validator_config.commit(RECONFIGURATION_ADDRESS);
    ASSERT_FALSE(again.has_error());
    EXPECT_FALSE(again.value());
}

TEST_F(StagedConfigTest, later_stage_replaces_earlier)
{
    ValidatorParams params = validator_config.current();
    params.max_validator_set_size = 5;
    ASSERT_FALSE(validator_config.stage(GOVERNANCE_ADDRESS, params).has_error());
    params.max_validator_set_size = 7;
    ASSERT_FALSE(validator_config.stage(GOVERNANCE_ADDRESS, params).has_error());

    ASSERT_FALSE(validator_config.commit(RECONFIGURATION_ADDRESS).has_error());
    EXPECT_EQ(validator_config.current().max_validator_set_size, 7);
}

TEST_F(StagedConfigTest, roles)
{
    auto const staged = validator_config.stage(
        RECONFIGURATION_ADDRESS, validator_config.current());
    ASSERT_TRUE(staged.has_error());
    EXPECT_EQ(staged.assume_error(), AccessError::Unauthorized);

    auto const committed = validator_config.commit(GOVERNANCE_ADDRESS);
    ASSERT_TRUE(committed.has_error());
    EXPECT_EQ(committed.assume_error(), AccessError::Unauthorized);

    auto const init =
        validator_config.initialize(SYSTEM_CALLER, validator_config.current());
    ASSERT_TRUE(init.has_error());
    EXPECT_EQ(init.assume_error(), AccessError::Unauthorized);
    EXPECT_EQ(events.size(), 0u);
}

TEST_F(StagedConfigTest, initialize_once)
{
    ValidatorParams params = validator_config.current();
    params.minimum_bond = 3;
    ASSERT_FALSE(
        validator_config.initialize(GENESIS_ADDRESS, params).has_error());
    EXPECT_EQ(validator_config.current().minimum_bond, 3);

    auto const res = validator_config.initialize(GENESIS_ADDRESS, params);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::AlreadyInitialized);
}

TEST_F(StagedConfigTest, validator_params_validation)
{
    ValidatorParams const base = validator_config.current();

    ValidatorParams p = base;
    p.minimum_bond = 0;
    auto res = validator_config.stage(GOVERNANCE_ADDRESS, p);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::InvalidBondRange);

    p = base;
    p.minimum_bond = 100;
    p.maximum_bond = 99;
    res = validator_config.stage(GOVERNANCE_ADDRESS, p);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::InvalidBondRange);

    p = base;
    p.voting_power_increase_limit_pct = 0;
    res = validator_config.stage(GOVERNANCE_ADDRESS, p);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::InvalidVotingPowerIncreaseLimit);

    p.voting_power_increase_limit_pct = 51;
    res = validator_config.stage(GOVERNANCE_ADDRESS, p);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::InvalidVotingPowerIncreaseLimit);

    p = base;
    p.max_validator_set_size = 0;
    res = validator_config.stage(GOVERNANCE_ADDRESS, p);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::InvalidValidatorSetSize);

    EXPECT_FALSE(validator_config.has_pending());
}

TEST_F(StagedConfigTest, version_never_downgrades)
{
    ASSERT_FALSE(
        version_config.stage(GOVERNANCE_ADDRESS, VersionParams{.major = 3})
            .has_error());
    ASSERT_FALSE(version_config.commit(RECONFIGURATION_ADDRESS).has_error());

    auto const res =
        version_config.stage(GOVERNANCE_ADDRESS, VersionParams{.major = 2});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::VersionDowngrade);
    EXPECT_FALSE(
        version_config.stage(GOVERNANCE_ADDRESS, VersionParams{.major = 3})
            .has_error());
}

TEST_F(StagedConfigTest, opaque_config_must_not_be_empty)
{
    auto const res =
        consensus_config.stage(GOVERNANCE_ADDRESS, OpaqueParams{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ConfigError::EmptyConfig);
}

TEST(ConfigValidation, epoch_and_randomness)
{
    auto const zero = validate_config(EpochParams{.interval_micros = 0}, {});
    ASSERT_TRUE(zero.has_error());
    EXPECT_EQ(zero.assume_error(), ConfigError::ZeroEpochInterval);

    EXPECT_FALSE(validate_config(RandomnessParams{}, {}).has_error());

    RandomnessParams v2{
        .variant = RandomnessVariant::V2,
        .secrecy_threshold = 3,
        .reconstruction_threshold = 2,
        .fast_path_secrecy_threshold = 0};
    auto const inverted = validate_config(v2, {});
    ASSERT_TRUE(inverted.has_error());
    EXPECT_EQ(inverted.assume_error(), ConfigError::InvalidRandomnessThresholds);

    v2.secrecy_threshold = 2;
    EXPECT_FALSE(validate_config(v2, {}).has_error());
    EXPECT_TRUE(v2.enabled());
}
