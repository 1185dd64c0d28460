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

#include <gravity/chain/chain_params.hpp>
#include <gravity/chain/runtime.hpp>
#include <gravity/core/address.hpp>
#include <gravity/core/int.hpp>
#include <gravity/core/result.hpp>
#include <gravity/epoch/access_control.hpp>
#include <gravity/epoch/clock.hpp>
#include <gravity/epoch/performance_tracker.hpp>
#include <gravity/test/bls_keys.hpp>
#include <gravity/test/config.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

GRAVITY_TEST_NAMESPACE_BEGIN

inline constexpr uint64_t TWO_HOURS_US = 2 * 60 * 60 * MICROS_PER_SECOND;
inline constexpr uint64_t GENESIS_TIME_US = 1'700'000'000 * MICROS_PER_SECOND;

inline uint256_t const MIN_BOND{1'000};
inline uint256_t const MAX_BOND{1'000'000};

inline Address pool_of(uint64_t const i)
{
    return Address{0xB000 + i};
}

inline Address operator_of(uint64_t const i)
{
    return Address{0xC000 + i};
}

inline Address owner_of(uint64_t const i)
{
    return Address{0xD000 + i};
}

inline RandomnessParams randomness_v2()
{
    return RandomnessParams{
        .variant = RandomnessVariant::V2,
        .secrecy_threshold = 1,
        .reconstruction_threshold = 2,
        .fast_path_secrecy_threshold = 2};
}

inline ChainParams make_chain_params(
    std::vector<uint256_t> const &stakes, bool const randomness = false)
{
    ChainParams params;
    params.genesis_time_us = GENESIS_TIME_US;
    params.validator = ValidatorParams{
        .minimum_bond = MIN_BOND,
        .maximum_bond = MAX_BOND,
        .unbonding_delay_micros = 0,
        .allow_validator_set_change = true,
        .voting_power_increase_limit_pct = 50,
        .max_validator_set_size = 10,
        .auto_evict_enabled = false,
        .auto_evict_threshold = 0};
    params.epoch.interval_micros = TWO_HOURS_US;
    params.consensus.data = byte_string{0x01};
    params.execution.data = byte_string{0x02};
    if (randomness) {
        params.randomness = randomness_v2();
    }
    for (uint64_t i = 0; i < stakes.size(); ++i) {
        auto key = make_consensus_key(static_cast<uint8_t>(i + 1));
        params.validators.push_back(GenesisValidator{
            .pool = pool_of(i),
            .operator_address = operator_of(i),
            .owner = owner_of(i),
            .stake = stakes[i],
            .moniker = "validator-" + std::to_string(i),
            .consensus_pubkey = std::move(key.pubkey),
            .consensus_pop = std::move(key.pop),
            .network_addresses = {},
            .fullnode_addresses = {},
            .voting_power = stakes[i]});
    }
    return params;
}

class ChainFixture : public ::testing::Test
{
protected:
    std::unique_ptr<Runtime> rt = std::make_unique<Runtime>();
    Address const system = SYSTEM_CALLER;
    Address const governance = GOVERNANCE_ADDRESS;

    void genesis(std::vector<uint256_t> const &stakes, bool randomness = false)
    {
        auto const res = rt->genesis(make_chain_params(stakes, randomness));
        ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    }

    uint64_t now() const
    {
        return rt->clock.now_microseconds();
    }

    Result<void> block(
        uint64_t const proposer, uint64_t const timestamp_us,
        std::vector<uint64_t> const &failed = {})
    {
        return rt->blocker.on_block_start(
            system, proposer, failed, timestamp_us);
    }

    Result<void> block_after(uint64_t const delta_us, uint64_t proposer = 0)
    {
        return block(proposer, now() + delta_us);
    }

    // first block past the epoch interval
    Result<void> block_past_interval()
    {
        return block_after(
            rt->epoch_config.current().interval_micros + MICROS_PER_SECOND);
    }
};

GRAVITY_TEST_NAMESPACE_END
