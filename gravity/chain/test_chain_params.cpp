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

#include <gravity/chain/chain_params.hpp>
#include <gravity/core/address.hpp>
#include <gravity/core/byte_string.hpp>
#include <gravity/core/int.hpp>
#include <gravity/epoch/params.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace gravity;
using json = nlohmann::json;

namespace
{
    json valid_params()
    {
        return json::parse(R"({
            "chainId": 7,
            "genesisTimestampMicros": 1700000000000000,
            "validatorConfig": {
                "minimumBond": "1000",
                "maximumBond": "1000000000000000000000000",
                "unbondingDelayMicros": 600000000,
                "votingPowerIncreaseLimitPct": 20,
                "maxValidatorSetSize": "100"
            },
            "stakingConfig": {
                "minimumStake": "1",
                "lockupDurationMicros": 1000,
                "unbondingDelayMicros": 1000,
                "minimumProposalStake": "10"
            },
            "governanceConfig": {
                "minVotingThreshold": "500",
                "requiredProposerStake": "10",
                "votingDurationMicros": 1000,
                "executionDelayMicros": 1000,
                "executionWindowMicros": 1000
            },
            "epochIntervalMicros": 7200000000,
            "majorVersion": 2,
            "consensusConfig": "0x0102",
            "executionConfig": "0x03",
            "randomnessConfig": {
                "variant": 1,
                "configV2": {
                    "secrecyThreshold": "1",
                    "reconstructionThreshold": "2",
                    "fastPathSecrecyThreshold": "3"
                }
            },
            "validators": [
                {
                    "operator": "0x0000000000000000000000000000000000001001",
                    "owner": "0x0000000000000000000000000000000000002001",
                    "stakeAmount": "5000",
                    "moniker": "alice",
                    "consensusPubkey": "0xaa",
                    "consensusPop": "0xbb",
                    "networkAddresses": "/ip4/127.0.0.1/tcp/2024",
                    "fullnodeAddresses": ""
                },
                {
                    "operator": "0x0000000000000000000000000000000000001002",
                    "owner": "0x0000000000000000000000000000000000002002",
                    "stakePool": "0x0000000000000000000000000000000000003002",
                    "stakeAmount": 6000,
                    "moniker": "bob",
                    "consensusPubkey": "0xcc",
                    "consensusPop": "0xdd",
                    "networkAddresses": "",
                    "fullnodeAddresses": "",
                    "votingPower": "4000"
                }
            ]
        })");
    }

    void expect_error(json const &doc, ChainParamsError const expected)
    {
        auto const res = parse_chain_params(doc.dump());
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), expected);
    }
}

TEST(ChainParams, parse)
{
    auto const res = parse_chain_params(valid_params().dump());
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    auto const &params = res.value();

    EXPECT_EQ(params.chain_id, 7);
    EXPECT_EQ(params.genesis_time_us, 1'700'000'000'000'000);
    EXPECT_EQ(params.validator.minimum_bond, 1000);
    EXPECT_EQ(
        params.validator.maximum_bond,
        intx::from_string<uint256_t>("1000000000000000000000000"));
    EXPECT_TRUE(params.validator.allow_validator_set_change);
    EXPECT_FALSE(params.validator.auto_evict_enabled);
    EXPECT_EQ(params.validator.max_validator_set_size, 100);
    EXPECT_EQ(params.governance.min_voting_threshold, 500);
    EXPECT_EQ(params.epoch.interval_micros, 7'200'000'000);
    EXPECT_EQ(params.version.major, 2);
    EXPECT_EQ(params.consensus.data, (byte_string{0x01, 0x02}));
    EXPECT_EQ(params.execution.data, byte_string{0x03});
    EXPECT_EQ(params.randomness.variant, RandomnessVariant::V2);
    EXPECT_EQ(params.randomness.fast_path_secrecy_threshold, 3);

    ASSERT_EQ(params.validators.size(), 2u);
    auto const &alice = params.validators[0];
    EXPECT_EQ(alice.operator_address, Address{0x1001});
    // without an explicit stake pool the owner is used
    EXPECT_EQ(alice.pool, Address{0x2001});
    EXPECT_EQ(alice.stake, 5000);
    EXPECT_EQ(alice.voting_power, 5000);
    EXPECT_EQ(alice.moniker, "alice");
    EXPECT_EQ(alice.consensus_pubkey, byte_string{0xaa});
    std::string const multiaddr = "/ip4/127.0.0.1/tcp/2024";
    EXPECT_EQ(alice.network_addresses, to_byte_string_view(multiaddr));
    EXPECT_TRUE(alice.fullnode_addresses.empty());

    auto const &bob = params.validators[1];
    EXPECT_EQ(bob.pool, Address{0x3002});
    EXPECT_EQ(bob.stake, 6000);
    EXPECT_EQ(bob.voting_power, 4000);
}

TEST(ChainParams, defaults)
{
    auto doc = valid_params();
    doc.erase("chainId");
    doc.erase("genesisTimestampMicros");
    auto const res = parse_chain_params(doc.dump());
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().chain_id, 1337);
    EXPECT_EQ(res.value().genesis_time_us, 0);
}

TEST(ChainParams, invalid_json)
{
    auto res = parse_chain_params("{ not json");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ChainParamsError::InvalidJson);

    res = parse_chain_params("[1, 2, 3]");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ChainParamsError::InvalidJson);
}

TEST(ChainParams, missing_fields)
{
    auto doc = valid_params();
    doc.erase("validatorConfig");
    expect_error(doc, ChainParamsError::MissingField);

    doc = valid_params();
    doc["randomnessConfig"].erase("configV2");
    expect_error(doc, ChainParamsError::MissingField);

    doc = valid_params();
    doc["validators"][1].erase("moniker");
    expect_error(doc, ChainParamsError::MissingField);

    doc = valid_params();
    doc["validators"] = "none";
    expect_error(doc, ChainParamsError::MissingField);
}

TEST(ChainParams, invalid_amounts)
{
    auto doc = valid_params();
    doc["validatorConfig"]["minimumBond"] = "12a";
    expect_error(doc, ChainParamsError::InvalidAmount);

    doc = valid_params();
    doc["validators"][0]["stakeAmount"] = -5;
    expect_error(doc, ChainParamsError::InvalidAmount);

    doc = valid_params();
    doc["epochIntervalMicros"] = "18446744073709551616";
    expect_error(doc, ChainParamsError::InvalidAmount);

    doc = valid_params();
    doc["validators"][0]["stakeAmount"] = std::string(80, '9');
    expect_error(doc, ChainParamsError::InvalidAmount);

    doc = valid_params();
    doc["randomnessConfig"]["variant"] = 2;
    expect_error(doc, ChainParamsError::InvalidAmount);
}

TEST(ChainParams, invalid_encodings)
{
    auto doc = valid_params();
    doc["validators"][0]["operator"] = "0xzz";
    expect_error(doc, ChainParamsError::InvalidAddress);

    doc = valid_params();
    doc["consensusConfig"] = "0xzz";
    expect_error(doc, ChainParamsError::InvalidHex);

    doc = valid_params();
    doc["validators"][1]["consensusPop"] = "not hex";
    expect_error(doc, ChainParamsError::InvalidHex);
}

TEST(ChainParams, file_not_found)
{
    auto const res = load_chain_params("/nonexistent/gravity/genesis.json");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ChainParamsError::FileNotFound);
}
