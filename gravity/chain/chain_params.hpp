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

#include <gravity/core/address.hpp>
#include <gravity/core/byte_string.hpp>
#include <gravity/core/config.hpp>
#include <gravity/core/int.hpp>
#include <gravity/core/result.hpp>
#include <gravity/core/status_code.hpp>
#include <gravity/epoch/params.hpp>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

GRAVITY_NAMESPACE_BEGIN

enum class ChainParamsError
{
    Success = 0,
    FileNotFound,
    InvalidJson,
    MissingField,
    InvalidAmount,
    InvalidAddress,
    InvalidHex,
};

struct GenesisValidator
{
    Address pool;
    Address operator_address;
    Address owner;
    uint256_t stake;
    std::string moniker;
    byte_string consensus_pubkey;
    byte_string consensus_pop;
    byte_string network_addresses;
    byte_string fullnode_addresses;
    uint256_t voting_power;
};

struct ChainParams
{
    uint64_t chain_id{1337};
    uint64_t genesis_time_us{0};
    ValidatorParams validator;
    StakingParams staking;
    GovernanceParams governance;
    EpochParams epoch;
    VersionParams version;
    OpaqueParams consensus;
    OpaqueParams execution;
    RandomnessParams randomness;
    std::vector<GenesisValidator> validators;
};

Result<ChainParams> parse_chain_params(std::string_view json_text);
Result<ChainParams> load_chain_params(std::filesystem::path const &);

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<gravity::ChainParamsError>
    : quick_status_code_from_enum_defaults<gravity::ChainParamsError>
{
    static constexpr auto const domain_name = "Chain Params Error";
    static constexpr auto const domain_uuid =
        "7b2e94d0-1c5a-4f68-b3e7-d8a0c46f5e21";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
