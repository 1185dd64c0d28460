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
#include <gravity/core/likely.h>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <algorithm>
#include <concepts>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

GRAVITY_ANONYMOUS_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;
using json = nlohmann::json;

Result<json const *> field(json const &obj, char const *const key)
{
    if (GRAVITY_UNLIKELY(!obj.is_object())) {
        LOG_ERROR("expected an object containing '{}'", key);
        return ChainParamsError::MissingField;
    }
    auto const it = obj.find(key);
    if (GRAVITY_UNLIKELY(it == obj.end())) {
        LOG_ERROR("missing field '{}'", key);
        return ChainParamsError::MissingField;
    }
    return &*it;
}

// amounts are decimal strings, small integers may also be plain numbers
template <class T>
Result<T> parse_uint(json const &value, char const *const key)
{
    if (value.is_number_unsigned()) {
        return T{value.get<uint64_t>()};
    }
    if (GRAVITY_UNLIKELY(!value.is_string())) {
        LOG_ERROR("field '{}' is not an amount", key);
        return ChainParamsError::InvalidAmount;
    }
    auto const &s = value.get_ref<std::string const &>();
    if (GRAVITY_UNLIKELY(
            s.empty() || !std::ranges::all_of(s, [](char const c) {
                return c >= '0' && c <= '9';
            }))) {
        LOG_ERROR("field '{}' is not a decimal amount: '{}'", key, s);
        return ChainParamsError::InvalidAmount;
    }
    try {
        auto const parsed = intx::from_string<uint256_t>(s);
        if constexpr (std::same_as<T, uint256_t>) {
            return parsed;
        }
        else {
            if (GRAVITY_UNLIKELY(
                    parsed > uint256_t{std::numeric_limits<T>::max()})) {
                LOG_ERROR("field '{}' is out of range: {}", key, s);
                return ChainParamsError::InvalidAmount;
            }
            return static_cast<T>(parsed);
        }
    }
    catch (std::out_of_range const &) {
        LOG_ERROR("field '{}' is out of range: {}", key, s);
        return ChainParamsError::InvalidAmount;
    }
}

template <class T>
Result<T> get_uint(json const &obj, char const *const key)
{
    BOOST_OUTCOME_TRY(auto const value, field(obj, key));
    return parse_uint<T>(*value, key);
}

template <class T>
Result<T> get_uint_or(json const &obj, char const *const key, T const fallback)
{
    if (!obj.contains(key)) {
        return fallback;
    }
    return get_uint<T>(obj, key);
}

Result<bool> get_bool_or(json const &obj, char const *const key, bool fallback)
{
    if (!obj.contains(key)) {
        return fallback;
    }
    auto const &value = obj.at(key);
    if (GRAVITY_UNLIKELY(!value.is_boolean())) {
        LOG_ERROR("field '{}' is not a boolean", key);
        return ChainParamsError::MissingField;
    }
    return value.get<bool>();
}

Result<std::string> get_string(json const &obj, char const *const key)
{
    BOOST_OUTCOME_TRY(auto const value, field(obj, key));
    if (GRAVITY_UNLIKELY(!value->is_string())) {
        LOG_ERROR("field '{}' is not a string", key);
        return ChainParamsError::MissingField;
    }
    return value->get<std::string>();
}

Result<Address> get_address(json const &obj, char const *const key)
{
    BOOST_OUTCOME_TRY(auto const s, get_string(obj, key));
    auto const address = evmc::from_hex<Address>(s);
    if (GRAVITY_UNLIKELY(!address.has_value())) {
        LOG_ERROR("field '{}' is not an address: '{}'", key, s);
        return ChainParamsError::InvalidAddress;
    }
    return *address;
}

Result<byte_string> get_hex(json const &obj, char const *const key)
{
    BOOST_OUTCOME_TRY(auto const s, get_string(obj, key));
    auto bytes = evmc::from_hex(s);
    if (GRAVITY_UNLIKELY(!bytes.has_value())) {
        LOG_ERROR("field '{}' is not hex", key);
        return ChainParamsError::InvalidHex;
    }
    return std::move(*bytes);
}

// multiaddr strings are carried verbatim
Result<byte_string> get_text_bytes(json const &obj, char const *const key)
{
    BOOST_OUTCOME_TRY(auto const s, get_string(obj, key));
    return byte_string{
        reinterpret_cast<unsigned char const *>(s.data()), s.size()};
}

Result<ValidatorParams> parse_validator_config(json const &obj)
{
    ValidatorParams p;
    BOOST_OUTCOME_TRY(p.minimum_bond, get_uint<uint256_t>(obj, "minimumBond"));
    BOOST_OUTCOME_TRY(p.maximum_bond, get_uint<uint256_t>(obj, "maximumBond"));
    BOOST_OUTCOME_TRY(
        p.unbonding_delay_micros,
        get_uint<uint64_t>(obj, "unbondingDelayMicros"));
    BOOST_OUTCOME_TRY(
        p.allow_validator_set_change,
        get_bool_or(obj, "allowValidatorSetChange", true));
    BOOST_OUTCOME_TRY(
        p.voting_power_increase_limit_pct,
        get_uint<uint64_t>(obj, "votingPowerIncreaseLimitPct"));
    BOOST_OUTCOME_TRY(
        p.max_validator_set_size,
        get_uint<uint64_t>(obj, "maxValidatorSetSize"));
    BOOST_OUTCOME_TRY(
        p.auto_evict_enabled, get_bool_or(obj, "autoEvictEnabled", false));
    BOOST_OUTCOME_TRY(
        p.auto_evict_threshold,
        get_uint_or<uint64_t>(obj, "autoEvictThreshold", 0));
    return p;
}

Result<StakingParams> parse_staking_config(json const &obj)
{
    StakingParams p;
    BOOST_OUTCOME_TRY(
        p.minimum_stake, get_uint<uint256_t>(obj, "minimumStake"));
    BOOST_OUTCOME_TRY(
        p.lockup_duration_micros,
        get_uint<uint64_t>(obj, "lockupDurationMicros"));
    BOOST_OUTCOME_TRY(
        p.unbonding_delay_micros,
        get_uint<uint64_t>(obj, "unbondingDelayMicros"));
    BOOST_OUTCOME_TRY(
        p.minimum_proposal_stake,
        get_uint<uint256_t>(obj, "minimumProposalStake"));
    return p;
}

Result<GovernanceParams> parse_governance_config(json const &obj)
{
    GovernanceParams p;
    BOOST_OUTCOME_TRY(
        p.min_voting_threshold,
        get_uint<uint128_t>(obj, "minVotingThreshold"));
    BOOST_OUTCOME_TRY(
        p.required_proposer_stake,
        get_uint<uint256_t>(obj, "requiredProposerStake"));
    BOOST_OUTCOME_TRY(
        p.voting_duration_micros,
        get_uint<uint64_t>(obj, "votingDurationMicros"));
    BOOST_OUTCOME_TRY(
        p.execution_delay_micros,
        get_uint<uint64_t>(obj, "executionDelayMicros"));
    BOOST_OUTCOME_TRY(
        p.execution_window_micros,
        get_uint<uint64_t>(obj, "executionWindowMicros"));
    return p;
}

Result<RandomnessParams> parse_randomness_config(json const &obj)
{
    RandomnessParams p;
    BOOST_OUTCOME_TRY(auto const variant, get_uint<uint64_t>(obj, "variant"));
    if (GRAVITY_UNLIKELY(variant > 1)) {
        LOG_ERROR("unknown randomness variant {}", variant);
        return ChainParamsError::InvalidAmount;
    }
    p.variant = static_cast<RandomnessVariant>(variant);
    BOOST_OUTCOME_TRY(auto const v2, field(obj, "configV2"));
    BOOST_OUTCOME_TRY(
        p.secrecy_threshold, get_uint<uint128_t>(*v2, "secrecyThreshold"));
    BOOST_OUTCOME_TRY(
        p.reconstruction_threshold,
        get_uint<uint128_t>(*v2, "reconstructionThreshold"));
    BOOST_OUTCOME_TRY(
        p.fast_path_secrecy_threshold,
        get_uint<uint128_t>(*v2, "fastPathSecrecyThreshold"));
    return p;
}

Result<GenesisValidator> parse_validator(json const &obj)
{
    GenesisValidator v;
    BOOST_OUTCOME_TRY(v.operator_address, get_address(obj, "operator"));
    BOOST_OUTCOME_TRY(v.owner, get_address(obj, "owner"));
    if (obj.contains("stakePool")) {
        BOOST_OUTCOME_TRY(v.pool, get_address(obj, "stakePool"));
    }
    else {
        v.pool = v.owner;
    }
    BOOST_OUTCOME_TRY(v.stake, get_uint<uint256_t>(obj, "stakeAmount"));
    BOOST_OUTCOME_TRY(v.moniker, get_string(obj, "moniker"));
    BOOST_OUTCOME_TRY(v.consensus_pubkey, get_hex(obj, "consensusPubkey"));
    BOOST_OUTCOME_TRY(v.consensus_pop, get_hex(obj, "consensusPop"));
    BOOST_OUTCOME_TRY(
        v.network_addresses, get_text_bytes(obj, "networkAddresses"));
    BOOST_OUTCOME_TRY(
        v.fullnode_addresses, get_text_bytes(obj, "fullnodeAddresses"));
    BOOST_OUTCOME_TRY(
        v.voting_power, get_uint_or<uint256_t>(obj, "votingPower", v.stake));
    return v;
}

GRAVITY_ANONYMOUS_NAMESPACE_END

GRAVITY_NAMESPACE_BEGIN

Result<ChainParams> parse_chain_params(std::string_view const json_text)
{
    auto const doc = json::parse(json_text, nullptr, false);
    if (GRAVITY_UNLIKELY(doc.is_discarded() || !doc.is_object())) {
        LOG_ERROR("chain params are not a json object");
        return ChainParamsError::InvalidJson;
    }

    ChainParams params;
    BOOST_OUTCOME_TRY(
        params.chain_id, get_uint_or<uint64_t>(doc, "chainId", 1337));
    BOOST_OUTCOME_TRY(
        params.genesis_time_us,
        get_uint_or<uint64_t>(doc, "genesisTimestampMicros", 0));

    BOOST_OUTCOME_TRY(auto const validator_config, field(doc, "validatorConfig"));
    BOOST_OUTCOME_TRY(
        params.validator, parse_validator_config(*validator_config));
    BOOST_OUTCOME_TRY(auto const staking_config, field(doc, "stakingConfig"));
    BOOST_OUTCOME_TRY(params.staking, parse_staking_config(*staking_config));
    BOOST_OUTCOME_TRY(
        auto const governance_config, field(doc, "governanceConfig"));
    BOOST_OUTCOME_TRY(
        params.governance, parse_governance_config(*governance_config));
    BOOST_OUTCOME_TRY(
        params.epoch.interval_micros,
        get_uint<uint64_t>(doc, "epochIntervalMicros"));
    BOOST_OUTCOME_TRY(
        params.version.major, get_uint<uint64_t>(doc, "majorVersion"));
    BOOST_OUTCOME_TRY(params.consensus.data, get_hex(doc, "consensusConfig"));
    BOOST_OUTCOME_TRY(params.execution.data, get_hex(doc, "executionConfig"));
    BOOST_OUTCOME_TRY(
        auto const randomness_config, field(doc, "randomnessConfig"));
    BOOST_OUTCOME_TRY(
        params.randomness, parse_randomness_config(*randomness_config));

    BOOST_OUTCOME_TRY(auto const validators, field(doc, "validators"));
    if (GRAVITY_UNLIKELY(!validators->is_array())) {
        LOG_ERROR("validators is not an array");
        return ChainParamsError::MissingField;
    }
    for (auto const &item : *validators) {
        BOOST_OUTCOME_TRY(auto v, parse_validator(item));
        params.validators.push_back(std::move(v));
    }
    return params;
}

Result<ChainParams> load_chain_params(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (GRAVITY_UNLIKELY(!in)) {
        LOG_ERROR("cannot open chain params {}", path.string());
        return ChainParamsError::FileNotFound;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_chain_params(buffer.str());
}

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<gravity::ChainParamsError>::mapping> const &
quick_status_code_from_enum<gravity::ChainParamsError>::value_mappings()
{
    using gravity::ChainParamsError;

    static std::initializer_list<mapping> const v = {
        {ChainParamsError::Success, "success", {errc::success}},
        {ChainParamsError::FileNotFound,
         "chain params file not found",
         {errc::no_such_file_or_directory}},
        {ChainParamsError::InvalidJson, "invalid json", {}},
        {ChainParamsError::MissingField, "missing or mistyped field", {}},
        {ChainParamsError::InvalidAmount, "invalid amount", {}},
        {ChainParamsError::InvalidAddress, "invalid address", {}},
        {ChainParamsError::InvalidHex, "invalid hex", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
