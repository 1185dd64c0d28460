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

#include <gravity/chain/runtime.hpp>
#include <gravity/core/fmt/int_fmt.hpp>

#include <quill/Quill.h>

#include <vector>

GRAVITY_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

Result<void> Runtime::genesis(ChainParams const &params)
{
    Address const &caller = access.identity(Role::Genesis);

    BOOST_OUTCOME_TRY(clock.initialize(caller, params.genesis_time_us));
    BOOST_OUTCOME_TRY(epoch_config.initialize(caller, params.epoch));
    BOOST_OUTCOME_TRY(randomness_config.initialize(caller, params.randomness));
    BOOST_OUTCOME_TRY(validator_config.initialize(caller, params.validator));
    BOOST_OUTCOME_TRY(staking_config.initialize(caller, params.staking));
    BOOST_OUTCOME_TRY(governance_config.initialize(caller, params.governance));
    BOOST_OUTCOME_TRY(version_config.initialize(caller, params.version));
    BOOST_OUTCOME_TRY(consensus_config.initialize(caller, params.consensus));
    BOOST_OUTCOME_TRY(execution_config.initialize(caller, params.execution));

    std::vector<staking::RegisterValidatorParams> initial;
    initial.reserve(params.validators.size());
    for (auto const &v : params.validators) {
        BOOST_OUTCOME_TRY(stake_pools.create_pool(
            v.pool,
            staking::StakePoolInfo{
                .owner = v.owner,
                .operator_address = v.operator_address,
                .stake = v.stake}));
        initial.push_back(staking::RegisterValidatorParams{
            .pool = v.pool,
            .consensus_pubkey = v.consensus_pubkey,
            .consensus_pop = v.consensus_pop,
            .moniker = v.moniker,
            .network_addresses = v.network_addresses,
            .fullnode_addresses = v.fullnode_addresses,
            .fee_recipient = v.owner,
            .initial_voting_power = v.voting_power});
    }
    BOOST_OUTCOME_TRY(validators.initialize_genesis(caller, initial));
    BOOST_OUTCOME_TRY(performance.initialize(caller, validators.active_count()));
    BOOST_OUTCOME_TRY(reconfiguration.initialize(caller));
    BOOST_OUTCOME_TRY(blocker.initialize(caller));

    LOG_INFO(
        "genesis for chain {}: {} validators, total voting power {}, epoch "
        "interval {}us, randomness {}",
        params.chain_id,
        validators.active_count(),
        validators.total_voting_power(),
        epoch_config.current().interval_micros,
        randomness_variant_name(randomness_config.current().variant));
    return success();
}

GRAVITY_NAMESPACE_END
