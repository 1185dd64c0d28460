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
#include <gravity/core/config.hpp>
#include <gravity/core/result.hpp>
#include <gravity/epoch/access_control.hpp>
#include <gravity/epoch/blocker.hpp>
#include <gravity/epoch/clock.hpp>
#include <gravity/epoch/dkg.hpp>
#include <gravity/epoch/epoch_state.hpp>
#include <gravity/epoch/event.hpp>
#include <gravity/epoch/performance_tracker.hpp>
#include <gravity/epoch/reconfiguration.hpp>
#include <gravity/epoch/staged_config.hpp>
#include <gravity/staking/stake_pool.hpp>
#include <gravity/staking/validator_registry.hpp>

GRAVITY_NAMESPACE_BEGIN

/// Owns and wires every component of the epoch core. Members are declared
/// in dependency order; the object is neither copyable nor movable since
/// components hold references to each other.
struct Runtime
{
    AccessControl access;
    EventLog events;
    EpochState epoch_state;
    Clock clock{access};

    EpochConfig epoch_config{"epoch", access, events};
    RandomnessConfig randomness_config{"randomness", access, events};
    ValidatorConfig validator_config{"validator", access, events};
    StakingConfig staking_config{"staking", access, events};
    GovernanceConfig governance_config{"governance", access, events};
    VersionConfig version_config{"version", access, events};
    ConsensusConfig consensus_config{"consensus", access, events};
    ExecutionConfig execution_config{"execution", access, events};

    staking::InMemoryStakePools stake_pools;
    staking::ValidatorRegistry validators{
        access, events, epoch_state, validator_config, stake_pools};
    PerformanceTracker performance{access};
    Dkg dkg{access, events, clock};
    Reconfiguration reconfiguration{
        access,
        events,
        clock,
        epoch_state,
        epoch_config,
        randomness_config,
        dkg,
        validators,
        performance,
        {&validator_config,
         &staking_config,
         &governance_config,
         &version_config,
         &epoch_config,
         &randomness_config,
         &consensus_config,
         &execution_config}};
    Blocker blocker{
        access,
        events,
        clock,
        performance,
        validators,
        reconfiguration,
        epoch_state};

    Runtime() = default;
    Runtime(Runtime const &) = delete;
    Runtime &operator=(Runtime const &) = delete;

    /// Bootstraps the chain from its genesis parameters. Must be called
    /// exactly once, before the first block.
    Result<void> genesis(ChainParams const &);
};

GRAVITY_NAMESPACE_END
