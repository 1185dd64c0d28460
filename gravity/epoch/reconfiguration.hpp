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
#include <gravity/core/result.hpp>
#include <gravity/epoch/access_control.hpp>
#include <gravity/epoch/clock.hpp>
#include <gravity/epoch/dkg.hpp>
#include <gravity/epoch/epoch_error.hpp>
#include <gravity/epoch/epoch_state.hpp>
#include <gravity/epoch/event.hpp>
#include <gravity/epoch/performance_tracker.hpp>
#include <gravity/epoch/staged_config.hpp>
#include <gravity/epoch/validator_set.hpp>

#include <cstdint>
#include <vector>

GRAVITY_NAMESPACE_BEGIN

/// Epoch state machine.
///
/// Once per block the Blocker asks whether the running epoch should end.
/// With randomness off the reconfiguration is applied in the same call;
/// with randomness on a DKG session is started and the epoch stays open
/// until the consensus engine (or governance) finishes the transition.
///
/// Applying a reconfiguration commits every staged config, recomputes the
/// validator set against the ending epoch, resets the performance counters
/// and only then advances the epoch counter.
class Reconfiguration
{
    AccessControl &access_;
    EventLog &events_;
    Clock const &clock_;
    EpochState &state_;
    EpochConfig const &epoch_config_;
    RandomnessConfig const &randomness_config_;
    DkgCoordinator &dkg_;
    ValidatorSetManager &validators_;
    PerformanceTracker &performance_;
    // committed in this order at every epoch boundary
    std::vector<StagedConfigBase *> staged_configs_;

public:
    Reconfiguration(
        AccessControl &, EventLog &, Clock const &, EpochState &,
        EpochConfig const &, RandomnessConfig const &, DkgCoordinator &,
        ValidatorSetManager &, PerformanceTracker &,
        std::vector<StagedConfigBase *> staged_configs);

    Result<void> initialize(Address const &caller);

    /// Returns whether a transition was started (and, with randomness off,
    /// already applied).
    Result<bool> check_and_start_transition(Address const &caller);

    Result<void>
    finish_transition(Address const &caller, byte_string_view transcript);

    /// Starts a transition regardless of the epoch interval
    Result<void> governance_reconfigure(Address const &caller);

    uint64_t current_epoch() const noexcept
    {
        return state_.epoch;
    }

    uint64_t last_reconfiguration_time() const noexcept
    {
        return state_.last_reconfiguration_time_us;
    }

    bool is_transition_in_progress() const noexcept
    {
        return state_.is_transition_in_progress();
    }

    TransitionState transition_state() const noexcept
    {
        return state_.transition_state;
    }

    bool is_initialized() const noexcept
    {
        return state_.initialized;
    }

    bool interval_elapsed() const noexcept;
    bool can_transition() const noexcept;
    uint64_t remaining_time_seconds() const noexcept;

private:
    Address const &self() const noexcept
    {
        return access_.identity(Role::Reconfiguration);
    }

    void start_transition();
    void apply_reconfiguration();
};

GRAVITY_NAMESPACE_END
