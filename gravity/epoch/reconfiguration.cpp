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

#include <gravity/core/assert.h>
#include <gravity/core/likely.h>
#include <gravity/epoch/reconfiguration.hpp>

#include <quill/Quill.h>

#include <utility>

GRAVITY_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

Reconfiguration::Reconfiguration(
    AccessControl &access, EventLog &events, Clock const &clock,
    EpochState &state, EpochConfig const &epoch_config,
    RandomnessConfig const &randomness_config, DkgCoordinator &dkg,
    ValidatorSetManager &validators, PerformanceTracker &performance,
    std::vector<StagedConfigBase *> staged_configs)
    : access_{access}
    , events_{events}
    , clock_{clock}
    , state_{state}
    , epoch_config_{epoch_config}
    , randomness_config_{randomness_config}
    , dkg_{dkg}
    , validators_{validators}
    , performance_{performance}
    , staged_configs_{std::move(staged_configs)}
{
}

Result<void> Reconfiguration::initialize(Address const &caller)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Genesis));
    if (GRAVITY_UNLIKELY(state_.initialized)) {
        return ReconfigurationError::AlreadyInitialized;
    }
    state_ = EpochState{
        .epoch = 0,
        .last_reconfiguration_time_us = clock_.now_microseconds(),
        .transition_state = TransitionState::Idle,
        .transition_started_at_epoch = 0,
        .initialized = true};
    LOG_INFO(
        "epoch state initialized at {}us, interval {}us",
        state_.last_reconfiguration_time_us,
        epoch_config_.current().interval_micros);
    return success();
}

bool Reconfiguration::interval_elapsed() const noexcept
{
    // saturating: a huge interval must not wrap around
    uint64_t const interval = epoch_config_.current().interval_micros;
    uint64_t const now = clock_.now_microseconds();
    return now >= state_.last_reconfiguration_time_us &&
           now - state_.last_reconfiguration_time_us >= interval;
}

bool Reconfiguration::can_transition() const noexcept
{
    return state_.initialized && !state_.is_transition_in_progress() &&
           interval_elapsed();
}

uint64_t Reconfiguration::remaining_time_seconds() const noexcept
{
    if (interval_elapsed()) {
        return 0;
    }
    uint64_t const interval = epoch_config_.current().interval_micros;
    uint64_t const elapsed =
        clock_.now_microseconds() - state_.last_reconfiguration_time_us;
    return (interval - elapsed) / MICROS_PER_SECOND;
}

Result<bool> Reconfiguration::check_and_start_transition(Address const &caller)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Blocker));
    if (GRAVITY_UNLIKELY(!state_.initialized)) {
        return ReconfigurationError::NotInitialized;
    }
    if (state_.is_transition_in_progress() || !interval_elapsed()) {
        return false;
    }
    start_transition();
    return true;
}

Result<void> Reconfiguration::finish_transition(
    Address const &caller, byte_string_view const transcript)
{
    BOOST_OUTCOME_TRY(
        access_.check_any(caller, {Role::System, Role::Governance}));
    if (GRAVITY_UNLIKELY(!state_.initialized)) {
        return ReconfigurationError::NotInitialized;
    }
    if (GRAVITY_UNLIKELY(!state_.is_transition_in_progress())) {
        return ReconfigurationError::NoTransitionInProgress;
    }

    if (!transcript.empty()) {
        if (auto const res = dkg_.finish(self(), transcript);
            GRAVITY_UNLIKELY(res.has_error())) {
            LOG_ERROR(
                "failed to finish dkg session of epoch {}: {}",
                state_.transition_started_at_epoch,
                res.error().message().c_str());
        }
    }
    auto const cleared = dkg_.discard_stale(self());
    GRAVITY_ASSERT(cleared.has_value());

    apply_reconfiguration();
    return success();
}

Result<void> Reconfiguration::governance_reconfigure(Address const &caller)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Governance));
    if (GRAVITY_UNLIKELY(!state_.initialized)) {
        return ReconfigurationError::NotInitialized;
    }
    if (GRAVITY_UNLIKELY(state_.is_transition_in_progress())) {
        return ReconfigurationError::TransitionInProgress;
    }
    LOG_WARNING(
        "governance forced reconfiguration at epoch {}", state_.epoch);
    start_transition();
    return success();
}

void Reconfiguration::start_transition()
{
    RandomnessParams const &randomness = randomness_config_.current();
    if (!randomness.enabled()) {
        apply_reconfiguration();
        return;
    }

    auto dealers = validators_.current_consensus_infos();
    auto targets = validators_.next_consensus_infos();

    auto const cleared = dkg_.discard_stale(self());
    GRAVITY_ASSERT(cleared.has_value());
    auto const started = dkg_.start(
        self(), state_.epoch, randomness, std::move(dealers),
        std::move(targets));
    GRAVITY_ASSERT(started.has_value());

    state_.transition_state = TransitionState::DkgInProgress;
    state_.transition_started_at_epoch = state_.epoch;
    LOG_INFO("epoch {} transition started, waiting for dkg", state_.epoch);
    events_.emit(EpochTransitionStartedEvent{.epoch = state_.epoch});
}

void Reconfiguration::apply_reconfiguration()
{
    for (StagedConfigBase *const config : staged_configs_) {
        auto const committed = config->commit(self());
        GRAVITY_ASSERT(committed.has_value());
    }

    auto const updated = validators_.on_new_epoch(self());
    GRAVITY_ASSERT(updated.has_value());
    auto const reset =
        performance_.on_new_epoch(self(), validators_.active_count());
    GRAVITY_ASSERT(reset.has_value());

    ++state_.epoch;
    state_.last_reconfiguration_time_us = clock_.now_microseconds();
    state_.transition_state = TransitionState::Idle;

    LOG_INFO(
        "new epoch {} at {}us with {} validators",
        state_.epoch,
        state_.last_reconfiguration_time_us,
        validators_.active_count());
    events_.emit(NewEpochEvent{
        .epoch = state_.epoch,
        .timestamp_us = state_.last_reconfiguration_time_us});
}

GRAVITY_NAMESPACE_END
