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
#include <gravity/core/fmt/address_fmt.hpp>
#include <gravity/core/likely.h>
#include <gravity/epoch/blocker.hpp>

#include <quill/Quill.h>

GRAVITY_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

Blocker::Blocker(
    AccessControl &access, EventLog &events, Clock &clock,
    PerformanceTracker &performance, ValidatorSetManager const &validators,
    Reconfiguration &reconfiguration, EpochState const &state)
    : access_{access}
    , events_{events}
    , clock_{clock}
    , performance_{performance}
    , validators_{validators}
    , reconfiguration_{reconfiguration}
    , state_{state}
{
}

Result<void> Blocker::initialize(Address const &caller)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Genesis));
    if (GRAVITY_UNLIKELY(initialized_)) {
        return ReconfigurationError::AlreadyInitialized;
    }
    initialized_ = true;
    block_number_ = 0;
    events_.emit(NewBlockEvent{
        .height = 0,
        .epoch = state_.epoch,
        .proposer = access_.identity(Role::System),
        .timestamp_us = clock_.now_microseconds()});
    return success();
}

Result<Address> Blocker::resolve_proposer(uint64_t const proposer_index) const
{
    if (proposer_index == NIL_PROPOSER_INDEX) {
        return access_.identity(Role::System);
    }
    auto const info = validators_.active_validator_at(proposer_index);
    if (GRAVITY_UNLIKELY(!info.has_value())) {
        return BlockError::ProposerNotInSet;
    }
    return info->validator;
}

Result<void> Blocker::on_block_start(
    Address const &caller, uint64_t const proposer_index,
    std::span<uint64_t const> const failed_proposer_indices,
    uint64_t const timestamp_us)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::System));
    if (GRAVITY_UNLIKELY(!initialized_ || !state_.initialized)) {
        return ReconfigurationError::NotInitialized;
    }
    BOOST_OUTCOME_TRY(auto const proposer, resolve_proposer(proposer_index));
    BOOST_OUTCOME_TRY(clock_.validate_advance(proposer, timestamp_us));

    auto const updated = performance_.update_statistics(
        self(), proposer_index, failed_proposer_indices);
    GRAVITY_ASSERT(updated.has_value());
    auto const advanced = clock_.advance(self(), proposer, timestamp_us);
    GRAVITY_ASSERT(advanced.has_value());
    auto const transition =
        reconfiguration_.check_and_start_transition(self());
    GRAVITY_ASSERT(transition.has_value());

    ++block_number_;
    LOG_DEBUG(
        "block {} epoch {} proposer {} at {}us",
        block_number_,
        state_.epoch,
        proposer,
        timestamp_us);
    events_.emit(NewBlockEvent{
        .height = block_number_,
        .epoch = state_.epoch,
        .proposer = proposer,
        .timestamp_us = timestamp_us});
    return success();
}

GRAVITY_NAMESPACE_END
