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
#include <gravity/core/config.hpp>
#include <gravity/core/result.hpp>
#include <gravity/epoch/access_control.hpp>
#include <gravity/epoch/clock.hpp>
#include <gravity/epoch/epoch_error.hpp>
#include <gravity/epoch/epoch_state.hpp>
#include <gravity/epoch/event.hpp>
#include <gravity/epoch/performance_tracker.hpp>
#include <gravity/epoch/reconfiguration.hpp>
#include <gravity/epoch/validator_set.hpp>

#include <cstdint>
#include <span>

GRAVITY_NAMESPACE_BEGIN

/// Block prologue. Invoked by the system caller once per block, before any
/// user transaction, and drives the performance counters, the clock and the
/// epoch state machine in that order.
class Blocker
{
    AccessControl &access_;
    EventLog &events_;
    Clock &clock_;
    PerformanceTracker &performance_;
    ValidatorSetManager const &validators_;
    Reconfiguration &reconfiguration_;
    EpochState const &state_;
    uint64_t block_number_{0};
    bool initialized_{false};

public:
    Blocker(
        AccessControl &, EventLog &, Clock &, PerformanceTracker &,
        ValidatorSetManager const &, Reconfiguration &, EpochState const &);

    Result<void> initialize(Address const &caller);

    Result<void> on_block_start(
        Address const &caller, uint64_t proposer_index,
        std::span<uint64_t const> failed_proposer_indices,
        uint64_t timestamp_us);

    uint64_t block_number() const noexcept
    {
        return block_number_;
    }

    /// Identity credited with a block: the system caller for NIL blocks,
    /// otherwise the active validator at the given index
    Result<Address> resolve_proposer(uint64_t proposer_index) const;

private:
    Address const &self() const noexcept
    {
        return access_.identity(Role::Blocker);
    }
};

GRAVITY_NAMESPACE_END
