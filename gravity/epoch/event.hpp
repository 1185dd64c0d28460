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
#include <gravity/epoch/params.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

GRAVITY_NAMESPACE_BEGIN

struct NewBlockEvent
{
    uint64_t height;
    uint64_t epoch;
    Address proposer;
    uint64_t timestamp_us;
};

struct NewEpochEvent
{
    uint64_t epoch;
    uint64_t timestamp_us;
};

struct EpochTransitionStartedEvent
{
    uint64_t epoch;
};

struct DkgStartedEvent
{
    uint64_t dealer_epoch;
    RandomnessParams config;
    uint64_t dealer_count;
    uint64_t target_count;
    uint64_t start_time_us;
};

struct DkgCompletedEvent
{
    uint64_t dealer_epoch;
    byte_string transcript;
};

struct DkgSessionClearedEvent
{
    uint64_t dealer_epoch;
};

struct ValidatorRegisteredEvent
{
    Address pool;
    Address operator_address;
    std::string moniker;
};

struct ValidatorJoinRequestedEvent
{
    Address pool;
    uint64_t epoch;
};

struct ValidatorLeaveRequestedEvent
{
    Address pool;
    uint64_t epoch;
    bool forced;
};

struct ValidatorActivatedEvent
{
    Address pool;
    uint64_t index;
    uint256_t voting_power;
    uint64_t epoch;
};

struct ValidatorDeactivatedEvent
{
    Address pool;
    uint64_t epoch;
};

struct ConsensusKeyRotatedEvent
{
    Address pool;
    byte_string consensus_pubkey;
};

struct FeeRecipientUpdatedEvent
{
    Address pool;
    Address fee_recipient;
    bool applied;
};

struct NetworkAddressesUpdatedEvent
{
    Address pool;
};

struct ValidatorEvictedEvent
{
    Address pool;
    uint64_t successful_proposals;
};

struct PerformanceSnapshotMismatchEvent
{
    uint64_t snapshot_length;
    uint64_t active_count;
};

struct ConfigStagedEvent
{
    std::string_view config;
};

using Event = std::variant<
    NewBlockEvent, NewEpochEvent, EpochTransitionStartedEvent,
    DkgStartedEvent, DkgCompletedEvent, DkgSessionClearedEvent,
    ValidatorRegisteredEvent, ValidatorJoinRequestedEvent,
    ValidatorLeaveRequestedEvent, ValidatorActivatedEvent,
    ValidatorDeactivatedEvent, ConsensusKeyRotatedEvent,
    FeeRecipientUpdatedEvent, NetworkAddressesUpdatedEvent,
    ValidatorEvictedEvent, PerformanceSnapshotMismatchEvent,
    ConfigStagedEvent>;

std::string_view event_name(Event const &);

/// Append-only notification sink shared by every component.
class EventLog
{
    std::vector<Event> events_;

public:
    void emit(Event);

    std::vector<Event> const &events() const noexcept
    {
        return events_;
    }

    template <class T>
    std::vector<T> events_of() const
    {
        std::vector<T> out;
        for (auto const &e : events_) {
            if (auto const *const p = std::get_if<T>(&e)) {
                out.push_back(*p);
            }
        }
        return out;
    }

    template <class T>
    size_t count() const
    {
        size_t n = 0;
        for (auto const &e : events_) {
            n += std::holds_alternative<T>(e) ? 1 : 0;
        }
        return n;
    }

    size_t size() const noexcept
    {
        return events_.size();
    }

    void clear() noexcept
    {
        events_.clear();
    }
};

GRAVITY_NAMESPACE_END
