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

#include <gravity/epoch/event.hpp>

#include <quill/Quill.h>

#include <concepts>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

GRAVITY_NAMESPACE_BEGIN

std::string_view event_name(Event const &event)
{
    return std::visit(
        [](auto const &e) -> std::string_view {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::same_as<T, NewBlockEvent>) {
                return "NewBlock";
            }
            else if constexpr (std::same_as<T, NewEpochEvent>) {
                return "NewEpoch";
            }
            else if constexpr (std::same_as<T, EpochTransitionStartedEvent>) {
                return "EpochTransitionStarted";
            }
            else if constexpr (std::same_as<T, DkgStartedEvent>) {
                return "DkgStarted";
            }
            else if constexpr (std::same_as<T, DkgCompletedEvent>) {
                return "DkgCompleted";
            }
            else if constexpr (std::same_as<T, DkgSessionClearedEvent>) {
                return "DkgSessionCleared";
            }
            else if constexpr (std::same_as<T, ValidatorRegisteredEvent>) {
                return "ValidatorRegistered";
            }
            else if constexpr (std::same_as<T, ValidatorJoinRequestedEvent>) {
                return "ValidatorJoinRequested";
            }
            else if constexpr (std::same_as<T, ValidatorLeaveRequestedEvent>) {
                return "ValidatorLeaveRequested";
            }
            else if constexpr (std::same_as<T, ValidatorActivatedEvent>) {
                return "ValidatorActivated";
            }
            else if constexpr (std::same_as<T, ValidatorDeactivatedEvent>) {
                return "ValidatorDeactivated";
            }
            else if constexpr (std::same_as<T, ConsensusKeyRotatedEvent>) {
                return "ConsensusKeyRotated";
            }
            else if constexpr (std::same_as<T, FeeRecipientUpdatedEvent>) {
                return "FeeRecipientUpdated";
            }
            else if constexpr (std::same_as<
                                   T,
                                   NetworkAddressesUpdatedEvent>) {
                return "NetworkAddressesUpdated";
            }
            else if constexpr (std::same_as<T, ValidatorEvictedEvent>) {
                return "ValidatorEvicted";
            }
            else if constexpr (std::same_as<
                                   T,
                                   PerformanceSnapshotMismatchEvent>) {
                return "PerformanceSnapshotMismatch";
            }
            else {
                static_assert(std::same_as<T, ConfigStagedEvent>);
                return "ConfigStaged";
            }
        },
        event);
}

void EventLog::emit(Event event)
{
    LOG_DEBUG("event #{} {}", events_.size(), event_name(event));
    events_.push_back(std::move(event));
}

GRAVITY_NAMESPACE_END
