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

#include <gravity/core/likely.h>
#include <gravity/epoch/epoch_error.hpp>
#include <gravity/epoch/performance_tracker.hpp>

#include <quill/Quill.h>

GRAVITY_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

PerformanceTracker::PerformanceTracker(AccessControl &access)
    : access_{access}
{
}

Result<void> PerformanceTracker::initialize(
    Address const &caller, uint64_t const num_validators)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Genesis));
    if (GRAVITY_UNLIKELY(initialized_)) {
        return ReconfigurationError::AlreadyInitialized;
    }
    validators_.assign(num_validators, IndividualPerformance{});
    initialized_ = true;
    return success();
}

Result<void> PerformanceTracker::update_statistics(
    Address const &caller, uint64_t const proposer_index,
    std::span<uint64_t const> const failed_proposer_indices)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Blocker));

    if (proposer_index != NIL_PROPOSER_INDEX) {
        if (GRAVITY_LIKELY(proposer_index < validators_.size())) {
            ++validators_[proposer_index].successful_proposals;
        }
        else {
            LOG_WARNING(
                "ignoring proposer index {}, {} validators",
                proposer_index,
                validators_.size());
        }
    }

    for (uint64_t const index : failed_proposer_indices) {
        if (GRAVITY_LIKELY(index < validators_.size())) {
            ++validators_[index].failed_proposals;
        }
        else {
            LOG_WARNING(
                "ignoring failed proposer index {}, {} validators",
                index,
                validators_.size());
        }
    }
    return success();
}

Result<void> PerformanceTracker::on_new_epoch(
    Address const &caller, uint64_t const num_validators)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Reconfiguration));
    validators_.assign(num_validators, IndividualPerformance{});
    return success();
}

std::optional<IndividualPerformance>
PerformanceTracker::performance_of(uint64_t const index) const noexcept
{
    if (index >= validators_.size()) {
        return std::nullopt;
    }
    return validators_[index];
}

GRAVITY_NAMESPACE_END
