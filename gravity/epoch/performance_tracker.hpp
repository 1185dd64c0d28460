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

#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <vector>

GRAVITY_NAMESPACE_BEGIN

// Proposer index reported for blocks without a proposer
inline constexpr uint64_t NIL_PROPOSER_INDEX =
    std::numeric_limits<uint64_t>::max();

struct IndividualPerformance
{
    uint64_t successful_proposals{0};
    uint64_t failed_proposals{0};

    bool operator==(IndividualPerformance const &) const = default;
};

/// Proposal counters for the running epoch, indexed by active-set index.
/// Out-of-range indices are ignored so that a bad report can never make a
/// block fail.
class PerformanceTracker
{
    AccessControl &access_;
    std::vector<IndividualPerformance> validators_;
    bool initialized_{false};

public:
    explicit PerformanceTracker(AccessControl &);

    Result<void> initialize(Address const &caller, uint64_t num_validators);

    Result<void> update_statistics(
        Address const &caller, uint64_t proposer_index,
        std::span<uint64_t const> failed_proposer_indices);

    Result<void> on_new_epoch(Address const &caller, uint64_t num_validators);

    std::optional<IndividualPerformance>
    performance_of(uint64_t index) const noexcept;

    std::vector<IndividualPerformance> const &all_performances() const noexcept
    {
        return validators_;
    }

    uint64_t size() const noexcept
    {
        return validators_.size();
    }
};

GRAVITY_NAMESPACE_END
