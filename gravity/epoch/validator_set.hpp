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
#include <gravity/core/result.hpp>

#include <cstdint>
#include <optional>
#include <vector>

GRAVITY_NAMESPACE_BEGIN

// Consensus-facing projection of an active validator.
struct ValidatorConsensusInfo
{
    Address validator;
    byte_string consensus_pubkey;
    byte_string consensus_pop;
    uint256_t voting_power;
    uint64_t validator_index;
    byte_string network_addresses;
    byte_string fullnode_addresses;

    bool operator==(ValidatorConsensusInfo const &) const = default;
};

/// What the epoch state machine needs from the validator registry.
class ValidatorSetManager
{
public:
    virtual ~ValidatorSetManager() = default;

    /// Active set of the running epoch, ordered by index.
    virtual std::vector<ValidatorConsensusInfo>
    current_consensus_infos() const = 0;

    /// Active set the next epoch boundary would produce. Pure projection.
    virtual std::vector<ValidatorConsensusInfo>
    next_consensus_infos() const = 0;

    virtual std::optional<ValidatorConsensusInfo>
    active_validator_at(uint64_t index) const = 0;

    virtual uint64_t active_count() const noexcept = 0;

    virtual Result<void> on_new_epoch(Address const &caller) = 0;
};

GRAVITY_NAMESPACE_END
