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
#include <gravity/core/int.hpp>
#include <gravity/staking/config.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

GRAVITY_STAKING_NAMESPACE_BEGIN

inline constexpr size_t MAX_MONIKER_LENGTH = 31;

enum class ValidatorStatus : uint8_t
{
    Inactive = 0,
    PendingActive,
    Active,
    PendingInactive,
};

constexpr std::string_view validator_status_name(ValidatorStatus const s)
{
    switch (s) {
    case ValidatorStatus::Inactive:
        return "inactive";
    case ValidatorStatus::PendingActive:
        return "pending_active";
    case ValidatorStatus::Active:
        return "active";
    case ValidatorStatus::PendingInactive:
        return "pending_inactive";
    }
    return "unknown";
}

// A validator never leaves the active set before an epoch boundary, so
// PENDING_INACTIVE still counts as active for consensus.
constexpr bool is_in_active_set(ValidatorStatus const s)
{
    return s == ValidatorStatus::Active || s == ValidatorStatus::PendingInactive;
}

struct ValidatorRecord
{
    Address pool;
    std::string moniker;
    byte_string consensus_pubkey;
    byte_string consensus_pop;
    byte_string network_addresses;
    byte_string fullnode_addresses;
    Address fee_recipient;
    std::optional<Address> pending_fee_recipient;
    ValidatorStatus status{ValidatorStatus::Inactive};
    // only meaningful while in the active set
    std::optional<uint64_t> index;
    uint256_t voting_power{0};
    uint64_t registered_at_epoch{0};
};

struct RegisterValidatorParams
{
    Address pool;
    byte_string consensus_pubkey;
    byte_string consensus_pop;
    std::string moniker;
    byte_string network_addresses;
    byte_string fullnode_addresses;
    Address fee_recipient;
    // genesis only; capped at the maximum bond. Later epochs derive power
    // from the bonded stake.
    std::optional<uint256_t> initial_voting_power{};
};

GRAVITY_STAKING_NAMESPACE_END
