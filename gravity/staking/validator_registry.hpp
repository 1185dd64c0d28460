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
#include <gravity/core/result.hpp>
#include <gravity/epoch/access_control.hpp>
#include <gravity/epoch/epoch_state.hpp>
#include <gravity/epoch/event.hpp>
#include <gravity/epoch/performance_tracker.hpp>
#include <gravity/epoch/staged_config.hpp>
#include <gravity/epoch/validator_set.hpp>
#include <gravity/staking/config.hpp>
#include <gravity/staking/stake_pool.hpp>
#include <gravity/staking/validator.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

GRAVITY_STAKING_NAMESPACE_BEGIN

/// Owns validator identity and status and computes the active set.
///
/// Requests from operators and governance only move validators between the
/// pending lists; the active set itself changes exclusively in
/// on_new_epoch(), which rebuilds it from scratch with contiguous indices.
/// Records are never deleted.
class ValidatorRegistry final : public ValidatorSetManager
{
    struct EpochPlan
    {
        // record ids, in index order
        std::vector<size_t> active;
        std::vector<uint256_t> voting_powers;
        std::vector<size_t> activated;
        std::vector<size_t> deactivated;
        std::vector<size_t> still_pending;
    };

    AccessControl &access_;
    EventLog &events_;
    EpochState const &epoch_;
    ValidatorConfig const &config_;
    StakePoolView const &pools_;

    std::vector<ValidatorRecord> records_;
    std::unordered_map<Address, size_t> by_pool_;
    std::map<byte_string, size_t> by_consensus_key_;

    std::vector<size_t> active_;
    std::vector<size_t> pending_active_;
    std::vector<size_t> pending_inactive_;

    std::vector<ValidatorConsensusInfo> current_infos_;
    uint256_t total_voting_power_{0};
    bool genesis_done_{false};

public:
    ValidatorRegistry(
        AccessControl &, EventLog &, EpochState const &,
        ValidatorConfig const &, StakePoolView const &);

    Result<void> initialize_genesis(
        Address const &caller,
        std::span<RegisterValidatorParams const> validators);

    Result<void>
    register_validator(Address const &caller, RegisterValidatorParams);

    Result<void> join_validator_set(Address const &caller, Address const &pool);
    Result<void>
    leave_validator_set(Address const &caller, Address const &pool);
    Result<void>
    force_leave_validator_set(Address const &caller, Address const &pool);

    Result<void> rotate_consensus_key(
        Address const &caller, Address const &pool,
        byte_string_view consensus_pubkey, byte_string_view consensus_pop);
    Result<void> set_fee_recipient(
        Address const &caller, Address const &pool,
        Address const &fee_recipient);
    Result<void> update_network_addresses(
        Address const &caller, Address const &pool,
        byte_string_view network_addresses,
        byte_string_view fullnode_addresses);

    /// Moves validators below the configured success threshold out of the
    /// set at the next epoch. Returns how many were evicted.
    Result<size_t> evict_underperforming_validators(
        Address const &caller,
        std::span<IndividualPerformance const> performances);

    Result<void> on_new_epoch(Address const &caller) override;

    std::vector<ValidatorConsensusInfo>
    current_consensus_infos() const override
    {
        return current_infos_;
    }

    std::vector<ValidatorConsensusInfo> next_consensus_infos() const override;

    std::optional<ValidatorConsensusInfo>
    active_validator_at(uint64_t index) const override;

    uint64_t active_count() const noexcept override
    {
        return active_.size();
    }

    uint256_t const &total_voting_power() const noexcept
    {
        return total_voting_power_;
    }

    std::optional<ValidatorStatus> status_of(Address const &pool) const;
    std::optional<uint64_t> index_of(Address const &pool) const;

    // nullptr for an unknown pool
    ValidatorRecord const *validator(Address const &pool) const;

    std::vector<Address> pending_active() const;
    std::vector<Address> pending_inactive() const;

    size_t size() const noexcept
    {
        return records_.size();
    }

private:
    std::optional<size_t> find(Address const &pool) const;
    uint256_t stake_of(Address const &pool) const;
    uint256_t voting_power_of(uint256_t const &stake) const;

    Result<void> check_not_in_transition() const;
    Result<size_t> authorize_operator(Address const &caller, Address const &pool);
    Result<void>
    check_new_validator(RegisterValidatorParams const &, bool genesis) const;

    size_t insert_record(RegisterValidatorParams, uint64_t epoch);
    void install_active_set(
        std::vector<size_t> active,
        std::vector<uint256_t> const &voting_powers);
    uint256_t voting_power_increase_limit() const;
    size_t remaining_after_pending_leaves() const noexcept;

    EpochPlan plan_next_epoch() const;
    ValidatorConsensusInfo consensus_info_of(
        ValidatorRecord const &, uint64_t index,
        uint256_t const &voting_power) const;
};

GRAVITY_STAKING_NAMESPACE_END
