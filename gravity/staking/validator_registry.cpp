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
#include <gravity/core/fmt/byte_string_fmt.hpp>
#include <gravity/core/fmt/int_fmt.hpp>
#include <gravity/core/likely.h>
#include <gravity/staking/bls.hpp>
#include <gravity/staking/staking_error.hpp>
#include <gravity/staking/validator_registry.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <set>
#include <unordered_set>
#include <utility>

GRAVITY_STAKING_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

ValidatorRegistry::ValidatorRegistry(
    AccessControl &access, EventLog &events, EpochState const &epoch,
    ValidatorConfig const &config, StakePoolView const &pools)
    : access_{access}
    , events_{events}
    , epoch_{epoch}
    , config_{config}
    , pools_{pools}
{
}

std::optional<size_t> ValidatorRegistry::find(Address const &pool) const
{
    auto const it = by_pool_.find(pool);
    if (it == by_pool_.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint256_t ValidatorRegistry::stake_of(Address const &pool) const
{
    auto const info = pools_.pool(pool);
    return info.has_value() ? info->stake : uint256_t{0};
}

uint256_t ValidatorRegistry::voting_power_of(uint256_t const &stake) const
{
    return std::min(stake, config_.current().maximum_bond);
}

size_t ValidatorRegistry::remaining_after_pending_leaves() const noexcept
{
    return active_.size() - pending_inactive_.size();
}

Result<void> ValidatorRegistry::check_not_in_transition() const
{
    if (GRAVITY_UNLIKELY(epoch_.is_transition_in_progress())) {
        return StakingError::ReconfigurationInProgress;
    }
    return success();
}

Result<size_t> ValidatorRegistry::authorize_operator(
    Address const &caller, Address const &pool)
{
    auto const info = pools_.pool(pool);
    if (GRAVITY_UNLIKELY(!info.has_value())) {
        return StakingError::UnknownStakePool;
    }
    BOOST_OUTCOME_TRY(access_.check_operator(caller, info->operator_address));
    auto const id = find(pool);
    if (GRAVITY_UNLIKELY(!id.has_value())) {
        return StakingError::UnknownValidator;
    }
    return *id;
}

Result<void> ValidatorRegistry::check_new_validator(
    RegisterValidatorParams const &params, bool const genesis) const
{
    auto const info = pools_.pool(params.pool);
    if (GRAVITY_UNLIKELY(!info.has_value())) {
        return StakingError::UnknownStakePool;
    }
    if (GRAVITY_UNLIKELY(by_pool_.contains(params.pool))) {
        return StakingError::StakePoolAlreadyRegistered;
    }
    if (!genesis) {
        auto const &config = config_.current();
        if (GRAVITY_UNLIKELY(info->stake < config.minimum_bond)) {
            return StakingError::InsufficientBond;
        }
        if (GRAVITY_UNLIKELY(info->stake > config.maximum_bond)) {
            return StakingError::ExcessiveBond;
        }
    }
    if (GRAVITY_UNLIKELY(
            params.moniker.empty() ||
            params.moniker.size() > MAX_MONIKER_LENGTH)) {
        return StakingError::InvalidMoniker;
    }
    if (genesis) {
        if (GRAVITY_UNLIKELY(params.consensus_pubkey.empty())) {
            return StakingError::InvalidConsensusKey;
        }
    }
    else {
        BOOST_OUTCOME_TRY(
            check_consensus_key(params.consensus_pubkey, params.consensus_pop));
    }
    if (GRAVITY_UNLIKELY(by_consensus_key_.contains(params.consensus_pubkey))) {
        return StakingError::ConsensusKeyInUse;
    }
    return success();
}

size_t ValidatorRegistry::insert_record(
    RegisterValidatorParams params, uint64_t const epoch)
{
    size_t const id = records_.size();
    by_pool_.emplace(params.pool, id);
    by_consensus_key_.emplace(params.consensus_pubkey, id);
    records_.push_back(ValidatorRecord{
        .pool = params.pool,
        .moniker = std::move(params.moniker),
        .consensus_pubkey = std::move(params.consensus_pubkey),
        .consensus_pop = std::move(params.consensus_pop),
        .network_addresses = std::move(params.network_addresses),
        .fullnode_addresses = std::move(params.fullnode_addresses),
        .fee_recipient = params.fee_recipient,
        .pending_fee_recipient = std::nullopt,
        .status = ValidatorStatus::Inactive,
        .index = std::nullopt,
        .voting_power = 0,
        .registered_at_epoch = epoch});
    return id;
}

ValidatorConsensusInfo ValidatorRegistry::consensus_info_of(
    ValidatorRecord const &record, uint64_t const index,
    uint256_t const &voting_power) const
{
    return ValidatorConsensusInfo{
        .validator = record.pool,
        .consensus_pubkey = record.consensus_pubkey,
        .consensus_pop = record.consensus_pop,
        .voting_power = voting_power,
        .validator_index = index,
        .network_addresses = record.network_addresses,
        .fullnode_addresses = record.fullnode_addresses};
}

void ValidatorRegistry::install_active_set(
    std::vector<size_t> active, std::vector<uint256_t> const &voting_powers)
{
    GRAVITY_ASSERT(!active.empty());
    GRAVITY_ASSERT(active.size() == voting_powers.size());

    active_ = std::move(active);
    current_infos_.clear();
    current_infos_.reserve(active_.size());
    total_voting_power_ = 0;
    for (uint64_t i = 0; i < active_.size(); ++i) {
        ValidatorRecord &record = records_[active_[i]];
        record.status = ValidatorStatus::Active;
        record.index = i;
        record.voting_power = voting_powers[i];
        total_voting_power_ += voting_powers[i];
        current_infos_.push_back(
            consensus_info_of(record, i, record.voting_power));
    }
}

Result<void> ValidatorRegistry::initialize_genesis(
    Address const &caller, std::span<RegisterValidatorParams const> validators)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Genesis));
    if (GRAVITY_UNLIKELY(genesis_done_ || !records_.empty())) {
        return StakingError::AlreadyInitialized;
    }
    if (GRAVITY_UNLIKELY(validators.empty())) {
        return StakingError::EmptyValidatorSet;
    }

    std::unordered_set<Address> pools;
    std::set<byte_string> keys;
    for (auto const &v : validators) {
        BOOST_OUTCOME_TRY(check_new_validator(v, true));
        if (GRAVITY_UNLIKELY(!pools.insert(v.pool).second)) {
            return StakingError::StakePoolAlreadyRegistered;
        }
        if (GRAVITY_UNLIKELY(!keys.insert(v.consensus_pubkey).second)) {
            return StakingError::ConsensusKeyInUse;
        }
    }

    std::vector<size_t> active;
    std::vector<uint256_t> voting_powers;
    for (auto const &v : validators) {
        active.push_back(insert_record(v, epoch_.epoch));
        voting_powers.push_back(voting_power_of(
            v.initial_voting_power.value_or(stake_of(v.pool))));
    }
    install_active_set(std::move(active), voting_powers);
    genesis_done_ = true;

    for (size_t const id : active_) {
        auto const &record = records_[id];
        auto const info = pools_.pool(record.pool);
        events_.emit(ValidatorRegisteredEvent{
            .pool = record.pool,
            .operator_address = info->operator_address,
            .moniker = record.moniker});
        events_.emit(ValidatorActivatedEvent{
            .pool = record.pool,
            .index = *record.index,
            .voting_power = record.voting_power,
            .epoch = epoch_.epoch});
    }
    LOG_INFO(
        "genesis validator set: {} validators, total voting power {}",
        active_.size(),
        total_voting_power_);
    return success();
}

Result<void> ValidatorRegistry::register_validator(
    Address const &caller, RegisterValidatorParams params)
{
    auto const info = pools_.pool(params.pool);
    if (GRAVITY_UNLIKELY(!info.has_value())) {
        return StakingError::UnknownStakePool;
    }
    BOOST_OUTCOME_TRY(access_.check_operator(caller, info->operator_address));
    BOOST_OUTCOME_TRY(check_new_validator(params, false));

    Address const pool = params.pool;
    size_t const id = insert_record(std::move(params), epoch_.epoch);
    LOG_INFO(
        "registered validator {} ({}) operated by {}",
        pool,
        records_[id].moniker,
        info->operator_address);
    events_.emit(ValidatorRegisteredEvent{
        .pool = pool,
        .operator_address = info->operator_address,
        .moniker = records_[id].moniker});
    return success();
}

Result<void>
ValidatorRegistry::join_validator_set(Address const &caller, Address const &pool)
{
    BOOST_OUTCOME_TRY(auto const id, authorize_operator(caller, pool));
    auto const &config = config_.current();
    if (GRAVITY_UNLIKELY(!config.allow_validator_set_change)) {
        return StakingError::ValidatorSetChangeDisabled;
    }
    BOOST_OUTCOME_TRY(check_not_in_transition());

    ValidatorRecord &record = records_[id];
    if (GRAVITY_UNLIKELY(record.status != ValidatorStatus::Inactive)) {
        return StakingError::InvalidStatus;
    }
    uint256_t const stake = stake_of(pool);
    if (GRAVITY_UNLIKELY(stake < config.minimum_bond)) {
        return StakingError::InsufficientBond;
    }
    if (GRAVITY_UNLIKELY(stake > config.maximum_bond)) {
        return StakingError::ExcessiveBond;
    }
    if (GRAVITY_UNLIKELY(
            remaining_after_pending_leaves() + pending_active_.size() >=
            config.max_validator_set_size)) {
        return StakingError::MaxValidatorSetSizeReached;
    }
    // a joiner larger than the whole per-epoch increase is refused outright
    if (total_voting_power_ != 0 &&
        GRAVITY_UNLIKELY(
            voting_power_of(stake) > voting_power_increase_limit())) {
        return StakingError::VotingPowerIncreaseLimitExceeded;
    }

    record.status = ValidatorStatus::PendingActive;
    pending_active_.push_back(id);
    LOG_INFO("validator {} requested to join", pool);
    events_.emit(
        ValidatorJoinRequestedEvent{.pool = pool, .epoch = epoch_.epoch});
    return success();
}

Result<void> ValidatorRegistry::leave_validator_set(
    Address const &caller, Address const &pool)
{
    BOOST_OUTCOME_TRY(auto const id, authorize_operator(caller, pool));
    if (GRAVITY_UNLIKELY(!config_.current().allow_validator_set_change)) {
        return StakingError::ValidatorSetChangeDisabled;
    }
    BOOST_OUTCOME_TRY(check_not_in_transition());

    ValidatorRecord &record = records_[id];
    switch (record.status) {
    case ValidatorStatus::PendingActive:
        std::erase(pending_active_, id);
        record.status = ValidatorStatus::Inactive;
        break;
    case ValidatorStatus::Active:
        if (GRAVITY_UNLIKELY(remaining_after_pending_leaves() <= 1)) {
            return StakingError::LastValidator;
        }
        record.status = ValidatorStatus::PendingInactive;
        pending_inactive_.push_back(id);
        break;
    default:
        return StakingError::InvalidStatus;
    }

    LOG_INFO(
        "validator {} requested to leave, now {}",
        pool,
        validator_status_name(record.status));
    events_.emit(ValidatorLeaveRequestedEvent{
        .pool = pool, .epoch = epoch_.epoch, .forced = false});
    return success();
}

Result<void> ValidatorRegistry::force_leave_validator_set(
    Address const &caller, Address const &pool)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Governance));
    auto const id = find(pool);
    if (GRAVITY_UNLIKELY(!id.has_value())) {
        return StakingError::UnknownValidator;
    }
    ValidatorRecord &record = records_[*id];
    if (GRAVITY_UNLIKELY(record.status != ValidatorStatus::Active)) {
        return StakingError::InvalidStatus;
    }
    if (GRAVITY_UNLIKELY(remaining_after_pending_leaves() <= 1)) {
        return StakingError::LastValidator;
    }

    record.status = ValidatorStatus::PendingInactive;
    pending_inactive_.push_back(*id);
    LOG_WARNING("governance removed validator {}", pool);
    events_.emit(ValidatorLeaveRequestedEvent{
        .pool = pool, .epoch = epoch_.epoch, .forced = true});
    return success();
}

Result<void> ValidatorRegistry::rotate_consensus_key(
    Address const &caller, Address const &pool,
    byte_string_view const consensus_pubkey,
    byte_string_view const consensus_pop)
{
    BOOST_OUTCOME_TRY(auto const id, authorize_operator(caller, pool));
    BOOST_OUTCOME_TRY(check_not_in_transition());
    BOOST_OUTCOME_TRY(check_consensus_key(consensus_pubkey, consensus_pop));

    byte_string key{consensus_pubkey};
    auto const it = by_consensus_key_.find(key);
    if (GRAVITY_UNLIKELY(it != by_consensus_key_.end() && it->second != id)) {
        return StakingError::ConsensusKeyInUse;
    }

    ValidatorRecord &record = records_[id];
    by_consensus_key_.erase(record.consensus_pubkey);
    by_consensus_key_.emplace(key, id);
    record.consensus_pubkey = std::move(key);
    record.consensus_pop = byte_string{consensus_pop};

    LOG_INFO(
        "validator {} rotated consensus key to {}",
        pool,
        record.consensus_pubkey);
    events_.emit(ConsensusKeyRotatedEvent{
        .pool = pool, .consensus_pubkey = record.consensus_pubkey});
    return success();
}

Result<void> ValidatorRegistry::set_fee_recipient(
    Address const &caller, Address const &pool, Address const &fee_recipient)
{
    BOOST_OUTCOME_TRY(auto const id, authorize_operator(caller, pool));
    BOOST_OUTCOME_TRY(check_not_in_transition());

    records_[id].pending_fee_recipient = fee_recipient;
    events_.emit(FeeRecipientUpdatedEvent{
        .pool = pool, .fee_recipient = fee_recipient, .applied = false});
    return success();
}

Result<void> ValidatorRegistry::update_network_addresses(
    Address const &caller, Address const &pool,
    byte_string_view const network_addresses,
    byte_string_view const fullnode_addresses)
{
    BOOST_OUTCOME_TRY(auto const id, authorize_operator(caller, pool));
    BOOST_OUTCOME_TRY(check_not_in_transition());

    ValidatorRecord &record = records_[id];
    record.network_addresses = byte_string{network_addresses};
    record.fullnode_addresses = byte_string{fullnode_addresses};
    events_.emit(NetworkAddressesUpdatedEvent{.pool = pool});
    return success();
}

Result<size_t> ValidatorRegistry::evict_underperforming_validators(
    Address const &caller,
    std::span<IndividualPerformance const> const performances)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Governance));

    if (GRAVITY_UNLIKELY(performances.size() != active_.size())) {
        LOG_WARNING(
            "performance snapshot has {} entries, active set has {}",
            performances.size(),
            active_.size());
        events_.emit(PerformanceSnapshotMismatchEvent{
            .snapshot_length = performances.size(),
            .active_count = active_.size()});
        return 0;
    }

    auto const &config = config_.current();
    if (!config.auto_evict_enabled) {
        return 0;
    }

    size_t evicted = 0;
    for (size_t i = 0; i < active_.size(); ++i) {
        size_t const id = active_[i];
        ValidatorRecord &record = records_[id];
        if (record.status != ValidatorStatus::Active ||
            performances[i].successful_proposals >=
                config.auto_evict_threshold) {
            continue;
        }
        if (remaining_after_pending_leaves() <= 1) {
            break;
        }
        record.status = ValidatorStatus::PendingInactive;
        pending_inactive_.push_back(id);
        ++evicted;
        events_.emit(ValidatorEvictedEvent{
            .pool = record.pool,
            .successful_proposals = performances[i].successful_proposals});
    }
    if (evicted) {
        LOG_INFO("evicted {} underperforming validators", evicted);
    }
    return evicted;
}

uint256_t ValidatorRegistry::voting_power_increase_limit() const
{
    return total_voting_power_ *
           config_.current().voting_power_increase_limit_pct / 100;
}

ValidatorRegistry::EpochPlan ValidatorRegistry::plan_next_epoch() const
{
    auto const &config = config_.current();
    EpochPlan plan;

    std::vector<size_t> survivors;
    for (size_t const id : active_) {
        if (records_[id].status == ValidatorStatus::PendingInactive) {
            plan.deactivated.push_back(id);
        }
        else {
            survivors.push_back(id);
        }
    }

    // stake may have been withdrawn below the bond during the epoch
    std::vector<size_t> kept;
    for (size_t i = 0; i < survivors.size(); ++i) {
        size_t const id = survivors[i];
        size_t const others = kept.size() + (survivors.size() - i - 1);
        if (stake_of(records_[id].pool) < config.minimum_bond && others > 0) {
            plan.deactivated.push_back(id);
        }
        else {
            kept.push_back(id);
        }
    }

    // first joined, first admitted; admission stops at the first validator
    // that does not fit. One whose power alone exceeds the limit waits
    // without holding back the rest of the queue.
    bool const limited = total_voting_power_ != 0;
    uint256_t const limit = voting_power_increase_limit();
    uint256_t added{0};
    bool blocked = false;
    for (size_t const id : pending_active_) {
        if (blocked) {
            plan.still_pending.push_back(id);
            continue;
        }
        uint256_t const stake = stake_of(records_[id].pool);
        if (stake < config.minimum_bond) {
            plan.still_pending.push_back(id);
            continue;
        }
        uint256_t const power = voting_power_of(stake);
        if (limited && power > limit) {
            plan.still_pending.push_back(id);
            continue;
        }
        if (kept.size() + plan.activated.size() >=
                config.max_validator_set_size ||
            (limited && added + power > limit)) {
            blocked = true;
            plan.still_pending.push_back(id);
            continue;
        }
        added += power;
        plan.activated.push_back(id);
    }

    plan.active = kept;
    plan.active.insert(
        plan.active.end(), plan.activated.begin(), plan.activated.end());
    std::ranges::sort(plan.active);
    plan.voting_powers.reserve(plan.active.size());
    for (size_t const id : plan.active) {
        plan.voting_powers.push_back(voting_power_of(stake_of(records_[id].pool)));
    }
    return plan;
}

std::vector<ValidatorConsensusInfo>
ValidatorRegistry::next_consensus_infos() const
{
    EpochPlan const plan = plan_next_epoch();
    std::vector<ValidatorConsensusInfo> infos;
    infos.reserve(plan.active.size());
    for (uint64_t i = 0; i < plan.active.size(); ++i) {
        infos.push_back(consensus_info_of(
            records_[plan.active[i]], i, plan.voting_powers[i]));
    }
    return infos;
}

Result<void> ValidatorRegistry::on_new_epoch(Address const &caller)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Reconfiguration));

    EpochPlan plan = plan_next_epoch();
    uint64_t const epoch = epoch_.epoch;

    for (size_t const id : plan.deactivated) {
        ValidatorRecord &record = records_[id];
        record.status = ValidatorStatus::Inactive;
        record.index.reset();
        record.voting_power = 0;
        events_.emit(
            ValidatorDeactivatedEvent{.pool = record.pool, .epoch = epoch});
    }
    install_active_set(std::move(plan.active), plan.voting_powers);
    pending_active_ = std::move(plan.still_pending);
    pending_inactive_.clear();

    for (size_t const id : plan.activated) {
        auto const &record = records_[id];
        events_.emit(ValidatorActivatedEvent{
            .pool = record.pool,
            .index = *record.index,
            .voting_power = record.voting_power,
            .epoch = epoch});
    }

    for (auto &record : records_) {
        if (record.pending_fee_recipient.has_value()) {
            record.fee_recipient = *record.pending_fee_recipient;
            record.pending_fee_recipient.reset();
            events_.emit(FeeRecipientUpdatedEvent{
                .pool = record.pool,
                .fee_recipient = record.fee_recipient,
                .applied = true});
        }
    }

    LOG_INFO(
        "validator set for epoch {}: {} active (+{} -{}), {} pending, total "
        "voting power {}",
        epoch + 1,
        active_.size(),
        plan.activated.size(),
        plan.deactivated.size(),
        pending_active_.size(),
        total_voting_power_);
    return success();
}

std::optional<ValidatorConsensusInfo>
ValidatorRegistry::active_validator_at(uint64_t const index) const
{
    if (index >= current_infos_.size()) {
        return std::nullopt;
    }
    return current_infos_[index];
}

std::optional<ValidatorStatus>
ValidatorRegistry::status_of(Address const &pool) const
{
    auto const id = find(pool);
    if (!id.has_value()) {
        return std::nullopt;
    }
    return records_[*id].status;
}

std::optional<uint64_t> ValidatorRegistry::index_of(Address const &pool) const
{
    auto const id = find(pool);
    if (!id.has_value()) {
        return std::nullopt;
    }
    return records_[*id].index;
}

ValidatorRecord const *ValidatorRegistry::validator(Address const &pool) const
{
    auto const id = find(pool);
    return id.has_value() ? &records_[*id] : nullptr;
}

std::vector<Address> ValidatorRegistry::pending_active() const
{
    std::vector<Address> pools;
    for (size_t const id : pending_active_) {
        pools.push_back(records_[id].pool);
    }
    return pools;
}

std::vector<Address> ValidatorRegistry::pending_inactive() const
{
    std::vector<Address> pools;
    for (size_t const id : pending_inactive_) {
        pools.push_back(records_[id].pool);
    }
    return pools;
}

GRAVITY_STAKING_NAMESPACE_END
