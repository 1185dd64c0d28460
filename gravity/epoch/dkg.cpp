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
#include <gravity/epoch/clock.hpp>
#include <gravity/epoch/dkg.hpp>

#include <quill/Quill.h>

#include <initializer_list>
#include <utility>

GRAVITY_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

Dkg::Dkg(AccessControl &access, EventLog &events, Clock const &clock)
    : access_{access}
    , events_{events}
    , clock_{clock}
{
}

Result<void> Dkg::start(
    Address const &caller, uint64_t const dealer_epoch,
    RandomnessParams const &config,
    std::vector<ValidatorConsensusInfo> dealers,
    std::vector<ValidatorConsensusInfo> targets)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Reconfiguration));
    if (GRAVITY_UNLIKELY(in_progress_.has_value())) {
        return DkgError::SessionInProgress;
    }

    uint64_t const dealer_count = dealers.size();
    uint64_t const target_count = targets.size();
    in_progress_ = DkgSession{
        .dealer_epoch = dealer_epoch,
        .config = config,
        .dealers = std::move(dealers),
        .targets = std::move(targets),
        .start_time_us = clock_.now_microseconds(),
        .transcript = {}};

    LOG_INFO(
        "dkg started for epoch {}: {} dealers, {} targets",
        dealer_epoch,
        dealer_count,
        target_count);
    events_.emit(DkgStartedEvent{
        .dealer_epoch = dealer_epoch,
        .config = config,
        .dealer_count = dealer_count,
        .target_count = target_count,
        .start_time_us = in_progress_->start_time_us});
    return success();
}

Result<void>
Dkg::finish(Address const &caller, byte_string_view const transcript)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Reconfiguration));
    if (GRAVITY_UNLIKELY(!in_progress_.has_value())) {
        return DkgError::NoSessionInProgress;
    }

    DkgSession session = std::move(*in_progress_);
    in_progress_.reset();
    session.transcript = byte_string{transcript};

    LOG_INFO(
        "dkg completed for epoch {}, transcript {} bytes",
        session.dealer_epoch,
        session.transcript.size());
    events_.emit(DkgCompletedEvent{
        .dealer_epoch = session.dealer_epoch,
        .transcript = session.transcript});
    last_completed_ = std::move(session);
    return success();
}

Result<bool> Dkg::discard_stale(Address const &caller)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Reconfiguration));
    if (!in_progress_.has_value()) {
        return false;
    }
    uint64_t const dealer_epoch = in_progress_->dealer_epoch;
    in_progress_.reset();
    LOG_INFO("discarded stale dkg session of epoch {}", dealer_epoch);
    events_.emit(DkgSessionClearedEvent{.dealer_epoch = dealer_epoch});
    return true;
}

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<gravity::DkgError>::mapping> const &
quick_status_code_from_enum<gravity::DkgError>::value_mappings()
{
    using gravity::DkgError;

    static std::initializer_list<mapping> const v = {
        {DkgError::Success, "success", {errc::success}},
        {DkgError::SessionInProgress, "dkg session in progress", {}},
        {DkgError::NoSessionInProgress, "no dkg session in progress", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
