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

#include <gravity/core/fmt/address_fmt.hpp>
#include <gravity/core/likely.h>
#include <gravity/epoch/clock.hpp>

#include <quill/Quill.h>

#include <initializer_list>

GRAVITY_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

Clock::Clock(AccessControl &access)
    : access_{access}
{
}

Result<void>
Clock::initialize(Address const &caller, uint64_t const genesis_time_us)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Genesis));
    if (GRAVITY_UNLIKELY(initialized_)) {
        return ClockError::AlreadyInitialized;
    }
    now_us_ = genesis_time_us;
    initialized_ = true;
    return success();
}

bool Clock::is_nil_proposer(Address const &proposer) const noexcept
{
    return proposer == access_.identity(Role::System);
}

Result<void> Clock::validate_advance(
    Address const &proposer, uint64_t const timestamp_us) const
{
    if (GRAVITY_UNLIKELY(!initialized_)) {
        return ClockError::NotInitialized;
    }
    if (is_nil_proposer(proposer)) {
        if (GRAVITY_UNLIKELY(timestamp_us != now_us_)) {
            return ClockError::NilBlockTimeAdvanced;
        }
    }
    else if (GRAVITY_UNLIKELY(timestamp_us < now_us_)) {
        return ClockError::TimestampRegression;
    }
    return success();
}

Result<void> Clock::advance(
    Address const &caller, Address const &proposer,
    uint64_t const timestamp_us)
{
    BOOST_OUTCOME_TRY(access_.check(caller, Role::Blocker));
    auto res = validate_advance(proposer, timestamp_us);
    if (GRAVITY_UNLIKELY(res.has_error())) {
        LOG_WARNING(
            "rejected timestamp {} from {}, now {}",
            timestamp_us,
            proposer,
            now_us_);
        return res;
    }
    now_us_ = timestamp_us;
    return success();
}

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<gravity::ClockError>::mapping> const &
quick_status_code_from_enum<gravity::ClockError>::value_mappings()
{
    using gravity::ClockError;

    static std::initializer_list<mapping> const v = {
        {ClockError::Success, "success", {errc::success}},
        {ClockError::TimestampRegression, "timestamp regression", {}},
        {ClockError::NilBlockTimeAdvanced, "nil block advanced time", {}},
        {ClockError::NotInitialized, "clock not initialized", {}},
        {ClockError::AlreadyInitialized, "clock already initialized", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
