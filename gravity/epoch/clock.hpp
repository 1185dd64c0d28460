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
#include <gravity/core/status_code.hpp>
#include <gravity/epoch/access_control.hpp>

#include <cstdint>
#include <initializer_list>

GRAVITY_NAMESPACE_BEGIN

enum class ClockError
{
    Success = 0,
    TimestampRegression,
    NilBlockTimeAdvanced,
    NotInitialized,
    AlreadyInitialized,
};

inline constexpr uint64_t MICROS_PER_SECOND = 1'000'000;

/// Authoritative on-chain time, advanced once per block by the Blocker.
/// Blocks proposed by a validator may not move time backwards; NIL blocks,
/// identified by the system caller as proposer, may not move it at all.
class Clock
{
    AccessControl &access_;
    uint64_t now_us_{0};
    bool initialized_{false};

public:
    explicit Clock(AccessControl &);

    Result<void> initialize(Address const &caller, uint64_t genesis_time_us);

    uint64_t now_microseconds() const noexcept
    {
        return now_us_;
    }

    uint64_t now_seconds() const noexcept
    {
        return now_us_ / MICROS_PER_SECOND;
    }

    bool is_initialized() const noexcept
    {
        return initialized_;
    }

    bool is_nil_proposer(Address const &proposer) const noexcept;

    /// Checks an advance without applying it
    Result<void>
    validate_advance(Address const &proposer, uint64_t timestamp_us) const;

    Result<void> advance(
        Address const &caller, Address const &proposer, uint64_t timestamp_us);
};

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<gravity::ClockError>
    : quick_status_code_from_enum_defaults<gravity::ClockError>
{
    static constexpr auto const domain_name = "Clock Error";
    static constexpr auto const domain_uuid =
        "0a4f9d37-5e2b-4c81-b6d3-7e19f0c2a58b";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
