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
#include <gravity/core/result.hpp>
#include <gravity/core/status_code.hpp>
#include <gravity/epoch/access_control.hpp>
#include <gravity/epoch/event.hpp>
#include <gravity/epoch/params.hpp>
#include <gravity/epoch/validator_set.hpp>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <vector>

GRAVITY_NAMESPACE_BEGIN

class Clock;

enum class DkgError
{
    Success = 0,
    SessionInProgress,
    NoSessionInProgress,
};

struct DkgSession
{
    uint64_t dealer_epoch;
    RandomnessParams config;
    std::vector<ValidatorConsensusInfo> dealers;
    std::vector<ValidatorConsensusInfo> targets;
    uint64_t start_time_us;
    byte_string transcript;
};

/// Bookkeeping for the off-chain distributed key generation run at epoch
/// boundaries. At most one session is in progress at a time.
class DkgCoordinator
{
public:
    virtual ~DkgCoordinator() = default;

    virtual Result<void> start(
        Address const &caller, uint64_t dealer_epoch,
        RandomnessParams const &config,
        std::vector<ValidatorConsensusInfo> dealers,
        std::vector<ValidatorConsensusInfo> targets) = 0;

    virtual Result<void>
    finish(Address const &caller, byte_string_view transcript) = 0;

    /// Drops an unfinished session. Returns whether there was one.
    virtual Result<bool> discard_stale(Address const &caller) = 0;

    virtual std::optional<DkgSession> const &in_progress() const noexcept = 0;
    virtual std::optional<DkgSession> const &
    last_completed() const noexcept = 0;
};

class Dkg final : public DkgCoordinator
{
    AccessControl &access_;
    EventLog &events_;
    Clock const &clock_;
    std::optional<DkgSession> in_progress_;
    std::optional<DkgSession> last_completed_;

public:
    Dkg(AccessControl &, EventLog &, Clock const &);

    Result<void> start(
        Address const &caller, uint64_t dealer_epoch,
        RandomnessParams const &config,
        std::vector<ValidatorConsensusInfo> dealers,
        std::vector<ValidatorConsensusInfo> targets) override;

    Result<void>
    finish(Address const &caller, byte_string_view transcript) override;

    Result<bool> discard_stale(Address const &caller) override;

    std::optional<DkgSession> const &in_progress() const noexcept override
    {
        return in_progress_;
    }

    std::optional<DkgSession> const &last_completed() const noexcept override
    {
        return last_completed_;
    }
};

GRAVITY_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<gravity::DkgError>
    : quick_status_code_from_enum_defaults<gravity::DkgError>
{
    static constexpr auto const domain_name = "DKG Error";
    static constexpr auto const domain_uuid =
        "e27c5b90-3d46-4a1f-9c08-b5f3d16e7a42";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
