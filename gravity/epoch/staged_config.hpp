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
#include <gravity/core/likely.h>
#include <gravity/core/result.hpp>
#include <gravity/epoch/access_control.hpp>
#include <gravity/epoch/event.hpp>
#include <gravity/epoch/params.hpp>

#include <quill/Quill.h>

#include <optional>
#include <string_view>
#include <utility>

GRAVITY_NAMESPACE_BEGIN

/// Type-erased handle used by Reconfiguration to commit every staged
/// configuration at an epoch boundary.
class StagedConfigBase
{
public:
    virtual ~StagedConfigBase() = default;

    virtual std::string_view name() const noexcept = 0;
    virtual bool has_pending() const noexcept = 0;

    /// Applies the pending value, if any. Returns whether one was applied.
    virtual Result<bool> commit(Address const &caller) = 0;
};

/// Configuration value with a stage/commit update pattern. Governance stages
/// a new value at any time; it becomes current only when Reconfiguration
/// commits it at the next epoch boundary. A second stage before the commit
/// replaces the first.
template <class T>
class StagedConfig final : public StagedConfigBase
{
    std::string_view name_;
    AccessControl &access_;
    EventLog &events_;
    T current_;
    std::optional<T> pending_;
    bool initialized_{false};

public:
    StagedConfig(
        std::string_view const name, AccessControl &access, EventLog &events,
        T initial = T{})
        : name_{name}
        , access_{access}
        , events_{events}
        , current_{std::move(initial)}
    {
    }

    std::string_view name() const noexcept override
    {
        return name_;
    }

    T const &current() const noexcept
    {
        return current_;
    }

    std::optional<T> const &pending() const noexcept
    {
        return pending_;
    }

    bool has_pending() const noexcept override
    {
        return pending_.has_value();
    }

    // genesis value, set once before the first epoch
    Result<void> initialize(Address const &caller, T value)
    {
        BOOST_OUTCOME_TRY(access_.check(caller, Role::Genesis));
        if (GRAVITY_UNLIKELY(initialized_)) {
            return ConfigError::AlreadyInitialized;
        }
        BOOST_OUTCOME_TRY(validate_config(value, current_));
        current_ = std::move(value);
        initialized_ = true;
        return outcome::success();
    }

    Result<void> stage(Address const &caller, T value)
    {
        BOOST_OUTCOME_TRY(access_.check(caller, Role::Governance));
        BOOST_OUTCOME_TRY(validate_config(value, current_));
        pending_ = std::move(value);
        LOG_INFO("staged {} config", name_);
        events_.emit(ConfigStagedEvent{.config = name_});
        return outcome::success();
    }

    Result<bool> commit(Address const &caller) override
    {
        BOOST_OUTCOME_TRY(access_.check(caller, Role::Reconfiguration));
        if (!pending_.has_value()) {
            return false;
        }
        current_ = std::move(*pending_);
        pending_.reset();
        LOG_INFO("committed {} config", name_);
        return true;
    }
};

using EpochConfig = StagedConfig<EpochParams>;
using RandomnessConfig = StagedConfig<RandomnessParams>;
using ValidatorConfig = StagedConfig<ValidatorParams>;
using StakingConfig = StagedConfig<StakingParams>;
using GovernanceConfig = StagedConfig<GovernanceParams>;
using VersionConfig = StagedConfig<VersionParams>;
using ConsensusConfig = StagedConfig<OpaqueParams>;
using ExecutionConfig = StagedConfig<OpaqueParams>;

GRAVITY_NAMESPACE_END
