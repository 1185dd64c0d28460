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
#include <gravity/core/int.hpp>
#include <gravity/core/result.hpp>
#include <gravity/staking/config.hpp>

#include <optional>
#include <unordered_map>

GRAVITY_STAKING_NAMESPACE_BEGIN

struct StakePoolInfo
{
    Address owner;
    Address operator_address;
    uint256_t stake;
};

/// Read access to stake pools. Custody of the staked funds lives outside of
/// the validator lifecycle; only the bonded amount and the pool roles are
/// consumed here.
class StakePoolView
{
public:
    virtual ~StakePoolView() = default;

    virtual std::optional<StakePoolInfo> pool(Address const &) const = 0;
};

class InMemoryStakePools final : public StakePoolView
{
    std::unordered_map<Address, StakePoolInfo> pools_;

public:
    std::optional<StakePoolInfo> pool(Address const &) const override;

    Result<void> create_pool(Address const &, StakePoolInfo);
    Result<void> set_stake(Address const &, uint256_t const &);
    Result<void> set_operator(Address const &, Address const &);

    size_t size() const noexcept
    {
        return pools_.size();
    }
};

GRAVITY_STAKING_NAMESPACE_END
