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
#include <gravity/staking/stake_pool.hpp>
#include <gravity/staking/staking_error.hpp>

#include <utility>

GRAVITY_STAKING_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

std::optional<StakePoolInfo>
InMemoryStakePools::pool(Address const &address) const
{
    auto const it = pools_.find(address);
    if (it == pools_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void>
InMemoryStakePools::create_pool(Address const &address, StakePoolInfo info)
{
    auto const [it, inserted] = pools_.try_emplace(address, std::move(info));
    if (GRAVITY_UNLIKELY(!inserted)) {
        return StakingError::StakePoolExists;
    }
    return success();
}

Result<void>
InMemoryStakePools::set_stake(Address const &address, uint256_t const &stake)
{
    auto const it = pools_.find(address);
    if (GRAVITY_UNLIKELY(it == pools_.end())) {
        return StakingError::UnknownStakePool;
    }
    it->second.stake = stake;
    return success();
}

Result<void> InMemoryStakePools::set_operator(
    Address const &address, Address const &operator_address)
{
    auto const it = pools_.find(address);
    if (GRAVITY_UNLIKELY(it == pools_.end())) {
        return StakingError::UnknownStakePool;
    }
    it->second.operator_address = operator_address;
    return success();
}

GRAVITY_STAKING_NAMESPACE_END
