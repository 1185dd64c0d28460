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

#include <gravity/chain/runtime.hpp>
#include <gravity/core/config.hpp>
#include <gravity/core/result.hpp>

#include <csignal>
#include <cstdint>

GRAVITY_NAMESPACE_BEGIN

struct SimConfig
{
    uint64_t nblocks;
    uint64_t block_time_us;
    // blocks between the start of a DKG session and its transcript
    uint64_t dkg_delay_blocks;
    // every nth block carries no proposer, 0 disables
    uint64_t nil_every;
};

struct SimStats
{
    uint64_t blocks{0};
    uint64_t nil_blocks{0};
    uint64_t epochs{0};
    uint64_t dkg_sessions{0};
};

Result<SimStats>
runloop_gravity(Runtime &, SimConfig const &, sig_atomic_t const volatile &stop);

GRAVITY_NAMESPACE_END
