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

#include "runloop.hpp"

#include <gravity/core/byte_string.hpp>
#include <gravity/core/fmt/address_fmt.hpp>
#include <gravity/core/fmt/int_fmt.hpp>
#include <gravity/epoch/performance_tracker.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>

GRAVITY_ANONYMOUS_NAMESPACE_BEGIN

// stands in for the aggregated DKG output of the consensus engine
byte_string make_transcript(uint64_t const epoch)
{
    byte_string transcript(32, 0);
    for (size_t i = 0; i < sizeof(epoch); ++i) {
        transcript[i] = static_cast<unsigned char>(epoch >> (8 * i));
    }
    return transcript;
}

void log_epoch(Runtime const &rt, uint64_t const block)
{
    LOG_INFO(
        "block {:6d} entered epoch {}: {} validators, total voting power {}",
        block,
        rt.reconfiguration.current_epoch(),
        rt.validators.active_count(),
        rt.validators.total_voting_power());
}

GRAVITY_ANONYMOUS_NAMESPACE_END

GRAVITY_NAMESPACE_BEGIN

Result<SimStats> runloop_gravity(
    Runtime &rt, SimConfig const &config, sig_atomic_t const volatile &stop)
{
    Address const &system = rt.access.identity(Role::System);
    SimStats stats;
    std::optional<uint64_t> dkg_started_at;
    auto const begin = std::chrono::steady_clock::now();

    for (uint64_t block = 1; block <= config.nblocks && stop == 0; ++block) {
        uint64_t const epoch_before = rt.reconfiguration.current_epoch();
        bool const nil = config.nil_every != 0 && block % config.nil_every == 0;
        uint64_t const proposer =
            nil ? NIL_PROPOSER_INDEX : block % rt.validators.active_count();
        uint64_t const timestamp =
            rt.clock.now_microseconds() + (nil ? 0 : config.block_time_us);

        BOOST_OUTCOME_TRY(rt.blocker.on_block_start(
            system, proposer, std::span<uint64_t const>{}, timestamp));
        ++stats.blocks;
        stats.nil_blocks += nil ? 1 : 0;

        if (rt.reconfiguration.is_transition_in_progress()) {
            if (!dkg_started_at.has_value()) {
                dkg_started_at = block;
                ++stats.dkg_sessions;
                LOG_INFO(
                    "block {:6d} started dkg for epoch {}",
                    block,
                    rt.reconfiguration.current_epoch());
            }
            if (block - *dkg_started_at >= config.dkg_delay_blocks) {
                BOOST_OUTCOME_TRY(rt.reconfiguration.finish_transition(
                    system,
                    make_transcript(rt.reconfiguration.current_epoch())));
                dkg_started_at.reset();
            }
        }

        if (rt.reconfiguration.current_epoch() != epoch_before) {
            ++stats.epochs;
            log_epoch(rt, block);
        }
    }

    auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);
    LOG_INFO(
        "ran {} blocks ({} nil) over {} epochs in {} ms",
        stats.blocks,
        stats.nil_blocks,
        stats.epochs,
        elapsed.count());
    return stats;
}

GRAVITY_NAMESPACE_END
