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

#include <gravity/epoch/clock.hpp>
#include <gravity/epoch/epoch_error.hpp>
#include <gravity/epoch/event.hpp>
#include <gravity/epoch/performance_tracker.hpp>
#include <gravity/test/epoch_fixture.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace gravity;
using namespace gravity::test;

namespace
{
    using BlockerTest = EpochFixture;
}

TEST_F(BlockerTest, genesis_block)
{
    EXPECT_EQ(blocker.block_number(), 0);
    auto const blocks = events.events_of<NewBlockEvent>();
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].height, 0);
    EXPECT_EQ(blocks[0].proposer, SYSTEM_CALLER);
    EXPECT_EQ(blocks[0].timestamp_us, T0_US);

    auto const res = blocker.initialize(genesis_caller);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ReconfigurationError::AlreadyInitialized);
}

TEST_F(BlockerTest, block_prologue)
{
    std::vector<uint64_t> const failed{2};
    ASSERT_FALSE(block(1, T0_US + 500, failed).has_error());

    EXPECT_EQ(blocker.block_number(), 1);
    EXPECT_EQ(clock.now_microseconds(), T0_US + 500);
    EXPECT_EQ(performance.performance_of(1)->successful_proposals, 1);
    EXPECT_EQ(performance.performance_of(2)->failed_proposals, 1);

    auto const blocks = events.events_of<NewBlockEvent>();
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[1].height, 1);
    EXPECT_EQ(blocks[1].epoch, 0);
    EXPECT_EQ(blocks[1].proposer, make_info(1).validator);
    EXPECT_EQ(blocks[1].timestamp_us, T0_US + 500);
}

TEST_F(BlockerTest, nil_block_keeps_time)
{
    ASSERT_FALSE(block(0, T0_US + 1'000).has_error());
    ASSERT_FALSE(block(NIL_PROPOSER_INDEX, T0_US + 1'000).has_error());
    EXPECT_EQ(clock.now_microseconds(), T0_US + 1'000);
    EXPECT_EQ(blocker.block_number(), 2);
    EXPECT_EQ(
        events.events_of<NewBlockEvent>().back().proposer, SYSTEM_CALLER);

    auto const res = block(NIL_PROPOSER_INDEX, T0_US + 2'000);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ClockError::NilBlockTimeAdvanced);
    EXPECT_EQ(blocker.block_number(), 2);

    ASSERT_FALSE(block(1, T0_US + 2'000).has_error());
    EXPECT_EQ(clock.now_microseconds(), T0_US + 2'000);
}

TEST_F(BlockerTest, unknown_proposer_has_no_effect)
{
    std::vector<uint64_t> const failed{0};
    auto const res = block(3, T0_US + 10, failed);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), BlockError::ProposerNotInSet);

    EXPECT_EQ(blocker.block_number(), 0);
    EXPECT_EQ(clock.now_microseconds(), T0_US);
    EXPECT_EQ(performance.performance_of(0)->failed_proposals, 0);
    EXPECT_EQ(events.count<NewBlockEvent>(), 1u);
}

TEST_F(BlockerTest, timestamp_regression_has_no_effect)
{
    ASSERT_FALSE(block(0, T0_US + 10).has_error());
    auto const res = block(1, T0_US + 9);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ClockError::TimestampRegression);
    EXPECT_EQ(performance.performance_of(1)->successful_proposals, 0);
    EXPECT_EQ(blocker.block_number(), 1);
}

TEST_F(BlockerTest, only_system_caller)
{
    auto const res =
        blocker.on_block_start(governance, 0, {}, T0_US + 10);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AccessError::Unauthorized);
    EXPECT_EQ(clock.now_microseconds(), T0_US);
}

TEST_F(BlockerTest, drives_epoch_transition)
{
    ASSERT_FALSE(block(0, T0_US + EPOCH_INTERVAL_US).has_error());
    EXPECT_EQ(reconfiguration.current_epoch(), 1);

    // the new-block event carries the epoch the block ended in
    EXPECT_EQ(events.events_of<NewBlockEvent>().back().epoch, 1);
    EXPECT_EQ(performance.performance_of(0)->successful_proposals, 0);
}

TEST_F(BlockerTest, resolve_proposer)
{
    auto const nil = blocker.resolve_proposer(NIL_PROPOSER_INDEX);
    ASSERT_FALSE(nil.has_error());
    EXPECT_EQ(nil.value(), SYSTEM_CALLER);

    auto const second = blocker.resolve_proposer(2);
    ASSERT_FALSE(second.has_error());
    EXPECT_EQ(second.value(), make_info(2).validator);
}
