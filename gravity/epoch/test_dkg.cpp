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

#include <gravity/core/byte_string.hpp>
#include <gravity/epoch/access_control.hpp>
#include <gravity/epoch/clock.hpp>
#include <gravity/epoch/dkg.hpp>
#include <gravity/epoch/event.hpp>
#include <gravity/test/epoch_fixture.hpp>

#include <gtest/gtest.h>

using namespace gravity;
using namespace gravity::test;

namespace
{
    struct DkgTest : public ::testing::Test
    {
        AccessControl access;
        EventLog events;
        Clock clock{access};
        Dkg dkg{access, events, clock};
        Address const self = RECONFIGURATION_ADDRESS;

        void SetUp() override
        {
            ASSERT_FALSE(clock.initialize(GENESIS_ADDRESS, T0_US).has_error());
        }

        Result<void> start(uint64_t const epoch)
        {
            return dkg.start(
                self,
                epoch,
                RandomnessParams{
                    .variant = RandomnessVariant::V2,
                    .secrecy_threshold = 1,
                    .reconstruction_threshold = 2,
                    .fast_path_secrecy_threshold = 2},
                {make_info(0), make_info(1)},
                {make_info(0), make_info(1), make_info(2)});
        }
    };
}

TEST_F(DkgTest, start_and_finish)
{
    ASSERT_FALSE(start(4).has_error());
    ASSERT_TRUE(dkg.in_progress().has_value());
    EXPECT_EQ(dkg.in_progress()->dealer_epoch, 4);
    EXPECT_EQ(dkg.in_progress()->dealers.size(), 2u);
    EXPECT_EQ(dkg.in_progress()->targets.size(), 3u);
    EXPECT_EQ(dkg.in_progress()->start_time_us, T0_US);

    auto const started = events.events_of<DkgStartedEvent>();
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].dealer_count, 2);
    EXPECT_EQ(started[0].target_count, 3);

    byte_string const transcript{0xde, 0xad, 0xbe, 0xef};
    ASSERT_FALSE(dkg.finish(self, transcript).has_error());
    EXPECT_FALSE(dkg.in_progress().has_value());
    ASSERT_TRUE(dkg.last_completed().has_value());
    EXPECT_EQ(dkg.last_completed()->transcript, transcript);
    EXPECT_EQ(events.count<DkgCompletedEvent>(), 1u);
}

TEST_F(DkgTest, one_session_at_a_time)
{
    ASSERT_FALSE(start(1).has_error());
    auto const res = start(2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DkgError::SessionInProgress);
    EXPECT_EQ(dkg.in_progress()->dealer_epoch, 1);
}

TEST_F(DkgTest, finish_without_session)
{
    auto const res = dkg.finish(self, byte_string{0x01});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DkgError::NoSessionInProgress);
}

TEST_F(DkgTest, discard_stale_is_idempotent)
{
    auto cleared = dkg.discard_stale(self);
    ASSERT_FALSE(cleared.has_error());
    EXPECT_FALSE(cleared.value());

    ASSERT_FALSE(start(7).has_error());
    cleared = dkg.discard_stale(self);
    ASSERT_FALSE(cleared.has_error());
    EXPECT_TRUE(cleared.value());
    EXPECT_FALSE(dkg.in_progress().has_value());
    EXPECT_FALSE(dkg.last_completed().has_value());

    auto const events_cleared = events.events_of<DkgSessionClearedEvent>();
    ASSERT_EQ(events_cleared.size(), 1u);
    EXPECT_EQ(events_cleared[0].dealer_epoch, 7);

    cleared = dkg.discard_stale(self);
    ASSERT_FALSE(cleared.has_error());
    EXPECT_FALSE(cleared.value());
}

TEST_F(DkgTest, restricted_to_reconfiguration)
{
    auto const res = dkg.discard_stale(SYSTEM_CALLER);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AccessError::Unauthorized);
}
