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

#include <gravity/core/config.hpp>

#include <cstdint>
#include <string_view>

GRAVITY_NAMESPACE_BEGIN

enum class TransitionState : uint8_t
{
    Idle = 0,
    DkgInProgress,
};

constexpr std::string_view transition_state_name(TransitionState const s)
{
    return s == TransitionState::Idle ? "idle" : "dkg_in_progress";
}

// Epoch metadata. Reconfiguration is the only writer; every other component
// holds a const reference.
struct EpochState
{
    uint64_t epoch{0};
    uint64_t last_reconfiguration_time_us{0};
    TransitionState transition_state{TransitionState::Idle};
    uint64_t transition_started_at_epoch{0};
    bool initialized{false};

    bool is_transition_in_progress() const noexcept
    {
        return transition_state == TransitionState::DkgInProgress;
    }
};

GRAVITY_NAMESPACE_END
