#pragma once

#include "kine/core/cvar.hpp"

namespace kine::animation::cvars
{
    extern kine::core::CVar<float> anim_fade_duration;
    extern kine::core::CVar<float> anim_playback_speed;
    extern kine::core::CVar<bool> anim_hold_last_frame;
} // namespace kine::animation::cvars
