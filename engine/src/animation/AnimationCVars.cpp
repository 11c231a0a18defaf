#include "kine/animation/AnimationCVars.hpp"

namespace kine::animation::cvars
{
    AUTO_CVAR_FLOAT(anim_fade_duration, "Default crossfade length in seconds", 0.3f, kine::core::CVarFlags::save);
    AUTO_CVAR_FLOAT(anim_playback_speed, "Default animator playback speed (negative plays backwards)", 1.0f,
                    kine::core::CVarFlags::save);
    AUTO_CVAR_BOOL(anim_hold_last_frame,
                   "Non-looping clips hold their last frame (1) or stop when they reach the end (0)", true,
                   kine::core::CVarFlags::save);
} // namespace kine::animation::cvars
