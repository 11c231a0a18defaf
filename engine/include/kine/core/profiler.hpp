#pragma once

#if defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define KINE_PROFILE_FRAME_MARK() FrameMark
    #define KINE_PROFILE_FUNCTION() ZoneScoped
    #define KINE_PROFILE_SCOPE(name) ZoneScopedN(name)

#else
    // Empty macros when disabled
    #define KINE_PROFILE_FRAME_MARK()
    #define KINE_PROFILE_FUNCTION()
    #define KINE_PROFILE_SCOPE(name)

#endif
