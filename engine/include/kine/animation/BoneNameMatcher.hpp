#pragma once

#include <string>
#include <string_view>

namespace kine::animation
{
    // Canonical form of exporter-specific bone names, e.g.
    // "Armature:mixamorig:Left_Arm" -> "leftarm".
    class BoneNameMatcher
    {
    public:
        static std::string normalize(std::string_view name);
        static bool matches(std::string_view a, std::string_view b);
    };
} // namespace kine::animation
