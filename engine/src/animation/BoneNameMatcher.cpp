#include "kine/animation/BoneNameMatcher.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace kine::animation
{
    namespace
    {
        constexpr std::string_view kRigPrefix = "mixamorig";

        char lower(char c)
        {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    std::string BoneNameMatcher::normalize(std::string_view name)
    {
        // Namespace qualifiers: keep what follows the last ':'
        if (auto colon = name.rfind(':'); colon != std::string_view::npos)
        {
            name.remove_prefix(colon + 1);
        }

        std::string lowered;
        lowered.reserve(name.size());
        std::transform(name.begin(), name.end(), std::back_inserter(lowered), lower);

        // The rig marker goes before separators, so "mixamo_rig" is left alone
        for (auto pos = lowered.find(kRigPrefix); pos != std::string::npos; pos = lowered.find(kRigPrefix, pos))
        {
            lowered.erase(pos, kRigPrefix.size());
        }

        std::erase_if(lowered, [](char c) { return c == '_' || c == '-' || c == ' '; });
        return lowered;
    }

    bool BoneNameMatcher::matches(std::string_view a, std::string_view b)
    {
        return a == b || normalize(a) == normalize(b);
    }
} // namespace kine::animation
