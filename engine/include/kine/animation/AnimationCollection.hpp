#pragma once

#include "kine/animation/Animation.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kine::animation
{
    // All clips imported with one model. Built once by the import step, then
    // shared read-only by every Animator that plays from it.
    class AnimationCollection
    {
    public:
        // Appends a clip and returns its storage index. Unnamed clips are called
        // "Animation_<index>"; a name that is already taken keeps resolving to
        // the first clip that used it. Import defects are repaired and logged.
        uint32_t addClip(AnimationClip clip);

        const AnimationClip* find(std::string_view name) const;
        const AnimationClip* clip(uint32_t index) const;
        AnimationClip* clipMutable(uint32_t index);

        std::optional<uint32_t> indexOf(std::string_view name) const;

        const std::vector<AnimationClip>& clips() const { return m_clips; }
        std::vector<std::string> clipNames() const;

        size_t size() const { return m_clips.size(); }
        bool empty() const { return m_clips.empty(); }

        // First invariant violation of the clip, if any
        static core::Result<void> validateClip(const AnimationClip& clip);

    private:
        static void repairClip(AnimationClip& clip);

        std::vector<AnimationClip> m_clips;
        std::unordered_map<std::string, uint32_t> m_nameToIndex;
    };
} // namespace kine::animation
