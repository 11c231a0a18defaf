#include "kine/animation/AnimationCollection.hpp"
#include "kine/core/common.hpp"

#include <algorithm>
#include <cmath>

namespace kine::animation
{
    uint32_t AnimationCollection::addClip(AnimationClip clip)
    {
        const auto index = util::u32(m_clips.size());

        if (clip.name().empty())
        {
            clip.setName("Animation_" + std::to_string(index));
        }

        if (auto valid = validateClip(clip); !valid)
        {
            core::Logger::warn("[AnimationCollection] Repairing clip '{}': {}", clip.name(), valid.error());
            repairClip(clip);
        }

        if (!m_nameToIndex.contains(clip.name()))
        {
            m_nameToIndex.emplace(clip.name(), index);
        }
        else
        {
            core::Logger::warn("[AnimationCollection] Duplicate clip name '{}' at index {}, name keeps index {}",
                               clip.name(), index, m_nameToIndex[clip.name()]);
        }

        core::Logger::debug("[AnimationCollection] Added clip '{}' ({} channels, {:.3f}s, {})", clip.name(),
                            clip.channelCount(), clip.duration(), clip.isLooping() ? "looping" : "once");

        m_clips.push_back(std::move(clip));
        return index;
    }

    const AnimationClip* AnimationCollection::find(std::string_view name) const
    {
        auto index = indexOf(name);
        return index ? &m_clips[*index] : nullptr;
    }

    const AnimationClip* AnimationCollection::clip(uint32_t index) const
    {
        return index < m_clips.size() ? &m_clips[index] : nullptr;
    }

    AnimationClip* AnimationCollection::clipMutable(uint32_t index)
    {
        return index < m_clips.size() ? &m_clips[index] : nullptr;
    }

    std::optional<uint32_t> AnimationCollection::indexOf(std::string_view name) const
    {
        auto it = m_nameToIndex.find(std::string(name));
        if (it == m_nameToIndex.end() || it->second >= m_clips.size())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> AnimationCollection::clipNames() const
    {
        std::vector<std::string> names;
        names.reserve(m_clips.size());
        for (const auto& c : m_clips)
        {
            names.push_back(c.name());
        }
        return names;
    }

    core::Result<void> AnimationCollection::validateClip(const AnimationClip& clip)
    {
        if (!(clip.duration() >= 0.0f))
        {
            return core::Unexpected<std::string>("negative duration");
        }

        for (const auto& ch : clip.channels())
        {
            if (auto valid = ch.validate(); !valid)
            {
                return valid;
            }
        }

        // A declared duration shorter than the last key is tolerated (the sampler
        // clamps), but a zero duration over moving keys cannot be played.
        if (clip.duration() == 0.0f && clip.lastKeyTime() > 0.0f)
        {
            return core::Unexpected<std::string>("zero duration with keys up to " +
                                                 std::to_string(clip.lastKeyTime()) + "s");
        }
        return {};
    }

    void AnimationCollection::repairClip(AnimationClip& clip)
    {
        if (const size_t removed = clip.removeEmptyChannels(); removed > 0)
        {
            core::Logger::warn("[AnimationCollection] '{}': dropped {} empty channel(s)", clip.name(), removed);
        }

        for (auto& ch : clip.channelsMutable())
        {
            auto& keys = ch.keyframes;

            for (auto& key : keys)
            {
                if (!(key.time >= 0.0f))
                {
                    key.time = 0.0f;
                }

                const float len = glm::length(key.rotation);
                if (len <= 0.0f || !std::isfinite(len))
                {
                    key.rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
                }
                else if (std::abs(len - 1.0f) > 1e-3f)
                {
                    key.rotation = key.rotation / len;
                }
            }

            std::stable_sort(keys.begin(), keys.end(),
                             [](const Keyframe& a, const Keyframe& b) { return a.time < b.time; });

            const size_t before = keys.size();
            keys.erase(std::unique(keys.begin(), keys.end(),
                                   [](const Keyframe& a, const Keyframe& b) { return a.time == b.time; }),
                       keys.end());
            if (keys.size() != before)
            {
                core::Logger::warn("[AnimationCollection] '{}': bone '{}' dropped {} duplicate key(s)", clip.name(),
                                   ch.boneName, before - keys.size());
            }
        }

        if (!(clip.duration() > 0.0f))
        {
            clip.setDuration(clip.lastKeyTime());
        }
    }
} // namespace kine::animation
