#include "kine/animation/Animation.hpp"
#include "kine/core/common.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace kine::animation
{
    namespace
    {
        constexpr float kUnitTolerance = 1e-3f;
    }

    core::Result<void> AnimationChannel::validate() const
    {
        if (keyframes.empty())
        {
            return core::Unexpected<std::string>("channel '" + boneName + "' has no keyframes");
        }

        for (size_t i = 0; i < keyframes.size(); ++i)
        {
            const auto& key = keyframes[i];
            if (!(key.time >= 0.0f))
            {
                return core::Unexpected<std::string>("channel '" + boneName + "' key " + std::to_string(i) +
                                                     " has negative time");
            }
            if (i > 0 && !(key.time > keyframes[i - 1].time))
            {
                return core::Unexpected<std::string>("channel '" + boneName + "' key " + std::to_string(i) +
                                                     " is not after the previous key");
            }
            if (std::abs(glm::length(key.rotation) - 1.0f) > kUnitTolerance)
            {
                return core::Unexpected<std::string>("channel '" + boneName + "' key " + std::to_string(i) +
                                                     " has a non-unit rotation");
            }
        }
        return {};
    }

    AnimationClip::AnimationClip(std::string name, float duration, bool looping)
        : m_name(std::move(name)), m_duration(duration), m_isLooping(looping)
    {
    }

    void AnimationClip::addChannel(AnimationChannel channel)
    {
        auto it = m_channelLookup.find(channel.boneName);
        if (it != m_channelLookup.end())
        {
            core::Logger::warn("[AnimationClip] '{}' already animates bone '{}', replacing channel", m_name,
                               channel.boneName);
            m_channels[it->second] = std::move(channel);
            return;
        }

        const auto index = util::u32(m_channels.size());
        m_channelLookup.emplace(channel.boneName, index);
        m_channels.push_back(std::move(channel));
    }

    const AnimationChannel* AnimationClip::findChannel(std::string_view boneName) const
    {
        auto index = channelIndex(boneName);
        return index ? &m_channels[*index] : nullptr;
    }

    std::optional<uint32_t> AnimationClip::channelIndex(std::string_view boneName) const
    {
        auto it = m_channelLookup.find(std::string(boneName));
        if (it == m_channelLookup.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    size_t AnimationClip::removeEmptyChannels()
    {
        const size_t before = m_channels.size();
        std::erase_if(m_channels, [](const AnimationChannel& ch) { return ch.keyframes.empty(); });
        const size_t removed = before - m_channels.size();
        if (removed > 0)
        {
            rebuildLookup();
        }
        return removed;
    }

    float AnimationClip::lastKeyTime() const
    {
        float last = 0.0f;
        for (const auto& ch : m_channels)
        {
            last = std::max(last, ch.endTime());
        }
        return last;
    }

    void AnimationClip::rebuildLookup()
    {
        m_channelLookup.clear();
        m_channelLookup.reserve(m_channels.size());
        for (size_t i = 0; i < m_channels.size(); ++i)
        {
            m_channelLookup.emplace(m_channels[i].boneName, util::u32(i));
        }
    }
} // namespace kine::animation
