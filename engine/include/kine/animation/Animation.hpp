#pragma once

#include "kine/animation/Transform.hpp"
#include "kine/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kine::animation
{
    // --- Keyframe Data ---
    struct Keyframe
    {
        float time = 0.0f; // Seconds from clip start
        glm::vec3 position{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 scale{1.0f};

        BoneTransform transform() const { return {position, rotation, scale}; }
    };

    struct AnimationChannel
    {
        std::string boneName;
        std::vector<Keyframe> keyframes; // Strictly increasing time

        bool isStatic() const { return keyframes.size() == 1; }
        float startTime() const { return keyframes.empty() ? 0.0f : keyframes.front().time; }
        float endTime() const { return keyframes.empty() ? 0.0f : keyframes.back().time; }

        // Checks the import invariants: at least one key, non-negative strictly
        // increasing times, unit rotations.
        core::Result<void> validate() const;
    };

    // A named animation over a subset of bones. Channels are stored densely and
    // looked up by bone name; the storage order is stable for the clip's lifetime.
    class AnimationClip
    {
    public:
        AnimationClip() = default;
        explicit AnimationClip(std::string name, float duration = 0.0f, bool looping = true);

        const std::string& name() const { return m_name; }
        void setName(std::string name) { m_name = std::move(name); }

        float duration() const { return m_duration; }
        void setDuration(float duration) { m_duration = duration; }

        // Source tick rate, kept as import metadata. Times are always seconds.
        float ticksPerSecond() const { return m_ticksPerSecond; }
        void setTicksPerSecond(float tps) { m_ticksPerSecond = tps; }

        bool isLooping() const { return m_isLooping; }
        void setLooping(bool looping) { m_isLooping = looping; }

        // Replaces an existing channel for the same bone.
        void addChannel(AnimationChannel channel);

        const std::vector<AnimationChannel>& channels() const { return m_channels; }
        size_t channelCount() const { return m_channels.size(); }

        // Keyframe edits only; bone names must not be changed through this.
        std::vector<AnimationChannel>& channelsMutable() { return m_channels; }

        const AnimationChannel* findChannel(std::string_view boneName) const;
        std::optional<uint32_t> channelIndex(std::string_view boneName) const;

        // Removes channels without keyframes, returns how many were removed
        size_t removeEmptyChannels();

        // Latest keyframe time over all channels
        float lastKeyTime() const;

    private:
        void rebuildLookup();

        std::string m_name;
        float m_duration = 0.0f;
        float m_ticksPerSecond = 25.0f;
        bool m_isLooping = true;

        std::vector<AnimationChannel> m_channels;
        std::unordered_map<std::string, uint32_t> m_channelLookup;
    };
} // namespace kine::animation
