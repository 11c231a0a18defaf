#pragma once

#include "kine/animation/Animation.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace kine::animation
{
    // Stateless keyframe sampling. Looping is the caller's concern: times
    // outside a channel's key range clamp to its first / last key.
    class PoseSampler
    {
    public:
        // Per-channel keyframe index hints for one clip, indexed like
        // AnimationClip::channels(). Speeds up forward playback only; results
        // are identical with or without it.
        using CursorCache = std::vector<uint32_t>;

        // Identity when the clip has no channel for the bone
        static BoneTransform sampleBone(const AnimationClip& clip, std::string_view boneName, float time);
        static std::optional<BoneTransform> trySampleBone(const AnimationClip& clip, std::string_view boneName,
                                                          float time);

        static BoneTransform sampleChannel(const AnimationChannel& channel, float time, uint32_t* cursor = nullptr);

        // Every channel of the clip in one pass
        static Pose samplePose(const AnimationClip& clip, float time);
        static void samplePose(const AnimationClip& clip, float time, Pose& outPose, CursorCache* cursors = nullptr);

        // Index i of the key with keys[i].time <= time < keys[i + 1].time,
        // clamped to [0, size - 1].
        static size_t findKeyframeIndex(const std::vector<Keyframe>& keys, float time, size_t hint = 0);
    };
} // namespace kine::animation
