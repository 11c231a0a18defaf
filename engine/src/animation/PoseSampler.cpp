#include "kine/animation/PoseSampler.hpp"
#include "kine/core/common.hpp"

#include <algorithm>
#include <cmath>

namespace kine::animation
{
    BoneTransform PoseSampler::sampleBone(const AnimationClip& clip, std::string_view boneName, float time)
    {
        return trySampleBone(clip, boneName, time).value_or(BoneTransform::identity());
    }

    std::optional<BoneTransform> PoseSampler::trySampleBone(const AnimationClip& clip, std::string_view boneName,
                                                            float time)
    {
        const AnimationChannel* channel = clip.findChannel(boneName);
        if (channel == nullptr)
        {
            return std::nullopt;
        }
        return sampleChannel(*channel, time);
    }

    size_t PoseSampler::findKeyframeIndex(const std::vector<Keyframe>& keys, float time, size_t hint)
    {
        const size_t count = keys.size();
        if (count < 2 || !(time > keys.front().time)) return 0;
        if (time >= keys.back().time) return count - 1;

        // Forward playback usually stays in the same interval or moves to the next one
        if (hint + 1 < count)
        {
            if (keys[hint].time <= time && time < keys[hint + 1].time) return hint;
            if (hint + 2 < count && keys[hint + 1].time <= time && time < keys[hint + 2].time) return hint + 1;
        }

        auto it = std::upper_bound(keys.begin(), keys.end(), time,
                                   [](float t, const Keyframe& key) { return t < key.time; });
        return static_cast<size_t>(std::distance(keys.begin(), it)) - 1;
    }

    BoneTransform PoseSampler::sampleChannel(const AnimationChannel& channel, float time, uint32_t* cursor)
    {
        const auto& keys = channel.keyframes;
        if (keys.empty()) return BoneTransform::identity();

        // Single key, before the first key, or NaN: first key
        if (keys.size() == 1 || !(time > keys.front().time))
        {
            return keys.front().transform();
        }
        if (time >= keys.back().time)
        {
            return keys.back().transform();
        }

        const size_t idx0 = findKeyframeIndex(keys, time, cursor ? *cursor : 0);
        if (cursor) *cursor = util::u32(idx0);

        const Keyframe& k0 = keys[idx0];
        const Keyframe& k1 = keys[idx0 + 1];

        const float span = k1.time - k0.time;
        if (!(span > 0.0f))
        {
            return k0.transform();
        }

        const float factor = (time - k0.time) / span;
        return interpolate(k0.transform(), k1.transform(), factor);
    }

    Pose PoseSampler::samplePose(const AnimationClip& clip, float time)
    {
        Pose pose;
        samplePose(clip, time, pose);
        return pose;
    }

    void PoseSampler::samplePose(const AnimationClip& clip, float time, Pose& outPose, CursorCache* cursors)
    {
        KINE_PROFILE_FUNCTION();

        const auto& channels = clip.channels();
        if (cursors && cursors->size() != channels.size())
        {
            cursors->assign(channels.size(), 0u);
        }

        outPose.clear();
        outPose.reserve(channels.size());
        for (size_t i = 0; i < channels.size(); ++i)
        {
            const auto& ch = channels[i];
            uint32_t* cursor = cursors ? &(*cursors)[i] : nullptr;
            outPose.insert_or_assign(ch.boneName, sampleChannel(ch, time, cursor));
        }
    }
} // namespace kine::animation
