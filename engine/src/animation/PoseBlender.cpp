#include "kine/animation/PoseBlender.hpp"
#include "kine/core/common.hpp"

#include <algorithm>

namespace kine::animation
{
    BoneTransform PoseBlender::blend(const BoneTransform& a, const BoneTransform& b, float weight)
    {
        return interpolate(a, b, std::clamp(weight, 0.0f, 1.0f));
    }

    Pose PoseBlender::blend(const Pose& a, const Pose& b, float weight)
    {
        Pose out;
        blend(a, b, weight, out);
        return out;
    }

    void PoseBlender::blend(const Pose& a, const Pose& b, float weight, Pose& outPose)
    {
        KINE_ASSERT(&outPose != &a && &outPose != &b, "PoseBlender output aliases an input pose");

        const float w = std::clamp(weight, 0.0f, 1.0f);

        outPose.clear();
        outPose.reserve(std::max(a.size(), b.size()));

        for (const auto& [bone, transformA] : a)
        {
            auto itB = b.find(bone);
            if (itB == b.end())
            {
                outPose.emplace(bone, transformA);
                continue;
            }
            outPose.emplace(bone, interpolate(transformA, itB->second, w));
        }

        // Bones only animated by B
        for (const auto& [bone, transformB] : b)
        {
            if (!a.contains(bone))
            {
                outPose.emplace(bone, transformB);
            }
        }
    }
} // namespace kine::animation
