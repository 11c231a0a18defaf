#pragma once

#include "kine/animation/Transform.hpp"

namespace kine::animation
{
    // Weighted combination of two poses. weight is B's share, clamped to [0, 1].
    // Bones present in only one input pass through unweighted.
    class PoseBlender
    {
    public:
        static BoneTransform blend(const BoneTransform& a, const BoneTransform& b, float weight);

        static Pose blend(const Pose& a, const Pose& b, float weight);

        // outPose must not alias either input
        static void blend(const Pose& a, const Pose& b, float weight, Pose& outPose);
    };
} // namespace kine::animation
