#pragma once

#include "kine/animation/Animator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kine::animation
{
    struct SkeletonBone
    {
        std::string name;
        int32_t parentIndex = -1; // -1 for roots
        BoneTransform restTransform;
    };

    // Pose sink that maps named bone transforms onto an indexed skeleton.
    // Bones the pose does not cover stay at their rest transform. Names are
    // matched exactly first, then through BoneNameMatcher::normalize.
    class SkeletonPoseSink : public IPoseSink
    {
    public:
        explicit SkeletonPoseSink(std::vector<SkeletonBone> bones);

        void applyPose(const Pose& pose) override;

        // Back to the bind pose
        void resetToRest();

        const std::vector<SkeletonBone>& bones() const { return m_bones; }
        const std::vector<BoneTransform>& localTransforms() const { return m_local; }
        std::vector<glm::mat4> localMatrices() const;

        std::optional<uint32_t> boneIndex(std::string_view name) const;

        // Whether the last applied pose drove this bone
        bool isAnimated(uint32_t boneIndex) const;

        uint64_t appliedPoseCount() const { return m_appliedPoses; }

    private:
        std::optional<uint32_t> resolve(const std::string& poseBoneName);

        std::vector<SkeletonBone> m_bones;
        std::vector<BoneTransform> m_local;
        std::vector<uint8_t> m_animated;

        std::unordered_map<std::string, uint32_t> m_exactLookup;
        std::unordered_map<std::string, uint32_t> m_normalizedLookup;
        std::unordered_map<std::string, std::optional<uint32_t>> m_resolved;

        uint64_t m_appliedPoses = 0;
    };
} // namespace kine::animation
