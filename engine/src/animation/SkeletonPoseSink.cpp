#include "kine/animation/SkeletonPoseSink.hpp"
#include "kine/animation/BoneNameMatcher.hpp"
#include "kine/core/common.hpp"

namespace kine::animation
{
    SkeletonPoseSink::SkeletonPoseSink(std::vector<SkeletonBone> bones)
        : m_bones(std::move(bones))
    {
        m_exactLookup.reserve(m_bones.size());
        m_normalizedLookup.reserve(m_bones.size());

        for (size_t i = 0; i < m_bones.size(); ++i)
        {
            const auto& bone = m_bones[i];
            const int32_t parent = bone.parentIndex;
            if (parent < -1 || parent >= static_cast<int32_t>(m_bones.size()) || parent == static_cast<int32_t>(i))
            {
                core::Logger::warn("[SkeletonPoseSink] Bone '{}' has invalid parent {}, treating as root", bone.name,
                                   bone.parentIndex);
                m_bones[i].parentIndex = -1;
            }

            m_exactLookup.try_emplace(bone.name, util::u32(i));
            m_normalizedLookup.try_emplace(BoneNameMatcher::normalize(bone.name), util::u32(i));
        }

        resetToRest();
    }

    void SkeletonPoseSink::resetToRest()
    {
        m_local.resize(m_bones.size());
        m_animated.assign(m_bones.size(), 0);
        for (size_t i = 0; i < m_bones.size(); ++i)
        {
            m_local[i] = m_bones[i].restTransform;
        }
    }

    void SkeletonPoseSink::applyPose(const Pose& pose)
    {
        resetToRest();

        for (const auto& [boneName, transform] : pose)
        {
            if (auto index = resolve(boneName))
            {
                m_local[*index] = transform;
                m_animated[*index] = 1;
            }
        }
        ++m_appliedPoses;
    }

    std::vector<glm::mat4> SkeletonPoseSink::localMatrices() const
    {
        std::vector<glm::mat4> matrices;
        matrices.reserve(m_local.size());
        for (const auto& t : m_local)
        {
            matrices.push_back(toMatrix(t));
        }
        return matrices;
    }

    std::optional<uint32_t> SkeletonPoseSink::boneIndex(std::string_view name) const
    {
        auto it = m_exactLookup.find(std::string(name));
        if (it == m_exactLookup.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool SkeletonPoseSink::isAnimated(uint32_t boneIndex) const
    {
        return boneIndex < m_animated.size() && m_animated[boneIndex] != 0;
    }

    std::optional<uint32_t> SkeletonPoseSink::resolve(const std::string& poseBoneName)
    {
        if (auto cached = m_resolved.find(poseBoneName); cached != m_resolved.end())
        {
            return cached->second;
        }

        std::optional<uint32_t> result;
        if (auto it = m_exactLookup.find(poseBoneName); it != m_exactLookup.end())
        {
            result = it->second;
        }
        else if (auto norm = m_normalizedLookup.find(BoneNameMatcher::normalize(poseBoneName));
                 norm != m_normalizedLookup.end())
        {
            result = norm->second;
        }
        else
        {
            core::Logger::warn("[SkeletonPoseSink] Pose bone '{}' matches no skeleton bone", poseBoneName);
        }

        m_resolved.emplace(poseBoneName, result);
        return result;
    }
} // namespace kine::animation
