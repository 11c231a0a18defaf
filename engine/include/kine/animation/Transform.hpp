#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <string>
#include <unordered_map>

namespace kine::animation
{
    // Local (parent-relative) transform of a single bone
    struct BoneTransform
    {
        glm::vec3 position{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 scale{1.0f};

        static BoneTransform identity() { return {}; }

        bool operator==(const BoneTransform&) const = default;
    };

    // boneName -> local transform at one instant
    using Pose = std::unordered_map<std::string, BoneTransform>;

    // Spherical interpolation along the shorter arc, re-normalized.
    inline glm::quat slerpShortest(const glm::quat& from, glm::quat to, float t)
    {
        if (glm::dot(from, to) < 0.0f)
        {
            to = -to;
        }
        return glm::normalize(glm::slerp(from, to, t));
    }

    // Linear position/scale, shortest-arc rotation. The endpoints are returned
    // untouched so that t == 0 / t == 1 reproduce the inputs exactly.
    inline BoneTransform interpolate(const BoneTransform& a, const BoneTransform& b, float t)
    {
        if (t <= 0.0f) return a;
        if (t >= 1.0f) return b;

        BoneTransform out;
        out.position = glm::mix(a.position, b.position, t);
        out.rotation = slerpShortest(a.rotation, b.rotation, t);
        out.scale = glm::mix(a.scale, b.scale, t);
        return out;
    }

    // translate * rotate * scale
    glm::mat4 toMatrix(const BoneTransform& transform);
} // namespace kine::animation
