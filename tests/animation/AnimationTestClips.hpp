#pragma once

#include "kine/animation/AnimationCollection.hpp"

#include <doctest/doctest.h>
#include <glm/gtc/quaternion.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace kine::test
{
    using namespace kine::animation;

    inline glm::quat yaw(float degrees)
    {
        return glm::angleAxis(glm::radians(degrees), glm::vec3(0.0f, 1.0f, 0.0f));
    }

    inline Keyframe key(float time, glm::vec3 position, float yawDegrees = 0.0f, glm::vec3 scale = glm::vec3(1.0f))
    {
        Keyframe k;
        k.time = time;
        k.position = position;
        k.rotation = yaw(yawDegrees);
        k.scale = scale;
        return k;
    }

    inline AnimationChannel channel(std::string bone, std::vector<Keyframe> keys)
    {
        AnimationChannel ch;
        ch.boneName = std::move(bone);
        ch.keyframes = std::move(keys);
        return ch;
    }

    // Hips: 3 keys over 1s, Spine: 2 keys, Head: static
    inline AnimationClip makeWalk()
    {
        AnimationClip clip("Walk", 1.0f, true);
        clip.addChannel(channel("Hips", {key(0.0f, {0, 1, 0}, 0.0f), key(0.5f, {0, 1.2f, 1}, 30.0f),
                                         key(1.0f, {0, 1, 2}, 60.0f)}));
        clip.addChannel(channel("Spine", {key(0.0f, {0, 0.5f, 0}, -10.0f, glm::vec3(1.0f)),
                                          key(1.0f, {0, 0.5f, 0}, 10.0f, glm::vec3(2.0f))}));
        clip.addChannel(channel("Head", {key(0.0f, {0, 0.3f, 0}, 5.0f)}));
        return clip;
    }

    inline AnimationClip makeIdle()
    {
        AnimationClip clip("Idle", 2.0f, true);
        clip.addChannel(channel("Hips", {key(0.0f, {0, 1, 0}), key(1.0f, {0, 1.1f, 0}, 20.0f),
                                         key(2.0f, {0, 1, 0})}));
        clip.addChannel(channel("Spine", {key(0.0f, {0, 0.5f, 0}), key(2.0f, {0, 0.5f, 0}, 40.0f)}));
        return clip;
    }

    // Shares Hips with the others, adds LeftArm; the channel ends before the clip does
    inline AnimationClip makeWave()
    {
        AnimationClip clip("Wave", 1.5f, true);
        clip.addChannel(channel("Hips", {key(0.0f, {1, 1, 0}, 90.0f), key(1.5f, {2, 1, 0}, 120.0f)}));
        clip.addChannel(channel("LeftArm", {key(0.0f, {0.2f, 1.4f, 0}), key(0.75f, {0.3f, 1.8f, 0}, 45.0f)}));
        return clip;
    }

    inline AnimationClip makeDeath()
    {
        AnimationClip clip("Death", 3.0f, false);
        clip.addChannel(channel("Hips", {key(0.0f, {0, 1, 0}), key(1.5f, {0, 0.6f, 0.5f}, 45.0f),
                                         key(3.0f, {0, 0.1f, 1}, 90.0f)}));
        clip.addChannel(channel("Spine", {key(0.0f, {0, 0.5f, 0}), key(2.0f, {0, 0.4f, 0}, -30.0f)}));
        return clip;
    }

    // Walk = 0, Idle = 1, Wave = 2, Death = 3
    inline AnimationCollection makeCollection()
    {
        AnimationCollection collection;
        collection.addClip(makeWalk());
        collection.addClip(makeIdle());
        collection.addClip(makeWave());
        collection.addClip(makeDeath());
        return collection;
    }

    inline void checkApprox(const glm::vec3& a, const glm::vec3& b, double eps = 1e-5)
    {
        CHECK(a.x == doctest::Approx(b.x).epsilon(eps));
        CHECK(a.y == doctest::Approx(b.y).epsilon(eps));
        CHECK(a.z == doctest::Approx(b.z).epsilon(eps));
    }

    // Same rotation, either sign
    inline void checkSameRotation(const glm::quat& a, const glm::quat& b, float eps = 1e-4f)
    {
        CHECK(std::abs(glm::dot(a, b)) == doctest::Approx(1.0f).epsilon(eps));
    }

    inline void checkApprox(const BoneTransform& a, const BoneTransform& b)
    {
        checkApprox(a.position, b.position);
        checkApprox(a.scale, b.scale);
        checkSameRotation(a.rotation, b.rotation);
    }

    inline void checkApprox(const Pose& a, const Pose& b)
    {
        REQUIRE(a.size() == b.size());
        for (const auto& [bone, transform] : a)
        {
            INFO("bone: ", bone);
            auto it = b.find(bone);
            REQUIRE(it != b.end());
            checkApprox(transform, it->second);
        }
    }
} // namespace kine::test
