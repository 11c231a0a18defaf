#include "kine/animation/AnimationCVars.hpp"
#include "kine/animation/Animator.hpp"
#include "kine/animation/SkeletonPoseSink.hpp"
#include "kine/core/Stopwatch.hpp"
#include "kine/core/cvar.hpp"
#include "kine/core/logger.hpp"
#include "kine/core/profiler.hpp"

#include <glm/gtc/quaternion.hpp>
#include <spdlog/fmt/ranges.h>

#include <functional>
#include <vector>

using namespace kine;
using namespace kine::animation;

namespace {

Keyframe makeKey(float time, glm::vec3 position, float yawDegrees) {
    Keyframe k;
    k.time = time;
    k.position = position;
    k.rotation = glm::angleAxis(glm::radians(yawDegrees), glm::vec3(0.0f, 1.0f, 0.0f));
    return k;
}

AnimationCollection buildCollection() {
    AnimationCollection collection;

    AnimationClip idle("Idle", 2.0f, true);
    idle.addChannel({"Hips", {makeKey(0.0f, {0, 1.0f, 0}, 0), makeKey(1.0f, {0, 1.05f, 0}, 5), makeKey(2.0f, {0, 1.0f, 0}, 0)}});
    idle.addChannel({"Spine", {makeKey(0.0f, {0, 0.4f, 0}, 0)}});
    collection.addClip(std::move(idle));

    AnimationClip walk("Walk", 1.0f, true);
    walk.addChannel({"Hips", {makeKey(0.0f, {0, 1.0f, 0}, -10), makeKey(0.5f, {0, 1.1f, 0.5f}, 10), makeKey(1.0f, {0, 1.0f, 1.0f}, -10)}});
    walk.addChannel({"LeftLeg", {makeKey(0.0f, {0.1f, -0.5f, 0}, 30), makeKey(0.5f, {0.1f, -0.5f, 0}, -30), makeKey(1.0f, {0.1f, -0.5f, 0}, 30)}});
    collection.addClip(std::move(walk));

    // Unnamed on purpose: the collection calls it Animation_2
    AnimationClip wave("", 1.5f, false);
    wave.addChannel({"LeftArm", {makeKey(0.0f, {0.3f, 0.2f, 0}, 0), makeKey(0.75f, {0.3f, 0.5f, 0}, 80)}});
    collection.addClip(std::move(wave));

    return collection;
}

std::vector<SkeletonBone> buildSkeleton() {
    return {
        {"mixamorig:Hips", -1, {}},
        {"mixamorig:Spine", 0, {}},
        {"mixamorig:LeftArm", 1, {}},
        {"mixamorig:Left_Leg", 0, {}},
    };
}

struct ScriptedEvent {
    int frame;
    const char* label;
    std::function<void(Animator&)> action;
};

} // namespace

int main(int argc, char** argv) {
    core::Logger::init();

    if (argc > 1) {
        if (auto loaded = core::CVarSystem::loadFromIni(argv[1]); !loaded) {
            core::Logger::error("Failed to load settings, using defaults: {}", loaded.error());
        }
    }

    const AnimationCollection collection = buildCollection();
    SkeletonPoseSink skeleton(buildSkeleton());

    Animator animator(&collection);
    animator.setPoseSink(&skeleton);

    core::Logger::info("Clips: {}", fmt::join(animator.clipNames(), ", "));

    constexpr float kFrameTime = 1.0f / 60.0f;
    constexpr int kFrameCount = 300;

    const std::vector<ScriptedEvent> script = {
        {0, "play Idle", [](Animator& a) { a.play("Idle", false); }},
        {60, "crossfade to Walk", [](Animator& a) { a.play("Walk", true); }},
        {120, "pause", [](Animator& a) { a.pause(); }},
        {150, "resume", [](Animator& a) { a.resume(); }},
        {180, "play Animation_2", [](Animator& a) { a.play("Animation_2", false); }},
        {200, "play missing clip", [](Animator& a) { a.play("Jump", true); }},
        {270, "stop", [](Animator& a) { a.stop(); }},
    };

    const auto hipsIndex = skeleton.boneIndex("mixamorig:Hips");
    size_t nextEvent = 0;
    core::Stopwatch updateCost;

    for (int frame = 0; frame < kFrameCount; ++frame) {
        while (nextEvent < script.size() && script[nextEvent].frame == frame) {
            KINE_PROFILE_SCOPE("ScriptedEvent");
            core::Logger::info("[frame {}] {}", frame, script[nextEvent].label);
            script[nextEvent].action(animator);
            ++nextEvent;
        }

        updateCost.start();
        animator.update(kFrameTime);
        updateCost.stop();
        KINE_PROFILE_FRAME_MARK();

        if (frame % 15 == 0 && hipsIndex) {
            const auto& hips = skeleton.localTransforms()[*hipsIndex];
            core::Logger::info("[frame {:3}] {:8} t={:.3f} w={:.2f} hips=({:.3f}, {:.3f}, {:.3f})", frame,
                               playStateToString(animator.state()), animator.currentTime(), animator.fadeWeight(),
                               hips.position.x, hips.position.y, hips.position.z);
        }
    }

    core::Logger::info("Applied {} poses, average update {:.2f} us", skeleton.appliedPoseCount(),
                       updateCost.averageMicroseconds());

    core::Logger::shutdown();
    return 0;
}
