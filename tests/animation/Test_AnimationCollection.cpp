#include <doctest/doctest.h>
#include "kine/animation/AnimationCollection.hpp"
#include "AnimationTestClips.hpp"

using namespace kine::animation;
using namespace kine::test;

TEST_CASE("AnimationCollection indexing") {
    AnimationCollection collection = makeCollection();

    CHECK(collection.size() == 4);
    CHECK(collection.indexOf("Walk") == 0u);
    CHECK(collection.indexOf("Death") == 3u);
    CHECK_FALSE(collection.indexOf("Jump").has_value());

    REQUIRE(collection.find("Idle") != nullptr);
    CHECK(collection.find("Idle")->duration() == doctest::Approx(2.0f));
    CHECK(collection.find("Jump") == nullptr);

    CHECK(collection.clip(2)->name() == "Wave");
    CHECK(collection.clip(4) == nullptr);

    CHECK(collection.clipNames() == std::vector<std::string>{"Walk", "Idle", "Wave", "Death"});
}

TEST_CASE("AnimationCollection naming") {
    AnimationCollection collection;

    SUBCASE("Unnamed clips get generated names") {
        collection.addClip(makeWalk());
        const uint32_t index = collection.addClip(AnimationClip("", 1.0f));
        CHECK(index == 1);
        CHECK(collection.clip(1)->name() == "Animation_1");
        CHECK(collection.indexOf("Animation_1") == 1u);
    }

    SUBCASE("Duplicate names resolve to the first clip") {
        AnimationClip second = makeIdle();
        second.setName("Walk");

        CHECK(collection.addClip(makeWalk()) == 0);
        CHECK(collection.addClip(std::move(second)) == 1);

        CHECK(collection.size() == 2);
        CHECK(collection.indexOf("Walk") == 0u);
        CHECK(collection.clip(1)->name() == "Walk");
    }
}

TEST_CASE("AnimationCollection looping is mutable after import") {
    AnimationCollection collection = makeCollection();

    REQUIRE(collection.clipMutable(0) != nullptr);
    collection.clipMutable(0)->setLooping(false);
    CHECK_FALSE(collection.find("Walk")->isLooping());
    CHECK(collection.clipMutable(10) == nullptr);
}

TEST_CASE("AnimationClip channels") {
    AnimationClip clip = makeWalk();

    CHECK(clip.channelCount() == 3);
    CHECK(clip.channelIndex("Spine") == 1u);
    CHECK(clip.findChannel("Missing") == nullptr);
    CHECK(clip.lastKeyTime() == doctest::Approx(1.0f));
    CHECK(clip.findChannel("Head")->isStatic());
    CHECK(clip.ticksPerSecond() == doctest::Approx(25.0f));

    SUBCASE("Adding a channel for an animated bone replaces it") {
        clip.addChannel(channel("Spine", {key(0.0f, {9, 9, 9})}));
        CHECK(clip.channelCount() == 3);
        CHECK(clip.findChannel("Spine")->keyframes.size() == 1);
        CHECK(clip.findChannel("Spine")->keyframes[0].position.x == doctest::Approx(9.0f));
    }
}

TEST_CASE("AnimationChannel validation") {
    SUBCASE("Valid channel") {
        CHECK(channel("Hips", {key(0.0f, {}), key(1.0f, {})}).validate().has_value());
    }

    SUBCASE("Empty channel") {
        auto res = channel("Hips", {}).validate();
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().find("no keyframes") != std::string::npos);
    }

    SUBCASE("Out of order keys") {
        auto res = channel("Hips", {key(1.0f, {}), key(0.5f, {})}).validate();
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().find("not after") != std::string::npos);
    }

    SUBCASE("Negative time") {
        CHECK_FALSE(channel("Hips", {key(-1.0f, {})}).validate().has_value());
    }

    SUBCASE("Non-unit rotation") {
        auto ch = channel("Hips", {key(0.0f, {})});
        ch.keyframes[0].rotation = glm::quat(2.0f, 0.0f, 0.0f, 0.0f);
        CHECK_FALSE(ch.validate().has_value());
    }
}

TEST_CASE("AnimationCollection repairs imported clips") {
    AnimationClip clip("Broken", 0.0f, false);
    clip.addChannel(channel("Hips", {key(1.0f, {1, 0, 0}), key(0.0f, {0, 0, 0}), key(1.0f, {5, 0, 0}),
                                     key(2.0f, {2, 0, 0})}));
    clip.addChannel(channel("Empty", {}));
    auto scaled = channel("Spine", {key(0.0f, {})});
    scaled.keyframes[0].rotation = glm::quat(0.0f, 0.0f, 0.0f, 2.0f);
    clip.addChannel(std::move(scaled));

    CHECK_FALSE(AnimationCollection::validateClip(clip).has_value());

    AnimationCollection collection;
    collection.addClip(std::move(clip));
    const AnimationClip* repaired = collection.find("Broken");
    REQUIRE(repaired != nullptr);

    CHECK(AnimationCollection::validateClip(*repaired).has_value());
    CHECK(repaired->channelCount() == 2);
    CHECK(repaired->findChannel("Empty") == nullptr);
    CHECK(repaired->duration() == doctest::Approx(2.0f));

    const auto& hips = repaired->findChannel("Hips")->keyframes;
    REQUIRE(hips.size() == 3);
    CHECK(hips[0].time == doctest::Approx(0.0f));
    CHECK(hips[1].time == doctest::Approx(1.0f));
    // First key at a repeated time wins
    CHECK(hips[1].position.x == doctest::Approx(1.0f));
    CHECK(hips[2].time == doctest::Approx(2.0f));

    CHECK(glm::length(repaired->findChannel("Spine")->keyframes[0].rotation) == doctest::Approx(1.0f));
}

TEST_CASE("Declared duration shorter than the last key is accepted") {
    AnimationClip clip("Short", 0.5f, true);
    clip.addChannel(channel("Hips", {key(0.0f, {}), key(1.0f, {})}));

    CHECK(AnimationCollection::validateClip(clip).has_value());

    AnimationCollection collection;
    collection.addClip(std::move(clip));
    CHECK(collection.find("Short")->duration() == doctest::Approx(0.5f));
}
