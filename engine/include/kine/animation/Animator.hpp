#pragma once

#include "kine/animation/AnimationCollection.hpp"
#include "kine/animation/PoseSampler.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace kine::animation
{
    enum class PlayState
    {
        Stopped,
        Playing,
        Paused,
        Fading
    };

    // What a non-looping clip does once its time reaches the end
    enum class ClipEndPolicy
    {
        HoldLastFrame,
        AutoStop
    };

    std::string_view playStateToString(PlayState state);

    // Receives every pose the Animator produces. The sink turns local bone
    // transforms into whatever the skinning stage needs.
    class IPoseSink
    {
    public:
        virtual ~IPoseSink() = default;
        virtual void applyPose(const Pose& pose) = 0;
    };

    struct AnimatorConfig
    {
        float speed = 1.0f;
        float fadeDuration = 0.3f;
        ClipEndPolicy endPolicy = ClipEndPolicy::HoldLastFrame;

        // Snapshot of the anim_* console variables
        static AnimatorConfig fromCVars();
    };

    // Per-instance playback state machine: Stopped -> Playing <-> Paused, with a
    // transient Fading state while crossfading from the previous clip.
    // Single-threaded; one instance must never be driven from two threads at once.
    class Animator
    {
    public:
        static constexpr float kMinFadeDuration = 0.01f;

        explicit Animator(const AnimationCollection* collection = nullptr,
                          AnimatorConfig config = AnimatorConfig::fromCVars());

        // Stops playback; the collection is not owned
        void setCollection(const AnimationCollection* collection);
        const AnimationCollection* collection() const { return m_collection; }

        // Not owned. nullptr disables publishing, poses are still computed.
        void setPoseSink(IPoseSink* sink) { m_sink = sink; }

        // false when the collection is unset or the clip does not exist
        bool play(std::string_view clipName, bool fade = true);
        bool play(uint32_t clipIndex, bool fade = true);

        void pause();
        void resume();
        void stop();

        void update(float deltaTime);

        // --- Configuration ---
        void setSpeed(float speed) { m_speed = speed; }
        float speed() const { return m_speed; }

        // Clamped to kMinFadeDuration. Only affects fades started afterwards.
        void setFadeDuration(float seconds);
        float fadeDuration() const { return m_fadeDuration; }

        void setClipEndPolicy(ClipEndPolicy policy) { m_endPolicy = policy; }
        ClipEndPolicy clipEndPolicy() const { return m_endPolicy; }

        // --- State ---
        PlayState state() const { return m_state; }
        bool isPlaying() const { return m_state == PlayState::Playing || m_state == PlayState::Fading; }
        bool isPaused() const { return m_state == PlayState::Paused; }
        bool isFading() const { return m_previousClip.has_value(); }

        std::optional<uint32_t> currentClipIndex() const { return m_currentClip; }
        std::optional<uint32_t> previousClipIndex() const { return m_previousClip; }
        const AnimationClip* currentClip() const;
        const AnimationClip* previousClip() const;

        float currentTime() const { return m_currentTime; }
        float previousTime() const { return m_previousTime; }
        float fadeElapsed() const { return m_fadeElapsed; }
        float activeFadeDuration() const { return m_activeFadeDuration; }

        // Contribution of the current clip during a fade, 1 otherwise
        float fadeWeight() const;

        // Last pose produced by update()
        const Pose& pose() const { return m_pose; }

        std::vector<std::string> clipNames() const;

    private:
        bool startClip(uint32_t index, bool fade);

        // Advances a clip-local time by delta under the clip's loop policy.
        // Returns true when a non-looping clip sits on its end.
        static bool advanceTime(const AnimationClip& clip, float& time, float delta);

        void finishFade();
        void publish();

        const AnimationCollection* m_collection = nullptr;
        IPoseSink* m_sink = nullptr;

        std::optional<uint32_t> m_currentClip;
        float m_currentTime = 0.0f;

        std::optional<uint32_t> m_previousClip;
        float m_previousTime = 0.0f;

        float m_fadeElapsed = 0.0f;
        float m_activeFadeDuration = 0.0f;

        float m_speed = 1.0f;
        float m_fadeDuration = 0.3f;
        ClipEndPolicy m_endPolicy = ClipEndPolicy::HoldLastFrame;

        PlayState m_state = PlayState::Stopped;
        PlayState m_pausedFrom = PlayState::Playing;

        PoseSampler::CursorCache m_currentCursors;
        PoseSampler::CursorCache m_previousCursors;

        Pose m_pose;
        Pose m_currentPose;
        Pose m_previousPose;
    };
} // namespace kine::animation
