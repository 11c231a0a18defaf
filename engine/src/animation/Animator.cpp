#include "kine/animation/Animator.hpp"
#include "kine/animation/AnimationCVars.hpp"
#include "kine/animation/PoseBlender.hpp"
#include "kine/core/common.hpp"

#include <algorithm>
#include <cmath>

namespace kine::animation
{
    std::string_view playStateToString(PlayState state)
    {
        switch (state)
        {
        case PlayState::Stopped: return "Stopped";
        case PlayState::Playing: return "Playing";
        case PlayState::Paused:  return "Paused";
        case PlayState::Fading:  return "Fading";
        default:                 return "Unknown";
        }
    }

    AnimatorConfig AnimatorConfig::fromCVars()
    {
        AnimatorConfig config;
        config.speed = cvars::anim_playback_speed.get();
        config.fadeDuration = cvars::anim_fade_duration.get();
        config.endPolicy = cvars::anim_hold_last_frame.get() ? ClipEndPolicy::HoldLastFrame : ClipEndPolicy::AutoStop;
        return config;
    }

    Animator::Animator(const AnimationCollection* collection, AnimatorConfig config)
        : m_collection(collection), m_speed(config.speed), m_endPolicy(config.endPolicy)
    {
        setFadeDuration(config.fadeDuration);
    }

    void Animator::setCollection(const AnimationCollection* collection)
    {
        stop();
        m_currentClip.reset();
        m_currentCursors.clear();
        m_pose.clear();
        m_collection = collection;
    }

    void Animator::setFadeDuration(float seconds)
    {
        m_fadeDuration = std::max(kMinFadeDuration, seconds);
    }

    const AnimationClip* Animator::currentClip() const
    {
        return (m_collection && m_currentClip) ? m_collection->clip(*m_currentClip) : nullptr;
    }

    const AnimationClip* Animator::previousClip() const
    {
        return (m_collection && m_previousClip) ? m_collection->clip(*m_previousClip) : nullptr;
    }

    float Animator::fadeWeight() const
    {
        if (!m_previousClip)
        {
            return 1.0f;
        }
        return std::clamp(m_fadeElapsed / m_activeFadeDuration, 0.0f, 1.0f);
    }

    std::vector<std::string> Animator::clipNames() const
    {
        return m_collection ? m_collection->clipNames() : std::vector<std::string>{};
    }

    bool Animator::play(std::string_view clipName, bool fade)
    {
        if (m_collection == nullptr)
        {
            core::Logger::warn("[Animator] No animation collection set, cannot play '{}'", clipName);
            return false;
        }

        auto index = m_collection->indexOf(clipName);
        if (!index)
        {
            core::Logger::warn("[Animator] Animation '{}' not found", clipName);
            return false;
        }
        return startClip(*index, fade);
    }

    bool Animator::play(uint32_t clipIndex, bool fade)
    {
        if (m_collection == nullptr)
        {
            core::Logger::warn("[Animator] No animation collection set, cannot play index {}", clipIndex);
            return false;
        }

        if (clipIndex >= m_collection->size())
        {
            core::Logger::warn("[Animator] Animation index {} out of range ({} clips)", clipIndex,
                               m_collection->size());
            return false;
        }
        return startClip(clipIndex, fade);
    }

    bool Animator::startClip(uint32_t index, bool fade)
    {
        const bool active = m_currentClip.has_value() && m_state != PlayState::Stopped;

        if (fade && active && *m_currentClip == index)
        {
            return true;
        }

        if (fade && active)
        {
            m_previousClip = m_currentClip;
            m_previousTime = m_currentTime;
            m_previousCursors.swap(m_currentCursors);
            m_fadeElapsed = 0.0f;
            m_activeFadeDuration = m_fadeDuration;
            m_state = PlayState::Fading;
        }
        else
        {
            m_previousClip.reset();
            m_previousTime = 0.0f;
            m_previousCursors.clear();
            m_fadeElapsed = 0.0f;
            m_state = PlayState::Playing;
        }

        m_currentClip = index;
        m_currentTime = 0.0f;
        m_currentCursors.clear();

        core::Logger::debug("[Animator] Playing '{}' {}", m_collection->clip(index)->name(),
                            m_state == PlayState::Fading ? "with fade" : "without fade");
        return true;
    }

    void Animator::pause()
    {
        if (m_state != PlayState::Playing && m_state != PlayState::Fading)
        {
            return;
        }
        m_pausedFrom = m_state;
        m_state = PlayState::Paused;
        core::Logger::debug("[Animator] Paused at {:.3f}s", m_currentTime);
    }

    void Animator::resume()
    {
        if (m_state != PlayState::Paused)
        {
            return;
        }
        m_state = m_pausedFrom;
        core::Logger::debug("[Animator] Resumed ({})", playStateToString(m_state));
    }

    void Animator::stop()
    {
        m_state = PlayState::Stopped;
        m_currentTime = 0.0f;
        m_previousClip.reset();
        m_previousTime = 0.0f;
        m_previousCursors.clear();
        m_fadeElapsed = 0.0f;
        core::Logger::debug("[Animator] Stopped");
    }

    bool Animator::advanceTime(const AnimationClip& clip, float& time, float delta)
    {
        const float duration = clip.duration();
        time += delta;

        if (!(duration > 0.0f))
        {
            time = 0.0f;
            return !clip.isLooping();
        }

        if (clip.isLooping())
        {
            if (time >= duration || time < 0.0f)
            {
                time = std::fmod(time, duration);
                if (time < 0.0f)
                {
                    time += duration;
                }
                // fmod of a tiny negative value can round back up to duration
                if (time >= duration)
                {
                    time = 0.0f;
                }
            }
            return false;
        }

        if (time >= duration)
        {
            time = duration;
            return true;
        }
        if (time <= 0.0f)
        {
            time = 0.0f;
            return delta < 0.0f;
        }
        return false;
    }

    void Animator::update(float deltaTime)
    {
        KINE_PROFILE_FUNCTION();

        if (m_state != PlayState::Playing && m_state != PlayState::Fading)
        {
            return;
        }

        KINE_ASSERT(m_currentClip.has_value(), "Animator is running without a current clip");
        const AnimationClip* current = currentClip();
        if (current == nullptr)
        {
            return;
        }

        const float delta = deltaTime * m_speed;
        const bool reachedEnd = advanceTime(*current, m_currentTime, delta);

        if (m_state == PlayState::Fading)
        {
            m_fadeElapsed += deltaTime;

            const AnimationClip* previous = previousClip();
            if (previous == nullptr || fadeWeight() >= 1.0f)
            {
                finishFade();
            }
            else
            {
                advanceTime(*previous, m_previousTime, delta);
                PoseSampler::samplePose(*previous, m_previousTime, m_previousPose, &m_previousCursors);
                PoseSampler::samplePose(*current, m_currentTime, m_currentPose, &m_currentCursors);
                PoseBlender::blend(m_previousPose, m_currentPose, fadeWeight(), m_pose);
            }
        }

        if (m_state == PlayState::Playing)
        {
            PoseSampler::samplePose(*current, m_currentTime, m_pose, &m_currentCursors);
        }

        publish();

        if (reachedEnd && m_endPolicy == ClipEndPolicy::AutoStop)
        {
            m_state = PlayState::Stopped;
            m_previousClip.reset();
            m_previousCursors.clear();
            core::Logger::debug("[Animator] '{}' finished", current->name());
        }
    }

    void Animator::finishFade()
    {
        m_previousClip.reset();
        m_previousTime = 0.0f;
        m_previousCursors.clear();
        m_previousPose.clear();
        m_state = PlayState::Playing;
    }

    void Animator::publish()
    {
        if (m_sink)
        {
            m_sink->applyPose(m_pose);
        }
    }
} // namespace kine::animation
