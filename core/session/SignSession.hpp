#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/config/EngineConfig.hpp"
#include "core/input/FaceFrame.hpp"
#include "core/input/HandFrame.hpp"
#include "core/mood/MoodTracker.hpp"
#include "core/recognition/GestureEvent.hpp"
#include "core/recognition/HandStreamProcessor.hpp"
#include "core/translation/GestureDictionary.hpp"
#include "core/translation/TranslationEngine.hpp"

namespace sl {

struct HandTickResult {
    std::vector<GestureEvent> events;
    std::optional<TranslationUpdate> update;
};

// Owns every piece of per-user state: one processor per hand, the mood
// tracker, and the translation buffer. Hand and face ticks may arrive from
// different threads; the only value crossing between them is the mood
// snapshot read when a hand tick is translated.
class SignSession {
public:
    explicit SignSession(const EngineConfig& config = {},
                         GestureDictionary dictionary = GestureDictionary::builtin())
        : m_config(config),
          m_left(config.handShape, config.motion, config.gestureHistoryCapacity),
          m_right(config.handShape, config.motion, config.gestureHistoryCapacity),
          m_mood(config.mood, config.moodHistoryCapacity),
          m_translation(std::move(dictionary), config.translationTimeoutMs) {}

    HandTickResult onHandFrames(const std::vector<HandFrame>& frames, std::uint64_t timestampMs) {
        HandTickResult result;
        const Mood mood = m_mood.current().mood;
        for (const auto& frame : frames) {
            GestureEvent event = processor(frame.handedness).process(frame, timestampMs);
            if (auto update = m_translation.processRealTimeGesture(event, mood, timestampMs))
                result.update = std::move(update);
            result.events.push_back(std::move(event));
        }
        return result;
    }

    MoodReading onFaceFrames(const std::vector<FaceFrame>& faces, std::uint64_t timestampMs) {
        return m_mood.observe(faces, timestampMs);
    }

    std::optional<std::string> heldGesture(Handedness hand, std::uint64_t nowMs) const {
        return processor(hand).heldGesture(nowMs, m_config.heldDurationMs);
    }

    void clear() {
        m_left.clear();
        m_right.clear();
        m_mood.clear();
        m_translation.clearBuffer();
    }

    HandStreamProcessor& processor(Handedness hand) { return hand == Handedness::Left ? m_left : m_right; }
    const HandStreamProcessor& processor(Handedness hand) const {
        return hand == Handedness::Left ? m_left : m_right;
    }
    MoodTracker& mood() { return m_mood; }
    const MoodTracker& mood() const { return m_mood; }
    TranslationEngine& translation() { return m_translation; }
    const TranslationEngine& translation() const { return m_translation; }
    const EngineConfig& config() const { return m_config; }

private:
    EngineConfig m_config;
    HandStreamProcessor m_left;
    HandStreamProcessor m_right;
    MoodTracker m_mood;
    TranslationEngine m_translation;
};

} // namespace sl
