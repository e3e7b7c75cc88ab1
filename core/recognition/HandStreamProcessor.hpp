#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/input/HandFrame.hpp"
#include "core/recognition/DynamicGestureDetector.hpp"
#include "core/recognition/GestureEvent.hpp"
#include "core/recognition/GestureHistory.hpp"
#include "core/recognition/StaticGestureClassifier.hpp"

namespace sl {

// Classification state for one hand stream. Create one per tracked hand so
// that concurrent streams never share a history.
class HandStreamProcessor {
public:
    explicit HandStreamProcessor(HandShapeThresholds shape = {}, DynamicThresholds motion = {},
                                 std::size_t historyCapacity = GestureHistory::kDefaultCapacity)
        : m_classifier(shape), m_detector(motion), m_history(historyCapacity) {}

    // The dynamic label reflects the frames received before this one.
    GestureEvent process(const HandFrame& frame, std::uint64_t timestampMs) {
        const StaticClassification cls = m_classifier.classify(frame);

        std::lock_guard<std::mutex> lock(m_mutex);
        GestureEvent event;
        event.staticLabel = cls.label;
        event.dynamicLabel = m_detector.detect(m_history);
        event.handedness = frame.handedness;
        event.frame = frame;
        event.confidence = frame.score;
        event.timestamp = timestampMs;
        m_lastFingers = cls.fingers;
        m_history.append(event);
        return event;
    }

    std::optional<std::string> heldGesture(std::uint64_t nowMs, std::uint64_t durationMs = 1000) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history.heldGesture(nowMs, durationMs);
    }

    std::optional<GestureEvent> latest() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        const GestureEvent* last = m_history.latest();
        if (!last)
            return std::nullopt;
        return *last;
    }

    std::vector<GestureEvent> snapshot() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history.recent(m_history.size());
    }

    FingerState lastFingers() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastFingers;
    }

    std::size_t historySize() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.clear();
        m_lastFingers = FingerState{};
    }

    const StaticGestureClassifier& classifier() const { return m_classifier; }
    const DynamicGestureDetector& detector() const { return m_detector; }

private:
    StaticGestureClassifier m_classifier;
    DynamicGestureDetector m_detector;
    GestureHistory m_history;
    FingerState m_lastFingers;
    mutable std::mutex m_mutex;
};

} // namespace sl
