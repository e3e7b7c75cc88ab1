#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/recognition/GestureEvent.hpp"
#include "core/recognition/GestureHistory.hpp"
#include "utils/Geometry.hpp"

namespace sl {

struct DynamicThresholds {
    std::size_t window{5};
    float swipeDistance{0.3f};
    float waveDeadband{0.02f};
    int waveDirectionChanges{2};
};

// Motion patterns over the wrist track of the most recent frames.
class DynamicGestureDetector {
public:
    explicit DynamicGestureDetector(DynamicThresholds thresholds = {})
        : m_thresholds(thresholds) {}

    std::optional<std::string> detect(const GestureHistory& history) const {
        if (history.size() < m_thresholds.window)
            return std::nullopt;
        std::vector<FeaturePoint> track;
        track.reserve(m_thresholds.window);
        for (const auto& event : history.recent(m_thresholds.window))
            track.push_back(event.frame.wrist().value_or(FeaturePoint{}));
        return detect(track);
    }

    // Uses the trailing `window` points of `track`.
    std::optional<std::string> detect(const std::vector<FeaturePoint>& track) const {
        if (m_thresholds.window < 2 || track.size() < m_thresholds.window)
            return std::nullopt;
        const std::vector<FeaturePoint> pts(track.end() - static_cast<std::ptrdiff_t>(m_thresholds.window),
                                            track.end());
        const auto x = [](const FeaturePoint& p) { return p.x; };
        const auto y = [](const FeaturePoint& p) { return p.y; };

        if (isSwipe(pts, x, true))
            return gesture::SwipeRight;
        if (isSwipe(pts, x, false))
            return gesture::SwipeLeft;
        // Image y grows downwards.
        if (isSwipe(pts, y, false))
            return gesture::SwipeUp;
        if (isSwipe(pts, y, true))
            return gesture::SwipeDown;
        if (isWaving(pts))
            return gesture::Wave;
        return std::nullopt;
    }

    // Counts horizontal direction changes, including the first move away
    // from rest. Deltas inside the deadband carry no direction.
    int directionChanges(const std::vector<FeaturePoint>& pts) const {
        int direction = 0;
        int changes = 0;
        for (std::size_t i = 1; i < pts.size(); ++i) {
            const float diff = pts[i].x - pts[i - 1].x;
            const int current = diff > m_thresholds.waveDeadband
                                    ? 1
                                    : (diff < -m_thresholds.waveDeadband ? -1 : 0);
            if (current != 0 && current != direction) {
                ++changes;
                direction = current;
            }
        }
        return changes;
    }

    const DynamicThresholds& thresholds() const { return m_thresholds; }

private:
    // Strictly monotonic along `axis` with total travel above the swipe distance.
    bool isSwipe(const std::vector<FeaturePoint>& pts,
                 const std::function<float(const FeaturePoint&)>& axis, bool increasing) const {
        for (std::size_t i = 1; i < pts.size(); ++i) {
            const float prev = axis(pts[i - 1]);
            const float cur = axis(pts[i]);
            if (increasing ? !(cur > prev) : !(cur < prev))
                return false;
        }
        const float travel = axis(pts.back()) - axis(pts.front());
        return (increasing ? travel : -travel) > m_thresholds.swipeDistance;
    }

    bool isWaving(const std::vector<FeaturePoint>& pts) const {
        if (pts.size() < m_thresholds.window)
            return false;
        return directionChanges(pts) >= m_thresholds.waveDirectionChanges;
    }

    DynamicThresholds m_thresholds;
};

} // namespace sl
