#pragma once
#include <array>
#include <cmath>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/input/HandFrame.hpp"
#include "core/recognition/GestureEvent.hpp"

namespace sl {

// Empirical thresholds in normalized image units.
struct HandShapeThresholds {
    float fingerExtensionRatio{1.2f};
    float thumbExtensionRatio{1.1f};
    float thumbBesideDistance{0.08f};
    float thumbVerticalOffset{0.05f};
    float touchDistance{0.05f};
    float spreadDistance{0.08f};
    float confidence{0.8f};
};

struct FingerState {
    std::array<bool, 5> extended{};

    bool operator[](Finger f) const { return extended[static_cast<std::size_t>(f)]; }

    int count() const {
        int n = 0;
        for (bool e : extended)
            if (e)
                ++n;
        return n;
    }

    // True when exactly the given fingers are extended among the four
    // non-thumb fingers. The thumb is not considered.
    bool fingersOnly(bool index, bool middle, bool ring, bool pinky) const {
        return (*this)[Finger::Index] == index && (*this)[Finger::Middle] == middle &&
               (*this)[Finger::Ring] == ring && (*this)[Finger::Pinky] == pinky;
    }
};

// Measurements derived once per frame and shared by every rule.
struct HandShape {
    const HandFrame& frame;
    FingerState fingers;
    const HandShapeThresholds& thresholds;

    bool thumbBeside() const {
        return distance(frame.tip(Finger::Thumb), frame.base(Finger::Index)) <
               thresholds.thumbBesideDistance;
    }

    bool thumbPointingUp() const {
        const auto& tip = frame.tip(Finger::Thumb);
        const auto& mcp = frame.base(Finger::Thumb);
        return tip && mcp && tip->y < mcp->y - thresholds.thumbVerticalOffset;
    }

    bool thumbPointingDown() const {
        const auto& tip = frame.tip(Finger::Thumb);
        const auto& mcp = frame.base(Finger::Thumb);
        return tip && mcp && tip->y > mcp->y + thresholds.thumbVerticalOffset;
    }

    bool thumbTouchesIndex() const {
        return distance(frame.tip(Finger::Thumb), frame.tip(Finger::Index)) <
               thresholds.touchDistance;
    }

    bool fingersSpread() const {
        const auto& index = frame.tip(Finger::Index);
        const auto& middle = frame.tip(Finger::Middle);
        if (!index || !middle)
            return false;
        return distance(*index, *middle) > thresholds.spreadDistance;
    }

    // Thumb runs horizontally while the index finger runs vertically.
    bool lShape() const {
        const auto& thumbTip = frame.tip(Finger::Thumb);
        const auto& thumbMcp = frame.base(Finger::Thumb);
        const auto& indexTip = frame.tip(Finger::Index);
        const auto& indexMcp = frame.base(Finger::Index);
        if (!thumbTip || !thumbMcp || !indexTip || !indexMcp)
            return false;
        const bool thumbHorizontal =
            std::fabs(thumbTip->x - thumbMcp->x) > std::fabs(thumbTip->y - thumbMcp->y);
        const bool indexVertical =
            std::fabs(indexTip->y - indexMcp->y) > std::fabs(indexTip->x - indexMcp->x);
        return thumbHorizontal && indexVertical;
    }
};

struct StaticClassification {
    std::optional<std::string> label;
    FingerState fingers;
    float confidence{0.f};
};

// Rule-table classifier for single-frame hand poses. Rules are evaluated in
// order and the first whose finger guard holds decides the frame: its label
// is reported only if its qualifier (when present) also holds, otherwise the
// frame has no label. Later rules are never consulted.
class StaticGestureClassifier {
public:
    using Check = std::function<bool(const HandShape&)>;

    struct Rule {
        std::string label;
        Check guard;
        Check qualifier;
    };

    explicit StaticGestureClassifier(HandShapeThresholds thresholds = {})
        : m_thresholds(thresholds), m_rules(defaultRules()) {}

    StaticClassification classify(const HandFrame& frame) const {
        StaticClassification result;
        result.fingers = fingerState(frame);
        const HandShape shape{frame, result.fingers, m_thresholds};
        for (const auto& rule : m_rules) {
            if (!rule.guard(shape))
                continue;
            if (!rule.qualifier || rule.qualifier(shape)) {
                result.label = rule.label;
                result.confidence = m_thresholds.confidence;
            }
            break;
        }
        return result;
    }

    FingerState fingerState(const HandFrame& frame) const {
        FingerState state;
        for (Finger f : kFingers)
            state.extended[static_cast<std::size_t>(f)] = isExtended(frame, f);
        return state;
    }

    // Tip must reach further from the wrist than the base joint by the
    // finger's margin. Missing joints count as folded.
    bool isExtended(const HandFrame& frame, Finger f) const {
        const auto& wrist = frame.wrist();
        const auto& tip = frame.tip(f);
        const auto& base = frame.base(f);
        if (f == Finger::Thumb) {
            return distance(tip, wrist) >
                   distance(base, wrist) * m_thresholds.thumbExtensionRatio;
        }
        if (!wrist || !tip || !base)
            return false;
        return distance(*tip, *wrist) > distance(*base, *wrist) * m_thresholds.fingerExtensionRatio;
    }

    const std::vector<Rule>& rules() const { return m_rules; }
    const HandShapeThresholds& thresholds() const { return m_thresholds; }

    static std::vector<Rule> defaultRules() {
        const auto thumbOnly = [](const HandShape& s) {
            return s.fingers[Finger::Thumb] && s.fingers.fingersOnly(false, false, false, false);
        };
        return {
            {gesture::OpenHand,
             [](const HandShape& s) { return s.fingers.count() == 5 && !s.fingersSpread(); }, {}},
            {gesture::Fist, [](const HandShape& s) { return s.fingers.count() == 0; },
             [](const HandShape& s) { return s.thumbBeside(); }},
            {gesture::Pointing,
             [](const HandShape& s) { return s.fingers.fingersOnly(true, false, false, false); }, {}},
            {gesture::Peace,
             [](const HandShape& s) {
                 return s.fingers.fingersOnly(true, true, false, false) && s.fingersSpread();
             },
             {}},
            {gesture::ThumbsUp, thumbOnly, [](const HandShape& s) { return s.thumbPointingUp(); }},
            // Same guard as THUMBS_UP, so never reached.
            {gesture::ThumbsDown, thumbOnly, [](const HandShape& s) { return s.thumbPointingDown(); }},
            {gesture::Ok, [](const HandShape& s) { return s.thumbTouchesIndex(); }, {}},
            {gesture::LSign,
             [](const HandShape& s) {
                 return s.fingers[Finger::Thumb] && s.fingers.fingersOnly(true, false, false, false);
             },
             [](const HandShape& s) { return s.lShape(); }},
            {gesture::ISign,
             [](const HandShape& s) { return s.fingers.fingersOnly(false, false, false, true); }, {}},
            {gesture::YSign,
             [](const HandShape& s) {
                 return s.fingers[Finger::Thumb] && s.fingers.fingersOnly(false, false, false, true);
             },
             {}},
            {gesture::ThreeFingers,
             [](const HandShape& s) { return s.fingers.fingersOnly(true, true, true, false); }, {}},
        };
    }

private:
    HandShapeThresholds m_thresholds;
    std::vector<Rule> m_rules;
};

} // namespace sl
