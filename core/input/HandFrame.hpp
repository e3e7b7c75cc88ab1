#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "utils/Geometry.hpp"

namespace sl {

enum class Handedness { Left, Right };

inline const char* handednessName(Handedness h) {
    return h == Handedness::Left ? "Left" : "Right";
}

inline std::optional<Handedness> handednessFromName(const std::string& name) {
    if (name == "Left" || name == "left")
        return Handedness::Left;
    if (name == "Right" || name == "right")
        return Handedness::Right;
    return std::nullopt;
}

// Landmark roles in the 21-point hand model ordering.
enum class HandLandmark : std::size_t {
    Wrist = 0,
    ThumbCmc,
    ThumbMcp,
    ThumbIp,
    ThumbTip,
    IndexMcp,
    IndexPip,
    IndexDip,
    IndexTip,
    MiddleMcp,
    MiddlePip,
    MiddleDip,
    MiddleTip,
    RingMcp,
    RingPip,
    RingDip,
    RingTip,
    PinkyMcp,
    PinkyPip,
    PinkyDip,
    PinkyTip,
    Count
};

constexpr std::size_t kHandLandmarkCount = static_cast<std::size_t>(HandLandmark::Count);

enum class Finger { Thumb = 0, Index, Middle, Ring, Pinky };

constexpr std::array<Finger, 5> kFingers{Finger::Thumb, Finger::Index, Finger::Middle,
                                         Finger::Ring, Finger::Pinky};

inline const char* fingerName(Finger f) {
    switch (f) {
    case Finger::Thumb:
        return "Thumb";
    case Finger::Index:
        return "Index";
    case Finger::Middle:
        return "Middle";
    case Finger::Ring:
        return "Ring";
    case Finger::Pinky:
        return "Pinky";
    }
    return "";
}

// Base joint used for extension tests. The thumb uses its MCP as well.
inline HandLandmark baseOf(Finger f) {
    switch (f) {
    case Finger::Thumb:
        return HandLandmark::ThumbMcp;
    case Finger::Index:
        return HandLandmark::IndexMcp;
    case Finger::Middle:
        return HandLandmark::MiddleMcp;
    case Finger::Ring:
        return HandLandmark::RingMcp;
    case Finger::Pinky:
        return HandLandmark::PinkyMcp;
    }
    return HandLandmark::Wrist;
}

inline HandLandmark tipOf(Finger f) {
    return static_cast<HandLandmark>(static_cast<std::size_t>(baseOf(f)) +
                                     (f == Finger::Thumb ? 2 : 3));
}

// One tracker observation of a single hand. Landmarks the tracker did not
// deliver stay empty.
struct HandFrame {
    std::array<OptionalPoint, kHandLandmarkCount> points{};
    Handedness handedness{Handedness::Right};
    float score{0.f};

    const OptionalPoint& operator[](HandLandmark role) const {
        return points[static_cast<std::size_t>(role)];
    }

    void set(HandLandmark role, const FeaturePoint& p) {
        points[static_cast<std::size_t>(role)] = p;
    }

    void erase(HandLandmark role) { points[static_cast<std::size_t>(role)].reset(); }

    const OptionalPoint& wrist() const { return (*this)[HandLandmark::Wrist]; }
    const OptionalPoint& base(Finger f) const { return (*this)[baseOf(f)]; }
    const OptionalPoint& tip(Finger f) const { return (*this)[tipOf(f)]; }

    bool empty() const {
        for (const auto& p : points)
            if (p)
                return false;
        return true;
    }

    // Degrees of the wrist to middle-MCP direction.
    float orientation() const {
        return headingDegrees(wrist(), (*this)[HandLandmark::MiddleMcp]);
    }

    float size() const { return distance(wrist(), tip(Finger::Middle)); }

    static HandFrame fromLandmarks(const std::vector<FeaturePoint>& landmarks,
                                   Handedness handedness, float score) {
        HandFrame frame;
        frame.handedness = handedness;
        frame.score = score;
        const std::size_t n = std::min(landmarks.size(), kHandLandmarkCount);
        for (std::size_t i = 0; i < n; ++i)
            frame.points[i] = landmarks[i];
        return frame;
    }
};

} // namespace sl
