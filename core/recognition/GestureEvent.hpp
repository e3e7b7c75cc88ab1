#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/input/HandFrame.hpp"

namespace sl {

// Gesture tags shared by the classifiers and the dictionary.
namespace gesture {
inline const std::string OpenHand = "OPEN_HAND";
inline const std::string Fist = "FIST";
inline const std::string Pointing = "POINTING";
inline const std::string Peace = "PEACE";
inline const std::string ThumbsUp = "THUMBS_UP";
inline const std::string ThumbsDown = "THUMBS_DOWN";
inline const std::string Ok = "OK";
inline const std::string LSign = "L_SIGN";
inline const std::string ISign = "I_SIGN";
inline const std::string YSign = "Y_SIGN";
inline const std::string ThreeFingers = "THREE_FINGERS";
inline const std::string SwipeLeft = "SWIPE_LEFT";
inline const std::string SwipeRight = "SWIPE_RIGHT";
inline const std::string SwipeUp = "SWIPE_UP";
inline const std::string SwipeDown = "SWIPE_DOWN";
inline const std::string Wave = "WAVE";
} // namespace gesture

// One classified hand frame. The static label comes from the pose of this
// frame; the dynamic label from the motion of the frames before it.
struct GestureEvent {
    std::optional<std::string> staticLabel;
    std::optional<std::string> dynamicLabel;
    Handedness handedness{Handedness::Right};
    HandFrame frame;
    float confidence{0.f};
    std::uint64_t timestamp{0};

    std::vector<std::string> labels() const {
        std::vector<std::string> out;
        if (staticLabel)
            out.push_back(*staticLabel);
        if (dynamicLabel)
            out.push_back(*dynamicLabel);
        return out;
    }

    // First label in order; the one the dictionary translates.
    std::optional<std::string> primaryLabel() const {
        if (staticLabel)
            return staticLabel;
        return dynamicLabel;
    }

    bool hasLabel() const { return staticLabel || dynamicLabel; }
};

} // namespace sl
