#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "utils/Geometry.hpp"

namespace sl {

// Facial landmark roles consumed by the mood classifier.
enum class FaceLandmark : std::size_t {
    LeftEyeTop = 0,
    LeftEyeBottom,
    RightEyeTop,
    RightEyeBottom,
    MouthLeft,
    MouthRight,
    UpperLip,
    LowerLip,
    MouthCenter,
    LeftBrowInner,
    LeftBrowOuter,
    RightBrowInner,
    RightBrowOuter,
    Count
};

constexpr std::size_t kFaceLandmarkCount = static_cast<std::size_t>(FaceLandmark::Count);

// Index of each role in the 468-point face mesh.
constexpr std::array<std::size_t, kFaceLandmarkCount> kFaceMeshIndex{
    159, 145, 386, 374, 61, 291, 13, 14, 17, 55, 70, 285, 300};

constexpr std::array<const char*, kFaceLandmarkCount> kFaceLandmarkNames{
    "leftEyeTop",     "leftEyeBottom", "rightEyeTop",    "rightEyeBottom", "mouthLeft",
    "mouthRight",     "upperLip",      "lowerLip",       "mouthCenter",    "leftBrowInner",
    "leftBrowOuter",  "rightBrowInner", "rightBrowOuter"};

inline std::optional<FaceLandmark> faceLandmarkFromName(const std::string& name) {
    for (std::size_t i = 0; i < kFaceLandmarkCount; ++i)
        if (name == kFaceLandmarkNames[i])
            return static_cast<FaceLandmark>(i);
    return std::nullopt;
}

struct FaceFrame {
    std::array<OptionalPoint, kFaceLandmarkCount> points{};

    const OptionalPoint& operator[](FaceLandmark role) const {
        return points[static_cast<std::size_t>(role)];
    }

    void set(FaceLandmark role, const FeaturePoint& p) {
        points[static_cast<std::size_t>(role)] = p;
    }

    // y of a role, 0 when the landmark is missing.
    float y(FaceLandmark role) const {
        const auto& p = (*this)[role];
        return p ? p->y : 0.f;
    }

    static FaceFrame fromMesh(const std::vector<FeaturePoint>& mesh) {
        FaceFrame frame;
        for (std::size_t i = 0; i < kFaceLandmarkCount; ++i) {
            if (kFaceMeshIndex[i] < mesh.size())
                frame.points[i] = mesh[kFaceMeshIndex[i]];
        }
        return frame;
    }
};

} // namespace sl
