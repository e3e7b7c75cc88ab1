#pragma once
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace sl {

// Normalized image coordinate. z defaults to 0 when the tracker omits depth.
struct FeaturePoint {
    float x{0.f};
    float y{0.f};
    float z{0.f};
};

using OptionalPoint = std::optional<FeaturePoint>;

inline float distance(const FeaturePoint& a, const FeaturePoint& b) {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    const float dz = a.z - b.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

// A missing point on either side reads as distance 0. Occluded landmarks can
// therefore satisfy "touching" tests; callers rely on that behaviour.
inline float distance(const OptionalPoint& a, const OptionalPoint& b) {
    if (!a || !b)
        return 0.f;
    return distance(*a, *b);
}

// Angle at `b` formed by a-b-c in the image plane, in degrees.
inline float angleDegrees(const FeaturePoint& a, const FeaturePoint& b, const FeaturePoint& c) {
    const float v1x = a.x - b.x;
    const float v1y = a.y - b.y;
    const float v2x = c.x - b.x;
    const float v2y = c.y - b.y;
    const float mag = std::sqrt(v1x * v1x + v1y * v1y) * std::sqrt(v2x * v2x + v2y * v2y);
    if (mag < 1e-8f)
        return 0.f;
    float cosine = (v1x * v2x + v1y * v2y) / mag;
    cosine = std::max(-1.f, std::min(1.f, cosine));
    return std::acos(cosine) * 180.f / 3.14159265358979f;
}

inline float angleDegrees(const OptionalPoint& a, const OptionalPoint& b, const OptionalPoint& c) {
    if (!a || !b || !c)
        return 0.f;
    return angleDegrees(*a, *b, *c);
}

// Heading of the vector from `from` to `to`, in degrees.
inline float headingDegrees(const OptionalPoint& from, const OptionalPoint& to) {
    if (!from || !to)
        return 0.f;
    return std::atan2(to->y - from->y, to->x - from->x) * 180.f / 3.14159265358979f;
}

inline float clamp01(float value) { return std::max(0.f, std::min(1.f, value)); }

// Saturating conversion for counts and timestamps read as doubles. Negative
// and NaN values give 0, values past the range give the maximum.
template <typename T>
T saturatingCast(double v) {
    if (!(v > 0.0))
        return 0;
    if (v >= static_cast<double>(std::numeric_limits<T>::max()))
        return std::numeric_limits<T>::max();
    return static_cast<T>(v);
}

} // namespace sl
