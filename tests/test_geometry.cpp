#include "core/input/FaceFrame.hpp"
#include "core/input/HandFrame.hpp"
#include "utils/Geometry.hpp"
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

int main() {
    using namespace sl;
    assert(std::fabs(distance(FeaturePoint{0.f, 0.f}, FeaturePoint{3.f, 4.f}) - 5.f) < 1e-5f);
    assert(std::fabs(distance(FeaturePoint{0.f, 0.f, 1.f}, FeaturePoint{0.f, 0.f, 3.f}) - 2.f) < 1e-5f);

    // a missing point on either side reads as zero distance
    OptionalPoint missing;
    OptionalPoint present = FeaturePoint{1.f, 1.f};
    assert(distance(missing, present) == 0.f);
    assert(distance(present, missing) == 0.f);

    assert(std::fabs(angleDegrees(FeaturePoint{1.f, 0.f}, FeaturePoint{0.f, 0.f}, FeaturePoint{0.f, 1.f}) - 90.f) < 1e-3f);
    assert(angleDegrees(FeaturePoint{0.f, 0.f}, FeaturePoint{0.f, 0.f}, FeaturePoint{1.f, 0.f}) == 0.f);
    assert(angleDegrees(missing, present, present) == 0.f);
    assert(std::fabs(headingDegrees(FeaturePoint{0.f, 0.f}, FeaturePoint{0.f, -1.f}) + 90.f) < 1e-3f);
    assert(clamp01(1.7f) == 1.f && clamp01(-0.2f) == 0.f && clamp01(0.4f) == 0.4f);

    // landmark list maps by index; short lists leave the tail missing
    std::vector<FeaturePoint> pts;
    for (int i = 0; i < 13; ++i)
        pts.push_back({0.01f * i, 0.5f});
    HandFrame frame = HandFrame::fromLandmarks(pts, Handedness::Left, 0.75f);
    assert(frame.handedness == Handedness::Left && frame.score == 0.75f);
    assert(frame.wrist() && frame.wrist()->x == 0.f);
    assert(frame[HandLandmark::MiddleTip] && std::fabs(frame[HandLandmark::MiddleTip]->x - 0.12f) < 1e-6f);
    assert(!frame[HandLandmark::RingMcp] && !frame.tip(Finger::Pinky));
    assert(tipOf(Finger::Thumb) == HandLandmark::ThumbTip);
    assert(tipOf(Finger::Index) == HandLandmark::IndexTip);
    assert(!frame.empty() && HandFrame{}.empty());

    HandFrame upright;
    upright.set(HandLandmark::Wrist, {0.5f, 0.8f});
    upright.set(HandLandmark::MiddleMcp, {0.5f, 0.6f});
    upright.set(HandLandmark::MiddleTip, {0.5f, 0.3f});
    assert(std::fabs(upright.orientation() + 90.f) < 1e-3f);
    assert(std::fabs(upright.size() - 0.5f) < 1e-5f);

    assert(handednessFromName("Right") == Handedness::Right);
    assert(!handednessFromName("both"));
    assert(std::string(handednessName(Handedness::Left)) == "Left");

    // face mesh lookup picks the fixed indices
    std::vector<FeaturePoint> mesh(468);
    mesh[61] = {0.4f, 0.7f};
    mesh[291] = {0.6f, 0.7f};
    FaceFrame face = FaceFrame::fromMesh(mesh);
    assert(face[FaceLandmark::MouthLeft]->x == 0.4f && face[FaceLandmark::MouthRight]->x == 0.6f);
    FaceFrame partial = FaceFrame::fromMesh(std::vector<FeaturePoint>(100));
    assert(partial[FaceLandmark::UpperLip] && partial[FaceLandmark::MouthLeft]);
    assert(!partial[FaceLandmark::LeftEyeTop] && !partial[FaceLandmark::MouthRight]);
    assert(partial.y(FaceLandmark::MouthRight) == 0.f);
    assert(faceLandmarkFromName("rightBrowOuter") == FaceLandmark::RightBrowOuter);
    assert(!faceLandmarkFromName("nose"));

    // out-of-range doubles saturate instead of wrapping
    assert(saturatingCast<std::uint64_t>(1500.9) == 1500);
    assert(saturatingCast<std::uint64_t>(-250.0) == 0);
    assert(saturatingCast<std::uint64_t>(std::nan("")) == 0);
    assert(saturatingCast<std::uint64_t>(1e30) == std::numeric_limits<std::uint64_t>::max());
    assert(saturatingCast<std::size_t>(-1.0) == 0);
    return 0;
}
