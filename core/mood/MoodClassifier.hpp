#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <vector>
#include "core/input/FaceFrame.hpp"
#include "core/mood/Mood.hpp"
#include "utils/Geometry.hpp"

namespace sl {

struct FacialFeatures {
    float leftEyeOpenness{0.f};
    float rightEyeOpenness{0.f};
    float eyeOpenness{0.f};
    float mouthWidth{0.f};
    float mouthHeight{0.f};
    float mouthAspectRatio{0.f};
    float eyebrowHeight{0.f};
    // Mouth center y minus mean corner y. Negative when the center sits above the corners.
    float mouthCurvature{0.f};

    static FacialFeatures extract(const FaceFrame& face) {
        FacialFeatures f;
        f.leftEyeOpenness = distance(face[FaceLandmark::LeftEyeTop], face[FaceLandmark::LeftEyeBottom]);
        f.rightEyeOpenness = distance(face[FaceLandmark::RightEyeTop], face[FaceLandmark::RightEyeBottom]);
        f.eyeOpenness = (f.leftEyeOpenness + f.rightEyeOpenness) / 2.f;

        f.mouthWidth = distance(face[FaceLandmark::MouthLeft], face[FaceLandmark::MouthRight]);
        f.mouthHeight = distance(face[FaceLandmark::UpperLip], face[FaceLandmark::LowerLip]);
        f.mouthAspectRatio = f.mouthWidth > 0.f ? f.mouthHeight / f.mouthWidth : 0.f;

        f.eyebrowHeight = (face.y(FaceLandmark::LeftBrowInner) + face.y(FaceLandmark::RightBrowInner)) / 2.f;

        const float cornersY = (face.y(FaceLandmark::MouthLeft) + face.y(FaceLandmark::MouthRight)) / 2.f;
        f.mouthCurvature = face.y(FaceLandmark::MouthCenter) - cornersY;
        return f;
    }
};

// Calibrated by hand against face mesh coordinates; not physical constants.
struct MoodThresholds {
    float happyCurvature{-0.01f};
    float happyMouthRatio{0.3f};
    float sadCurvature{0.01f};
    float sadEyebrow{0.35f};
    float surprisedEyeOpenness{0.025f};
    float surprisedMouthRatio{0.5f};
    float angryEyebrow{0.3f};
    float angryMouthWidth{0.15f};
    float fearfulEyeOpenness{0.02f};
    float fearfulEyebrow{0.32f};
    float fearfulMaxConfidence{0.8f};
    float disgustedCurvature{0.005f};
    float disgustedMouthWidth{0.14f};
    float disgustedMaxConfidence{0.9f};
};

struct MoodSample {
    Mood mood{Mood::Neutral};
    float confidence{0.f};
    FacialFeatures features;
    std::uint64_t timestamp{0};
};

// Ordered rule table over facial features; first match wins, neutral otherwise.
class MoodClassifier {
public:
    struct Rule {
        Mood mood;
        std::function<bool(const FacialFeatures&, const MoodThresholds&)> predicate;
        std::function<float(const FacialFeatures&, const MoodThresholds&)> confidence;
    };

    explicit MoodClassifier(MoodThresholds thresholds = {})
        : m_thresholds(thresholds), m_rules(defaultRules()) {}

    MoodReading classify(const FacialFeatures& features) const {
        for (const auto& rule : m_rules) {
            if (rule.predicate(features, m_thresholds))
                return {rule.mood, clamp01(rule.confidence(features, m_thresholds))};
        }
        return {Mood::Neutral, 0.f};
    }

    MoodSample classify(const FaceFrame& face, std::uint64_t timestampMs) const {
        MoodSample sample;
        sample.features = FacialFeatures::extract(face);
        const MoodReading reading = classify(sample.features);
        sample.mood = reading.mood;
        sample.confidence = reading.confidence;
        sample.timestamp = timestampMs;
        return sample;
    }

    const std::vector<Rule>& rules() const { return m_rules; }
    const MoodThresholds& thresholds() const { return m_thresholds; }

    static std::vector<Rule> defaultRules() {
        using F = FacialFeatures;
        using T = MoodThresholds;
        return {
            {Mood::Happy,
             [](const F& f, const T& t) {
                 return f.mouthCurvature < t.happyCurvature && f.mouthAspectRatio > t.happyMouthRatio;
             },
             [](const F& f, const T&) { return std::min(std::fabs(f.mouthCurvature) * 50.f, 1.f); }},
            {Mood::Sad,
             [](const F& f, const T& t) {
                 return f.mouthCurvature > t.sadCurvature && f.eyebrowHeight > t.sadEyebrow;
             },
             [](const F& f, const T& t) {
                 return std::min(f.mouthCurvature * 50.f + (f.eyebrowHeight - t.sadEyebrow) * 5.f, 1.f);
             }},
            {Mood::Surprised,
             [](const F& f, const T& t) {
                 return f.eyeOpenness > t.surprisedEyeOpenness &&
                        f.mouthAspectRatio > t.surprisedMouthRatio;
             },
             [](const F& f, const T& t) {
                 return std::min((f.eyeOpenness - t.surprisedEyeOpenness) * 40.f + f.mouthAspectRatio,
                                 1.f);
             }},
            {Mood::Angry,
             [](const F& f, const T& t) {
                 return f.eyebrowHeight < t.angryEyebrow && f.mouthWidth < t.angryMouthWidth;
             },
             [](const F& f, const T& t) { return std::min((t.angryEyebrow - f.eyebrowHeight) * 10.f, 1.f); }},
            {Mood::Fearful,
             [](const F& f, const T& t) {
                 return f.eyeOpenness > t.fearfulEyeOpenness && f.eyebrowHeight < t.fearfulEyebrow;
             },
             [](const F& f, const T& t) { return std::min(f.eyeOpenness * 35.f, t.fearfulMaxConfidence); }},
            {Mood::Disgusted,
             [](const F& f, const T& t) {
                 return f.mouthCurvature > t.disgustedCurvature && f.mouthWidth < t.disgustedMouthWidth;
             },
             [](const F& f, const T& t) {
                 return std::min(f.mouthCurvature * 80.f, t.disgustedMaxConfidence);
             }},
        };
    }

private:
    MoodThresholds m_thresholds;
    std::vector<Rule> m_rules;
};

} // namespace sl
