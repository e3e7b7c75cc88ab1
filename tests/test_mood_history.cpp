#include "core/mood/MoodHistory.hpp"
#include "core/mood/MoodTracker.hpp"
#include "HandPoses.hpp"
#include <cassert>
#include <cmath>
#include <string>
#include <vector>

using sl::Mood;

static sl::MoodSample sample(Mood mood, float confidence, std::uint64_t ts) {
    sl::MoodSample s;
    s.mood = mood;
    s.confidence = confidence;
    s.timestamp = ts;
    return s;
}

int main() {
    // dominant mood averages the confidence of the winning mood only
    sl::MoodHistory history;
    history.append(sample(Mood::Happy, 0.9f, 1000));
    history.append(sample(Mood::Happy, 0.6f, 1100));
    history.append(sample(Mood::Sad, 1.0f, 1200));
    history.append(sample(Mood::Happy, 0.3f, 1300));
    auto dominant = history.dominantMood(1500);
    assert(dominant && dominant->mood == Mood::Happy);
    assert(std::fabs(dominant->confidence - 0.6f) < 1e-5f);
    assert(dominant->sampleCount == 4);

    // window excludes old samples
    auto late = history.dominantMood(6150, 5.0);
    assert(late && late->sampleCount == 2 && late->mood == Mood::Sad);
    assert(!history.dominantMood(100000));
    assert(!sl::MoodHistory().dominantMood(0));

    // a negative window keeps only samples at or after now
    auto instant = history.dominantMood(1300, -2.0);
    assert(instant && instant->sampleCount == 1 && instant->mood == Mood::Happy);
    assert(!history.dominantMood(1400, -2.0));

    // a tie goes to the mood seen first
    sl::MoodHistory tie;
    tie.append(sample(Mood::Angry, 0.5f, 0));
    tie.append(sample(Mood::Sad, 0.5f, 10));
    tie.append(sample(Mood::Sad, 0.5f, 20));
    tie.append(sample(Mood::Angry, 0.5f, 30));
    assert(tie.dominantMood(40)->mood == Mood::Angry);

    // change needs a new label with enough confidence
    sl::MoodHistory change;
    change.append(sample(Mood::Neutral, 0.f, 0));
    assert(!change.moodChange());
    change.append(sample(Mood::Happy, 0.5f, 100));
    assert(!change.moodChange());
    assert(change.moodChange(0.4f));
    change.append(sample(Mood::Sad, 0.7f, 200));
    auto transition = change.moodChange();
    assert(transition && transition->from == Mood::Happy && transition->to == Mood::Sad);
    assert(transition->timestamp == 200);
    change.append(sample(Mood::Sad, 0.9f, 300));
    assert(!change.moodChange());

    // trend over the last N samples
    sl::MoodHistory trend;
    for (int i = 0; i < 9; ++i)
        trend.append(sample(Mood::Happy, 0.8f, static_cast<std::uint64_t>(i)));
    assert(trend.trend() == sl::MoodTrend::Stable);
    trend.append(sample(Mood::Neutral, 0.f, 9));
    assert(trend.trend() == sl::MoodTrend::Improving);
    for (int i = 0; i < 7; ++i)
        trend.append(sample(i % 2 ? Mood::Angry : Mood::Fearful, 0.8f, static_cast<std::uint64_t>(10 + i)));
    assert(trend.trend() == sl::MoodTrend::Declining);
    // exactly 60% is not enough
    sl::MoodHistory even;
    for (int i = 0; i < 10; ++i)
        even.append(sample(i < 6 ? Mood::Happy : Mood::Neutral, 0.8f, static_cast<std::uint64_t>(i)));
    assert(even.trend() == sl::MoodTrend::Stable);
    assert(std::string(sl::moodTrendName(sl::MoodTrend::Declining)) == "declining");

    // capacity and statistics
    sl::MoodHistory bounded;
    for (int i = 0; i < 40; ++i)
        bounded.append(sample(i % 4 == 0 ? Mood::Sad : Mood::Happy, i % 4 == 0 ? 0.4f : 0.8f,
                              static_cast<std::uint64_t>(i)));
    assert(bounded.size() == 30 && bounded.samples().front().timestamp == 10);
    auto stats = bounded.statistics();
    assert(stats.totalSamples == 30);
    assert(stats.moods.at(Mood::Sad).count == 7);
    assert(std::fabs(stats.moods.at(Mood::Happy).percentage - 23.0 / 30.0 * 100.0) < 1e-6);
    assert(std::fabs(stats.moods.at(Mood::Sad).averageConfidence - 0.4f) < 1e-5f);
    assert(sl::MoodHistory().statistics().moods.empty());

    // tracker keeps the current reading and ignores frames without a face
    sl::MoodTracker tracker;
    assert(tracker.current().mood == Mood::Neutral && tracker.current().confidence == 0.f);
    auto none = tracker.observe({}, 0);
    assert(none.mood == Mood::Neutral && none.confidence == 0.f && tracker.historySize() == 0);
    auto reading = tracker.observe({poses::happyFace(), poses::sadFace()}, 100);
    assert(reading.mood == Mood::Happy && tracker.historySize() == 1);
    tracker.process(poses::sadFace(), 200);
    assert(tracker.current().mood == Mood::Sad);
    assert(tracker.moodChange() && tracker.moodChange()->to == Mood::Sad);

    QJsonObject exported = tracker.exportData(300);
    assert(exported.value("current").toObject().value("mood").toString() == "sad");
    assert(exported.value("history").toArray().size() == 2);
    assert(exported.value("statistics").toObject().value("totalSamples").toInt() == 2);
    assert(exported.contains("dominant"));

    // every history entry carries the features it was classified from
    {
        const QJsonObject first = exported.value("history").toArray().at(0).toObject();
        const QJsonObject features = first.value("features").toObject();
        const sl::FacialFeatures expected = sl::FacialFeatures::extract(poses::happyFace());
        assert(features.size() == 8);
        assert(std::fabs(features.value("mouthWidth").toDouble() - expected.mouthWidth) < 1e-6);
        assert(std::fabs(features.value("mouthCurvature").toDouble() - expected.mouthCurvature) < 1e-6);
        assert(features.value("mouthCurvature").toDouble() < 0.0);
        assert(std::fabs(features.value("eyebrowHeight").toDouble() - expected.eyebrowHeight) < 1e-6);
        assert(first.value("timestamp").toDouble() == 100.0);
    }

    tracker.clear();
    assert(tracker.historySize() == 0 && tracker.current().mood == Mood::Neutral);
    assert(!tracker.dominantMood(300));
    return 0;
}
