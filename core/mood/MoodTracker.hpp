#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include "core/input/FaceFrame.hpp"
#include "core/mood/Mood.hpp"
#include "core/mood/MoodClassifier.hpp"
#include "core/mood/MoodHistory.hpp"
#include "utils/Logger.hpp"

namespace sl {

// Face-stream counterpart of HandStreamProcessor: classifies each face frame,
// keeps the current reading and the bounded sample history.
class MoodTracker {
public:
    explicit MoodTracker(MoodThresholds thresholds = {},
                         std::size_t historyCapacity = MoodHistory::kDefaultCapacity)
        : m_classifier(thresholds), m_history(historyCapacity) {}

    MoodSample process(const FaceFrame& face, std::uint64_t timestampMs) {
        MoodSample sample = m_classifier.classify(face, timestampMs);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.append(sample);
        m_current = {sample.mood, sample.confidence};
        if (logEnabled(LogLevel::Debug)) {
            if (auto change = m_history.moodChange()) {
                SL_LOG_TAG(LogLevel::Debug, "MoodTracker",
                           std::string("mood ") + moodName(change->from) + " -> " + moodName(change->to));
            }
        }
        return sample;
    }

    // Only the first face is analysed. No face reads as neutral with zero
    // confidence and leaves the history untouched.
    MoodReading observe(const std::vector<FaceFrame>& faces, std::uint64_t timestampMs) {
        if (faces.empty())
            return {Mood::Neutral, 0.f};
        const MoodSample sample = process(faces.front(), timestampMs);
        return {sample.mood, sample.confidence};
    }

    MoodReading current() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_current;
    }

    std::optional<DominantMood> dominantMood(std::uint64_t nowMs, double windowSeconds = 5.0) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history.dominantMood(nowMs, windowSeconds);
    }

    std::optional<MoodTransition> moodChange(float threshold = 0.6f) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history.moodChange(threshold);
    }

    MoodTrend trend(std::size_t sampleCount = 10) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history.trend(sampleCount);
    }

    MoodStatistics statistics() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history.statistics();
    }

    std::size_t historySize() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_history.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.clear();
        m_current = MoodReading{};
    }

    QJsonObject exportData(std::uint64_t nowMs) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        QJsonObject root;
        root.insert(QStringLiteral("current"), readingToJson(m_current));

        if (auto dominant = m_history.dominantMood(nowMs, 30.0)) {
            QJsonObject obj = readingToJson({dominant->mood, dominant->confidence});
            obj.insert(QStringLiteral("duration"), dominant->windowSeconds);
            obj.insert(QStringLiteral("sampleCount"), static_cast<double>(dominant->sampleCount));
            root.insert(QStringLiteral("dominant"), obj);
        }

        const MoodStatistics stats = m_history.statistics();
        QJsonObject statsObj;
        statsObj.insert(QStringLiteral("totalSamples"), static_cast<double>(stats.totalSamples));
        QJsonObject moods;
        for (const auto& kv : stats.moods) {
            QJsonObject entry;
            entry.insert(QStringLiteral("count"), static_cast<double>(kv.second.count));
            entry.insert(QStringLiteral("percentage"), kv.second.percentage);
            entry.insert(QStringLiteral("avgConfidence"), kv.second.averageConfidence);
            moods.insert(QString::fromUtf8(moodName(kv.first)), entry);
        }
        statsObj.insert(QStringLiteral("moods"), moods);
        root.insert(QStringLiteral("statistics"), statsObj);

        QJsonArray history;
        for (const auto& s : m_history.samples()) {
            QJsonObject obj = readingToJson({s.mood, s.confidence});
            obj.insert(QStringLiteral("features"), featuresToJson(s.features));
            obj.insert(QStringLiteral("timestamp"), static_cast<double>(s.timestamp));
            history.append(obj);
        }
        root.insert(QStringLiteral("history"), history);
        root.insert(QStringLiteral("exportDate"), static_cast<double>(nowMs));
        return root;
    }

private:
    static QJsonObject readingToJson(const MoodReading& reading) {
        QJsonObject obj;
        obj.insert(QStringLiteral("mood"), QString::fromUtf8(moodName(reading.mood)));
        obj.insert(QStringLiteral("confidence"), reading.confidence);
        return obj;
    }

    static QJsonObject featuresToJson(const FacialFeatures& f) {
        QJsonObject obj;
        obj.insert(QStringLiteral("leftEyeOpenness"), f.leftEyeOpenness);
        obj.insert(QStringLiteral("rightEyeOpenness"), f.rightEyeOpenness);
        obj.insert(QStringLiteral("eyeOpenness"), f.eyeOpenness);
        obj.insert(QStringLiteral("mouthWidth"), f.mouthWidth);
        obj.insert(QStringLiteral("mouthHeight"), f.mouthHeight);
        obj.insert(QStringLiteral("mouthAspectRatio"), f.mouthAspectRatio);
        obj.insert(QStringLiteral("eyebrowHeight"), f.eyebrowHeight);
        obj.insert(QStringLiteral("mouthCurvature"), f.mouthCurvature);
        return obj;
    }

    MoodClassifier m_classifier;
    MoodHistory m_history;
    MoodReading m_current;
    mutable std::mutex m_mutex;
};

} // namespace sl
