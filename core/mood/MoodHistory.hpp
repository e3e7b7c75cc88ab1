#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <utility>
#include <vector>
#include "core/mood/Mood.hpp"
#include "core/mood/MoodClassifier.hpp"
#include "utils/Geometry.hpp"

namespace sl {

enum class MoodTrend { Improving, Declining, Stable };

inline const char* moodTrendName(MoodTrend trend) {
    switch (trend) {
    case MoodTrend::Improving:
        return "improving";
    case MoodTrend::Declining:
        return "declining";
    case MoodTrend::Stable:
        return "stable";
    }
    return "stable";
}

struct DominantMood {
    Mood mood{Mood::Neutral};
    float confidence{0.f};
    double windowSeconds{0.0};
    std::size_t sampleCount{0};
};

struct MoodTransition {
    Mood from{Mood::Neutral};
    Mood to{Mood::Neutral};
    float confidence{0.f};
    std::uint64_t timestamp{0};
};

struct MoodStatistics {
    struct Entry {
        std::size_t count{0};
        double percentage{0.0};
        float averageConfidence{0.f};
    };
    std::size_t totalSamples{0};
    std::map<Mood, Entry> moods;
};

// Bounded FIFO of mood samples for one face stream, with the aggregations
// consumers poll between frames.
class MoodHistory {
public:
    static constexpr std::size_t kDefaultCapacity = 30;

    explicit MoodHistory(std::size_t capacity = kDefaultCapacity)
        : m_capacity(std::max<std::size_t>(1, capacity)) {}

    void append(MoodSample sample) {
        m_samples.push_back(std::move(sample));
        while (m_samples.size() > m_capacity)
            m_samples.pop_front();
    }

    std::size_t capacity() const { return m_capacity; }
    std::size_t size() const { return m_samples.size(); }
    bool empty() const { return m_samples.empty(); }
    void clear() { m_samples.clear(); }
    const std::deque<MoodSample>& samples() const { return m_samples; }

    // Most frequent mood among samples no older than `windowSeconds` before
    // `nowMs`. Ties go to the mood seen first in the window. A non-positive
    // window keeps only samples stamped at `nowMs` or later.
    std::optional<DominantMood> dominantMood(std::uint64_t nowMs, double windowSeconds = 5.0) const {
        const auto span = saturatingCast<std::uint64_t>(windowSeconds * 1000.0);
        const std::uint64_t cutoff = nowMs > span ? nowMs - span : 0;

        std::vector<std::pair<Mood, std::size_t>> counts;
        std::size_t total = 0;
        for (const auto& s : m_samples) {
            if (s.timestamp < cutoff)
                continue;
            ++total;
            auto it = std::find_if(counts.begin(), counts.end(),
                                   [&](const std::pair<Mood, std::size_t>& c) { return c.first == s.mood; });
            if (it == counts.end())
                counts.emplace_back(s.mood, 1);
            else
                ++it->second;
        }
        if (total == 0)
            return std::nullopt;

        DominantMood result;
        std::size_t best = 0;
        for (const auto& c : counts) {
            if (c.second > best) {
                best = c.second;
                result.mood = c.first;
            }
        }
        float sum = 0.f;
        for (const auto& s : m_samples)
            if (s.timestamp >= cutoff && s.mood == result.mood)
                sum += s.confidence;
        result.confidence = sum / static_cast<float>(best);
        result.windowSeconds = windowSeconds;
        result.sampleCount = total;
        return result;
    }

    std::optional<MoodTransition> moodChange(float threshold = 0.6f) const {
        if (m_samples.size() < 2)
            return std::nullopt;
        const MoodSample& current = m_samples[m_samples.size() - 1];
        const MoodSample& previous = m_samples[m_samples.size() - 2];
        if (current.mood == previous.mood || current.confidence < threshold)
            return std::nullopt;
        return MoodTransition{previous.mood, current.mood, current.confidence, current.timestamp};
    }

    // Stable until `sampleCount` samples have accumulated.
    MoodTrend trend(std::size_t sampleCount = 10) const {
        if (sampleCount == 0 || m_samples.size() < sampleCount)
            return MoodTrend::Stable;
        std::size_t positive = 0;
        std::size_t negative = 0;
        for (auto it = m_samples.end() - static_cast<std::ptrdiff_t>(sampleCount); it != m_samples.end(); ++it) {
            if (it->mood == Mood::Happy)
                ++positive;
            else if (isNegative(it->mood))
                ++negative;
        }
        const double limit = static_cast<double>(sampleCount) * 0.6;
        if (static_cast<double>(positive) > limit)
            return MoodTrend::Improving;
        if (static_cast<double>(negative) > limit)
            return MoodTrend::Declining;
        return MoodTrend::Stable;
    }

    MoodStatistics statistics() const {
        MoodStatistics stats;
        stats.totalSamples = m_samples.size();
        if (m_samples.empty())
            return stats;
        std::map<Mood, float> sums;
        for (const auto& s : m_samples) {
            ++stats.moods[s.mood].count;
            sums[s.mood] += s.confidence;
        }
        for (auto& kv : stats.moods) {
            kv.second.percentage =
                static_cast<double>(kv.second.count) / static_cast<double>(stats.totalSamples) * 100.0;
            kv.second.averageConfidence = sums[kv.first] / static_cast<float>(kv.second.count);
        }
        return stats;
    }

private:
    std::size_t m_capacity;
    std::deque<MoodSample> m_samples;
};

} // namespace sl
