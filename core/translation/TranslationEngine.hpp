#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include "core/mood/Mood.hpp"
#include "core/recognition/GestureEvent.hpp"
#include "core/translation/GestureDictionary.hpp"
#include "core/translation/TextToSign.hpp"
#include "utils/Logger.hpp"

namespace sl {

struct TranslationToken {
    std::string text;
    TokenKind kind{TokenKind::Letter};
    std::string gesture;
    Handedness handedness{Handedness::Right};
    Mood mood{Mood::Neutral};
    float confidence{0.f};
    std::uint64_t timestamp{0};
};

struct TranslationUpdate {
    TranslationToken current;
    std::string sentence;
    std::vector<TranslationToken> buffer;
};

struct TranslationStatistics {
    std::size_t bufferSize{0};
    std::size_t currentLength{0};
    std::uint64_t lastEventTime{0};
    std::size_t totalGestures{0};
};

struct PatternRun {
    std::string gesture;
    std::size_t count{0};
};

// Turns classified gesture events into text. The buffer holds one utterance:
// a gap longer than the timeout between consecutive events starts a new one.
class TranslationEngine {
public:
    static constexpr std::uint64_t kDefaultTimeoutMs = 2000;

    explicit TranslationEngine(GestureDictionary dictionary = GestureDictionary::builtin(),
                               std::uint64_t timeoutMs = kDefaultTimeoutMs)
        : m_dictionary(std::move(dictionary)), m_timeoutMs(timeoutMs) {}

    std::optional<TranslationToken> translateGesture(const GestureEvent& event,
                                                     Mood mood = Mood::Neutral) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return translateLocked(event, mood);
    }

    // Stateless: collapses repeated text and joins with single spaces.
    std::string buildSentence(const std::vector<GestureEvent>& events) const {
        std::vector<TranslationToken> tokens;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& event : events) {
                if (auto token = translateLocked(event, Mood::Neutral))
                    tokens.push_back(std::move(*token));
            }
        }
        return joinCollapsed(tokens);
    }

    // Per-frame entry point. The event time is taken as "now". Unrecognised
    // events still advance the timeout clock.
    std::optional<TranslationUpdate> processRealTimeGesture(const GestureEvent& event, Mood mood,
                                                            std::uint64_t nowMs) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_buffer.empty() && (nowMs < m_lastEventTime || nowMs - m_lastEventTime > m_timeoutMs)) {
            SL_LOG_TAG(LogLevel::Debug, "TranslationEngine",
                       "Gesture timeout, dropping " + std::to_string(m_buffer.size()) + " tokens");
            m_buffer.clear();
            m_sentence.clear();
        }
        m_lastEventTime = nowMs;

        auto token = translateLocked(event, mood);
        if (!token)
            return std::nullopt;
        token->timestamp = nowMs;
        m_buffer.push_back(*token);
        m_sentence = joinCollapsed(m_buffer);
        return TranslationUpdate{*token, m_sentence, m_buffer};
    }

    void clearBuffer() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_buffer.clear();
        m_sentence.clear();
    }

    std::string currentSentence() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sentence;
    }

    std::vector<TranslationToken> buffer() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_buffer;
    }

    std::vector<SignToken> translateTextToSign(const std::string& text, std::uint64_t timestampMs = 0) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return TextToSignMapper(m_dictionary).translate(text, timestampMs);
    }

    TranslationStatistics statistics() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return {m_buffer.size(), m_sentence.size(), m_lastEventTime, m_dictionary.size()};
    }

    // Runs of identical primary labels. Needs at least three events.
    static std::vector<PatternRun> analyzePattern(const std::vector<GestureEvent>& events) {
        std::vector<PatternRun> runs;
        if (events.size() < 3)
            return runs;
        std::string current;
        std::size_t count = 0;
        for (const auto& event : events) {
            const std::string label = event.primaryLabel().value_or(std::string());
            if (label == current) {
                ++count;
                continue;
            }
            if (!current.empty())
                runs.push_back({current, count});
            current = label;
            count = 1;
        }
        if (!current.empty())
            runs.push_back({current, count});
        return runs;
    }

    static std::vector<std::string> suggestNextGesture(const std::vector<GestureEvent>& sequence) {
        static const std::unordered_map<std::string, std::vector<std::string>> followUps = {
            {gesture::Fist, {gesture::OpenHand, gesture::Pointing}},
            {gesture::OpenHand, {gesture::Fist, gesture::Peace}},
            {gesture::Pointing, {gesture::OpenHand, gesture::ThumbsUp}},
        };
        if (sequence.empty())
            return {};
        const auto label = sequence.back().primaryLabel();
        if (!label)
            return {};
        auto it = followUps.find(*label);
        if (it == followUps.end())
            return {};
        return it->second;
    }

    static std::string moodPrefix(Mood mood) {
        switch (mood) {
        case Mood::Happy:
        case Mood::Sad:
        case Mood::Angry:
        case Mood::Surprised:
            return std::string(moodEmoji(mood)) + " ";
        default:
            return std::string();
        }
    }

    QJsonObject exportData(std::uint64_t nowMs) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        QJsonObject root;
        root.insert(QStringLiteral("gestures"), m_dictionary.toJson());
        QJsonArray buffer;
        for (const auto& token : m_buffer)
            buffer.append(tokenToJson(token));
        root.insert(QStringLiteral("buffer"), buffer);
        root.insert(QStringLiteral("current"), QString::fromStdString(m_sentence));
        root.insert(QStringLiteral("exportDate"), static_cast<double>(nowMs));
        return root;
    }

    // Merges the record's "gestures" into the dictionary; imported tags win.
    void importData(const QJsonObject& data) {
        const QJsonValue gestures = data.value(QStringLiteral("gestures"));
        if (!gestures.isObject())
            return;
        const GestureDictionary extension = GestureDictionary::fromJson(gestures.toObject());
        std::lock_guard<std::mutex> lock(m_mutex);
        m_dictionary.merge(extension);
        SL_LOG_TAG(LogLevel::Info, "TranslationEngine",
                   "Imported " + std::to_string(extension.size()) + " gestures");
    }

    GestureDictionary dictionary() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dictionary;
    }

    std::uint64_t timeoutMs() const { return m_timeoutMs; }

private:
    std::optional<TranslationToken> translateLocked(const GestureEvent& event, Mood mood) const {
        const auto label = event.primaryLabel();
        if (!label)
            return std::nullopt;
        const GestureMapping* mapping = m_dictionary.find(*label);
        if (!mapping)
            return std::nullopt;

        TranslationToken token;
        token.text = mapping->text;
        if (mapping->kind == TokenKind::Word && mood != Mood::Neutral)
            token.text = moodPrefix(mood) + token.text;
        token.kind = mapping->kind;
        token.gesture = *label;
        token.handedness = event.handedness;
        token.mood = mood;
        token.confidence = event.frame.empty() ? 0.5f : 0.8f;
        token.timestamp = event.timestamp;
        return token;
    }

    static std::string joinCollapsed(const std::vector<TranslationToken>& tokens) {
        std::string sentence;
        const std::string* last = nullptr;
        for (const auto& token : tokens) {
            if (last && *last == token.text)
                continue;
            if (!sentence.empty())
                sentence += ' ';
            sentence += token.text;
            last = &token.text;
        }
        return sentence;
    }

    static QJsonObject tokenToJson(const TranslationToken& token) {
        QJsonObject obj;
        obj.insert(QStringLiteral("text"), QString::fromStdString(token.text));
        obj.insert(QStringLiteral("type"), QString::fromUtf8(tokenKindName(token.kind)));
        obj.insert(QStringLiteral("gesture"), QString::fromStdString(token.gesture));
        obj.insert(QStringLiteral("handedness"), QString::fromUtf8(handednessName(token.handedness)));
        obj.insert(QStringLiteral("mood"), QString::fromUtf8(moodName(token.mood)));
        obj.insert(QStringLiteral("confidence"), token.confidence);
        obj.insert(QStringLiteral("timestamp"), static_cast<double>(token.timestamp));
        return obj;
    }

    GestureDictionary m_dictionary;
    std::uint64_t m_timeoutMs;
    std::vector<TranslationToken> m_buffer;
    std::string m_sentence;
    std::uint64_t m_lastEventTime{0};
    mutable std::mutex m_mutex;
};

} // namespace sl
