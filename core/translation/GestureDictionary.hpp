#pragma once
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <QByteArray>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include "utils/Logger.hpp"

namespace sl {

enum class TokenKind { Letter, Word };

inline const char* tokenKindName(TokenKind kind) { return kind == TokenKind::Letter ? "letter" : "word"; }

inline std::optional<TokenKind> tokenKindFromName(const std::string& name) {
    if (name == "letter")
        return TokenKind::Letter;
    if (name == "word")
        return TokenKind::Word;
    return std::nullopt;
}

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct GestureMapping {
    std::string text;
    TokenKind kind{TokenKind::Letter};
};

// Gesture tag -> {text, kind}. Entries keep insertion order so that reverse
// lookups resolve duplicates deterministically. QJsonObject sorts its keys,
// so a dictionary read from JSON is in tag order, not file order.
class GestureDictionary {
public:
    GestureDictionary() = default;

    static GestureDictionary builtin() {
        GestureDictionary dict;
        dict.set("FIST", {"A", TokenKind::Letter});
        dict.set("OPEN_HAND", {"B", TokenKind::Letter});
        dict.set("OK", {"F", TokenKind::Letter});
        dict.set("POINTING", {"D", TokenKind::Letter});
        dict.set("PEACE", {"V", TokenKind::Letter});
        dict.set("THUMBS_UP", {"GOOD", TokenKind::Word});
        dict.set("SWIPE_RIGHT", {"NEXT", TokenKind::Word});
        dict.set("SWIPE_LEFT", {"BACK", TokenKind::Word});
        return dict;
    }

    // Never fails the caller: on any error the built-in table is returned.
    static GestureDictionary loadOrBuiltin(const std::string& path) {
        GestureDictionary dict;
        if (dict.loadFromFile(path))
            return dict;
        SL_LOG_TAG(LogLevel::Warn, "GestureDictionary",
                   "Could not load " + path + ". Falling back to built-in gestures.");
        return builtin();
    }

    bool loadFromFile(const std::string& path) {
        QFile file(QString::fromStdString(path));
        if (!file.open(QIODevice::ReadOnly))
            return false;
        const QByteArray data = file.readAll();
        file.close();
        const QJsonDocument doc = QJsonDocument::fromJson(data);
        if (!doc.isObject())
            return false;
        GestureDictionary parsed = fromJson(doc.object());
        if (parsed.empty())
            return false;
        *this = std::move(parsed);
        SL_LOG_TAG(LogLevel::Info, "GestureDictionary",
                   "Loaded " + std::to_string(size()) + " gestures from " + path);
        return true;
    }

    // Entries without a string "text" are skipped; unknown kinds read as letter.
    // Entries are added in ascending tag order.
    static GestureDictionary fromJson(const QJsonObject& obj) {
        GestureDictionary dict;
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (!it.value().isObject())
                continue;
            const QJsonObject entry = it.value().toObject();
            const QJsonValue text = entry.value(QStringLiteral("text"));
            if (!text.isString())
                continue;
            QString kindName = entry.value(QStringLiteral("type")).toString();
            if (kindName.isEmpty())
                kindName = entry.value(QStringLiteral("kind")).toString();
            GestureMapping mapping;
            mapping.text = text.toString().toStdString();
            mapping.kind = tokenKindFromName(kindName.toStdString()).value_or(TokenKind::Letter);
            dict.set(it.key().toStdString(), std::move(mapping));
        }
        return dict;
    }

    QJsonObject toJson() const {
        QJsonObject obj;
        for (const auto& entry : m_entries) {
            QJsonObject value;
            value.insert(QStringLiteral("text"), QString::fromStdString(entry.second.text));
            value.insert(QStringLiteral("type"), QString::fromUtf8(tokenKindName(entry.second.kind)));
            obj.insert(QString::fromStdString(entry.first), value);
        }
        return obj;
    }

    // Entries from `other` override existing tags.
    void merge(const GestureDictionary& other) {
        for (const auto& entry : other.m_entries)
            set(entry.first, entry.second);
    }

    void set(const std::string& tag, GestureMapping mapping) {
        auto it = m_index.find(tag);
        if (it != m_index.end()) {
            m_entries[it->second].second = std::move(mapping);
            return;
        }
        m_index.emplace(tag, m_entries.size());
        m_entries.emplace_back(tag, std::move(mapping));
    }

    const GestureMapping* find(const std::string& tag) const {
        auto it = m_index.find(tag);
        if (it == m_index.end())
            return nullptr;
        return &m_entries[it->second].second;
    }

    // Tag of the first entry of `kind` whose text matches case-insensitively.
    std::optional<std::string> findByText(const std::string& text, TokenKind kind) const {
        const std::string needle = toLower(text);
        for (const auto& entry : m_entries) {
            if (entry.second.kind == kind && toLower(entry.second.text) == needle)
                return entry.first;
        }
        return std::nullopt;
    }

    static std::string description(const std::string& tag) {
        static const std::unordered_map<std::string, std::string> descriptions = {
            {"FIST", "Make a fist with your hand"},
            {"OPEN_HAND", "Open your hand with fingers extended"},
            {"OK", "Touch thumb and index finger in a circle"},
            {"POINTING", "Point with index finger"},
            {"PEACE", "Extend index and middle fingers"},
            {"THUMBS_UP", "Raise thumb up with fist closed"},
            {"THUMBS_DOWN", "Point thumb down with fist closed"},
            {"L_SIGN", "Extend thumb and index finger in an L shape"},
            {"I_SIGN", "Extend only the pinky finger"},
            {"Y_SIGN", "Extend thumb and pinky finger"},
            {"THREE_FINGERS", "Extend index, middle and ring fingers"},
            {"SWIPE_RIGHT", "Move hand from left to right"},
            {"SWIPE_LEFT", "Move hand from right to left"},
            {"SWIPE_UP", "Move hand upwards"},
            {"SWIPE_DOWN", "Move hand downwards"},
            {"WAVE", "Wave your hand side to side"},
        };
        auto it = descriptions.find(tag);
        if (it == descriptions.end())
            return "Perform the gesture";
        return it->second;
    }

    const std::vector<std::pair<std::string, GestureMapping>>& entries() const { return m_entries; }
    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

private:
    std::vector<std::pair<std::string, GestureMapping>> m_entries;
    std::unordered_map<std::string, std::size_t> m_index;
};

} // namespace sl
