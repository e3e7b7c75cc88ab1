#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace sl {

enum class Mood { Happy, Sad, Angry, Surprised, Fearful, Disgusted, Neutral };

constexpr std::array<Mood, 7> kMoods{Mood::Happy,   Mood::Sad,       Mood::Angry,  Mood::Surprised,
                                     Mood::Fearful, Mood::Disgusted, Mood::Neutral};

inline const char* moodName(Mood mood) {
    switch (mood) {
    case Mood::Happy:
        return "happy";
    case Mood::Sad:
        return "sad";
    case Mood::Angry:
        return "angry";
    case Mood::Surprised:
        return "surprised";
    case Mood::Fearful:
        return "fearful";
    case Mood::Disgusted:
        return "disgusted";
    case Mood::Neutral:
        return "neutral";
    }
    return "neutral";
}

inline std::optional<Mood> moodFromName(const std::string& name) {
    for (Mood m : kMoods)
        if (name == moodName(m))
            return m;
    return std::nullopt;
}

inline bool isNegative(Mood mood) {
    return mood == Mood::Sad || mood == Mood::Angry || mood == Mood::Fearful ||
           mood == Mood::Disgusted;
}

// UTF-8 emoji for display.
inline const char* moodEmoji(Mood mood) {
    switch (mood) {
    case Mood::Happy:
        return "\xF0\x9F\x98\x8A";
    case Mood::Sad:
        return "\xF0\x9F\x98\xA2";
    case Mood::Angry:
        return "\xF0\x9F\x98\xA0";
    case Mood::Surprised:
        return "\xF0\x9F\x98\xAE";
    case Mood::Fearful:
        return "\xF0\x9F\x98\xA8";
    case Mood::Disgusted:
        return "\xF0\x9F\xA4\xA2";
    case Mood::Neutral:
        return "\xF0\x9F\x98\x90";
    }
    return "\xF0\x9F\x98\x90";
}

inline const char* moodColor(Mood mood) {
    switch (mood) {
    case Mood::Happy:
        return "#10B981";
    case Mood::Sad:
        return "#3B82F6";
    case Mood::Angry:
        return "#EF4444";
    case Mood::Surprised:
        return "#F59E0B";
    case Mood::Fearful:
        return "#8B5CF6";
    case Mood::Disgusted:
        return "#6B7280";
    case Mood::Neutral:
        return "#9CA3AF";
    }
    return "#9CA3AF";
}

inline const char* moodDescription(Mood mood) {
    switch (mood) {
    case Mood::Happy:
        return "Happy and positive";
    case Mood::Sad:
        return "Sad or unhappy";
    case Mood::Angry:
        return "Angry or frustrated";
    case Mood::Surprised:
        return "Surprised or shocked";
    case Mood::Fearful:
        return "Fearful or anxious";
    case Mood::Disgusted:
        return "Disgusted or displeased";
    case Mood::Neutral:
        return "Neutral expression";
    }
    return "Neutral expression";
}

struct MoodReading {
    Mood mood{Mood::Neutral};
    float confidence{0.f};
};

} // namespace sl
