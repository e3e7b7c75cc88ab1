#pragma once
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>
#include "core/translation/GestureDictionary.hpp"

namespace sl {

struct SignToken {
    std::string word;
    std::string gesture;
    std::string description;
    bool fingerSpelled{false};
    std::uint64_t timestamp{0};
};

// Reverse lookup: whole words first, then letter-by-letter spelling.
// Characters without a letter sign are skipped.
class TextToSignMapper {
public:
    explicit TextToSignMapper(const GestureDictionary& dictionary) : m_dictionary(dictionary) {}

    std::vector<SignToken> translate(const std::string& text, std::uint64_t timestampMs = 0) const {
        std::vector<SignToken> signs;
        std::istringstream words(text);
        std::string word;
        while (words >> word) {
            const std::string lower = toLower(word);
            if (auto tag = m_dictionary.findByText(lower, TokenKind::Word)) {
                signs.push_back({lower, *tag, GestureDictionary::description(*tag), false, timestampMs});
                continue;
            }
            for (char c : lower) {
                const std::string letter(1, c);
                if (auto tag = m_dictionary.findByText(letter, TokenKind::Letter))
                    signs.push_back({letter, *tag, GestureDictionary::description(*tag), true, timestampMs});
            }
        }
        return signs;
    }

private:
    const GestureDictionary& m_dictionary;
};

} // namespace sl
