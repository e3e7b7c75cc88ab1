#include "core/translation/TextToSign.hpp"
#include "core/translation/TranslationEngine.hpp"
#include <cassert>
#include <string>

int main() {
    sl::GestureDictionary dict = sl::GestureDictionary::builtin();
    dict.set("I_SIGN", {"I", sl::TokenKind::Letter});
    sl::TextToSignMapper mapper(dict);

    auto word = mapper.translate("Good", 42);
    assert(word.size() == 1);
    assert(word[0].word == "good" && word[0].gesture == "THUMBS_UP");
    assert(!word[0].fingerSpelled && word[0].timestamp == 42);
    assert(word[0].description == "Raise thumb up with fist closed");

    // no word entry: spell it, skipping letters without a sign
    auto spelled = mapper.translate("hi");
    assert(spelled.size() == 1);
    assert(spelled[0].word == "i" && spelled[0].gesture == "I_SIGN" && spelled[0].fingerSpelled);
    dict.set("H_SIGN", {"H", sl::TokenKind::Letter});
    spelled = mapper.translate("hi");
    assert(spelled.size() == 2 && spelled[0].gesture == "H_SIGN" && spelled[1].gesture == "I_SIGN");
    assert(spelled[0].description == "Perform the gesture");

    auto mixed = mapper.translate("  NEXT   bad\tav ");
    assert(mixed.size() == 6);
    assert(mixed[0].gesture == "SWIPE_RIGHT" && mixed[0].word == "next");
    assert(mixed[1].gesture == "OPEN_HAND" && mixed[1].word == "b");
    assert(mixed[2].gesture == "FIST" && mixed[3].gesture == "POINTING");
    assert(mixed[4].gesture == "FIST" && mixed[5].gesture == "PEACE");

    assert(mapper.translate("").empty());
    assert(mapper.translate("xyz 123 !").empty());

    // word text matching is exact, not prefix
    auto goods = mapper.translate("goods");
    assert(goods.size() == 1 && goods[0].gesture == "POINTING" && goods[0].fingerSpelled);

    sl::TranslationEngine engine;
    auto viaEngine = engine.translateTextToSign("back", 7);
    assert(viaEngine.size() == 1 && viaEngine[0].gesture == "SWIPE_LEFT" && viaEngine[0].timestamp == 7);
    return 0;
}
