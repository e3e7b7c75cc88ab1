#include "core/translation/TranslationEngine.hpp"
#include "HandPoses.hpp"
#include <cassert>
#include <string>
#include <vector>

static sl::GestureEvent event(const char* staticLabel, std::uint64_t ts, const char* dynamicLabel = nullptr) {
    sl::GestureEvent e;
    if (staticLabel)
        e.staticLabel = std::string(staticLabel);
    if (dynamicLabel)
        e.dynamicLabel = std::string(dynamicLabel);
    e.frame = poses::openHand();
    e.timestamp = ts;
    return e;
}

int main() {
    using sl::Mood;
    sl::TranslationEngine engine;

    auto token = engine.translateGesture(event("FIST", 10));
    assert(token && token->text == "A" && token->kind == sl::TokenKind::Letter);
    assert(token->gesture == "FIST" && token->confidence == 0.8f && token->timestamp == 10);
    assert(!engine.translateGesture(event("THREE_FINGERS", 0)));
    assert(!engine.translateGesture(event(nullptr, 0)));
    // the dynamic label is used when there is no static one
    assert(engine.translateGesture(event(nullptr, 0, "SWIPE_RIGHT"))->text == "NEXT");
    // an empty frame gets the lower confidence
    sl::GestureEvent bare = event("PEACE", 0);
    bare.frame = sl::HandFrame{};
    assert(engine.translateGesture(bare)->confidence == 0.5f);

    // mood decorates words, never letters
    const std::string happy = std::string(sl::moodEmoji(Mood::Happy)) + " GOOD";
    assert(engine.translateGesture(event("THUMBS_UP", 0), Mood::Happy)->text == happy);
    assert(engine.translateGesture(event("FIST", 0), Mood::Happy)->text == "A");
    assert(engine.translateGesture(event("THUMBS_UP", 0), Mood::Neutral)->text == "GOOD");
    assert(engine.translateGesture(event("THUMBS_UP", 0), Mood::Fearful)->text == "GOOD");
    assert(engine.translateGesture(event("THUMBS_UP", 0), Mood::Sad)->mood == Mood::Sad);

    // pure sentence building collapses repeats
    std::vector<sl::GestureEvent> seq;
    for (std::uint64_t t = 0; t <= 400; t += 100)
        seq.push_back(event("THUMBS_UP", t));
    assert(engine.buildSentence(seq) == "GOOD");
    seq.push_back(event("FIST", 500));
    seq.push_back(event(nullptr, 600));
    seq.push_back(event("THUMBS_UP", 700));
    assert(engine.buildSentence(seq) == "GOOD A GOOD");
    assert(engine.buildSentence({}) == "");
    assert(engine.buffer().empty());

    // real-time: repeated signs give one word
    for (std::uint64_t t = 0; t <= 400; t += 100) {
        auto update = engine.processRealTimeGesture(event("THUMBS_UP", t), Mood::Neutral, t);
        assert(update && update->sentence == "GOOD");
    }
    assert(engine.buffer().size() == 5);
    assert(engine.currentSentence() == "GOOD");

    // unrecognised frames keep the clock moving without adding tokens
    assert(!engine.processRealTimeGesture(event(nullptr, 1500), Mood::Neutral, 1500));
    auto kept = engine.processRealTimeGesture(event("OPEN_HAND", 3000), Mood::Neutral, 3000);
    assert(kept && kept->sentence == "GOOD B" && kept->buffer.size() == 6);
    assert(kept->current.text == "B" && kept->current.timestamp == 3000);

    // a gap above the timeout starts a new utterance
    engine.clearBuffer();
    engine.processRealTimeGesture(event("FIST", 0), Mood::Neutral, 0);
    auto fresh = engine.processRealTimeGesture(event("PEACE", 2500), Mood::Neutral, 2500);
    assert(fresh && fresh->buffer.size() == 1 && fresh->sentence == "V");
    assert(engine.currentSentence() == "V");
    // exactly the timeout still continues
    auto same = engine.processRealTimeGesture(event("FIST", 4500), Mood::Neutral, 4500);
    assert(same->buffer.size() == 2 && same->sentence == "V A");
    // time going backwards also starts over
    auto back = engine.processRealTimeGesture(event("OK", 4000), Mood::Neutral, 4000);
    assert(back->buffer.size() == 1 && back->sentence == "F");

    auto stats = engine.statistics();
    assert(stats.bufferSize == 1 && stats.currentLength == 1);
    assert(stats.lastEventTime == 4000 && stats.totalGestures == 8);

    // export and import
    QJsonObject record = engine.exportData(99);
    assert(record.value("current").toString() == "F");
    assert(record.value("buffer").toArray().size() == 1);
    assert(record.value("gestures").toObject().size() == 8);

    QJsonObject extra;
    QJsonObject wave;
    wave.insert("text", "HELLO");
    wave.insert("type", "word");
    extra.insert("WAVE", wave);
    QJsonObject fist;
    fist.insert("text", "S");
    fist.insert("kind", "letter");
    extra.insert("FIST", fist);
    QJsonObject payload;
    payload.insert("gestures", extra);
    engine.importData(payload);
    assert(engine.dictionary().size() == 9);
    assert(engine.translateGesture(event(nullptr, 0, "WAVE"))->text == "HELLO");
    assert(engine.translateGesture(event("FIST", 0))->text == "S");
    engine.importData(QJsonObject());
    assert(engine.dictionary().size() == 9);

    engine.clearBuffer();
    assert(engine.buffer().empty() && engine.currentSentence().empty());

    // run lengths
    assert(sl::TranslationEngine::analyzePattern({event("FIST", 0), event("FIST", 1)}).empty());
    auto runs = sl::TranslationEngine::analyzePattern(
        {event("FIST", 0), event("FIST", 1), event(nullptr, 2), event("PEACE", 3), event("PEACE", 4),
         event("FIST", 5)});
    assert(runs.size() == 3);
    assert(runs[0].gesture == "FIST" && runs[0].count == 2);
    assert(runs[1].gesture == "PEACE" && runs[1].count == 2);
    assert(runs[2].gesture == "FIST" && runs[2].count == 1);

    auto next = sl::TranslationEngine::suggestNextGesture({event("FIST", 0)});
    assert(next.size() == 2 && next[0] == "OPEN_HAND" && next[1] == "POINTING");
    assert(sl::TranslationEngine::suggestNextGesture({event("OK", 0)}).empty());
    assert(sl::TranslationEngine::suggestNextGesture({}).empty());
    return 0;
}
