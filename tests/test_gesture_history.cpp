#include "core/recognition/GestureHistory.hpp"
#include <cassert>
#include <string>

static sl::GestureEvent labelled(const char* label, std::uint64_t ts) {
    sl::GestureEvent e;
    if (label)
        e.staticLabel = std::string(label);
    e.timestamp = ts;
    return e;
}

int main() {
    sl::GestureHistory history;
    assert(history.capacity() == 10 && history.empty() && !history.latest());

    // oldest entries fall off past capacity
    for (std::uint64_t i = 0; i < 15; ++i)
        history.append(labelled("FIST", i));
    assert(history.size() == 10);
    assert(history.entries().front().timestamp == 5);
    assert(history.latest()->timestamp == 14);
    auto recent = history.recent(3);
    assert(recent.size() == 3 && recent.front().timestamp == 12 && recent.back().timestamp == 14);
    assert(history.recent(50).size() == 10);

    history.setCapacity(4);
    assert(history.size() == 4 && history.entries().front().timestamp == 11);
    history.setCapacity(0);
    assert(history.capacity() == 1 && history.size() == 1);

    // five identical labels spanning a second are held
    sl::GestureHistory held;
    for (std::uint64_t t = 0; t <= 1000; t += 250)
        held.append(labelled("PEACE", t));
    assert(held.heldGesture(1000) == std::string("PEACE"));
    // 900 ms is not enough
    sl::GestureHistory brief;
    for (std::uint64_t t = 0; t <= 900; t += 225)
        brief.append(labelled("PEACE", t));
    assert(!brief.heldGesture(900));
    assert(brief.heldGesture(1000) == std::string("PEACE"));
    assert(brief.heldGesture(600, 500) == std::string("PEACE"));

    // one different label in the window breaks the hold
    sl::GestureHistory mixed;
    mixed.append(labelled("PEACE", 0));
    mixed.append(labelled("PEACE", 300));
    mixed.append(labelled("FIST", 600));
    mixed.append(labelled("PEACE", 900));
    mixed.append(labelled("PEACE", 1200));
    assert(!mixed.heldGesture(2000));
    // older entries outside the window do not matter
    for (std::uint64_t t = 1500; t <= 2400; t += 300)
        mixed.append(labelled("PEACE", t));
    assert(mixed.heldGesture(2400) == std::string("PEACE"));

    // unlabelled frames are never held
    sl::GestureHistory blank;
    for (std::uint64_t t = 0; t <= 2000; t += 500)
        blank.append(labelled(nullptr, t));
    assert(!blank.heldGesture(3000));

    sl::GestureHistory single;
    single.append(labelled("FIST", 0));
    assert(!single.heldGesture(5000));

    history.clear();
    assert(history.empty());
    return 0;
}
