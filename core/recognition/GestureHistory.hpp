#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/recognition/GestureEvent.hpp"

namespace sl {

// Bounded FIFO of classified frames for one hand stream. Appends at the
// tail and evicts the oldest entry once capacity is exceeded.
class GestureHistory {
public:
    static constexpr std::size_t kDefaultCapacity = 10;
    static constexpr std::size_t kHeldWindow = 5;

    explicit GestureHistory(std::size_t capacity = kDefaultCapacity)
        : m_capacity(std::max<std::size_t>(1, capacity)) {}

    void append(GestureEvent event) {
        m_entries.push_back(std::move(event));
        while (m_entries.size() > m_capacity)
            m_entries.pop_front();
    }

    void setCapacity(std::size_t capacity) {
        m_capacity = std::max<std::size_t>(1, capacity);
        while (m_entries.size() > m_capacity)
            m_entries.pop_front();
    }

    std::size_t capacity() const { return m_capacity; }
    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    void clear() { m_entries.clear(); }

    const std::deque<GestureEvent>& entries() const { return m_entries; }

    const GestureEvent* latest() const { return m_entries.empty() ? nullptr : &m_entries.back(); }

    // Up to `count` most recent entries, oldest first.
    std::vector<GestureEvent> recent(std::size_t count) const {
        const std::size_t n = std::min(count, m_entries.size());
        return std::vector<GestureEvent>(m_entries.end() - static_cast<std::ptrdiff_t>(n),
                                         m_entries.end());
    }

    // Static label shared by the last five entries when the oldest of them
    // is at least `durationMs` before `nowMs`.
    std::optional<std::string> heldGesture(std::uint64_t nowMs,
                                           std::uint64_t durationMs = 1000) const {
        if (m_entries.size() < 2)
            return std::nullopt;
        const std::size_t n = std::min(kHeldWindow, m_entries.size());
        auto first = m_entries.end() - static_cast<std::ptrdiff_t>(n);
        const auto& label = first->staticLabel;
        if (!label)
            return std::nullopt;
        for (auto it = first; it != m_entries.end(); ++it) {
            if (it->staticLabel != label)
                return std::nullopt;
        }
        if (nowMs < first->timestamp || nowMs - first->timestamp < durationMs)
            return std::nullopt;
        return label;
    }

private:
    std::size_t m_capacity;
    std::deque<GestureEvent> m_entries;
};

} // namespace sl
