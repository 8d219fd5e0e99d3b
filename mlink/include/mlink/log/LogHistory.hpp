#pragma once

#include "LogEntry.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace mlink::log
{
    // Bounded ring of the most recent entries, oldest first.
    class LogHistory
    {
      public:
        explicit LogHistory(std::size_t capacity = 500)
          : m_capacity{ std::max<std::size_t>(capacity, 1) }
        {
        }

        auto add(LogEntry entry) -> void
        {
            std::lock_guard lock(m_mutex);
            if (m_entries.size() >= m_capacity) {
                m_entries.pop_front();
                ++m_overflowCount;
            }
            m_entries.push_back(std::move(entry));
        }

        // last `limit` entries at or above `minLevel`, oldest first; limit 0 returns all
        auto recent(std::size_t limit = 0, Level minLevel = Level::Debug) const -> std::vector<LogEntry>
        {
            std::lock_guard lock(m_mutex);

            std::vector<LogEntry> selected;
            for (auto it{ m_entries.rbegin() }; it != m_entries.rend(); ++it) {
                if (limit != 0 && selected.size() >= limit) {
                    break;
                }
                if (it->level >= minLevel) {
                    selected.push_back(*it);
                }
            }
            std::ranges::reverse(selected);
            return selected;
        }

        auto setCapacity(std::size_t capacity) -> void
        {
            std::lock_guard lock(m_mutex);
            m_capacity = std::max<std::size_t>(capacity, 1);
            while (m_entries.size() > m_capacity) {
                m_entries.pop_front();
                ++m_overflowCount;
            }
        }

        auto clear() -> void
        {
            std::lock_guard lock(m_mutex);
            m_entries.clear();
            m_overflowCount = 0;
        }

        auto size() const -> std::size_t
        {
            std::lock_guard lock(m_mutex);
            return m_entries.size();
        }

        // entries pushed out of the ring since the last clear()
        auto overflowCount() const -> std::size_t
        {
            std::lock_guard lock(m_mutex);
            return m_overflowCount;
        }

      private:
        mutable std::mutex m_mutex;
        std::deque<LogEntry> m_entries;
        std::size_t m_capacity;
        std::size_t m_overflowCount{ 0 };
    };
}
