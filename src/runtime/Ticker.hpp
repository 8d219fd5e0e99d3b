#pragma once

#include "Clock.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>

namespace mcell::runtime
{
    class ITicker
    {
    public:
        virtual ~ITicker() = default;

        // Blocks until the next tick is due. Returns false once a stop was requested.
        virtual bool wait(std::stop_token stop) = 0;
    };

    /**
     * Fixed period ticker. A late tick fires immediately and the schedule restarts from
     * there, missed ticks are not replayed.
     */
    class PeriodicTicker : public ITicker
    {
    public:
        explicit PeriodicTicker(std::chrono::milliseconds period)
            : m_period(period)
        {
        }

        bool wait(std::stop_token stop) override
        {
            std::unique_lock lock(m_mutex);

            auto now = Clock::now();
            if (!m_next) {
                m_next = now + m_period;
            }

            if (*m_next > now) {
                m_cv.wait_until(lock, stop, *m_next, [] { return false; });
            }
            if (stop.stop_requested()) {
                return false;
            }

            m_next = std::max(*m_next, Clock::now()) + m_period;
            return true;
        }

    private:
        const std::chrono::milliseconds m_period;
        std::optional<TimePoint> m_next;
        std::mutex m_mutex;
        std::condition_variable_any m_cv;
    };
}
