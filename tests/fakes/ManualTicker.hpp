#pragma once
/** @file  ManualTicker.hpp
 *  @brief ITicker released one tick at a time from the test thread.
 */

#include "runtime/Ticker.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace mcell::test
{
    class ManualTicker : public runtime::ITicker
    {
    public:
        bool wait(std::stop_token stop) override
        {
            std::unique_lock lock(m_mutex);
            ++m_waits;
            m_cv.notify_all();

            m_cv.wait(lock, stop, [this] { return m_released > m_consumed; });
            if (stop.stop_requested()) {
                return false;
            }
            ++m_consumed;
            return true;
        }

        // releases one tick and waits until the worker ran it and is waiting again
        bool step(std::chrono::milliseconds timeout = std::chrono::seconds(2))
        {
            std::unique_lock lock(m_mutex);
            ++m_released;
            m_cv.notify_all();
            return m_cv.wait_for(lock, timeout, [this] { return m_waits > m_released; });
        }

        // waits until the worker blocks in wait() for the first time
        bool wait_parked(std::chrono::milliseconds timeout = std::chrono::seconds(2))
        {
            std::unique_lock lock(m_mutex);
            return m_cv.wait_for(lock, timeout, [this] { return m_waits > 0; });
        }

        int ticks() const
        {
            std::lock_guard lock(m_mutex);
            return m_consumed;
        }

    private:
        mutable std::mutex m_mutex;
        std::condition_variable_any m_cv;
        int m_waits = 0;
        int m_released = 0;
        int m_consumed = 0;
    };
}
