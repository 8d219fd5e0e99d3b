#pragma once
/** @file  ManualClock.hpp
 *  @brief IClock that only moves when a test advances it.
 */

#include "runtime/Clock.hpp"

#include <chrono>
#include <mutex>

namespace mcell::test
{
    class ManualClock : public runtime::IClock
    {
    public:
        runtime::TimePoint now() const override
        {
            std::lock_guard lock(m_mutex);
            return m_now;
        }

        void advance(std::chrono::milliseconds delta)
        {
            std::lock_guard lock(m_mutex);
            m_now += delta;
        }

    private:
        mutable std::mutex m_mutex;
        runtime::TimePoint m_now{ std::chrono::hours(1) };
    };
}
