#pragma once

#include <chrono>

namespace mcell::runtime
{
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    class IClock
    {
    public:
        virtual ~IClock() = default;
        virtual TimePoint now() const = 0;
    };

    class SteadyClock : public IClock
    {
    public:
        TimePoint now() const override { return Clock::now(); }
    };
}
