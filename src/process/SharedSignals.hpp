#pragma once

#include <atomic>

namespace mcell::process
{
    /**
     * Hand-over flags between the control surface and the feeder.
     *
     * part requested: raised by the control surface, cleared by the feeder once the PLC
     *                 started the feed motor.
     * part delivered: raised by the feeder, cleared by whoever consumes the part.
     */
    class SharedSignals
    {
    public:
        void request_part() { m_part_requested.store(true); }
        void clear_part_request() { m_part_requested.store(false); }
        bool part_requested() const { return m_part_requested.load(); }

        void mark_part_delivered() { m_part_delivered.store(true); }
        bool part_delivered() const { return m_part_delivered.load(); }
        // returns the flag and clears it
        bool take_part_delivered() { return m_part_delivered.exchange(false); }

    private:
        std::atomic<bool> m_part_requested{ false };
        std::atomic<bool> m_part_delivered{ false };
    };
}
