#pragma once

#include "process/StatusFeed.hpp"

#include "mlink/coroutine/coroutine.hpp"

#include <atomic>
#include <optional>
#include <thread>

namespace mcell::app
{
    /**
     * Status feed consumer running on its own context. Logs cell level changes: system
     * state, PLC connectivity, stock and delivered parts.
     */
    class StatusMonitor
    {
    public:
        explicit StatusMonitor(process::StatusFeed& feed);
        ~StatusMonitor();

        StatusMonitor(const StatusMonitor&) = delete;
        StatusMonitor& operator=(const StatusMonitor&) = delete;

        void start();
        void stop();

        // number of snapshots consumed so far
        std::size_t received() const { return m_received; }

    private:
        mlink::coro::Task<void> watch();
        void report(const model::CellStatus& previous, const model::CellStatus& current);

        process::StatusFeed& m_feed;
        process::StatusSubscription m_subscription;
        std::atomic<std::size_t> m_received{ 0 };
        mlink::coro::Context m_ctx;
        std::jthread m_thread;
    };
}
