#pragma once

#include "Log.hpp"
#include "Ticker.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcell::runtime
{
    /**
     * Background thread running a body once per ticker period until stopped.
     * stop() waits a bounded time for the thread; a thread that does not exit in time is
     * reported and joined later by the destructor.
     */
    class PeriodicWorker
    {
    public:
        PeriodicWorker(std::string name, std::unique_ptr<ITicker> ticker)
            : m_name(std::move(name))
            , m_ticker(std::move(ticker))
        {
        }

        ~PeriodicWorker()
        {
            std::lock_guard lock(m_lifecycle_mutex);
            m_thread.request_stop();
            m_running = false;
        }

        PeriodicWorker(const PeriodicWorker&) = delete;
        PeriodicWorker& operator=(const PeriodicWorker&) = delete;

        // false if already running
        bool start(std::function<void()> body, bool run_immediately = false)
        {
            std::lock_guard lock(m_lifecycle_mutex);
            if (m_running) {
                return false;
            }
            if (m_thread.joinable()) {
                m_thread.join();
            }

            {
                std::lock_guard exit_lock(m_exit_mutex);
                m_exited = false;
            }
            m_running = true;

            m_thread = std::jthread([this, body = std::move(body), run_immediately](std::stop_token stop) {
                if (run_immediately) {
                    run_guarded(body);
                }
                while (m_ticker->wait(stop)) {
                    run_guarded(body);
                }

                {
                    std::lock_guard exit_lock(m_exit_mutex);
                    m_exited = true;
                }
                m_exit_cv.notify_all();
            });
            return true;
        }

        // false if the thread did not exit within the timeout
        bool stop(std::chrono::milliseconds timeout)
        {
            std::lock_guard lock(m_lifecycle_mutex);
            if (!m_running) {
                return true;
            }

            m_thread.request_stop();
            m_running = false;

            bool exited = false;
            {
                std::unique_lock exit_lock(m_exit_mutex);
                exited = m_exit_cv.wait_for(exit_lock, timeout, [this] { return m_exited; });
            }

            if (!exited) {
                log::warning("{}: worker did not stop within {} ms", m_name, timeout.count());
                return false;
            }

            m_thread.join();
            return true;
        }

        bool is_running() const { return m_running; }

    private:
        void run_guarded(const std::function<void()>& body)
        {
            try {
                body();
            } catch (const std::exception& e) {
                log::error("{}: cycle aborted: {}", m_name, e.what());
            }
        }

        const std::string m_name;
        std::unique_ptr<ITicker> m_ticker;

        std::mutex m_lifecycle_mutex;
        std::atomic<bool> m_running{ false };

        std::mutex m_exit_mutex;
        std::condition_variable m_exit_cv;
        bool m_exited{ true };

        std::jthread m_thread;
    };
}
