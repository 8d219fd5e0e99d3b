#include "app/StatusMonitor.hpp"
#include "runtime/Log.hpp"

#include <exception>

namespace mcell::app
{
    StatusMonitor::StatusMonitor(process::StatusFeed& feed)
        : m_feed(feed)
    {
    }

    StatusMonitor::~StatusMonitor()
    {
        stop();
    }

    void StatusMonitor::start()
    {
        if (m_subscription.is_valid()) {
            return;
        }

        m_subscription = m_feed.subscribe();
        m_ctx.restart();
        mlink::coro::co_spawn(m_ctx, [this](mlink::coro::IExecutor&) -> mlink::coro::Task<void> {
            try {
                co_await watch();
            } catch (const std::exception& e) {
                log::error("status monitor stopped: {}", e.what());
            }
            m_ctx.stop();
        });
        m_thread = std::jthread([this] { m_ctx.run(); });
    }

    void StatusMonitor::stop()
    {
        if (!m_subscription.is_valid()) {
            return;
        }

        // closing the stream ends watch(), which stops the context
        m_feed.unsubscribe(m_subscription.id);
        if (m_thread.joinable()) {
            m_thread.join();
        }
        m_subscription = {};
    }

    mlink::coro::Task<void> StatusMonitor::watch()
    {
        std::optional<model::CellStatus> last;
        while (auto status = co_await m_subscription.stream.next()) {
            ++m_received;
            if (last) {
                report(*last, *status);
            }
            last = std::move(*status);
        }
    }

    void StatusMonitor::report(const model::CellStatus& previous, const model::CellStatus& current)
    {
        if (previous.system_state != current.system_state) {
            log::info("cell is {}", current.system_state);
        }
        if (previous.plc_connected != current.plc_connected) {
            log::info("cell sees the PLC {}", current.plc_connected ? "online" : "offline");
        }
        if (previous.marks.no_stock != current.marks.no_stock) {
            log::info("feeder stock {}", current.marks.no_stock ? "empty" : "available");
        }
        if (current.feeder.counter > previous.feeder.counter) {
            log::info("parts delivered: {}", current.feeder.counter);
        }
    }
}
