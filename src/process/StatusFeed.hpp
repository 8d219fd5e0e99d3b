#pragma once

#include "Orchestrator.hpp"

#include "mlink/coroutine/Channel.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace mcell::process
{
    struct StatusSubscription
    {
        uint64_t id{ 0 };
        mlink::coro::Channel<model::CellStatus> stream;

        bool is_valid() const { return id != 0; }
    };

    /**
     * Fans the per-tick status out to coroutine consumers. Each subscriber gets its own
     * bounded channel, a consumer that falls behind loses the oldest snapshots instead of
     * stalling the process loop.
     */
    class StatusFeed : public IStatusObserver
    {
    public:
        explicit StatusFeed(std::size_t depth = 16)
            : m_depth(depth)
        {
        }

        ~StatusFeed() override { close_all(); }

        StatusSubscription subscribe()
        {
            std::lock_guard lock(m_mutex);
            StatusSubscription subscription{ ++m_next_id, mlink::coro::Channel<model::CellStatus>(m_depth) };
            m_streams.emplace(subscription.id, subscription.stream);
            return subscription;
        }

        // closes the stream, pending values stay readable; false for unknown ids
        bool unsubscribe(uint64_t id)
        {
            std::unique_lock lock(m_mutex);
            auto node = m_streams.extract(id);
            lock.unlock();

            if (node.empty()) {
                return false;
            }
            node.mapped().close();
            return true;
        }

        std::size_t subscriber_count() const
        {
            std::lock_guard lock(m_mutex);
            return m_streams.size();
        }

        void on_status(const model::CellStatus& status) override
        {
            std::vector<mlink::coro::Channel<model::CellStatus>> streams;
            {
                std::lock_guard lock(m_mutex);
                for (const auto& [id, stream] : m_streams) {
                    streams.push_back(stream);
                }
            }
            for (auto& stream : streams) {
                stream.push(status);
            }
        }

        void close_all()
        {
            std::map<uint64_t, mlink::coro::Channel<model::CellStatus>> streams;
            {
                std::lock_guard lock(m_mutex);
                streams.swap(m_streams);
            }
            for (auto& [id, stream] : streams) {
                stream.close();
            }
        }

    private:
        const std::size_t m_depth;
        mutable std::mutex m_mutex;
        uint64_t m_next_id{ 0 };
        std::map<uint64_t, mlink::coro::Channel<model::CellStatus>> m_streams;
    };
}
