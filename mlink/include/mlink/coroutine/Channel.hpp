#pragma once

#include "Context.hpp"

#include <cstddef>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace mlink::coro
{
    enum class ChannelMode
    {
        Broadcast,   // every waiter gets every update
        LoadBalancer // updates are distributed among waiters
    };

    template<typename T>
    class Channel
    {
        struct Awaiter;

        struct Waiter
        {
            std::coroutine_handle<> handle;
            IExecutor* executor;
            std::weak_ptr<void> lifeToken;
            Awaiter* awaiter;
        };

        struct State
        {
            std::mutex mutex;
            std::deque<T> queue; // buffered while nobody waits
            std::list<Waiter> waiters;
            std::size_t capacity{ 0 };
            ChannelMode mode{ ChannelMode::Broadcast };
            bool closed{ false };
        };

        struct Awaiter
        {
            std::shared_ptr<State> state;
            std::optional<T> result{};
            std::optional<typename std::list<Waiter>::iterator> iterator{};

            ~Awaiter()
            {
                std::lock_guard lock(state->mutex);
                if (iterator) {
                    state->waiters.erase(*iterator);
                }
            }

            auto await_ready() -> bool
            {
                std::lock_guard lock(state->mutex);
                return takeQueued();
            }

            template<typename P>
            auto await_suspend(std::coroutine_handle<P> handle) -> bool
            {
                std::lock_guard lock(state->mutex);
                if (takeQueued()) {
                    return false;
                }

                IExecutor* executor{ nullptr };
                std::weak_ptr<void> lifeToken;
                if constexpr (requires { handle.promise().executor; }) {
                    executor = handle.promise().executor;
                    if (executor) {
                        lifeToken = executor->getLifeToken();
                    }
                }

                iterator = state->waiters.insert(state->waiters.end(),
                                                 { handle, executor, std::move(lifeToken), this });
                return true;
            }

            auto await_resume() -> std::optional<T> { return std::move(result); }

          private:
            // caller holds state->mutex
            auto takeQueued() -> bool
            {
                if (!state->queue.empty()) {
                    result = std::move(state->queue.front());
                    state->queue.pop_front();
                    return true;
                }
                return state->closed;
            }
        };

      public:
        Channel()
          : Channel(0)
        {
        }

        // capacity 0 buffers without bound
        explicit Channel(std::size_t capacity, ChannelMode mode = ChannelMode::Broadcast)
          : m_state(std::make_shared<State>())
        {
            m_state->capacity = capacity;
            m_state->mode = mode;
        }

        // Never blocks. With a capacity set, the oldest buffered value is dropped when full.
        auto push(T value) -> void
        {
            std::list<Waiter> toResume;
            {
                std::lock_guard lock(m_state->mutex);
                if (m_state->closed) {
                    return;
                }

                if (m_state->waiters.empty()) {
                    if (m_state->capacity > 0 && m_state->queue.size() >= m_state->capacity) {
                        m_state->queue.pop_front();
                    }
                    m_state->queue.push_back(std::move(value));
                    return;
                }

                if (m_state->mode == ChannelMode::LoadBalancer) {
                    toResume.splice(toResume.end(), m_state->waiters, m_state->waiters.begin());
                    detach(toResume.front());
                    toResume.front().awaiter->result = std::move(value);
                }
                else {
                    toResume.splice(toResume.end(), m_state->waiters);
                    for (auto& waiter : toResume) {
                        detach(waiter);
                        waiter.awaiter->result = value;
                    }
                }
            }
            resume(toResume);
        }

        auto close() -> void
        {
            std::list<Waiter> toResume;
            {
                std::lock_guard lock(m_state->mutex);
                if (m_state->closed) {
                    return;
                }
                m_state->closed = true;
                toResume.splice(toResume.end(), m_state->waiters);
                for (auto& waiter : toResume) {
                    detach(waiter);
                }
            }
            resume(toResume);
        }

        auto isClosed() const -> bool
        {
            std::lock_guard lock(m_state->mutex);
            return m_state->closed;
        }

        auto size() const -> std::size_t
        {
            std::lock_guard lock(m_state->mutex);
            return m_state->queue.size();
        }

        // co_await channel.next() yields the next value, or std::nullopt once closed and drained
        auto next() -> Awaiter { return Awaiter{ m_state }; }

      private:
        static auto detach(Waiter& waiter) -> void { waiter.awaiter->iterator = std::nullopt; }

        static auto resume(std::list<Waiter>& waiters) -> void
        {
            for (auto& waiter : waiters) {
                if (waiter.executor) {
                    if (auto token{ waiter.lifeToken.lock() }) {
                        waiter.executor->schedule(waiter.handle);
                    }
                }
                else {
                    waiter.handle.resume();
                }
            }
        }

        std::shared_ptr<State> m_state;
    };
}
