#pragma once

#include "Channel.hpp"
#include "Context.hpp"
#include "Task.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <variant>

namespace mlink::coro
{
    namespace detail
    {
        template<typename Ex, typename Coro>
        auto co_spawn_impl(Ex& ex, Coro coro) -> DetachedTask
        {
            co_await std::invoke(std::move(coro), ex);
        }
    }

    template<Executor Ex, std::invocable<Ex&> Coro>
    void co_spawn(Ex& ex, Coro&& coro)
    {
        auto detached{ detail::co_spawn_impl(ex, std::forward<Coro>(coro)) };
        ex.schedule(detached.getHandle());
    }

    // Drives the task to completion on a private context owned by the calling thread.
    template<typename T>
    auto syncWait(Task<T> task) -> T
    {
        Context ctx;
        std::optional<std::conditional_t<std::is_void_v<T>, std::monostate, T>> result;
        std::exception_ptr failure;

        co_spawn(ctx, [&](IExecutor&) -> Task<void> {
            try {
                if constexpr (std::is_void_v<T>) {
                    co_await std::move(task);
                    result.emplace();
                }
                else {
                    result.emplace(co_await std::move(task));
                }
            } catch (...) {
                failure = std::current_exception();
            }
            ctx.stop();
        });
        ctx.run();

        if (failure) {
            std::rethrow_exception(failure);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*result);
        }
    }
}
