#pragma once

#include "mlink/coroutine/coroutine.hpp"
#include "mlink/log/LogEntry.hpp"
#include "mlink/log/LogHistory.hpp"
#include "mlink/log/formatter.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <mutex>
#include <print>
#include <source_location>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>

namespace mlink::log
{
    struct LoggerConfig
    {
        Level minLevel{ Level::Info };
        bool showTimestamp{ true };
        std::string timestampFormat{ "{:%Y-%m-%d %H:%M:%S}" };
        bool showLevel{ true };
        bool showThreadId{ false };
        bool showFile{ false };
        bool showLine{ false };
        bool showFunction{ true };
        std::size_t historySize{ 500 };
    };

    template<typename... Args>
    struct FormatString
    {
        std::format_string<Args...> str;
        std::source_location loc;

        template<typename T>
            requires std::convertible_to<const T&, std::string_view>
        consteval FormatString(const T& s, std::source_location l = std::source_location::current())
          : str(s)
          , loc(l)
        {
        }
    };

    // Entries are formatted on the calling thread and printed by a coroutine running on
    // the logger's own context, so callers never wait on the terminal.
    class Logger
    {
      public:
        static auto instance() -> Logger&
        {
            static Logger logger;
            return logger;
        }

        Logger()
          : m_thread([this]() { m_ctx.run(); })
        {
            coro::co_spawn(m_ctx, [this](coro::IExecutor&) -> coro::Task<void> { return process(); });
        }

        ~Logger()
        {
            // process() drains what is queued and stops the context once the channel reports closed
            m_channel.close();
            if (m_thread.joinable()) {
                m_thread.join();
            }
        }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        auto setConfig(LoggerConfig config) -> void
        {
            m_minLevel = config.minLevel;
            m_history.setCapacity(config.historySize);

            std::lock_guard lock(m_configMutex);
            m_config = std::move(config);
        }

        auto setMinLevel(Level level) -> void { m_minLevel = level; }
        auto isEnabled(Level level) const -> bool { return level >= m_minLevel.load(); }

        auto history() -> LogHistory& { return m_history; }
        auto history() const -> const LogHistory& { return m_history; }

        template<typename... Args>
        auto log(Level level, std::source_location loc, std::format_string<Args...> fmt, Args&&... args) -> void
        {
            if (!isEnabled(level)) {
                return;
            }

            std::string msg;
            try {
                msg = std::format(fmt, std::forward<Args>(args)...);
            } catch (const std::format_error& e) {
                msg = std::format("<format error: {}>", e.what());
            }

            m_channel.push({ std::chrono::system_clock::now(),
                             level,
                             std::move(msg),
                             std::this_thread::get_id(),
                             loc.file_name(),
                             loc.line(),
                             std::string(qualifiedFunctionName(loc.function_name())) });
        }

      private:
        auto process() -> coro::Task<void>
        {
            while (true) {
                auto entry{ co_await m_channel.next() };
                if (!entry) {
                    break;
                }
                print(*entry);
                m_history.add(std::move(*entry));
            }
            m_ctx.stop();
        }

        auto print(const LogEntry& entry) -> void
        {
            std::lock_guard lock(m_configMutex);

            std::string line;
            auto out{ std::back_inserter(line) };

            if (m_config.showTimestamp) {
                auto ts{ std::chrono::floor<std::chrono::milliseconds>(entry.timestamp) };
                try {
                    std::format_to(out, "[{}] ", std::vformat(m_config.timestampFormat, std::make_format_args(ts)));
                } catch (const std::format_error&) {
                    std::format_to(out, "[{}] ", ts);
                }
            }

            if (m_config.showLevel) {
                std::format_to(out, "[{}] ", entry.level);
            }

            if (m_config.showThreadId) {
                std::stringstream ss;
                ss << entry.threadId;
                std::format_to(out, "[Thread {}] ", ss.str());
            }

            if (m_config.showFile || m_config.showLine || m_config.showFunction) {
                line += '[';
                bool first{ true };
                if (m_config.showFile) {
                    line += entry.file;
                    first = false;
                }
                if (m_config.showLine) {
                    std::format_to(out, "{}{}", first ? "" : ":", entry.line);
                    first = false;
                }
                if (m_config.showFunction) {
                    std::format_to(out, "{}{}", first ? "" : " ", entry.function);
                }
                line += "] ";
            }

            line += entry.message;

            if (entry.level >= Level::Warning) {
                std::println(stderr, "{}", line);
            }
            else {
                std::println("{}", line);
            }
        }

        LoggerConfig m_config{};
        std::mutex m_configMutex;
        std::atomic<Level> m_minLevel{ Level::Info };
        LogHistory m_history{};
        coro::Channel<LogEntry> m_channel{ 0, coro::ChannelMode::LoadBalancer };
        coro::Context m_ctx{};
        std::thread m_thread;
    };

    template<typename... Args>
    auto debug(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Debug, fmt.loc, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto info(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Info, fmt.loc, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto warning(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Warning, fmt.loc, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto error(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Error, fmt.loc, fmt.str, std::forward<Args>(args)...);
    }
}
