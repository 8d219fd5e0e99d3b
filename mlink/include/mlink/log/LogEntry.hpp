#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

namespace mlink::log
{
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        Level level;
        std::string message;
        std::thread::id threadId;
        std::string file;
        uint32_t line;
        std::string function;
    };

    // "ret ns::Class::method(args) const" -> "ns::Class::method", best effort
    inline auto qualifiedFunctionName(std::string_view signature) -> std::string_view
    {
        auto open{ signature.find('(') };
        if (open == std::string_view::npos) {
            return signature;
        }

        auto name{ signature.substr(0, open) };
        if (auto space{ name.rfind(' ') }; space != std::string_view::npos) {
            name.remove_prefix(space + 1);
        }
        return name;
    }
}
