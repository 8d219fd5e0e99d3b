#pragma once

#include "mlink/Result.hpp"
#include "mlink/log/LogEntry.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace mcell::config
{
    struct PlcConfig
    {
        std::string host{ "192.168.29.3" };
        uint16_t port{ 502 };
        std::chrono::milliseconds connect_timeout{ 3000 };
        std::chrono::milliseconds health_interval{ 5000 };
    };

    struct ProcessConfig
    {
        std::chrono::milliseconds tick_period{ 10 };
        std::chrono::milliseconds stop_timeout{ 2000 };
    };

    struct LogConfig
    {
        mlink::log::Level level{ mlink::log::Level::Info };
        std::size_t history_size{ 500 };
    };

    struct AppConfig
    {
        PlcConfig plc;
        ProcessConfig process;
        LogConfig log;
    };

    /**
     * Reads the cell configuration document.
     *
     * {
     *   "devices": { "plc": { "ip": "192.168.29.3", "port": 502, "timeout_ms": 3000 } },
     *   "process": { "tick_ms": 10 },
     *   "log":     { "level": "info", "history": 500 }
     * }
     *
     * Every key is optional. A missing file is not an error: defaults are returned and a
     * warning is logged. Every call re-reads the file.
     */
    class ConfigLoader
    {
    public:
        explicit ConfigLoader(std::string path);

        mlink::Result<AppConfig> load() const;

        // parses a document already in memory, used by load()
        static mlink::Result<AppConfig> parse(const std::string& text);

        const std::string& path() const { return m_path; }

    private:
        std::string m_path;
    };
}
