#include "config/Config.hpp"
#include "runtime/Log.hpp"

#include <magic_enum/magic_enum.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace mcell::config
{
    namespace
    {
        using nlohmann::json;

        template<typename T>
        void read_optional(const json& node, const char* key, T& target)
        {
            if (auto it = node.find(key); it != node.end() && !it->is_null()) {
                target = it->get<T>();
            }
        }

        void read_millis(const json& node, const char* key, std::chrono::milliseconds& target)
        {
            if (auto it = node.find(key); it != node.end() && !it->is_null()) {
                auto value = it->get<int64_t>();
                if (value <= 0) {
                    throw std::out_of_range(std::string(key) + " must be positive");
                }
                target = std::chrono::milliseconds(value);
            }
        }

        const json& child(const json& node, const char* key)
        {
            static const json empty = json::object();
            if (auto it = node.find(key); it != node.end() && it->is_object()) {
                return *it;
            }
            return empty;
        }
    }

    ConfigLoader::ConfigLoader(std::string path)
        : m_path(std::move(path))
    {
    }

    mlink::Result<AppConfig> ConfigLoader::load() const
    {
        std::error_code ec;
        if (!std::filesystem::exists(m_path, ec)) {
            log::warning("config file '{}' not found, using defaults", m_path);
            return AppConfig{};
        }

        std::ifstream file(m_path);
        if (!file) {
            log::error("config file '{}' cannot be opened", m_path);
            return mlink::fail(mlink::Error::ConfigNotFound);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse(buffer.str());
    }

    mlink::Result<AppConfig> ConfigLoader::parse(const std::string& text)
    {
        AppConfig config;

        try {
            auto root = json::parse(text);
            if (!root.is_object()) {
                log::error("config root must be an object");
                return mlink::fail(mlink::Error::InvalidConfig);
            }

            const auto& plc = child(child(root, "devices"), "plc");
            read_optional(plc, "ip", config.plc.host);
            if (auto it = plc.find("port"); it != plc.end()) {
                auto port = it->get<int64_t>();
                if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
                    throw std::out_of_range("port out of range");
                }
                config.plc.port = static_cast<uint16_t>(port);
            }
            read_millis(plc, "timeout_ms", config.plc.connect_timeout);
            read_millis(plc, "health_interval_ms", config.plc.health_interval);

            const auto& process = child(root, "process");
            read_millis(process, "tick_ms", config.process.tick_period);
            read_millis(process, "stop_timeout_ms", config.process.stop_timeout);

            const auto& logging = child(root, "log");
            if (auto it = logging.find("level"); it != logging.end()) {
                auto name = it->get<std::string>();
                auto level = magic_enum::enum_cast<mlink::log::Level>(name, magic_enum::case_insensitive);
                if (!level) {
                    log::error("unknown log level '{}'", name);
                    return mlink::fail(mlink::Error::InvalidConfig);
                }
                config.log.level = *level;
            }
            read_optional(logging, "history", config.log.history_size);
        } catch (const json::exception& e) {
            log::error("invalid config: {}", e.what());
            return mlink::fail(mlink::Error::InvalidConfig);
        } catch (const std::out_of_range& e) {
            log::error("invalid config: {}", e.what());
            return mlink::fail(mlink::Error::InvalidConfig);
        }

        if (config.plc.host.empty()) {
            log::error("invalid config: devices.plc.ip is empty");
            return mlink::fail(mlink::Error::InvalidConfig);
        }
        return config;
    }
}
