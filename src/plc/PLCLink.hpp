#pragma once

#include "PlcIo.hpp"
#include "config/Config.hpp"
#include "runtime/Ticker.hpp"
#include "runtime/Worker.hpp"

#include "mlink/Driver.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcell::plc
{
    struct ConnectionEvent
    {
        bool connected;
        std::string message;
    };

    class IConnectionHandler
    {
    public:
        virtual ~IConnectionHandler() = default;
        virtual void on_connection_changed(const ConnectionEvent& event) = 0;
    };

    struct ConnectionStatus
    {
        bool connected;
        std::string host;
        uint16_t port;
    };

    struct IoSnapshot
    {
        std::vector<bool> inputs;    // I1..I8
        std::vector<bool> outputs;   // Q1..Q12, empty if the read failed
        std::vector<bool> marks;     // M1..M8, empty if the read failed
    };

    /**
     * Owner of all controller I/O.
     *
     * Every operation opens its own short lived connection and closes it before returning,
     * whatever the outcome. Connectivity is decided only by the health check, which probes
     * the controller once per interval and notifies handlers when the result changes.
     */
    class PLCLink : public IPlcIo
    {
    public:
        using DriverFactory = std::function<std::unique_ptr<mlink::IDriver>(const mlink::Endpoint&)>;

        PLCLink(config::PlcConfig config, DriverFactory factory, std::unique_ptr<runtime::ITicker> ticker);
        explicit PLCLink(config::PlcConfig config);
        ~PLCLink() override;

        PLCLink(const PLCLink&) = delete;
        PLCLink& operator=(const PLCLink&) = delete;

        // starts the health check task, the first probe runs right away
        void start();
        // stops the health check and drops every handler
        void shutdown();

        // one health check cycle: probe, update connectivity, notify on change
        void check_health();
        // opens and closes a connection without touching the connectivity state
        bool probe();

        bool is_connected() const override { return m_connected; }
        ConnectionStatus connection_status() const;

        mlink::Endpoint address() const;
        void set_address(mlink::Endpoint endpoint);

        // idempotent, false when nothing changed
        bool subscribe(std::shared_ptr<IConnectionHandler> handler);
        bool unsubscribe(const std::shared_ptr<IConnectionHandler>& handler);
        std::size_t subscriber_count() const;

        mlink::Result<void> write_coil(std::string_view address) override;
        mlink::Result<void> clear_coil(std::string_view address) override;

        mlink::Result<std::vector<bool>> read_coils(uint16_t start, uint16_t count);
        mlink::Result<std::vector<bool>> read_discrete_inputs(uint16_t start, uint16_t count);

        mlink::Result<std::vector<bool>> read_inputs();
        mlink::Result<std::vector<bool>> read_outputs();
        mlink::Result<std::vector<bool>> read_marks() override;
        // succeeds when the inputs could be read, outputs and marks degrade to empty
        mlink::Result<IoSnapshot> read_all();

    private:
        mlink::Result<void> set_coil(std::string_view address, bool value);
        void notify(const ConnectionEvent& event);

        const config::PlcConfig m_config;
        DriverFactory m_factory;

        mutable std::mutex m_address_mutex;
        mlink::Endpoint m_address;

        std::atomic<bool> m_connected{ false };
        std::mutex m_health_mutex;
        std::optional<bool> m_last_reported;

        mutable std::mutex m_handlers_mutex;
        std::vector<std::shared_ptr<IConnectionHandler>> m_handlers;

        runtime::PeriodicWorker m_health;
    };
}
