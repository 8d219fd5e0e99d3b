#pragma once

#include "config/Config.hpp"
#include "model/Status.hpp"
#include "plc/PLCLink.hpp"
#include "process/Orchestrator.hpp"
#include "process/SharedSignals.hpp"
#include "process/StatusFeed.hpp"

#include "mlink/log/LogEntry.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcell::app
{
    struct StateChangeResult
    {
        bool success;
        std::string message;
        model::CellStatus status;
    };

    struct IoReadResult
    {
        bool success;
        std::string message;
        std::vector<bool> values;   // empty on failure
    };

    struct SnapshotResult
    {
        bool success;
        std::string message;
        plc::IoSnapshot snapshot;
    };

    /**
     * Command and status surface of the cell. Nothing here throws, every PLC touching call
     * reports success and a message.
     */
    class CellController
    {
    public:
        CellController(plc::PLCLink& plc,
                       process::Orchestrator& orchestrator,
                       process::SharedSignals& signals,
                       process::StatusFeed& feed,
                       config::ConfigLoader loader);

        model::CellStatus status() const;
        std::vector<model::MachineConfig> process_config() const;

        StateChangeResult set_system_state(model::SystemState state);
        // "stopped", "PAUSED", ... case insensitive
        StateChangeResult set_system_state(std::string_view name);
        StateChangeResult toggle_start_pause();

        bool subscribe_status(std::shared_ptr<process::IStatusObserver> observer);
        bool unsubscribe_status(const std::shared_ptr<process::IStatusObserver>& observer);
        process::StatusSubscription open_status_feed();
        bool close_status_feed(uint64_t id);

        model::OperationResult request_part();
        // consumes the part delivered flag
        bool take_delivered_part();

        model::OperationResult write_coil(std::string_view address);
        model::OperationResult clear_coil(std::string_view address);
        IoReadResult read_inputs();
        IoReadResult read_outputs();
        IoReadResult read_marks();
        SnapshotResult read_all();

        plc::ConnectionStatus plc_status() const;
        bool subscribe_connection(std::shared_ptr<plc::IConnectionHandler> handler);
        bool unsubscribe_connection(const std::shared_ptr<plc::IConnectionHandler>& handler);

        // re-reads the configuration file and applies the PLC address and log level
        model::OperationResult reload_config();

        std::vector<mlink::log::LogEntry> logs(std::size_t limit = 50,
                                               mlink::log::Level min_level = mlink::log::Level::Debug) const;

    private:
        static IoReadResult to_read_result(std::string_view what, mlink::Result<std::vector<bool>> result);

        plc::PLCLink& m_plc;
        process::Orchestrator& m_orchestrator;
        process::SharedSignals& m_signals;
        process::StatusFeed& m_feed;
        config::ConfigLoader m_loader;
    };
}
