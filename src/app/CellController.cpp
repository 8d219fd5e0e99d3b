#include "app/CellController.hpp"
#include "runtime/Log.hpp"

#include <magic_enum/magic_enum.hpp>

#include <format>

namespace mcell::app
{
    CellController::CellController(plc::PLCLink& plc,
                                   process::Orchestrator& orchestrator,
                                   process::SharedSignals& signals,
                                   process::StatusFeed& feed,
                                   config::ConfigLoader loader)
        : m_plc(plc)
        , m_orchestrator(orchestrator)
        , m_signals(signals)
        , m_feed(feed)
        , m_loader(std::move(loader))
    {
    }

    model::CellStatus CellController::status() const
    {
        return m_orchestrator.status();
    }

    std::vector<model::MachineConfig> CellController::process_config() const
    {
        return m_orchestrator.config();
    }

    StateChangeResult CellController::set_system_state(model::SystemState state)
    {
        auto result = m_orchestrator.set_system_state(state);
        return { result.success, std::move(result.message), m_orchestrator.status() };
    }

    StateChangeResult CellController::set_system_state(std::string_view name)
    {
        auto state = magic_enum::enum_cast<model::SystemState>(name, magic_enum::case_insensitive);
        if (!state) {
            log::warning("rejected system state '{}'", name);
            return { false, std::format("invalid system state '{}'", name), m_orchestrator.status() };
        }
        return set_system_state(*state);
    }

    StateChangeResult CellController::toggle_start_pause()
    {
        auto result = m_orchestrator.toggle_start_pause();
        return { result.success, std::move(result.message), m_orchestrator.status() };
    }

    bool CellController::subscribe_status(std::shared_ptr<process::IStatusObserver> observer)
    {
        return m_orchestrator.add_observer(std::move(observer));
    }

    bool CellController::unsubscribe_status(const std::shared_ptr<process::IStatusObserver>& observer)
    {
        return m_orchestrator.remove_observer(observer);
    }

    process::StatusSubscription CellController::open_status_feed()
    {
        return m_feed.subscribe();
    }

    bool CellController::close_status_feed(uint64_t id)
    {
        return m_feed.unsubscribe(id);
    }

    model::OperationResult CellController::request_part()
    {
        if (m_signals.part_requested()) {
            return { true, "part already requested" };
        }
        m_signals.request_part();
        log::info("part requested");
        return { true, "part requested" };
    }

    bool CellController::take_delivered_part()
    {
        return m_signals.take_part_delivered();
    }

    model::OperationResult CellController::write_coil(std::string_view address)
    {
        if (auto result = m_plc.write_coil(address); !result) {
            return { false, std::format("{} set failed: {}", address, result.error().message()) };
        }
        return { true, std::format("{} set", address) };
    }

    model::OperationResult CellController::clear_coil(std::string_view address)
    {
        if (auto result = m_plc.clear_coil(address); !result) {
            return { false, std::format("{} clear failed: {}", address, result.error().message()) };
        }
        return { true, std::format("{} cleared", address) };
    }

    IoReadResult CellController::read_inputs()
    {
        return to_read_result("inputs", m_plc.read_inputs());
    }

    IoReadResult CellController::read_outputs()
    {
        return to_read_result("outputs", m_plc.read_outputs());
    }

    IoReadResult CellController::read_marks()
    {
        return to_read_result("marks", m_plc.read_marks());
    }

    SnapshotResult CellController::read_all()
    {
        auto result = m_plc.read_all();
        if (!result) {
            return { false, std::format("read failed: {}", result.error().message()), {} };
        }

        auto partial = result->outputs.empty() || result->marks.empty();
        return { true, partial ? "inputs read, outputs or marks unavailable" : "read ok", std::move(*result) };
    }

    plc::ConnectionStatus CellController::plc_status() const
    {
        return m_plc.connection_status();
    }

    bool CellController::subscribe_connection(std::shared_ptr<plc::IConnectionHandler> handler)
    {
        return m_plc.subscribe(std::move(handler));
    }

    bool CellController::unsubscribe_connection(const std::shared_ptr<plc::IConnectionHandler>& handler)
    {
        return m_plc.unsubscribe(handler);
    }

    model::OperationResult CellController::reload_config()
    {
        auto loaded = m_loader.load();
        if (!loaded) {
            return { false, std::format("config not reloaded: {}", loaded.error().message()) };
        }

        m_plc.set_address({ loaded->plc.host, loaded->plc.port });
        mlink::log::Logger::instance().setMinLevel(loaded->log.level);
        return { true, std::format("config reloaded, PLC at {}:{}", loaded->plc.host, loaded->plc.port) };
    }

    std::vector<mlink::log::LogEntry> CellController::logs(std::size_t limit, mlink::log::Level min_level) const
    {
        return mlink::log::Logger::instance().history().recent(limit, min_level);
    }

    IoReadResult CellController::to_read_result(std::string_view what, mlink::Result<std::vector<bool>> result)
    {
        if (!result) {
            return { false, std::format("{} read failed: {}", what, result.error().message()), {} };
        }
        return { true, std::format("{} read", what), std::move(*result) };
    }
}
