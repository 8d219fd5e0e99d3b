#include "process/Orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace mcell::process
{
    Orchestrator::Orchestrator(plc::IPlcIo& plc,
                               SharedSignals& signals,
                               const runtime::IClock& clock,
                               std::unique_ptr<runtime::ITicker> ticker,
                               config::ProcessConfig config)
        : m_plc(plc)
        , m_signals(signals)
        , m_config(config)
        , m_feeder(plc, signals, clock)
        , m_vision(clock)
        , m_robot(clock)
        , m_machines{ &m_feeder, &m_vision, &m_robot }
        , m_loop("process loop", std::move(ticker))
    {
        m_published = build_status();
    }

    Orchestrator::~Orchestrator()
    {
        stop();
    }

    model::OperationResult Orchestrator::start()
    {
        if (!m_loop.start([this] { tick(); })) {
            return { true, "process loop already running" };
        }

        log::info("process loop started, {} ms tick", m_config.tick_period.count());
        return { true, "process loop started" };
    }

    model::OperationResult Orchestrator::stop()
    {
        if (!m_loop.is_running()) {
            return { true, "process loop not running" };
        }

        if (!m_loop.stop(m_config.stop_timeout)) {
            return { true, std::format("process loop stop requested, still exiting after {} ms",
                                       m_config.stop_timeout.count()) };
        }

        log::info("process loop stopped");
        return { true, "process loop stopped" };
    }

    void Orchestrator::tick()
    {
        model::CellStatus snapshot;
        {
            std::lock_guard lock(m_machines_mutex);
            const auto state = sync_state();
            for (auto* machine : m_machines) {
                machine->step(state);
            }
            snapshot = build_status();
            snapshot.system_state = state;
            publish(snapshot);
        }

        notify(snapshot);
    }

    model::OperationResult Orchestrator::set_system_state(model::SystemState state)
    {
        if (!magic_enum::enum_contains(state)) {
            log::error("rejected system state {}", magic_enum::enum_integer(state));
            return { false, std::format("invalid system state {}", magic_enum::enum_integer(state)) };
        }

        model::SystemState previous;
        {
            std::lock_guard lock(m_state_mutex);
            previous = m_system_state.exchange(state);
            if (state == model::SystemState::Stopped) {
                m_reset_pending = true;
            }
        }

        if (state == model::SystemState::Stopped) {
            // a tick in flight applies the reset itself before its next step
            std::unique_lock lock(m_machines_mutex, std::try_to_lock);
            if (lock.owns_lock()) {
                sync_state();
                publish(build_status());
            }
        }

        if (previous != state) {
            log::info("system state {} -> {}", previous, state);
        }
        return { true, std::format("system state {}", state) };
    }

    model::OperationResult Orchestrator::toggle_start_pause()
    {
        auto next = m_system_state == model::SystemState::Running ? model::SystemState::Paused
                                                                  : model::SystemState::Running;
        return set_system_state(next);
    }

    model::CellStatus Orchestrator::status() const
    {
        model::CellStatus status;
        {
            std::lock_guard lock(m_status_mutex);
            status = m_published;
        }
        status.running = m_loop.is_running();
        status.system_state = m_system_state.load();
        status.plc_connected = m_plc.is_connected();
        return status;
    }

    // state tables are fixed at construction, no lock needed
    std::vector<model::MachineConfig> Orchestrator::config() const
    {
        std::vector<model::MachineConfig> configs;
        for (const auto* machine : m_machines) {
            configs.push_back(machine->config());
        }
        return configs;
    }

    bool Orchestrator::add_observer(std::shared_ptr<IStatusObserver> observer)
    {
        if (!observer) {
            return false;
        }

        std::lock_guard lock(m_observers_mutex);
        if (std::ranges::find(m_observers, observer) != m_observers.end()) {
            return false;
        }
        m_observers.push_back(std::move(observer));
        return true;
    }

    bool Orchestrator::remove_observer(const std::shared_ptr<IStatusObserver>& observer)
    {
        std::lock_guard lock(m_observers_mutex);
        return std::erase(m_observers, observer) > 0;
    }

    // caller holds m_machines_mutex
    model::SystemState Orchestrator::sync_state()
    {
        model::SystemState state;
        bool reset;
        {
            std::lock_guard lock(m_state_mutex);
            state = m_system_state.load();
            reset = std::exchange(m_reset_pending, false);
        }

        if (reset) {
            for (auto* machine : m_machines) {
                machine->reset();
            }
        }
        return state;
    }

    // caller holds m_machines_mutex
    model::CellStatus Orchestrator::build_status() const
    {
        return { m_loop.is_running(),
                 m_system_state.load(),
                 m_feeder.status(),
                 m_vision.status(),
                 m_robot.status(),
                 m_plc.is_connected(),
                 m_feeder.marks(),
                 m_signals.part_requested(),
                 m_signals.part_delivered() };
    }

    void Orchestrator::publish(const model::CellStatus& status)
    {
        std::lock_guard lock(m_status_mutex);
        m_published = status;
    }

    void Orchestrator::notify(const model::CellStatus& status)
    {
        std::vector<std::shared_ptr<IStatusObserver>> observers;
        {
            std::lock_guard lock(m_observers_mutex);
            observers = m_observers;
        }

        for (const auto& observer : observers) {
            try {
                observer->on_status(status);
            } catch (const std::exception& e) {
                log::error("status observer failed: {}", e.what());
            }
        }
    }
}
