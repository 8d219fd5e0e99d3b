#pragma once

#include "CyclicMachine.hpp"
#include "FeederMachine.hpp"
#include "SharedSignals.hpp"
#include "config/Config.hpp"
#include "model/Status.hpp"
#include "plc/PlcIo.hpp"
#include "runtime/Clock.hpp"
#include "runtime/Ticker.hpp"
#include "runtime/Worker.hpp"

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace mcell::process
{
    class IStatusObserver
    {
    public:
        virtual ~IStatusObserver() = default;
        virtual void on_status(const model::CellStatus& status) = 0;
    };

    /**
     * Fixed period scheduler for the cell.
     *
     * Each tick reads the system state once, steps feeder, vision and robot in that order and
     * hands the aggregated status to every observer. Observers run on the loop thread and
     * must return quickly; StatusFeed decouples slow consumers.
     *
     * Commands and status queries never wait for a tick. STOPPED resets the machines right
     * away when no tick is in flight, otherwise the next tick applies the reset before it
     * steps anything. status() returns the snapshot published by the last tick.
     */
    class Orchestrator
    {
    public:
        Orchestrator(plc::IPlcIo& plc,
                     SharedSignals& signals,
                     const runtime::IClock& clock,
                     std::unique_ptr<runtime::ITicker> ticker,
                     config::ProcessConfig config = {});
        ~Orchestrator();

        Orchestrator(const Orchestrator&) = delete;
        Orchestrator& operator=(const Orchestrator&) = delete;

        model::OperationResult start();
        model::OperationResult stop();
        bool is_running() const { return m_loop.is_running(); }

        // one scheduler cycle, the loop calls this once per tick
        void tick();

        model::OperationResult set_system_state(model::SystemState state);
        model::SystemState system_state() const { return m_system_state; }
        // STOPPED/PAUSED -> RUNNING, RUNNING -> PAUSED
        model::OperationResult toggle_start_pause();

        model::CellStatus status() const;
        std::vector<model::MachineConfig> config() const;

        bool add_observer(std::shared_ptr<IStatusObserver> observer);
        bool remove_observer(const std::shared_ptr<IStatusObserver>& observer);

        const FeederMachine& feeder() const { return m_feeder; }
        const VisionMachine& vision() const { return m_vision; }
        const RobotMachine& robot() const { return m_robot; }

    private:
        // system state for the next step, applies a STOPPED reset that is still pending
        model::SystemState sync_state();
        model::CellStatus build_status() const;
        void publish(const model::CellStatus& status);
        void notify(const model::CellStatus& status);

        plc::IPlcIo& m_plc;
        SharedSignals& m_signals;
        const config::ProcessConfig m_config;

        std::mutex m_state_mutex;
        std::atomic<model::SystemState> m_system_state{ model::SystemState::Stopped };
        bool m_reset_pending{ false };

        std::mutex m_machines_mutex;
        FeederMachine m_feeder;
        VisionMachine m_vision;
        RobotMachine m_robot;
        std::array<IStateMachine*, 3> m_machines;

        mutable std::mutex m_status_mutex;
        model::CellStatus m_published;

        std::mutex m_observers_mutex;
        std::vector<std::shared_ptr<IStatusObserver>> m_observers;

        runtime::PeriodicWorker m_loop;
    };
}
