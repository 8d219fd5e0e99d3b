#pragma once

#include "SharedSignals.hpp"
#include "StateMachine.hpp"
#include "plc/PlcIo.hpp"

#include <array>
#include <chrono>
#include <string>

namespace mcell::process
{
    enum class FeederState
    {
        Idle = 0,
        NoStock = 1,
        Disabled = 2,
        WaitingRequest = 10,
        Requesting = 20,
        StartingMotor = 30,
        Delivering = 40,
        Error = 100
    };

    // PLC marks owned by the feeder program, Mn
    enum class FeederMark
    {
        Request = 1,
        MotorOn = 2,
        NoStock = 3,
        Enabled = 4,
        PartDetected = 5,
        Reset = 6
    };

    /**
     * Part feeder sequence.
     *
     * Idle -> WaitingRequest -> (part requested, M6 cleared) Requesting -> (M1 written)
     * StartingMotor -> (M2 motor on, request and M1 cleared) Delivering -> (M5 part detected,
     * part delivered raised) Idle.
     * M3 diverts Idle to NoStock. M4 low forces Disabled ahead of any other transition.
     * StartingMotor has no timeout, it waits for M2 as long as it takes.
     */
    class FeederMachine : public StateMachine<FeederState>
    {
    public:
        static constexpr std::chrono::milliseconds MARK_REFRESH{ 500 };

        FeederMachine(plc::IPlcIo& plc, SharedSignals& signals, const runtime::IClock& clock);

        void reset() override;

        bool mark(FeederMark mark) const;
        model::FeederMarks marks() const;

        static std::string address_of(FeederMark mark);

    protected:
        Transition transition(FeederState current) override;
        void on_tick(model::SystemState system_state, runtime::TimePoint now) override;

    private:
        void refresh_marks();
        void write_mark(FeederMark mark, bool value);

        plc::IPlcIo& m_plc;
        SharedSignals& m_signals;

        std::array<bool, 8> m_marks{};
        runtime::TimePoint m_next_refresh{};
        model::SystemState m_last_system_state{ model::SystemState::Stopped };
    };
}
