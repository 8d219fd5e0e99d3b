#include "process/FeederMachine.hpp"

#include <algorithm>
#include <format>

namespace mcell::process
{
    using namespace std::chrono_literals;

    FeederMachine::FeederMachine(plc::IPlcIo& plc, SharedSignals& signals, const runtime::IClock& clock)
        : StateMachine("feeder",
                       FeederState::Idle,
                       { { FeederState::Idle, 1000ms },
                         { FeederState::NoStock, 500ms },
                         { FeederState::Disabled, 500ms },
                         { FeederState::WaitingRequest, 500ms },
                         { FeederState::Requesting, 100ms },
                         { FeederState::StartingMotor, 200ms },
                         { FeederState::Delivering, 200ms },
                         { FeederState::Error, 1000ms } },
                       clock)
        , m_plc(plc)
        , m_signals(signals)
    {
    }

    void FeederMachine::reset()
    {
        StateMachine::reset();
        m_next_refresh = {};
        m_last_system_state = model::SystemState::Stopped;
    }

    bool FeederMachine::mark(FeederMark mark) const
    {
        return m_marks[static_cast<std::size_t>(mark) - 1];
    }

    model::FeederMarks FeederMachine::marks() const
    {
        return { mark(FeederMark::NoStock), mark(FeederMark::Enabled), mark(FeederMark::PartDetected) };
    }

    std::string FeederMachine::address_of(FeederMark mark)
    {
        return std::format("M{}", static_cast<int>(mark));
    }

    void FeederMachine::on_tick(model::SystemState system_state, runtime::TimePoint now)
    {
        if (system_state != m_last_system_state) {
            // entering RUNNING always starts from a released global reset
            if (system_state == model::SystemState::Running) {
                write_mark(FeederMark::Reset, false);
            }
            m_last_system_state = system_state;
        }

        if (now >= m_next_refresh) {
            refresh_marks();
            m_next_refresh = now + MARK_REFRESH;
        }
    }

    FeederMachine::Transition FeederMachine::transition(FeederState current)
    {
        if (!mark(FeederMark::Enabled) && current != FeederState::Disabled) {
            log::info("feeder disabled by {} while {}", address_of(FeederMark::Enabled), current);
            current = FeederState::Disabled;
        }

        switch (current) {
            case FeederState::Idle:
                if (mark(FeederMark::NoStock)) {
                    log::warning("feeder out of stock");
                    return { FeederState::NoStock, delay(current) };
                }
                return { FeederState::WaitingRequest, delay(current) };

            case FeederState::NoStock:
                return { mark(FeederMark::NoStock) ? FeederState::NoStock : FeederState::Idle, delay(current) };

            case FeederState::Disabled:
                return { mark(FeederMark::Enabled) ? FeederState::Idle : FeederState::Disabled, delay(current) };

            case FeederState::WaitingRequest:
                if (!m_signals.part_requested()) {
                    return { current, delay(current) };
                }
                write_mark(FeederMark::Reset, false);
                return { FeederState::Requesting, delay(current) };

            case FeederState::Requesting:
                if (auto written = m_plc.write_coil(address_of(FeederMark::Request)); !written) {
                    log::warning("feeder request not sent: {}", written.error().message());
                    return { current, delay(current) };
                }
                return { FeederState::StartingMotor, delay(current) };

            case FeederState::StartingMotor:
                if (!mark(FeederMark::MotorOn)) {
                    return { current, delay(current) };
                }
                m_signals.clear_part_request();
                write_mark(FeederMark::Request, false);
                return { FeederState::Delivering, delay(current) };

            case FeederState::Delivering:
                if (!mark(FeederMark::PartDetected)) {
                    return { current, delay(current) };
                }
                m_signals.mark_part_delivered();
                ++m_counter;
                log::info("feeder delivered part #{}", m_counter);
                return { FeederState::Idle, delay(current) };

            case FeederState::Error:
                return { current, delay(current) };
        }

        log::error("feeder: unhandled state {}", magic_enum::enum_integer(current));
        return { FeederState::Idle, delay(FeederState::Idle) };
    }

    void FeederMachine::refresh_marks()
    {
        auto marks = m_plc.read_marks();
        if (!marks) {
            log::debug("feeder marks not refreshed: {}", marks.error().message());
            return;
        }

        auto count = std::min(marks->size(), m_marks.size());
        for (std::size_t i = 0; i < count; ++i) {
            m_marks[i] = (*marks)[i];
        }
    }

    void FeederMachine::write_mark(FeederMark mark, bool value)
    {
        auto address = address_of(mark);
        auto result = value ? m_plc.write_coil(address) : m_plc.clear_coil(address);
        if (!result) {
            log::warning("feeder could not {} {}: {}", value ? "set" : "clear", address, result.error().message());
        }
    }
}
