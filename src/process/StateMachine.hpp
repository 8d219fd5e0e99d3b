#pragma once

#include "model/Status.hpp"
#include "runtime/Clock.hpp"
#include "runtime/Log.hpp"

#include <magic_enum/magic_enum.hpp>

#include <chrono>
#include <map>
#include <string>

namespace mcell::process
{
    class IStateMachine
    {
    public:
        virtual ~IStateMachine() = default;

        virtual void step(model::SystemState system_state) = 0;
        virtual model::SubsystemStatus status() const = 0;
        virtual void reset() = 0;
        virtual model::MachineConfig config() const = 0;
    };

    /**
     * Rate gated state machine. A step only does work once the deadline set by the previous
     * evaluation has passed; then STOPPED returns to the initial state, PAUSED holds the
     * state and restarts the timer, RUNNING asks the subclass for the next transition.
     */
    template<typename State>
    class StateMachine : public IStateMachine
    {
    public:
        using Delays = std::map<State, std::chrono::milliseconds>;

        struct Transition
        {
            State next;
            std::chrono::milliseconds delay;
        };

        StateMachine(std::string name, State initial, Delays delays, const runtime::IClock& clock)
            : m_name(std::move(name))
            , m_initial(initial)
            , m_state(initial)
            , m_delays(std::move(delays))
            , m_clock(clock)
        {
        }

        void step(model::SystemState system_state) override
        {
            auto now = m_clock.now();
            on_tick(system_state, now);

            if (now < m_deadline) {
                return;
            }

            if (!magic_enum::enum_contains(m_state)) {
                log::error("{}: unknown state {}, resetting", m_name, magic_enum::enum_integer(m_state));
                reset();
                m_deadline = now + delay(m_initial);
                return;
            }

            switch (system_state) {
                case model::SystemState::Stopped:
                    m_state = m_initial;
                    m_counter = 0;
                    m_deadline = now + delay(m_initial);
                    return;
                case model::SystemState::Paused:
                    m_deadline = now + delay(m_state);
                    return;
                case model::SystemState::Running: {
                    auto [next, dwell] = transition(m_state);
                    if (next != m_state) {
                        log::debug("{}: {} -> {}", m_name, m_state, next);
                    }
                    m_state = next;
                    m_deadline = now + dwell;
                    return;
                }
            }

            log::error("{}: unknown system state {}", m_name, magic_enum::enum_integer(system_state));
            reset();
        }

        model::SubsystemStatus status() const override
        {
            return { m_name, magic_enum::enum_integer(m_state), label(m_state), m_counter };
        }

        void reset() override
        {
            m_state = m_initial;
            m_counter = 0;
            m_deadline = {};
        }

        model::MachineConfig config() const override
        {
            model::MachineConfig description{ m_name, {} };
            for (auto [value, name] : magic_enum::enum_entries<State>()) {
                description.states.push_back({ magic_enum::enum_integer(value),
                                               std::string(name),
                                               static_cast<int>(delay(value).count()) });
            }
            return description;
        }

        State state() const { return m_state; }
        int counter() const { return m_counter; }
        const std::string& name() const { return m_name; }

        std::chrono::milliseconds delay(State state) const
        {
            if (auto it = m_delays.find(state); it != m_delays.end()) {
                return it->second;
            }
            return DEFAULT_DELAY;
        }

    protected:
        static constexpr std::chrono::milliseconds DEFAULT_DELAY{ 1000 };

        // called on RUNNING once the deadline passed, the returned delay applies to the next evaluation
        virtual Transition transition(State current) = 0;

        // called on every step before the deadline check
        virtual void on_tick(model::SystemState, runtime::TimePoint) {}

        static std::string label(State state)
        {
            auto name = magic_enum::enum_name(state);
            return name.empty() ? std::to_string(magic_enum::enum_integer(state)) : std::string(name);
        }

        int m_counter{ 0 };

    private:
        const std::string m_name;
        const State m_initial;
        State m_state;
        runtime::TimePoint m_deadline{};
        Delays m_delays;
        const runtime::IClock& m_clock;
    };
}
