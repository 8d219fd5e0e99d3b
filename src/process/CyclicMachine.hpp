#pragma once

#include "StateMachine.hpp"

#include <magic_enum/magic_enum.hpp>

namespace mcell::process
{
    /**
     * Steps through every value of State in declaration order and wraps around, counting
     * one cycle per RUNNING evaluation.
     */
    template<typename State>
    class CyclicMachine : public StateMachine<State>
    {
    public:
        CyclicMachine(std::string name, std::chrono::milliseconds period, const runtime::IClock& clock)
            : StateMachine<State>(std::move(name), magic_enum::enum_values<State>().front(), uniform(period), clock)
        {
        }

    protected:
        using typename StateMachine<State>::Transition;

        Transition transition(State current) override
        {
            constexpr auto values = magic_enum::enum_values<State>();
            auto index = magic_enum::enum_index(current).value_or(0);

            ++this->m_counter;
            return { values[(index + 1) % values.size()], this->delay(current) };
        }

    private:
        static typename StateMachine<State>::Delays uniform(std::chrono::milliseconds period)
        {
            typename StateMachine<State>::Delays delays;
            for (auto value : magic_enum::enum_values<State>()) {
                delays[value] = period;
            }
            return delays;
        }
    };

    enum class VisionState
    {
        Capturing,
        Processing,
        Validating
    };

    enum class RobotState
    {
        Home,
        Moving,
        Approaching
    };

    class VisionMachine : public CyclicMachine<VisionState>
    {
    public:
        static constexpr std::chrono::milliseconds PERIOD{ 1000 };

        explicit VisionMachine(const runtime::IClock& clock)
            : CyclicMachine("vision", PERIOD, clock)
        {
        }
    };

    class RobotMachine : public CyclicMachine<RobotState>
    {
    public:
        static constexpr std::chrono::milliseconds PERIOD{ 1500 };

        explicit RobotMachine(const runtime::IClock& clock)
            : CyclicMachine("robot", PERIOD, clock)
        {
        }
    };
}
