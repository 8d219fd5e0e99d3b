#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mcell::model
{
    enum class SystemState
    {
        Stopped,
        Paused,
        Running
    };

    /**
     * Result of a command issued through the control surface.
     */
    struct OperationResult
    {
        bool success;
        std::string message;
    };

    struct StateInfo
    {
        int value;
        std::string label;
        int delay_ms;          // dwell before the state is evaluated again
    };

    /**
     * Static description of a subsystem state machine.
     */
    struct MachineConfig
    {
        std::string name;
        std::vector<StateInfo> states;
    };

    struct SubsystemStatus
    {
        std::string name;
        int state;
        std::string state_label;
        int counter;           // cycles for vision/robot, delivered parts for the feeder
    };

    /**
     * Feeder marks that gate the cell, as last read from the PLC.
     */
    struct FeederMarks
    {
        bool no_stock;         // M3
        bool enabled;          // M4
        bool part_detected;    // M5
    };

    struct CellStatus
    {
        bool running;          // process loop thread alive
        SystemState system_state;
        SubsystemStatus feeder;
        SubsystemStatus vision;
        SubsystemStatus robot;
        bool plc_connected;
        FeederMarks marks;
        bool part_requested;
        bool part_delivered;
    };
}
