#pragma once

#include "CellController.hpp"

#include <iosfwd>
#include <string_view>

namespace mcell::app
{
    /**
     * Line oriented operator console on top of CellController.
     */
    class Console
    {
    public:
        Console(CellController& controller, std::istream& in, std::ostream& out);

        // reads commands until "quit" or end of input
        void run();

        // false once the operator asked to quit
        bool execute(std::string_view line);

    private:
        void print_help();
        void print_status();
        void print_config();
        void print_bits(std::string_view prefix, const IoReadResult& result);
        void print_logs(std::string_view argument);
        void print_result(bool success, std::string_view message);

        CellController& m_controller;
        std::istream& m_in;
        std::ostream& m_out;
    };
}
