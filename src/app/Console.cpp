#include "app/Console.hpp"
#include "runtime/Log.hpp"

#include <charconv>
#include <chrono>
#include <format>
#include <istream>
#include <ostream>
#include <print>
#include <string>

namespace mcell::app
{
    namespace
    {
        std::string_view trim(std::string_view text)
        {
            auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }

        std::string bits(std::string_view prefix, const std::vector<bool>& values)
        {
            std::string text;
            for (std::size_t i = 0; i < values.size(); ++i) {
                text += std::format("{}{}={} ", prefix, i + 1, values[i] ? 1 : 0);
            }
            return text.empty() ? "-" : text;
        }
    }

    Console::Console(CellController& controller, std::istream& in, std::ostream& out)
        : m_controller(controller)
        , m_in(in)
        , m_out(out)
    {
    }

    void Console::run()
    {
        print_help();

        std::string line;
        while (std::getline(m_in, line)) {
            if (!execute(line)) {
                break;
            }
        }
    }

    bool Console::execute(std::string_view line)
    {
        line = trim(line);
        auto split = line.find(' ');
        auto command = line.substr(0, split);
        auto argument = split == std::string_view::npos ? std::string_view{} : trim(line.substr(split + 1));

        if (command.empty()) {
            return true;
        }

        if (command == "quit" || command == "exit") {
            return false;
        }
        else if (command == "help") {
            print_help();
        }
        else if (command == "status") {
            print_status();
        }
        else if (command == "config") {
            print_config();
        }
        else if (command == "start") {
            auto result = m_controller.set_system_state(model::SystemState::Running);
            print_result(result.success, result.message);
        }
        else if (command == "pause") {
            auto result = m_controller.set_system_state(model::SystemState::Paused);
            print_result(result.success, result.message);
        }
        else if (command == "stop") {
            auto result = m_controller.set_system_state(model::SystemState::Stopped);
            print_result(result.success, result.message);
        }
        else if (command == "toggle") {
            auto result = m_controller.toggle_start_pause();
            print_result(result.success, result.message);
        }
        else if (command == "state") {
            auto result = m_controller.set_system_state(argument);
            print_result(result.success, result.message);
        }
        else if (command == "request") {
            auto result = m_controller.request_part();
            print_result(result.success, result.message);
        }
        else if (command == "set") {
            auto result = m_controller.write_coil(argument);
            print_result(result.success, result.message);
        }
        else if (command == "clear") {
            auto result = m_controller.clear_coil(argument);
            print_result(result.success, result.message);
        }
        else if (command == "inputs") {
            print_bits("I", m_controller.read_inputs());
        }
        else if (command == "outputs") {
            print_bits("Q", m_controller.read_outputs());
        }
        else if (command == "marks") {
            print_bits("M", m_controller.read_marks());
        }
        else if (command == "all") {
            auto result = m_controller.read_all();
            print_result(result.success, result.message);
            if (result.success) {
                std::println(m_out, "  {}", bits("I", result.snapshot.inputs));
                std::println(m_out, "  {}", bits("Q", result.snapshot.outputs));
                std::println(m_out, "  {}", bits("M", result.snapshot.marks));
            }
        }
        else if (command == "plc") {
            auto plc = m_controller.plc_status();
            std::println(m_out, "PLC {}:{} {}", plc.host, plc.port, plc.connected ? "connected" : "disconnected");
        }
        else if (command == "reload") {
            auto result = m_controller.reload_config();
            print_result(result.success, result.message);
        }
        else if (command == "logs") {
            print_logs(argument);
        }
        else {
            print_result(false, std::format("unknown command '{}', try help", command));
        }
        return true;
    }

    void Console::print_help()
    {
        std::println(m_out, "commands: start pause stop toggle state <name> status config request");
        std::println(m_out, "          set <addr> clear <addr> inputs outputs marks all plc reload logs [n] quit");
    }

    void Console::print_status()
    {
        auto status = m_controller.status();
        std::println(m_out, "system {} (loop {})", status.system_state, status.running ? "running" : "stopped");
        for (const auto& machine : { status.feeder, status.vision, status.robot }) {
            std::println(m_out,
                         "  {:<8} {:>3} {:<16} counter {}",
                         machine.name,
                         machine.state,
                         machine.state_label,
                         machine.counter);
        }
        std::println(m_out, "  plc {} marks {}", status.plc_connected ? "connected" : "disconnected", status.marks);
        std::println(m_out,
                     "  part requested {} delivered {}",
                     status.part_requested ? "yes" : "no",
                     status.part_delivered ? "yes" : "no");
    }

    void Console::print_config()
    {
        for (const auto& machine : m_controller.process_config()) {
            std::println(m_out, "{}", machine.name);
            for (const auto& state : machine.states) {
                std::println(m_out, "  {:>3} {:<16} {} ms", state.value, state.label, state.delay_ms);
            }
        }
    }

    void Console::print_bits(std::string_view prefix, const IoReadResult& result)
    {
        print_result(result.success, result.message);
        if (result.success) {
            std::println(m_out, "  {}", bits(prefix, result.values));
        }
    }

    void Console::print_logs(std::string_view argument)
    {
        std::size_t limit = 20;
        if (!argument.empty()) {
            auto [end, ec] = std::from_chars(argument.data(), argument.data() + argument.size(), limit);
            if (ec != std::errc{} || end != argument.data() + argument.size()) {
                print_result(false, std::format("invalid count '{}'", argument));
                return;
            }
        }

        for (const auto& entry : m_controller.logs(limit)) {
            auto ts = std::chrono::floor<std::chrono::milliseconds>(entry.timestamp);
            std::println(m_out, "[{:%H:%M:%S}] [{}] {}", ts, entry.level, entry.message);
        }
    }

    void Console::print_result(bool success, std::string_view message)
    {
        std::println(m_out, "{} {}", success ? "ok:" : "error:", message);
    }
}
