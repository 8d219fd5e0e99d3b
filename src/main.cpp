#include "app/CellController.hpp"
#include "app/Console.hpp"
#include "app/StatusMonitor.hpp"
#include "config/Config.hpp"
#include "plc/PLCLink.hpp"
#include "process/Orchestrator.hpp"
#include "process/StatusFeed.hpp"
#include "runtime/Clock.hpp"
#include "runtime/Log.hpp"
#include "runtime/Ticker.hpp"

#include <iostream>
#include <memory>
#include <print>
#include <string>

using namespace mcell;

int main(int argc, char** argv)
{
    std::string path = argc > 1 ? argv[1] : "config/mcell.json";

    config::ConfigLoader loader(path);
    auto config = loader.load();
    if (!config) {
        std::println(std::cerr, "mcell: cannot use configuration '{}': {}", path, config.error().message());
        return 1;
    }

    mlink::log::Logger::instance().setConfig({ .minLevel = config->log.level, .historySize = config->log.history_size });
    log::info("mcell starting, PLC at {}:{}", config->plc.host, config->plc.port);

    runtime::SteadyClock clock;
    process::SharedSignals signals;
    auto feed = std::make_shared<process::StatusFeed>();

    plc::PLCLink plc(config->plc);
    process::Orchestrator orchestrator(plc,
                                       signals,
                                       clock,
                                       std::make_unique<runtime::PeriodicTicker>(config->process.tick_period),
                                       config->process);
    orchestrator.add_observer(feed);

    app::CellController controller(plc, orchestrator, signals, *feed, loader);
    app::StatusMonitor monitor(*feed);

    plc.start();
    monitor.start();
    orchestrator.start();

    app::Console console(controller, std::cin, std::cout);
    console.run();

    controller.set_system_state(model::SystemState::Stopped);
    orchestrator.stop();
    monitor.stop();
    plc.shutdown();
    log::info("mcell stopped");
    return 0;
}
