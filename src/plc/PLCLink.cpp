#include "plc/PLCLink.hpp"
#include "plc/CoilAddress.hpp"
#include "runtime/Log.hpp"

#include "mlink/coroutine/coroutine.hpp"
#include "mlink/drivers/ModbusTcp.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace mcell::plc
{
    namespace
    {
        template<typename T>
        using Operation = std::function<mlink::coro::Task<mlink::Result<T>>(mlink::IDriver&)>;

        // Closes the transport on every way out of a transaction.
        class ScopedConnection
        {
        public:
            explicit ScopedConnection(mlink::IDriver& driver)
                : m_driver(driver)
            {
            }
            ~ScopedConnection() { m_driver.disconnectSync(); }

            ScopedConnection(const ScopedConnection&) = delete;
            ScopedConnection& operator=(const ScopedConnection&) = delete;

        private:
            mlink::IDriver& m_driver;
        };

        template<typename T>
        auto run_transaction(mlink::IDriver& driver, std::chrono::milliseconds timeout, Operation<T> operation)
            -> mlink::coro::Task<mlink::Result<T>>
        {
            if (auto opened = co_await driver.connect(timeout); !opened) {
                co_return std::unexpected(opened.error());
            }
            co_return co_await operation(driver);
        }

        template<typename T>
        mlink::Result<T> transact(const PLCLink::DriverFactory& factory,
                                  const mlink::Endpoint& endpoint,
                                  std::chrono::milliseconds timeout,
                                  Operation<T> operation)
        {
            try {
                auto driver = factory(endpoint);
                if (!driver) {
                    return mlink::fail(mlink::Error::ConnectFailed);
                }

                ScopedConnection connection(*driver);
                return mlink::coro::syncWait(run_transaction<T>(*driver, timeout, std::move(operation)));
            } catch (const std::exception& e) {
                log::error("transaction with {}:{} aborted: {}", endpoint.host, endpoint.port, e.what());
                return mlink::fail(mlink::Error::IoError);
            }
        }

        PLCLink::DriverFactory modbus_factory()
        {
            return [](const mlink::Endpoint& endpoint) -> std::unique_ptr<mlink::IDriver> {
                return std::make_unique<mlink::drivers::ModbusTcpDriver>(endpoint);
            };
        }
    }

    PLCLink::PLCLink(config::PlcConfig config, DriverFactory factory, std::unique_ptr<runtime::ITicker> ticker)
        : m_config(std::move(config))
        , m_factory(std::move(factory))
        , m_address{ m_config.host, m_config.port }
        , m_health("plc health check", std::move(ticker))
    {
    }

    PLCLink::PLCLink(config::PlcConfig config)
        : PLCLink(config, modbus_factory(), std::make_unique<runtime::PeriodicTicker>(config.health_interval))
    {
    }

    PLCLink::~PLCLink()
    {
        shutdown();
    }

    void PLCLink::start()
    {
        auto endpoint = address();
        if (m_health.start([this] { check_health(); }, true)) {
            log::info("PLC link to {}:{} started, health check every {} ms",
                      endpoint.host,
                      endpoint.port,
                      m_config.health_interval.count());
        }
    }

    void PLCLink::shutdown()
    {
        if (m_health.is_running()) {
            m_health.stop(std::chrono::milliseconds(2000));
            log::info("PLC link stopped");
        }

        std::lock_guard lock(m_handlers_mutex);
        m_handlers.clear();
    }

    bool PLCLink::probe()
    {
        auto endpoint = address();
        auto result = transact<void>(
            m_factory, endpoint, m_config.connect_timeout, [](mlink::IDriver&) -> mlink::coro::Task<mlink::Result<void>> {
                co_return mlink::success();
            });
        return result.has_value();
    }

    void PLCLink::check_health()
    {
        std::lock_guard lock(m_health_mutex);

        auto connected = probe();
        m_connected = connected;

        auto previous = std::exchange(m_last_reported, connected);
        if (previous == connected) {
            return;
        }

        auto endpoint = address();
        ConnectionEvent event{ connected,
                               connected ? std::format("PLC connected at {}:{}", endpoint.host, endpoint.port)
                                         : std::format("PLC unreachable at {}:{}", endpoint.host, endpoint.port) };
        if (connected) {
            log::info("{}", event.message);
        }
        else {
            log::warning("{}", event.message);
        }
        notify(event);
    }

    ConnectionStatus PLCLink::connection_status() const
    {
        auto endpoint = address();
        return { m_connected, endpoint.host, endpoint.port };
    }

    mlink::Endpoint PLCLink::address() const
    {
        std::lock_guard lock(m_address_mutex);
        return m_address;
    }

    void PLCLink::set_address(mlink::Endpoint endpoint)
    {
        log::info("PLC address set to {}:{}", endpoint.host, endpoint.port);
        std::lock_guard lock(m_address_mutex);
        m_address = std::move(endpoint);
    }

    bool PLCLink::subscribe(std::shared_ptr<IConnectionHandler> handler)
    {
        if (!handler) {
            return false;
        }

        std::lock_guard lock(m_handlers_mutex);
        if (std::ranges::find(m_handlers, handler) != m_handlers.end()) {
            return false;
        }
        m_handlers.push_back(std::move(handler));
        return true;
    }

    bool PLCLink::unsubscribe(const std::shared_ptr<IConnectionHandler>& handler)
    {
        std::lock_guard lock(m_handlers_mutex);
        return std::erase(m_handlers, handler) > 0;
    }

    std::size_t PLCLink::subscriber_count() const
    {
        std::lock_guard lock(m_handlers_mutex);
        return m_handlers.size();
    }

    void PLCLink::notify(const ConnectionEvent& event)
    {
        std::vector<std::shared_ptr<IConnectionHandler>> handlers;
        {
            std::lock_guard lock(m_handlers_mutex);
            handlers = m_handlers;
        }

        for (const auto& handler : handlers) {
            try {
                handler->on_connection_changed(event);
            } catch (const std::exception& e) {
                log::error("connection handler failed: {}", e.what());
            }
        }
    }

    mlink::Result<void> PLCLink::write_coil(std::string_view address)
    {
        return set_coil(address, true);
    }

    mlink::Result<void> PLCLink::clear_coil(std::string_view address)
    {
        return set_coil(address, false);
    }

    mlink::Result<void> PLCLink::set_coil(std::string_view address, bool value)
    {
        auto coil = parse_coil_address(address);
        if (!coil) {
            log::warning("rejected coil address '{}'", address);
            return std::unexpected(coil.error());
        }
        if (!m_connected) {
            return mlink::fail(mlink::Error::NotConnected);
        }

        auto reg = coil->reg;
        auto result = transact<void>(
            m_factory, this->address(), m_config.connect_timeout, [reg, value](mlink::IDriver& driver) {
                return driver.writeCoil(reg, value);
            });

        if (result) {
            log::debug("{} {}", address, value ? "set" : "cleared");
        }
        else {
            log::warning("{} {} failed: {}", value ? "set" : "clear", address, result.error().message());
        }
        return result;
    }

    mlink::Result<std::vector<bool>> PLCLink::read_coils(uint16_t start, uint16_t count)
    {
        if (!m_connected) {
            return mlink::fail(mlink::Error::NotConnected);
        }
        return transact<std::vector<bool>>(
            m_factory, address(), m_config.connect_timeout, [start, count](mlink::IDriver& driver) {
                return driver.readCoils(start, count);
            });
    }

    mlink::Result<std::vector<bool>> PLCLink::read_discrete_inputs(uint16_t start, uint16_t count)
    {
        if (!m_connected) {
            return mlink::fail(mlink::Error::NotConnected);
        }
        return transact<std::vector<bool>>(
            m_factory, address(), m_config.connect_timeout, [start, count](mlink::IDriver& driver) {
                return driver.readDiscreteInputs(start, count);
            });
    }

    mlink::Result<std::vector<bool>> PLCLink::read_inputs()
    {
        return read_discrete_inputs(INPUT_BASE, INPUT_COUNT);
    }

    mlink::Result<std::vector<bool>> PLCLink::read_outputs()
    {
        return read_coils(OUTPUT_BASE, OUTPUT_COUNT);
    }

    mlink::Result<std::vector<bool>> PLCLink::read_marks()
    {
        return read_coils(MARK_BASE, MARK_READ_COUNT);
    }

    mlink::Result<IoSnapshot> PLCLink::read_all()
    {
        auto inputs = read_inputs();
        if (!inputs) {
            return std::unexpected(inputs.error());
        }

        IoSnapshot snapshot{ std::move(*inputs), {}, {} };
        if (auto outputs = read_outputs()) {
            snapshot.outputs = std::move(*outputs);
        }
        else {
            log::debug("read_all: outputs unavailable ({})", outputs.error().message());
        }
        if (auto marks = read_marks()) {
            snapshot.marks = std::move(*marks);
        }
        else {
            log::debug("read_all: marks unavailable ({})", marks.error().message());
        }
        return snapshot;
    }
}
