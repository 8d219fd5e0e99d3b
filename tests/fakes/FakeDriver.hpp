#pragma once
/** @file  FakeDriver.hpp
 *  @brief IDriver with scripted outcomes and shared bookkeeping for PLCLink tests.
 */

#include "plc/PLCLink.hpp"

#include "mlink/Driver.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace mcell::test
{
    /**
     * State seen by every FakeDriver created from the same factory. PLCLink destroys its
     * driver after each transaction, so assertions go through the bus.
     */
    struct FakeBus
    {
        mutable std::mutex mutex;

        int created = 0;
        int connects = 0;
        int disconnects = 0;

        bool reachable = true;
        std::optional<mlink::Error> write_error;
        std::optional<mlink::Error> coil_read_error;
        std::optional<mlink::Error> input_read_error;
        bool throw_on_write = false;

        std::map<uint16_t, bool> coils;
        std::vector<bool> inputs = std::vector<bool>(8, false);
        std::vector<std::pair<uint16_t, bool>> writes;

        int open_connections() const
        {
            std::lock_guard lock(mutex);
            return connects - disconnects;
        }
    };

    class FakeDriver : public mlink::IDriver
    {
    public:
        explicit FakeDriver(std::shared_ptr<FakeBus> bus)
            : m_bus(std::move(bus))
        {
        }

        mlink::coro::Task<mlink::Result<void>> connect(std::chrono::milliseconds) override
        {
            mlink::Result<void> result = mlink::success();
            {
                std::lock_guard lock(m_bus->mutex);
                ++m_bus->connects;
                if (!m_bus->reachable) {
                    result = mlink::fail(mlink::Error::ConnectFailed);
                }
            }
            m_connected = result.has_value();
            co_return result;
        }

        void disconnectSync() noexcept override
        {
            std::lock_guard lock(m_bus->mutex);
            ++m_bus->disconnects;
            m_connected = false;
        }

        bool isConnected() const noexcept override { return m_connected; }

        mlink::coro::Task<mlink::Result<std::vector<bool>>> readCoils(uint16_t address, uint16_t count) override
        {
            mlink::Result<std::vector<bool>> result;
            {
                std::lock_guard lock(m_bus->mutex);
                if (m_bus->coil_read_error) {
                    result = mlink::fail(*m_bus->coil_read_error);
                }
                else {
                    std::vector<bool> bits(count, false);
                    for (uint16_t i = 0; i < count; ++i) {
                        if (auto it = m_bus->coils.find(static_cast<uint16_t>(address + i)); it != m_bus->coils.end()) {
                            bits[i] = it->second;
                        }
                    }
                    result = std::move(bits);
                }
            }
            co_return result;
        }

        mlink::coro::Task<mlink::Result<std::vector<bool>>> readDiscreteInputs(uint16_t address,
                                                                               uint16_t count) override
        {
            mlink::Result<std::vector<bool>> result;
            {
                std::lock_guard lock(m_bus->mutex);
                if (m_bus->input_read_error) {
                    result = mlink::fail(*m_bus->input_read_error);
                }
                else {
                    std::vector<bool> bits(count, false);
                    for (uint16_t i = 0; i < count && address + i < m_bus->inputs.size(); ++i) {
                        bits[i] = m_bus->inputs[address + i];
                    }
                    result = std::move(bits);
                }
            }
            co_return result;
        }

        mlink::coro::Task<mlink::Result<void>> writeCoil(uint16_t address, bool value) override
        {
            mlink::Result<void> result = mlink::success();
            bool fault = false;
            {
                std::lock_guard lock(m_bus->mutex);
                fault = m_bus->throw_on_write;
                if (!fault) {
                    if (m_bus->write_error) {
                        result = mlink::fail(*m_bus->write_error);
                    }
                    else {
                        m_bus->coils[address] = value;
                        m_bus->writes.emplace_back(address, value);
                    }
                }
            }
            if (fault) {
                throw std::runtime_error("bus fault");
            }
            co_return result;
        }

    private:
        std::shared_ptr<FakeBus> m_bus;
        bool m_connected = false;
    };

    inline plc::PLCLink::DriverFactory fake_factory(std::shared_ptr<FakeBus> bus)
    {
        return [bus](const mlink::Endpoint&) -> std::unique_ptr<mlink::IDriver> {
            {
                std::lock_guard lock(bus->mutex);
                ++bus->created;
            }
            return std::make_unique<FakeDriver>(bus);
        };
    }
}
