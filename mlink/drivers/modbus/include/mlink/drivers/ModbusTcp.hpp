#pragma once

#include "mlink/Driver.hpp"

#include <modbus.h>

#include <cstdint>
#include <vector>

namespace mlink::drivers
{
    class ModbusTcpDriver : public mlink::IDriver
    {
      public:
        static constexpr uint16_t DEFAULT_PORT{ 502 };
        static constexpr uint8_t DEFAULT_UNIT{ 1 };

        explicit ModbusTcpDriver(Endpoint endpoint, uint8_t unitId = DEFAULT_UNIT);
        ~ModbusTcpDriver() override;

        ModbusTcpDriver(const ModbusTcpDriver&) = delete;
        ModbusTcpDriver& operator=(const ModbusTcpDriver&) = delete;

        // clang-format off
        auto connect(std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> override;
        auto disconnectSync() noexcept -> void override;
        auto isConnected() const noexcept -> bool override { return m_ctx != nullptr; }

        auto readCoils(uint16_t address, uint16_t count) -> coro::Task<Result<std::vector<bool>>> override;
        auto readDiscreteInputs(uint16_t address, uint16_t count) -> coro::Task<Result<std::vector<bool>>> override;
        auto writeCoil(uint16_t address, bool value) -> coro::Task<Result<void>> override;
        // clang-format on

      private:
        using ReadFn = int (*)(modbus_t*, int, int, uint8_t*);

        auto open(std::chrono::milliseconds timeout) -> Result<void>;
        auto readBits(ReadFn read, uint16_t address, uint16_t count) -> Result<std::vector<bool>>;
        // maps errno after a failed libmodbus call and drops the connection
        auto failure(const char* what, uint16_t address) -> std::unexpected<std::error_code>;

        Endpoint m_endpoint;
        uint8_t m_unitId;
        modbus_t* m_ctx{ nullptr };
    };

} // namespace mlink::drivers
