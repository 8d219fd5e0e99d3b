#pragma once

#include "coroutine/Task.hpp"

#include "Result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mlink
{
    static constexpr std::chrono::milliseconds NO_TIMEOUT{ std::chrono::milliseconds(0) };

    struct Endpoint
    {
        std::string host;
        uint16_t port;
    };

    // Bit oriented field-bus transport. One instance maps to one transport connection.
    class IDriver
    {
      public:
        virtual ~IDriver() = default;

        // clang-format off
        virtual auto connect(std::chrono::milliseconds timeout = NO_TIMEOUT) -> coro::Task<Result<void>> = 0;
        // releases the transport right away, safe to call from destructors and more than once
        virtual auto disconnectSync() noexcept -> void = 0;
        virtual auto isConnected() const noexcept -> bool = 0;

        virtual auto readCoils(uint16_t address, uint16_t count) -> coro::Task<Result<std::vector<bool>>> = 0;
        virtual auto readDiscreteInputs(uint16_t address, uint16_t count) -> coro::Task<Result<std::vector<bool>>> = 0;
        virtual auto writeCoil(uint16_t address, bool value) -> coro::Task<Result<void>> = 0;
        // clang-format on
    };

} // namespace mlink
