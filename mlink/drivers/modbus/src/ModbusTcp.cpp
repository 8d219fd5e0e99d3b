#include "mlink/drivers/ModbusTcp.hpp"
#include "mlink/log/Logger.hpp"

#include <cerrno>
#include <string>

namespace
{
    using namespace mlink;

    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{ std::chrono::seconds(3) };

    auto toError(int errnum) -> Error
    {
        if (errnum > MODBUS_ENOBASE && errnum <= MODBUS_ENOBASE + MODBUS_EXCEPTION_GATEWAY_TARGET) {
            return Error::DeviceException;
        }

        switch (errnum) {
            case ETIMEDOUT:
                return Error::Timeout;
            case ECONNRESET:
            case EPIPE:
                return Error::ConnectionClosed;
            case ECONNREFUSED:
            case EHOSTUNREACH:
            case ENETUNREACH:
                return Error::ConnectFailed;
            case EMBBADDATA:
            case EMBBADEXC:
            case EMBUNKEXC:
            case EMBBADSLAVE:
            case EMBMDATA:
                return Error::ProtocolError;
            default:
                return Error::IoError;
        }
    }
}

namespace mlink::drivers
{
    ModbusTcpDriver::ModbusTcpDriver(Endpoint endpoint, uint8_t unitId)
      : m_endpoint(std::move(endpoint))
      , m_unitId{ unitId }
    {
    }

    ModbusTcpDriver::~ModbusTcpDriver()
    {
        disconnectSync();
    }

    auto ModbusTcpDriver::connect(std::chrono::milliseconds timeout) -> coro::Task<Result<void>>
    {
        co_return open(timeout);
    }

    auto ModbusTcpDriver::disconnectSync() noexcept -> void
    {
        if (m_ctx != nullptr) {
            modbus_close(m_ctx);
            modbus_free(m_ctx);
            m_ctx = nullptr;
        }
    }

    auto ModbusTcpDriver::readCoils(uint16_t address, uint16_t count) -> coro::Task<Result<std::vector<bool>>>
    {
        co_return readBits(&modbus_read_bits, address, count);
    }

    auto ModbusTcpDriver::readDiscreteInputs(uint16_t address, uint16_t count)
      -> coro::Task<Result<std::vector<bool>>>
    {
        co_return readBits(&modbus_read_input_bits, address, count);
    }

    auto ModbusTcpDriver::writeCoil(uint16_t address, bool value) -> coro::Task<Result<void>>
    {
        if (m_ctx == nullptr) {
            co_return fail(Error::NotConnected);
        }
        if (modbus_write_bit(m_ctx, address, value ? 1 : 0) != 1) {
            co_return failure("write coil", address);
        }
        co_return success();
    }

    auto ModbusTcpDriver::open(std::chrono::milliseconds timeout) -> Result<void>
    {
        disconnectSync();

        // libmodbus bounds the tcp connect by the response timeout as well
        auto effective{ timeout > NO_TIMEOUT ? timeout : DEFAULT_TIMEOUT };
        auto seconds{ std::chrono::duration_cast<std::chrono::seconds>(effective) };
        auto micros{ std::chrono::duration_cast<std::chrono::microseconds>(effective - seconds) };

        auto service{ std::to_string(m_endpoint.port) };
        auto* ctx{ modbus_new_tcp_pi(m_endpoint.host.c_str(), service.c_str()) };
        if (ctx == nullptr) {
            log::debug("modbus: cannot create context for {}: {}", m_endpoint.host, modbus_strerror(errno));
            return fail(Error::ConnectFailed);
        }

        if (modbus_set_slave(ctx, m_unitId) != 0 ||
            modbus_set_response_timeout(
              ctx, static_cast<uint32_t>(seconds.count()), static_cast<uint32_t>(micros.count())) != 0) {
            log::debug("modbus: cannot configure context: {}", modbus_strerror(errno));
            modbus_free(ctx);
            return fail(Error::IoError);
        }

        if (modbus_connect(ctx) != 0) {
            auto errnum{ errno };
            log::debug("modbus: {}:{} unreachable ({})", m_endpoint.host, m_endpoint.port, modbus_strerror(errnum));
            modbus_free(ctx);
            return fail(errnum == ETIMEDOUT ? Error::Timeout : Error::ConnectFailed);
        }

        m_ctx = ctx;
        return success();
    }

    auto ModbusTcpDriver::readBits(ReadFn read, uint16_t address, uint16_t count) -> Result<std::vector<bool>>
    {
        if (count == 0 || count > MODBUS_MAX_READ_BITS) {
            return fail(Error::InvalidAddress);
        }
        if (m_ctx == nullptr) {
            return fail(Error::NotConnected);
        }

        std::vector<uint8_t> raw(count);
        if (read(m_ctx, address, count, raw.data()) != count) {
            return failure("read bits", address);
        }
        return std::vector<bool>(raw.begin(), raw.end());
    }

    auto ModbusTcpDriver::failure(const char* what, uint16_t address) -> std::unexpected<std::error_code>
    {
        auto errnum{ errno };
        log::debug("modbus: {} at {} failed: {}", what, address, modbus_strerror(errnum));

        // a device exception leaves the stream in sync, anything else does not
        auto error{ toError(errnum) };
        if (error != Error::DeviceException) {
            disconnectSync();
        }
        return fail(error);
    }

} // namespace mlink::drivers
