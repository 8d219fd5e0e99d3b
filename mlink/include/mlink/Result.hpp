#pragma once

#include <magic_enum/magic_enum.hpp>

#include <expected>
#include <string>
#include <system_error>

namespace mlink
{
    template<typename T>
    using Result = std::expected<T, std::error_code>;

    inline auto success() -> Result<void> { return {}; }

    enum class Error
    {
        None = 0,
        NotConnected,     /**< link is not up, no I/O attempted */
        InvalidAddress,   /**< malformed or out of range symbolic address */
        ConnectFailed,    /**< transport could not be established */
        Timeout,          /**< peer did not answer in time */
        ConnectionClosed, /**< peer closed the transport mid transaction */
        ProtocolError,    /**< malformed or mismatched response frame */
        DeviceException,  /**< peer answered with an exception response */
        IoError,          /**< local socket failure or unexpected exception */
        ConfigNotFound,
        InvalidConfig
    };

    namespace detail
    {
        class ErrorCategory : public std::error_category
        {
          public:
            auto name() const noexcept -> const char* override { return "mlink"; }

            auto message(int ev) const -> std::string override
            {
                return std::string(magic_enum::enum_name(static_cast<Error>(ev)));
            }
        };
    }

    inline auto errorCategory() -> const std::error_category&
    {
        static detail::ErrorCategory instance;
        return instance;
    }

    inline auto make_error_code(Error e) -> std::error_code
    {
        return std::error_code(static_cast<int>(e), errorCategory());
    }

    inline auto fail(Error e) -> std::unexpected<std::error_code>
    {
        return std::unexpected(make_error_code(e));
    }
} // namespace mlink

namespace std
{
    template<>
    struct is_error_code_enum<mlink::Error> : true_type
    {
    };
}
