#pragma once

#include "mlink/Result.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string_view>

namespace mcell::plc
{
    enum class CoilType
    {
        Output,   // Qn
        Mark      // Mn
    };

    struct CoilAddress
    {
        CoilType type;
        uint16_t index;      // 1-based, as written on the controller
        uint16_t reg;        // protocol coil number
    };

    inline constexpr uint16_t OUTPUT_BASE = 8192;
    inline constexpr uint16_t OUTPUT_COUNT = 12;
    inline constexpr uint16_t MARK_BASE = 8256;
    inline constexpr uint16_t MARK_COUNT = 64;
    inline constexpr uint16_t INPUT_BASE = 0;
    inline constexpr uint16_t INPUT_COUNT = 8;
    // marks read back as a block, M1..M8
    inline constexpr uint16_t MARK_READ_COUNT = 8;

    /**
     * Maps "Q1".."Q12" and "M1".."M64" (type letter case insensitive) to coil numbers.
     * Anything else is Error::InvalidAddress.
     */
    inline mlink::Result<CoilAddress> parse_coil_address(std::string_view text)
    {
        if (text.size() < 2) {
            return mlink::fail(mlink::Error::InvalidAddress);
        }

        auto letter = static_cast<char>(std::toupper(static_cast<unsigned char>(text.front())));
        auto digits = text.substr(1);

        unsigned index = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
        if (ec != std::errc{} || end != digits.data() + digits.size()) {
            return mlink::fail(mlink::Error::InvalidAddress);
        }

        switch (letter) {
            case 'Q':
                if (index < 1 || index > OUTPUT_COUNT) {
                    return mlink::fail(mlink::Error::InvalidAddress);
                }
                return CoilAddress{ CoilType::Output,
                                    static_cast<uint16_t>(index),
                                    static_cast<uint16_t>(OUTPUT_BASE + index - 1) };
            case 'M':
                if (index < 1 || index > MARK_COUNT) {
                    return mlink::fail(mlink::Error::InvalidAddress);
                }
                return CoilAddress{ CoilType::Mark,
                                    static_cast<uint16_t>(index),
                                    static_cast<uint16_t>(MARK_BASE + index - 1) };
            default:
                return mlink::fail(mlink::Error::InvalidAddress);
        }
    }
}
