#pragma once

#include "mlink/Result.hpp"

#include <string_view>
#include <vector>

namespace mcell::plc
{
    /**
     * Controller access needed by the process state machines.
     */
    class IPlcIo
    {
    public:
        virtual ~IPlcIo() = default;

        virtual bool is_connected() const = 0;
        virtual mlink::Result<void> write_coil(std::string_view address) = 0;
        virtual mlink::Result<void> clear_coil(std::string_view address) = 0;
        // M1..M8
        virtual mlink::Result<std::vector<bool>> read_marks() = 0;
    };
}
