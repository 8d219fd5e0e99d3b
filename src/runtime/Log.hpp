#pragma once

#include "mlink/log/Logger.hpp"

namespace mcell
{
    namespace log = mlink::log;
}
