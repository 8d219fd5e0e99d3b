#pragma once

// MLink - coroutine based field-bus link layer.
// Result/error codes, the driver interface and the executor primitives shared by the drivers.

#include "Driver.hpp"
#include "Result.hpp"
#include "coroutine/coroutine.hpp"
