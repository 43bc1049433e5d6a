#pragma once

#include "Platform.hpp"

#define QUARRY_NODISCARD [[nodiscard]]
#define QUARRY_UNLIKELY [[unlikely]]

#define QUARRY_UNUSED(x) ((void)(x))

// Debug-only precondition checks
#ifdef QUARRY_BUILD_DEBUG
    #include <cassert>
    #define QUARRY_ASSERT(condition, message) assert((condition) && (message))
#else
    #define QUARRY_ASSERT(condition, message) ((void)0)
#endif
