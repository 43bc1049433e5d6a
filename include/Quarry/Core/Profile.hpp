#pragma once

#include <cstdint>

#include "Base.hpp"

// Tracy integration - only enabled in release builds with TRACY_ENABLE
#if defined(QUARRY_BUILD_RELEASE) && defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    #define QUARRY_PROFILE_ZONE() ZoneScoped
    #define QUARRY_PROFILE_ZONE_NAMED(name) ZoneScopedN(name)
    #define QUARRY_PROFILE_ZONE_NAMED_COLOR(name, color) ZoneScopedNC(name, color)

    #define QUARRY_PROFILE_FUNCTION() ZoneScoped

    #define QUARRY_PROFILE_ZONE_VALUE(value) ZoneValue(value)

    #define QUARRY_PROFILE_FRAME_MARK() FrameMark

    #define QUARRY_PROFILE_PLOT(name, val) TracyPlot(name, val)

    #define QUARRY_PROFILE_MESSAGE(text, size) TracyMessage(text, size)
#else
    #define QUARRY_PROFILE_ZONE()
    #define QUARRY_PROFILE_ZONE_NAMED(name)
    #define QUARRY_PROFILE_ZONE_NAMED_COLOR(name, color)

    #define QUARRY_PROFILE_FUNCTION()

    #define QUARRY_PROFILE_ZONE_VALUE(value)

    #define QUARRY_PROFILE_FRAME_MARK()

    #define QUARRY_PROFILE_PLOT(name, val)

    #define QUARRY_PROFILE_MESSAGE(text, size)
#endif

// Zone colours, Tracy 0xRRGGBB
namespace Quarry::Profile
{
    constexpr std::uint32_t ColorEntity = 0x88FF00;
    constexpr std::uint32_t ColorComponent = 0x0088FF;
    constexpr std::uint32_t ColorQuery = 0x8800FF;
    constexpr std::uint32_t ColorCull = 0xFF8800;
    constexpr std::uint32_t ColorSubscription = 0x00DDDD;
}
