#pragma once

#include <cstddef>
#include <cstdint>

#include "Base.hpp"

#define QUARRY_VERSION_MAJOR 0
#define QUARRY_VERSION_MINOR 3
#define QUARRY_VERSION_PATCH 0

#define QUARRY_VERSION ((QUARRY_VERSION_MAJOR << 16) | (QUARRY_VERSION_MINOR << 8) | QUARRY_VERSION_PATCH)

// Highest network id a component type may be given.
// Usage: #define QUARRY_MAX_NET_ID 1023 before including Quarry
#ifndef QUARRY_MAX_NET_ID
    #define QUARRY_MAX_NET_ID 0xFFFEu
#endif

// Name of the spdlog logger the library writes to
#ifndef QUARRY_LOGGER_NAME
    #define QUARRY_LOGGER_NAME "quarry"
#endif

namespace Quarry
{
    inline constexpr int VERSION_MAJOR = QUARRY_VERSION_MAJOR;
    inline constexpr int VERSION_MINOR = QUARRY_VERSION_MINOR;
    inline constexpr int VERSION_PATCH = QUARRY_VERSION_PATCH;
    inline constexpr int VERSION = QUARRY_VERSION;

    namespace config
    {
        // Initial capacity of the entity version table
        inline constexpr std::size_t ENTITY_RESERVE = 1024;

        // Initial capacity of a per-type component bucket
        inline constexpr std::size_t BUCKET_RESERVE = 64;

        // Initial capacity of the removal queue
        inline constexpr std::size_t REMOVAL_QUEUE_RESERVE = 128;

        // Records per entity before the directory entry grows
        inline constexpr std::size_t ENTITY_COMPONENT_RESERVE = 8;

        inline constexpr std::uint32_t MAX_NET_ID = QUARRY_MAX_NET_ID;
    }
}
