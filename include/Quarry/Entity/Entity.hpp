#pragma once

#include <cstdint>
#include <functional>
#include <limits>

#include "../Core/Base.hpp"

namespace Quarry
{
    /**
     * Opaque entity handle: 24-bit index and 8-bit version packed into 32 bits.
     * The version changes every time an index is recycled, so a stale handle
     * never aliases a newer entity.
     */
    class Entity
    {
    public:
        using IDType = std::uint32_t;
        using VersionType = std::uint8_t;

        static constexpr std::size_t ID_BITS = 24;
        static constexpr std::size_t VERSION_SHIFT = ID_BITS;
        static constexpr IDType ID_MASK = (IDType{1} << ID_BITS) - 1;
        static constexpr IDType VERSION_MASK = 0xFF;
        static constexpr IDType INVALID = std::numeric_limits<IDType>::max();

        constexpr Entity() noexcept : m_entity{INVALID} {}
        constexpr explicit Entity(IDType value) noexcept : m_entity{value} {}
        constexpr Entity(IDType id, VersionType version) noexcept
            : m_entity{(static_cast<IDType>(version) << VERSION_SHIFT) | (id & ID_MASK)}
        {}

        QUARRY_NODISCARD constexpr explicit operator bool() const noexcept { return IsValid(); }

        QUARRY_NODISCARD constexpr bool operator==(const Entity& other) const noexcept = default;
        QUARRY_NODISCARD constexpr bool operator<(const Entity& other) const noexcept { return m_entity < other.m_entity; }

        QUARRY_NODISCARD constexpr IDType GetID() const noexcept { return m_entity & ID_MASK; }
        QUARRY_NODISCARD constexpr VersionType GetVersion() const noexcept
        {
            return static_cast<VersionType>((m_entity >> VERSION_SHIFT) & VERSION_MASK);
        }
        QUARRY_NODISCARD constexpr IDType GetValue() const noexcept { return m_entity; }

        QUARRY_NODISCARD constexpr bool IsValid() const noexcept { return m_entity != INVALID; }

        QUARRY_NODISCARD static constexpr Entity Invalid() noexcept { return Entity{INVALID}; }

    private:
        IDType m_entity;
    };

    inline constexpr std::size_t MAX_ENTITIES = Entity::ID_MASK;

    struct EntityHash
    {
        std::size_t operator()(const Entity& entity) const noexcept
        {
            // splitmix64 finaliser, handles are dense small integers
            std::uint64_t hash = entity.GetValue();
            hash ^= hash >> 30;
            hash *= 0xBF58476D1CE4E5B9ULL;
            hash ^= hash >> 27;
            hash *= 0x94D049BB133111EBULL;
            hash ^= hash >> 31;
            return static_cast<std::size_t>(hash);
        }
    };
}

namespace std
{
    template<>
    struct hash<Quarry::Entity>
    {
        QUARRY_NODISCARD std::size_t operator()(const Quarry::Entity& entity) const noexcept
        {
            return Quarry::EntityHash{}(entity);
        }
    };
}
