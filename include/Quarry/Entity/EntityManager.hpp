#pragma once

#include <cstddef>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "Entity.hpp"

namespace Quarry
{
    /**
     * Allocates and recycles entity handles.
     *
     * Each index keeps its current version in a dense table; a destroyed index
     * is pushed on a LIFO recycle stack together with the version its next
     * incarnation will carry. Versions wrap from 255 back to 1 so that 0 stays
     * reserved for "not alive".
     */
    class EntityManager
    {
    public:
        using IDType = Entity::IDType;
        using VersionType = Entity::VersionType;

        static constexpr VersionType NULL_VERSION = 0;
        static constexpr VersionType INITIAL_VERSION = 1;
        static constexpr IDType INVALID_ID = Entity::ID_MASK;

        struct Config
        {
            std::size_t initialCapacity = config::ENTITY_RESERVE;
        };

        EntityManager() : EntityManager(Config{}) {}

        explicit EntityManager(const Config& config)
        {
            m_versions.reserve(config.initialCapacity);
        }

        /**
         * @return A fresh handle, or Entity::Invalid() once every index is in use
         */
        QUARRY_NODISCARD Entity Create()
        {
            if (!m_recycled.empty())
            {
                const RecycledEntry entry = m_recycled.back();
                m_recycled.pop_back();
                m_versions[entry.id] = entry.nextVersion;
                ++m_alive;
                return Entity(entry.id, entry.nextVersion);
            }

            const IDType id = static_cast<IDType>(m_versions.size());
            if (id >= INVALID_ID) QUARRY_UNLIKELY
            {
                return Entity::Invalid();
            }

            m_versions.push_back(INITIAL_VERSION);
            ++m_alive;
            return Entity(id, INITIAL_VERSION);
        }

        bool Destroy(Entity entity)
        {
            if (!IsValid(entity)) QUARRY_UNLIKELY
            {
                return false;
            }

            const IDType id = entity.GetID();
            VersionType nextVersion = static_cast<VersionType>(entity.GetVersion() + 1);
            if (nextVersion == NULL_VERSION)
            {
                nextVersion = INITIAL_VERSION;
            }

            m_versions[id] = NULL_VERSION;
            m_recycled.push_back({id, nextVersion});
            --m_alive;
            return true;
        }

        QUARRY_NODISCARD bool IsValid(Entity entity) const noexcept
        {
            if (!entity.IsValid())
                return false;

            const IDType id = entity.GetID();
            return id < m_versions.size() &&
                   m_versions[id] != NULL_VERSION &&
                   m_versions[id] == entity.GetVersion();
        }

        template<typename Func>
        void ForEach(Func&& func) const
        {
            for (IDType id = 0; id < m_versions.size(); ++id)
            {
                if (m_versions[id] != NULL_VERSION)
                {
                    func(Entity(id, m_versions[id]));
                }
            }
        }

        void Clear() noexcept
        {
            m_versions.clear();
            m_recycled.clear();
            m_alive = 0;
        }

        QUARRY_NODISCARD std::size_t Size() const noexcept { return m_alive; }
        QUARRY_NODISCARD bool IsEmpty() const noexcept { return m_alive == 0; }
        QUARRY_NODISCARD std::size_t Capacity() const noexcept { return m_versions.size(); }

    private:
        struct RecycledEntry
        {
            IDType id;
            VersionType nextVersion;
        };

        std::vector<VersionType> m_versions;
        std::vector<RecycledEntry> m_recycled;
        std::size_t m_alive = 0;
    };
}
