#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <ranges>
#include <unordered_map>
#include <vector>

#include "../Component/Component.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Result.hpp"
#include "../Entity/Entity.hpp"

namespace Quarry
{
    /**
     * Per-type buckets of component records plus network id translation.
     *
     * A bucket lists the records of one concrete type in attach order. Records
     * pending removal stay in their bucket until culled; every accessor except
     * Bucket() filters them out.
     */
    class ComponentIndex
    {
    public:
        using BucketType = std::vector<ComponentRecord*>;

        explicit ComponentIndex(const ComponentRegistry& registry) : m_registry(registry) {}

        ComponentIndex(const ComponentIndex&) = delete;
        ComponentIndex& operator=(const ComponentIndex&) = delete;

        void Insert(ComponentRecord& record)
        {
            auto [it, inserted] = m_buckets.try_emplace(record.GetType());
            if (inserted)
            {
                it->second.reserve(config::BUCKET_RESERVE);
            }
            it->second.push_back(&record);
        }

        // Keeps the order of the remaining records
        bool Remove(const ComponentRecord& record)
        {
            auto it = m_buckets.find(record.GetType());
            if (it == m_buckets.end())
                return false;

            BucketType& bucket = it->second;
            auto pos = std::find(bucket.begin(), bucket.end(), &record);
            if (pos == bucket.end())
                return false;

            bucket.erase(pos);
            return true;
        }

        // Raw bucket, pending records included
        QUARRY_NODISCARD const BucketType& Bucket(ComponentTypeID type) const
        {
            auto it = m_buckets.find(type);
            return it != m_buckets.end() ? it->second : s_emptyBucket;
        }

        /**
         * Entities holding a live component of the type, in attach order.
         * Attaching or culling components of the type invalidates the view.
         */
        QUARRY_NODISCARD auto EntitiesWith(ComponentTypeID type) const
        {
            return std::views::all(Bucket(type))
                | std::views::filter([](const ComponentRecord* record) { return record->IsAlive(); })
                | std::views::transform([](const ComponentRecord* record) { return record->GetOwner(); });
        }

        template<Component T>
        QUARRY_NODISCARD auto EntitiesWith() const
        {
            return EntitiesWith(TypeID<T>::Value());
        }

        QUARRY_NODISCARD std::optional<NetID> ResolveNetID(ComponentTypeID type) const
        {
            return m_registry.GetNetID(type);
        }

        QUARRY_NODISCARD Result<ComponentTypeID> ResolveType(NetID netId) const
        {
            return m_registry.GetTypeByNetID(netId);
        }

        // Live records of the type
        QUARRY_NODISCARD std::size_t Count(ComponentTypeID type) const
        {
            const BucketType& bucket = Bucket(type);
            return static_cast<std::size_t>(std::count_if(bucket.begin(), bucket.end(),
                [](const ComponentRecord* record) { return record->IsAlive(); }));
        }

        QUARRY_NODISCARD std::size_t BucketCount() const noexcept { return m_buckets.size(); }

        void Clear() noexcept
        {
            m_buckets.clear();
        }

    private:
        inline static const BucketType s_emptyBucket{};

        const ComponentRegistry& m_registry;
        std::unordered_map<ComponentTypeID, BucketType> m_buckets;
    };
}
