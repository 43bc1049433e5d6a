#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <ranges>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../Component/Component.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Delegate.hpp"
#include "../Core/Log.hpp"
#include "../Core/Result.hpp"
#include "../Entity/Entity.hpp"
#include "ComponentIndex.hpp"

namespace Quarry
{
    /**
     * Owns every component instance, grouped by entity in attach order.
     *
     * An entity holds at most one Alive record per concrete type. Records that
     * are pending removal stay in the entity's list until culled, so a pending
     * record and a newer Alive record of the same type may coexist. Record
     * addresses are stable for the record's whole life.
     *
     * Attach and Release change the entity's record list: do not call them while
     * iterating Enumerate() or EnumerateByCapability() for the same entity.
     */
    class EntityDirectory
    {
    public:
        using RecordList = std::vector<std::unique_ptr<ComponentRecord>>;

        // Receives a record displaced by an overwriting attach, after it has
        // been detached and right before it is destroyed
        using DisplacedHandler = Delegate<void(ComponentRecord&)>;

        EntityDirectory(const ComponentRegistry& registry, ComponentIndex& index)
            : m_registry(registry), m_index(index)
        {
            m_entities.reserve(config::ENTITY_RESERVE);
        }

        EntityDirectory(const EntityDirectory&) = delete;
        EntityDirectory& operator=(const EntityDirectory&) = delete;

        void SetDisplacedHandler(DisplacedHandler handler)
        {
            m_onDisplaced = std::move(handler);
        }

        // Starts tracking an entity; false if it was already tracked
        bool Track(Entity entity)
        {
            if (!entity.IsValid())
                return false;

            auto [it, inserted] = m_entities.try_emplace(entity);
            if (inserted)
            {
                it->second.reserve(config::ENTITY_COMPONENT_RESERVE);
            }
            return inserted;
        }

        /**
         * Stops tracking an entity. Records still attached are detached from the
         * index and destroyed without any shutdown notification; the owner is
         * expected to have culled them first.
         */
        bool Untrack(Entity entity)
        {
            auto it = m_entities.find(entity);
            if (it == m_entities.end())
                return false;

            for (const auto& record : it->second)
            {
                QUARRY_LOG_WARN("EntityDirectory::Untrack: '{}' on entity {} was never culled",
                                record->GetDescriptor().name, entity.GetValue());
                record->SetStage(ComponentStage::Culled);
                m_index.Remove(*record);
            }
            m_entities.erase(it);
            return true;
        }

        QUARRY_NODISCARD bool Contains(Entity entity) const
        {
            return m_entities.contains(entity);
        }

        /**
         * Attaches a component constructed from args.
         * Fails with AlreadyAttached when a live component of the type exists and
         * overwrite is false; nothing changes in that case. With overwrite, the
         * displaced record is culled on the spot, bypassing the removal queue.
         */
        template<Component T, typename... Args>
        Result<T*> Emplace(Entity entity, bool overwrite, Args&&... args)
        {
            auto it = m_entities.find(entity);
            if (it == m_entities.end())
            {
                return Err(ErrorCode::InvalidEntity);
            }

            const ComponentDescriptor* descriptor = m_registry.GetDescriptor<T>();
            if (!descriptor)
            {
                return Err(ErrorCode::InvalidComponent, "Component type is not registered");
            }

            RecordList& records = it->second;
            auto live = FindLive(records, descriptor->id);
            if (live != records.end() && !overwrite)
            {
                QUARRY_LOG_DEBUG("EntityDirectory::Emplace: '{}' already attached to entity {}",
                                 descriptor->name, entity.GetValue());
                return Err(ErrorCode::AlreadyAttached);
            }

            auto record = std::make_unique<TypedComponentRecord<T>>(*descriptor, entity, std::forward<Args>(args)...);
            T* component = &record->Value();

            std::unique_ptr<ComponentRecord> displaced;
            if (live != records.end())
            {
                displaced = std::move(*live);
                records.erase(live);
                displaced->SetStage(ComponentStage::Culled);
                m_index.Remove(*displaced);
            }

            m_index.Insert(*record);
            records.push_back(std::move(record));

            if (displaced && m_onDisplaced)
            {
                m_onDisplaced(*displaced);
            }

            return component;
        }

        template<typename T, typename C = std::remove_cvref_t<T>>
            requires Component<C>
        Result<C*> Attach(Entity entity, T&& component, bool overwrite = false)
        {
            return Emplace<C>(entity, overwrite, std::forward<T>(component));
        }

        template<Component T>
        QUARRY_NODISCARD Result<T*> Get(Entity entity)
        {
            auto result = Get(entity, TypeID<T>::Value());
            if (!result)
            {
                return Err(result.Error());
            }
            return static_cast<T*>(*result);
        }

        template<Component T>
        QUARRY_NODISCARD T* TryGet(Entity entity)
        {
            return static_cast<T*>(TryGet(entity, TypeID<T>::Value()));
        }

        QUARRY_NODISCARD Result<void*> Get(Entity entity, ComponentTypeID type)
        {
            auto it = m_entities.find(entity);
            if (it == m_entities.end())
            {
                return Err(ErrorCode::InvalidEntity);
            }

            auto live = FindLive(it->second, type);
            if (live == it->second.end())
            {
                return Err(ErrorCode::ComponentNotFound);
            }
            return (*live)->Get();
        }

        QUARRY_NODISCARD void* TryGet(Entity entity, ComponentTypeID type)
        {
            ComponentRecord* record = FindRecord(entity, type);
            return record ? record->Get() : nullptr;
        }

        QUARRY_NODISCARD Result<void*> GetByNetID(Entity entity, NetID netId)
        {
            auto type = m_index.ResolveType(netId);
            if (!type)
            {
                return Err(type.Error());
            }
            return Get(entity, *type);
        }

        // Live record of the type, or nullptr
        QUARRY_NODISCARD ComponentRecord* FindRecord(Entity entity, ComponentTypeID type)
        {
            auto it = m_entities.find(entity);
            if (it == m_entities.end())
                return nullptr;

            auto live = FindLive(it->second, type);
            return live != it->second.end() ? live->get() : nullptr;
        }

        /**
         * Every live component of the entity, in attach order. Restartable;
         * empty for an untracked entity.
         */
        QUARRY_NODISCARD auto Enumerate(Entity entity)
        {
            return std::views::all(Records(entity))
                | std::views::filter([](const std::unique_ptr<ComponentRecord>& record)
                  {
                      return record->IsAlive();
                  })
                | std::views::transform([](const std::unique_ptr<ComponentRecord>& record)
                  {
                      return ComponentRef{record->GetType(), record->GetOwner(), record->Get()};
                  });
        }

        // Every live component of the entity whose type declared Capability
        template<typename Capability>
        QUARRY_NODISCARD auto EnumerateByCapability(Entity entity)
        {
            const CapabilityID capability = TypeID<Capability>::Value();
            return std::views::all(Records(entity))
                | std::views::filter([capability](const std::unique_ptr<ComponentRecord>& record)
                  {
                      return record->IsAlive() && record->GetDescriptor().HasCapability(capability);
                  })
                | std::views::transform([capability](const std::unique_ptr<ComponentRecord>& record)
                  {
                      return static_cast<Capability*>(record->GetDescriptor().CastTo(capability, record->Get()));
                  });
        }

        // All records of the entity, including those pending removal
        QUARRY_NODISCARD const RecordList& Records(Entity entity) const
        {
            auto it = m_entities.find(entity);
            return it != m_entities.end() ? it->second : s_noRecords;
        }

        QUARRY_NODISCARD std::size_t LiveCount(Entity entity) const
        {
            const RecordList& records = Records(entity);
            return static_cast<std::size_t>(std::count_if(records.begin(), records.end(),
                [](const std::unique_ptr<ComponentRecord>& record) { return record->IsAlive(); }));
        }

        /**
         * Hands ownership of a record back to the caller and drops it from the
         * entity's list. The index is not touched.
         * @return nullptr if the record is not owned by this directory
         */
        std::unique_ptr<ComponentRecord> Release(const ComponentRecord& record)
        {
            auto it = m_entities.find(record.GetOwner());
            if (it == m_entities.end())
                return nullptr;

            RecordList& records = it->second;
            auto pos = std::find_if(records.begin(), records.end(),
                                    [&record](const std::unique_ptr<ComponentRecord>& owned)
                                    {
                                        return owned.get() == &record;
                                    });
            if (pos == records.end())
                return nullptr;

            std::unique_ptr<ComponentRecord> owned = std::move(*pos);
            records.erase(pos);
            return owned;
        }

        template<typename Func>
        void ForEachEntity(Func&& func) const
        {
            for (const auto& [entity, records] : m_entities)
            {
                func(entity);
            }
        }

        QUARRY_NODISCARD std::size_t Size() const noexcept { return m_entities.size(); }
        QUARRY_NODISCARD bool IsEmpty() const noexcept { return m_entities.empty(); }

        // Destroys every record without notification
        void Clear()
        {
            m_entities.clear();
            m_index.Clear();
        }

    private:
        static RecordList::iterator FindLive(RecordList& records, ComponentTypeID type)
        {
            return std::find_if(records.begin(), records.end(),
                                [type](const std::unique_ptr<ComponentRecord>& record)
                                {
                                    return record->IsAlive() && record->GetType() == type;
                                });
        }

        inline static const RecordList s_noRecords{};

        const ComponentRegistry& m_registry;
        ComponentIndex& m_index;
        std::unordered_map<Entity, RecordList, EntityHash> m_entities;
        DisplacedHandler m_onDisplaced;
    };
}
