#pragma once

#include <cstddef>
#include <ranges>
#include <utility>

#include "../Component/Component.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Base.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"
#include "../Storage/ComponentIndex.hpp"
#include "../Storage/EntityDirectory.hpp"

namespace Quarry
{
    template<Component T>
    struct QueryItem
    {
        ComponentTypeID type;
        Entity entity;
        T& component;
    };

    template<typename Capability>
    struct CapabilityItem
    {
        Entity entity;
        Capability& component;
    };

    /**
     * Read-only traversal over the component index.
     *
     * All views are lazy and observe stage changes immediately: a component
     * marked for removal mid-iteration is skipped from then on. Attaching or
     * culling components of the iterated type while a view is in use is a
     * precondition violation.
     */
    class QueryEngine
    {
    public:
        QueryEngine(EntityDirectory& directory, const ComponentIndex& index, const ComponentRegistry& registry)
            : m_directory(directory), m_index(index), m_registry(registry)
        {}

        /**
         * Every live T in attach order.
         * @param includePending also yield components marked for removal and
         *        not yet culled; meant for maintenance code only
         */
        template<Component T>
        QUARRY_NODISCARD auto Query(bool includePending = false) const
        {
            const ComponentTypeID type = TypeID<T>::Value();
            return std::views::all(m_index.Bucket(type))
                | std::views::filter([includePending](const ComponentRecord* record)
                  {
                      return record->IsAlive() || (includePending && record->IsPendingRemoval());
                  })
                | std::views::transform([type](ComponentRecord* record)
                  {
                      return QueryItem<T>{type, record->GetOwner(), *static_cast<T*>(record->Get())};
                  });
        }

        QUARRY_NODISCARD auto Query(ComponentTypeID type, bool includePending = false) const
        {
            return std::views::all(m_index.Bucket(type))
                | std::views::filter([includePending](const ComponentRecord* record)
                  {
                      return record->IsAlive() || (includePending && record->IsPendingRemoval());
                  })
                | std::views::transform([](ComponentRecord* record)
                  {
                      return ComponentRef{record->GetType(), record->GetOwner(), record->Get()};
                  });
        }

        /**
         * Every live component whose type declared Capability, grouped by
         * concrete type in registration order. A component shows up once no
         * matter how many other capabilities it declares.
         */
        template<typename Capability>
        QUARRY_NODISCARD auto QueryCapability() const
        {
            const CapabilityID capability = TypeID<Capability>::Value();
            const ComponentIndex& index = m_index;
            return std::views::all(m_registry.GetTypesWithCapability(capability))
                | std::views::transform([&index](ComponentTypeID type) -> const ComponentIndex::BucketType&
                  {
                      return index.Bucket(type);
                  })
                | std::views::join
                | std::views::filter([](const ComponentRecord* record) { return record->IsAlive(); })
                | std::views::transform([capability](ComponentRecord* record)
                  {
                      void* base = record->GetDescriptor().CastTo(capability, record->Get());
                      return CapabilityItem<Capability>{record->GetOwner(), *static_cast<Capability*>(base)};
                  });
        }

        // func(Entity, T&) for every live T
        template<Component T, typename Func>
        void ForEach(Func&& func) const
        {
            for (auto&& item : Query<T>())
            {
                func(item.entity, item.component);
            }
        }

        QUARRY_NODISCARD bool Has(Entity entity, ComponentTypeID type) const
        {
            return m_directory.FindRecord(entity, type) != nullptr;
        }

        template<Component T>
        QUARRY_NODISCARD bool Has(Entity entity) const
        {
            return Has(entity, TypeID<T>::Value());
        }

        // NetID and ComponentTypeID share a representation, hence the distinct name
        QUARRY_NODISCARD Result<bool> HasByNetID(Entity entity, NetID netId) const
        {
            auto type = m_index.ResolveType(netId);
            if (!type)
            {
                return Err(type.Error());
            }
            return Has(entity, *type);
        }

        template<Component T>
        QUARRY_NODISCARD std::size_t Count() const
        {
            return m_index.Count(TypeID<T>::Value());
        }

        QUARRY_NODISCARD std::size_t Count(ComponentTypeID type) const
        {
            return m_index.Count(type);
        }

    private:
        EntityDirectory& m_directory;
        const ComponentIndex& m_index;
        const ComponentRegistry& m_registry;
    };
}
