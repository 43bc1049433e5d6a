#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "../Component/Component.hpp"
#include "../Component/ComponentRegistry.hpp"
#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Result.hpp"
#include "../Core/Signal.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"
#include "../Entity/EntityManager.hpp"
#include "../Storage/ComponentIndex.hpp"
#include "../Storage/EntityDirectory.hpp"
#include "../Storage/RemovalQueue.hpp"
#include "QueryEngine.hpp"
#include "SubscriptionLedger.hpp"

namespace Quarry
{
    class Registry
    {
    public:
        struct Config
        {
            EntityManager::Config entityManagerConfig;

            // Shut down components replaced by an overwriting attach (OnShutdown
            // hook and ComponentShutdown). When false they are dropped silently.
            bool notifyDisplacedComponents = true;

            Signal enabledSignals = Signal::All;

            // Lock the component registry when the first entity is created, so
            // late registrations fail instead of silently growing the tables
            bool lockRegistryOnFirstEntity = false;

            // Applied to the library logger on construction
            std::optional<spdlog::level::level_enum> logLevel;
        };

        Registry() : Registry(Config{}) {}

        explicit Registry(const Config& config)
            : Registry(std::make_shared<ComponentRegistry>(), config)
        {}

        explicit Registry(std::shared_ptr<ComponentRegistry> componentRegistry)
            : Registry(std::move(componentRegistry), Config{})
        {}

        /**
         * Shares a component registry with other registries, e.g. a client and
         * a server world that must agree on network ids.
         */
        Registry(std::shared_ptr<ComponentRegistry> componentRegistry, const Config& config)
            : m_config(config),
              m_componentRegistry(componentRegistry ? std::move(componentRegistry) : std::make_shared<ComponentRegistry>()),
              m_entityManager(config.entityManagerConfig),
              m_signalManager(config.enabledSignals),
              m_index(*m_componentRegistry),
              m_directory(*m_componentRegistry, m_index),
              m_removalQueue(m_directory, m_index),
              m_queryEngine(m_directory, m_index, *m_componentRegistry),
              m_ledger(m_signalManager)
        {
            if (config.logLevel)
            {
                Log::SetLevel(*config.logLevel);
            }

            m_directory.SetDisplacedHandler([this](ComponentRecord& record) { OnDisplaced(record); });
        }

        Registry(const Registry&) = delete;
        Registry& operator=(const Registry&) = delete;
        Registry(Registry&&) = delete;
        Registry& operator=(Registry&&) = delete;

        // ====================== Component types ======================

        template<Component T, typename... Capabilities>
        Result<ComponentTypeID> RegisterComponent(const ComponentRegistration& registration = {})
        {
            return m_componentRegistry->RegisterComponent<T, Capabilities...>(registration);
        }

        Result<std::size_t> GenerateNetworkIDs()
        {
            return m_componentRegistry->GenerateNetworkIDs();
        }

        QUARRY_NODISCARD std::string_view GetComponentName(ComponentTypeID type) const
        {
            const ComponentDescriptor* descriptor = m_componentRegistry->GetDescriptor(type);
            return descriptor ? std::string_view(descriptor->name) : std::string_view();
        }

        // ====================== Entities ======================

        /**
         * @return The new entity, or Entity::Invalid() when the id space is exhausted
         */
        Entity CreateEntity()
        {
            if (m_config.lockRegistryOnFirstEntity && !m_componentRegistry->IsLocked())
            {
                m_componentRegistry->Lock();
            }

            const Entity entity = m_entityManager.Create();
            if (!entity.IsValid()) QUARRY_UNLIKELY
            {
                QUARRY_LOG_ERROR("Registry::CreateEntity: Entity id space exhausted");
                return entity;
            }

            m_directory.Track(entity);
            m_signalManager.Emit<Events::EntityCreated>(entity);
            return entity;
        }

        /**
         * Entity shutdown. In order: EntityShutdown is emitted, the subscription
         * ledger drops the entity silently, every component is marked removed and
         * culled on the spot (ComponentRemoved, OnShutdown, ComponentShutdown),
         * handlers addressed to the entity are dropped, and the id is recycled.
         * Handlers running during the shutdown cannot attach to or subscribe to
         * the entity; both fail with InvalidEntity.
         * @return false for an invalid entity or one already shutting down
         */
        bool DestroyEntity(Entity entity)
        {
            if (!IsAlive(entity))
                return false;

            QUARRY_PROFILE_ZONE_NAMED_COLOR("Registry::DestroyEntity", Profile::ColorEntity);
            m_dying.push_back(entity);

            m_signalManager.Emit<Events::EntityShutdown>(entity);
            m_ledger.OnEntityShutdown(entity);

            RemoveComponents(entity);
            m_removalQueue.CullEntity(entity, [this](ComponentRecord& record) { EmitShutdown(record); });

            m_directory.Untrack(entity);
            m_signalManager.ClearEntityHandlers(entity);
            m_entityManager.Destroy(entity);

            m_dying.erase(std::find(m_dying.begin(), m_dying.end(), entity));
            return true;
        }

        std::size_t DestroyEntities(std::span<const Entity> entities)
        {
            std::size_t destroyed = 0;
            for (Entity entity : entities)
            {
                if (DestroyEntity(entity))
                    ++destroyed;
            }
            return destroyed;
        }

        QUARRY_NODISCARD bool IsValid(Entity entity) const noexcept
        {
            return m_entityManager.IsValid(entity);
        }

        QUARRY_NODISCARD std::size_t Size() const noexcept
        {
            return m_entityManager.Size();
        }

        QUARRY_NODISCARD bool IsEmpty() const noexcept
        {
            return m_entityManager.IsEmpty();
        }

        // ====================== Attach ======================

        /**
         * Attaches a component. Fails with AlreadyAttached if the entity already
         * holds a live component of the type and overwrite is false.
         *
         * Example:
         *   auto health = registry.AttachComponent(entity, Health{100}, true);
         */
        template<typename T, typename C = std::remove_cvref_t<T>>
            requires Component<C>
        Result<C*> AttachComponent(Entity entity, T&& component, bool overwrite = false)
        {
            return Emplace<C>(entity, overwrite, std::forward<T>(component));
        }

        template<Component T, typename... Args>
        Result<T*> AddComponent(Entity entity, Args&&... args)
        {
            return Emplace<T>(entity, false, std::forward<Args>(args)...);
        }

        template<Component T, typename... Args>
        Result<T*> ReplaceComponent(Entity entity, Args&&... args)
        {
            return Emplace<T>(entity, true, std::forward<Args>(args)...);
        }

        // Returns the live T, constructing one from args only if there is none
        template<Component T, typename... Args>
        Result<T*> EnsureComponent(Entity entity, Args&&... args)
        {
            if (T* existing = m_directory.TryGet<T>(entity))
                return existing;

            return Emplace<T>(entity, false, std::forward<Args>(args)...);
        }

        // ====================== Removal ======================

        /**
         * Marks the entity's live T for removal. It disappears from every lookup
         * and query immediately and is destroyed by the next Cull().
         * @return false if there is no live T (absent or already pending),
         *         InvalidEntity if the entity is not alive
         */
        template<Component T>
        Result<bool> RemoveComponent(Entity entity)
        {
            return RemoveComponent(entity, TypeID<T>::Value());
        }

        Result<bool> RemoveComponent(Entity entity, ComponentTypeID type)
        {
            if (!m_entityManager.IsValid(entity))
            {
                QUARRY_LOG_DEBUG("Registry::RemoveComponent: Entity {} is not alive", entity.GetValue());
                return Err(ErrorCode::InvalidEntity);
            }
            return MarkRemoved(entity, type);
        }

        Result<bool> RemoveComponentByNetID(Entity entity, NetID netId)
        {
            auto type = m_index.ResolveType(netId);
            if (!type)
            {
                QUARRY_LOG_DEBUG("Registry::RemoveComponentByNetID: Unknown network id {}", netId);
                return Err(type.Error());
            }
            return RemoveComponent(entity, *type);
        }

        // Marks every live component of the entity
        std::size_t RemoveComponents(Entity entity)
        {
            // By type: a ComponentRemoved handler may cull records of this entity
            std::vector<ComponentTypeID> types;
            for (const auto& record : m_directory.Records(entity))
            {
                if (record->IsAlive())
                    types.push_back(record->GetType());
            }

            std::size_t marked = 0;
            for (ComponentTypeID type : types)
            {
                if (MarkRemoved(entity, type))
                    ++marked;
            }
            return marked;
        }

        /**
         * Destroys every component marked for removal, emitting ComponentShutdown
         * for each. Must not run while a query over an affected type is iterated.
         * @return number of components destroyed
         */
        std::size_t Cull()
        {
            return m_removalQueue.Cull([this](ComponentRecord& record) { EmitShutdown(record); });
        }

        QUARRY_NODISCARD std::size_t PendingRemovals() const noexcept
        {
            return m_removalQueue.Size();
        }

        // ====================== Lookup ======================

        template<Component T>
        QUARRY_NODISCARD Result<T*> GetComponent(Entity entity)
        {
            return m_directory.Get<T>(entity);
        }

        template<Component T>
        QUARRY_NODISCARD T* TryGetComponent(Entity entity)
        {
            return m_directory.TryGet<T>(entity);
        }

        QUARRY_NODISCARD Result<void*> GetComponent(Entity entity, ComponentTypeID type)
        {
            return m_directory.Get(entity, type);
        }

        QUARRY_NODISCARD Result<void*> GetComponentByNetID(Entity entity, NetID netId)
        {
            return m_directory.GetByNetID(entity, netId);
        }

        template<Component T>
        QUARRY_NODISCARD bool HasComponent(Entity entity) const
        {
            return m_queryEngine.Has<T>(entity);
        }

        QUARRY_NODISCARD bool HasComponent(Entity entity, ComponentTypeID type) const
        {
            return m_queryEngine.Has(entity, type);
        }

        QUARRY_NODISCARD Result<bool> HasComponentByNetID(Entity entity, NetID netId) const
        {
            return m_queryEngine.HasByNetID(entity, netId);
        }

        // All live components of the entity as ComponentRef, in attach order
        QUARRY_NODISCARD auto GetComponents(Entity entity)
        {
            return m_directory.Enumerate(entity);
        }

        // Live components of the entity that declared Capability
        template<typename Capability>
        QUARRY_NODISCARD auto GetComponents(Entity entity)
        {
            return m_directory.EnumerateByCapability<Capability>(entity);
        }

        // ====================== Queries ======================

        template<Component T>
        QUARRY_NODISCARD auto EntityQuery(bool includePending = false) const
        {
            return m_queryEngine.Query<T>(includePending);
        }

        template<typename Capability>
        QUARRY_NODISCARD auto CapabilityQuery() const
        {
            return m_queryEngine.QueryCapability<Capability>();
        }

        template<Component T>
        QUARRY_NODISCARD auto EntitiesWith() const
        {
            return m_index.EntitiesWith<T>();
        }

        template<Component T, typename Func>
        void ForEach(Func&& func) const
        {
            QUARRY_PROFILE_ZONE_NAMED_COLOR("Registry::ForEach", Profile::ColorQuery);
            m_queryEngine.ForEach<T>(std::forward<Func>(func));
        }

        template<Component T>
        QUARRY_NODISCARD std::size_t Count() const
        {
            return m_queryEngine.Count<T>();
        }

        // ====================== Subscriptions ======================

        /**
         * @return false if already subscribed, InvalidEntity if the entity is
         *         not alive or is shutting down
         */
        Result<bool> Subscribe(Entity entity, SubscriberID subscriber)
        {
            if (!IsAlive(entity))
            {
                QUARRY_LOG_DEBUG("Registry::Subscribe: Entity {} is not alive", entity.GetValue());
                return Err(ErrorCode::InvalidEntity);
            }
            return m_ledger.Subscribe(entity, subscriber);
        }

        Result<bool> Unsubscribe(Entity entity, SubscriberID subscriber)
        {
            if (!m_entityManager.IsValid(entity))
            {
                QUARRY_LOG_DEBUG("Registry::Unsubscribe: Entity {} is not alive", entity.GetValue());
                return Err(ErrorCode::InvalidEntity);
            }
            return m_ledger.Unsubscribe(entity, subscriber);
        }

        std::size_t DisconnectSubscriber(SubscriberID subscriber)
        {
            return m_ledger.OnSubscriberDisconnected(subscriber);
        }

        // ====================== Signals ======================

        void SetEnabledSignals(Signal signals) noexcept
        {
            m_signalManager.SetEnabledSignals(signals);
        }

        QUARRY_NODISCARD Signal GetEnabledSignals() const noexcept
        {
            return m_signalManager.GetEnabledSignals();
        }

        /**
         * Direct access to the signal manager for registering handlers
         * Example:
         *   registry.GetSignalManager().OnEntity<Events::ComponentShutdown>(door).Register(
         *       [](const Events::ComponentShutdown& e) { ... });
         */
        SignalManager& GetSignalManager() noexcept { return m_signalManager; }
        const SignalManager& GetSignalManager() const noexcept { return m_signalManager; }

        // ====================== Modules ======================

        QUARRY_NODISCARD ComponentRegistry& GetComponentRegistry() noexcept { return *m_componentRegistry; }
        QUARRY_NODISCARD const ComponentRegistry& GetComponentRegistry() const noexcept { return *m_componentRegistry; }
        QUARRY_NODISCARD std::shared_ptr<ComponentRegistry> ShareComponentRegistry() const { return m_componentRegistry; }

        QUARRY_NODISCARD EntityDirectory& GetEntityDirectory() noexcept { return m_directory; }
        QUARRY_NODISCARD const ComponentIndex& GetComponentIndex() const noexcept { return m_index; }
        QUARRY_NODISCARD const RemovalQueue& GetRemovalQueue() const noexcept { return m_removalQueue; }
        QUARRY_NODISCARD const QueryEngine& GetQueryEngine() const noexcept { return m_queryEngine; }
        QUARRY_NODISCARD SubscriptionLedger& GetSubscriptionLedger() noexcept { return m_ledger; }
        QUARRY_NODISCARD const SubscriptionLedger& GetSubscriptionLedger() const noexcept { return m_ledger; }

        /**
         * Destroys every entity through DestroyEntity, so every hook and event
         * runs, then flushes anything still queued.
         */
        void Clear()
        {
            std::vector<Entity> entities;
            entities.reserve(m_entityManager.Size());
            m_entityManager.ForEach([&entities](Entity entity) { entities.push_back(entity); });

            DestroyEntities(entities);
            Cull();

            QUARRY_LOG_DEBUG("Registry::Clear: Destroyed {} entities", entities.size());
        }

    private:
        template<Component T, typename... Args>
        Result<T*> Emplace(Entity entity, bool overwrite, Args&&... args)
        {
            QUARRY_PROFILE_ZONE_NAMED_COLOR("Registry::Emplace", Profile::ColorComponent);

            if (!IsAlive(entity))
            {
                QUARRY_LOG_DEBUG("Registry::Emplace: Entity {} is not alive", entity.GetValue());
                return Err(ErrorCode::InvalidEntity);
            }

            if (!m_componentRegistry->IsRegistered<T>())
            {
                if (m_componentRegistry->IsLocked())
                {
                    QUARRY_LOG_WARN("Registry::Emplace: '{}' was not registered before the registry was locked",
                                    TypeID<T>::Name());
                    return Err(ErrorCode::InvalidComponent, "Component type was not registered");
                }

                auto registered = m_componentRegistry->RegisterComponent<T>();
                if (!registered)
                {
                    return Err(registered.Error());
                }
            }

            auto component = m_directory.Emplace<T>(entity, overwrite, std::forward<Args>(args)...);
            if (component)
            {
                m_signalManager.Emit<Events::ComponentAdded>(entity, TypeID<T>::Value(), static_cast<void*>(*component));
            }
            return component;
        }

        // Valid and not in the middle of DestroyEntity
        bool IsAlive(Entity entity) const
        {
            return m_entityManager.IsValid(entity) &&
                   std::find(m_dying.begin(), m_dying.end(), entity) == m_dying.end();
        }

        bool MarkRemoved(Entity entity, ComponentTypeID type)
        {
            ComponentRecord* record = m_directory.FindRecord(entity, type);
            return record && Mark(*record);
        }

        bool Mark(ComponentRecord& record)
        {
            if (!m_removalQueue.Mark(record))
                return false;

            m_signalManager.Emit<Events::ComponentRemoved>(record.GetOwner(), record.GetType(), record.Get());
            return true;
        }

        void EmitShutdown(ComponentRecord& record)
        {
            m_signalManager.Emit<Events::ComponentShutdown>(record.GetOwner(), record.GetType(), record.Get());
        }

        void OnDisplaced(ComponentRecord& record)
        {
            if (!m_config.notifyDisplacedComponents)
                return;

            if (record.Shutdown())
            {
                EmitShutdown(record);
            }
        }

        Config m_config;
        std::shared_ptr<ComponentRegistry> m_componentRegistry;
        EntityManager m_entityManager;
        SignalManager m_signalManager;

        ComponentIndex m_index;
        EntityDirectory m_directory;
        RemovalQueue m_removalQueue;
        QueryEngine m_queryEngine;
        SubscriptionLedger m_ledger;

        std::vector<Entity> m_dying;
    };
}
