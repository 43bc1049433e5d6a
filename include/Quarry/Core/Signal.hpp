#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "../Component/Component.hpp"
#include "../Entity/Entity.hpp"
#include "Base.hpp"
#include "Delegate.hpp"

namespace Quarry
{
    // Opaque identity of an external observer (a client session, a camera, ...)
    using SubscriberID = std::uint32_t;

    enum class Signal : std::uint32_t
    {
        None                = 0,
        EntityCreated       = 1 << 0,
        EntityShutdown      = 1 << 1,
        ComponentAdded      = 1 << 2,
        ComponentRemoved    = 1 << 3,
        ComponentShutdown   = 1 << 4,
        SubscriptionAdded   = 1 << 5,
        SubscriptionRemoved = 1 << 6,
        All = ~0u
    };

    inline Signal operator|(Signal a, Signal b) noexcept
    {
        return static_cast<Signal>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
    }

    inline Signal operator&(Signal a, Signal b) noexcept
    {
        return static_cast<Signal>(static_cast<std::uint32_t>(a) & static_cast<std::uint32_t>(b));
    }

    inline Signal operator~(Signal a) noexcept
    {
        return static_cast<Signal>(~static_cast<std::uint32_t>(a));
    }

    inline Signal& operator|=(Signal& a, Signal b) noexcept
    {
        return a = a | b;
    }

    inline Signal& operator&=(Signal& a, Signal b) noexcept
    {
        return a = a & b;
    }

    inline bool HasSignal(Signal flags, Signal signal) noexcept
    {
        return (flags & signal) != Signal::None;
    }

    template<typename T>
    concept Event = requires
    {
        { T::flag } -> std::convertible_to<Signal>;
    } && requires(const T& event)
    {
        { event.entity } -> std::convertible_to<Entity>;
    } && std::is_trivially_copyable_v<T> && std::is_default_constructible_v<T>;

    namespace Events
    {
        struct EntityCreated
        {
            static constexpr Signal flag = Signal::EntityCreated;
            Entity entity;
        };

        // Sent before any of the entity's state is torn down
        struct EntityShutdown
        {
            static constexpr Signal flag = Signal::EntityShutdown;
            Entity entity;
        };

        struct ComponentAdded
        {
            static constexpr Signal flag = Signal::ComponentAdded;
            Entity entity;
            ComponentTypeID componentId;
            void* component;
        };

        // Sent when a component is marked for removal; it is still in storage
        struct ComponentRemoved
        {
            static constexpr Signal flag = Signal::ComponentRemoved;
            Entity entity;
            ComponentTypeID componentId;
            void* component;
        };

        // Sent exactly once per instance, right before it is destroyed
        struct ComponentShutdown
        {
            static constexpr Signal flag = Signal::ComponentShutdown;
            Entity entity;
            ComponentTypeID componentId;
            void* component;
        };

        struct SubscriptionAdded
        {
            static constexpr Signal flag = Signal::SubscriptionAdded;
            Entity entity;
            SubscriberID subscriber;
        };

        struct SubscriptionRemoved
        {
            static constexpr Signal flag = Signal::SubscriptionRemoved;
            Entity entity;
            SubscriberID subscriber;
        };
    }

    namespace Detail
    {
        template<typename E, typename... Es>
        struct EventIndexImpl;

        template<typename E>
        struct EventIndexImpl<E>
        {
            static constexpr std::size_t value = std::size_t(-1);
        };

        template<typename E, typename... Rest>
        struct EventIndexImpl<E, E, Rest...>
        {
            static constexpr std::size_t value = 0;
        };

        template<typename E, typename First, typename... Rest>
        struct EventIndexImpl<E, First, Rest...>
        {
            static constexpr std::size_t value = 1 + EventIndexImpl<E, Rest...>::value;
        };
    }

    /**
     * Synchronous event hub.
     *
     * Handlers registered with On<E>() see every event of that kind; handlers
     * registered with OnEntity<E>(entity) only see events addressed to that
     * entity. Global handlers run first. Emission is gated per event kind by
     * the enabled mask, so disabled signals cost a branch.
     */
    class SignalManager
    {
    public:
        template<Event E>
        using Handler = MulticastDelegate<void(const E&)>;

        SignalManager() noexcept : m_enabledSignals(Signal::None) {}
        explicit SignalManager(Signal enabled) noexcept : m_enabledSignals(enabled) {}

        template<Event E, typename... Args>
        void Emit(Args&&... args)
        {
            if (!IsEnabled<E>())
                return;

            const E event{std::forward<Args>(args)...};
            auto& slot = std::get<IndexOf<E>()>(m_slots);
            slot.global(event);

            if (slot.perEntity.empty())
                return;

            auto it = slot.perEntity.find(event.entity);
            if (it != slot.perEntity.end())
            {
                // Keeps the list alive if a handler clears this entity's handlers
                const std::shared_ptr<Handler<E>> handlers = it->second;
                (*handlers)(event);
            }
        }

        template<Event E>
        Handler<E>& On() noexcept
        {
            return std::get<IndexOf<E>()>(m_slots).global;
        }

        template<Event E>
        Handler<E>& OnEntity(Entity entity)
        {
            std::shared_ptr<Handler<E>>& handlers = std::get<IndexOf<E>()>(m_slots).perEntity[entity];
            if (!handlers)
            {
                handlers = std::make_shared<Handler<E>>();
            }
            return *handlers;
        }

        /**
         * Drops every handler addressed to the entity. Handlers still pending
         * in a running Emit for the entity are skipped.
         */
        void ClearEntityHandlers(Entity entity)
        {
            std::apply([entity](auto&... slot)
            {
                (ClearEntity(slot, entity), ...);
            }, m_slots);
        }

        void ClearAllHandlers()
        {
            std::apply([](auto&... slot)
            {
                (ClearSlot(slot), ...);
            }, m_slots);
        }

        template<Event E>
        void Enable() noexcept { m_enabledSignals |= E::flag; }

        template<Event E>
        void Disable() noexcept { m_enabledSignals &= ~E::flag; }

        template<Event E>
        QUARRY_NODISCARD bool IsEnabled() const noexcept
        {
            return HasSignal(m_enabledSignals, E::flag);
        }

        void SetEnabledSignals(Signal signals) noexcept { m_enabledSignals = signals; }
        QUARRY_NODISCARD Signal GetEnabledSignals() const noexcept { return m_enabledSignals; }

    private:
        template<Event E>
        struct Slot
        {
            Handler<E> global;
            std::unordered_map<Entity, std::shared_ptr<Handler<E>>, EntityHash> perEntity;
        };

        template<Event E>
        static void ClearEntity(Slot<E>& slot, Entity entity)
        {
            auto it = slot.perEntity.find(entity);
            if (it == slot.perEntity.end())
                return;

            it->second->Clear();
            slot.perEntity.erase(it);
        }

        template<Event E>
        static void ClearSlot(Slot<E>& slot)
        {
            slot.global.Clear();
            for (auto& entry : slot.perEntity)
            {
                entry.second->Clear();
            }
            slot.perEntity.clear();
        }

        template<Event E>
        static constexpr std::size_t IndexOf() noexcept
        {
            constexpr std::size_t index = Detail::EventIndexImpl<E,
                Events::EntityCreated,
                Events::EntityShutdown,
                Events::ComponentAdded,
                Events::ComponentRemoved,
                Events::ComponentShutdown,
                Events::SubscriptionAdded,
                Events::SubscriptionRemoved
            >::value;
            static_assert(index != std::size_t(-1), "Unknown event type");
            return index;
        }

        std::tuple<
            Slot<Events::EntityCreated>,
            Slot<Events::EntityShutdown>,
            Slot<Events::ComponentAdded>,
            Slot<Events::ComponentRemoved>,
            Slot<Events::ComponentShutdown>,
            Slot<Events::SubscriptionAdded>,
            Slot<Events::SubscriptionRemoved>
        > m_slots;

        Signal m_enabledSignals;
    };
}
