#pragma once

#include <algorithm>
#include <cstddef>
#include <unordered_map>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Core/Signal.hpp"
#include "../Entity/Entity.hpp"

namespace Quarry
{
    /**
     * @brief Which subscribers watch which entities.
     *
     * Both directions are kept as plain id indexes (entity -> subscribers and
     * subscriber -> entities), so either side can be torn down without the
     * other. Nothing here owns an entity or a subscriber.
     *
     * Explicit subscribe/unsubscribe emit SubscriptionAdded/SubscriptionRemoved
     * to listeners of the entity. Cleanup triggered by entity shutdown is silent.
     */
    class SubscriptionLedger
    {
    public:
        using SubscriberList = std::vector<SubscriberID>;
        using EntityList = std::vector<Entity>;

        explicit SubscriptionLedger(SignalManager& signals) : m_signals(signals) {}

        SubscriptionLedger(const SubscriptionLedger&) = delete;
        SubscriptionLedger& operator=(const SubscriptionLedger&) = delete;

        /**
         * @brief Subscribe to an entity
         * @return false if the pair was already subscribed (no event is sent)
         */
        bool Subscribe(Entity entity, SubscriberID subscriber)
        {
            QUARRY_ASSERT(entity.IsValid(), "Cannot subscribe to an invalid entity");
            if (!entity.IsValid())
                return false;

            SubscriberList& subscribers = m_subscribers[entity];
            if (std::find(subscribers.begin(), subscribers.end(), subscriber) != subscribers.end())
                return false;

            subscribers.push_back(subscriber);
            m_subscriptions[subscriber].push_back(entity);

            m_signals.Emit<Events::SubscriptionAdded>(entity, subscriber);
            return true;
        }

        /**
         * @brief Unsubscribe from an entity
         * @return false if the pair was not subscribed (no event is sent)
         */
        bool Unsubscribe(Entity entity, SubscriberID subscriber)
        {
            if (!Detach(entity, subscriber))
                return false;

            m_signals.Emit<Events::SubscriptionRemoved>(entity, subscriber);
            return true;
        }

        /**
         * @brief Entity shutdown hook
         *
         * Drops every subscription to the entity without emitting
         * SubscriptionRemoved. Must run before the entity id is recycled.
         * @return number of subscriptions dropped
         */
        std::size_t OnEntityShutdown(Entity entity)
        {
            QUARRY_PROFILE_ZONE_NAMED_COLOR("SubscriptionLedger::OnEntityShutdown", Profile::ColorSubscription);

            auto it = m_subscribers.find(entity);
            if (it == m_subscribers.end())
                return 0;

            // Take the list out before touching the other side
            const SubscriberList subscribers = std::move(it->second);
            m_subscribers.erase(it);

            for (SubscriberID subscriber : subscribers)
            {
                EraseFrom(m_subscriptions, subscriber, entity);
            }

            QUARRY_LOG_TRACE("SubscriptionLedger::OnEntityShutdown: Dropped {} subscribers of entity {}",
                             subscribers.size(), entity.GetValue());
            return subscribers.size();
        }

        /**
         * @brief Subscriber teardown (a session going away)
         *
         * Unsubscribes from every watched entity, emitting SubscriptionRemoved
         * for each, in subscription order.
         * @return number of subscriptions dropped
         */
        std::size_t OnSubscriberDisconnected(SubscriberID subscriber)
        {
            auto it = m_subscriptions.find(subscriber);
            if (it == m_subscriptions.end())
                return 0;

            const EntityList entities = it->second;
            std::size_t dropped = 0;
            for (Entity entity : entities)
            {
                if (Unsubscribe(entity, subscriber))
                    ++dropped;
            }
            return dropped;
        }

        QUARRY_NODISCARD bool IsSubscribed(Entity entity, SubscriberID subscriber) const
        {
            const SubscriberList& subscribers = GetSubscribers(entity);
            return std::find(subscribers.begin(), subscribers.end(), subscriber) != subscribers.end();
        }

        QUARRY_NODISCARD const SubscriberList& GetSubscribers(Entity entity) const
        {
            auto it = m_subscribers.find(entity);
            return it != m_subscribers.end() ? it->second : s_noSubscribers;
        }

        // Entities the subscriber watches, in subscription order
        QUARRY_NODISCARD const EntityList& GetSubscriptions(SubscriberID subscriber) const
        {
            auto it = m_subscriptions.find(subscriber);
            return it != m_subscriptions.end() ? it->second : s_noEntities;
        }

        QUARRY_NODISCARD std::size_t SubscriberCount(Entity entity) const
        {
            return GetSubscribers(entity).size();
        }

        QUARRY_NODISCARD bool IsEmpty() const noexcept
        {
            return m_subscribers.empty();
        }

        void Clear() noexcept
        {
            m_subscribers.clear();
            m_subscriptions.clear();
        }

    private:
        bool Detach(Entity entity, SubscriberID subscriber)
        {
            if (!EraseFrom(m_subscribers, entity, subscriber))
                return false;

            EraseFrom(m_subscriptions, subscriber, entity);
            return true;
        }

        // Removes value from map[key], dropping the entry once it is empty
        template<typename Map, typename Key, typename Value>
        static bool EraseFrom(Map& map, const Key& key, const Value& value)
        {
            auto it = map.find(key);
            if (it == map.end())
                return false;

            auto& values = it->second;
            auto pos = std::find(values.begin(), values.end(), value);
            if (pos == values.end())
                return false;

            values.erase(pos);
            if (values.empty())
            {
                map.erase(it);
            }
            return true;
        }

        inline static const SubscriberList s_noSubscribers{};
        inline static const EntityList s_noEntities{};

        SignalManager& m_signals;
        std::unordered_map<Entity, SubscriberList, EntityHash> m_subscribers;
        std::unordered_map<SubscriberID, EntityList> m_subscriptions;
    };
}
