#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Config.hpp"
#include "../Core/Log.hpp"
#include "../Core/Profile.hpp"
#include "../Entity/Entity.hpp"
#include "ComponentIndex.hpp"
#include "EntityDirectory.hpp"

namespace Quarry
{
    /**
     * Two-phase removal.
     *
     * MarkRemoved() only flips a record to PendingRemoval, which hides it from
     * every lookup and query while its storage stays put, so a pass iterating
     * the type can finish. Cull() performs the actual detach and destruction.
     *
     * Finalizing a record detaches it from the index, takes it out of the
     * directory, runs its shutdown exactly once and then destroys it. Shutdown
     * handlers may therefore mark, attach or destroy freely: the record being
     * shut down is no longer reachable from storage.
     */
    class RemovalQueue
    {
    public:
        RemovalQueue(EntityDirectory& directory, ComponentIndex& index)
            : m_directory(directory), m_index(index)
        {
            m_pending.reserve(config::REMOVAL_QUEUE_RESERVE);
        }

        RemovalQueue(const RemovalQueue&) = delete;
        RemovalQueue& operator=(const RemovalQueue&) = delete;

        /**
         * @return false if the entity has no live component of the type (absent
         *         or already pending); nothing changes in that case
         */
        bool MarkRemoved(Entity entity, ComponentTypeID type)
        {
            ComponentRecord* record = m_directory.FindRecord(entity, type);
            return record && Mark(*record);
        }

        bool Mark(ComponentRecord& record)
        {
            if (!record.IsAlive())
                return false;

            record.SetStage(ComponentStage::PendingRemoval);
            m_pending.push_back(&record);
            return true;
        }

        /**
         * Finalizes every queued record, including records queued by shutdown
         * handlers while the pass runs. The queue is empty afterwards.
         * onShutdown(ComponentRecord&) is called once per finalized record.
         * A Cull() issued from inside a shutdown handler returns 0; the running
         * pass picks its records up.
         * @return number of records destroyed
         */
        template<typename Func>
        std::size_t Cull(Func&& onShutdown)
        {
            if (m_culling || m_pending.empty())
                return 0;

            QUARRY_PROFILE_ZONE_NAMED_COLOR("RemovalQueue::Cull", Profile::ColorCull);

            m_culling = true;
            std::size_t culled = 0;

            while (!m_pending.empty())
            {
                m_batch.clear();
                m_batch.swap(m_pending);

                for (std::size_t i = 0; i < m_batch.size(); ++i)
                {
                    ComponentRecord* record = m_batch[i];
                    if (!record || record->IsCulled())
                        continue;

                    m_batch[i] = nullptr;
                    Finalize(*record, onShutdown);
                    ++culled;
                }
            }

            m_batch.clear();
            m_culling = false;

            QUARRY_LOG_TRACE("RemovalQueue::Cull: Destroyed {} components", culled);
            return culled;
        }

        std::size_t Cull()
        {
            return Cull([](ComponentRecord&) {});
        }

        /**
         * Finalizes every record the entity still owns, pending or alive, in
         * attach order, and drops its entries from the queue.
         */
        template<typename Func>
        std::size_t CullEntity(Entity entity, Func&& onShutdown)
        {
            QUARRY_PROFILE_ZONE_NAMED_COLOR("RemovalQueue::CullEntity", Profile::ColorCull);

            std::size_t culled = 0;
            while (true)
            {
                const EntityDirectory::RecordList& records = m_directory.Records(entity);
                if (records.empty())
                    break;

                ComponentRecord& record = *records.front();
                if (record.IsPendingRemoval())
                {
                    Forget(record);
                }

                Finalize(record, onShutdown);
                ++culled;
            }
            return culled;
        }

        std::size_t CullEntity(Entity entity)
        {
            return CullEntity(entity, [](ComponentRecord&) {});
        }

        QUARRY_NODISCARD bool IsPending(const ComponentRecord& record) const noexcept
        {
            return record.IsPendingRemoval();
        }

        QUARRY_NODISCARD bool IsPending(Entity entity, ComponentTypeID type) const
        {
            const EntityDirectory::RecordList& records = m_directory.Records(entity);
            return std::any_of(records.begin(), records.end(),
                               [type](const std::unique_ptr<ComponentRecord>& record)
                               {
                                   return record->GetType() == type && record->IsPendingRemoval();
                               });
        }

        QUARRY_NODISCARD std::size_t Size() const noexcept { return m_pending.size(); }
        QUARRY_NODISCARD bool Empty() const noexcept { return m_pending.empty(); }

        // Forgets queued records without finalizing them
        void Clear() noexcept
        {
            m_pending.clear();
            std::fill(m_batch.begin(), m_batch.end(), nullptr);
        }

    private:
        template<typename Func>
        void Finalize(ComponentRecord& record, Func& onShutdown)
        {
            record.SetStage(ComponentStage::Culled);
            m_index.Remove(record);

            std::unique_ptr<ComponentRecord> owned = m_directory.Release(record);
            QUARRY_ASSERT(owned != nullptr, "Culled a record the directory does not own");
            if (!owned)
                return;

            if (owned->Shutdown())
            {
                onShutdown(*owned);
            }
        }

        void Forget(const ComponentRecord& record)
        {
            m_pending.erase(std::remove(m_pending.begin(), m_pending.end(), &record), m_pending.end());
            std::replace(m_batch.begin(), m_batch.end(), const_cast<ComponentRecord*>(&record),
                         static_cast<ComponentRecord*>(nullptr));
        }

        EntityDirectory& m_directory;
        ComponentIndex& m_index;
        std::vector<ComponentRecord*> m_pending;
        std::vector<ComponentRecord*> m_batch;
        bool m_culling = false;
    };
}
