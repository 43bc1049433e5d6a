#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "../Core/Base.hpp"
#include "../Core/TypeID.hpp"
#include "../Entity/Entity.hpp"

namespace Quarry
{
    using ComponentTypeID = TypeIndex;
    using CapabilityID = TypeIndex;
    using NetID = std::uint16_t;

    inline constexpr ComponentTypeID INVALID_COMPONENT = INVALID_TYPE_INDEX;

    template<typename T>
    concept Component = std::is_object_v<T> &&
                        !std::is_const_v<T> &&
                        !std::is_pointer_v<T> &&
                        std::is_nothrow_move_assignable_v<T> &&
                        std::is_nothrow_destructible_v<T> &&
                        std::is_move_constructible_v<T>;

    // A capability is any class a component type publicly derives from and
    // declares at registration time.
    template<typename T, typename Capability>
    concept ProvidesCapability = std::is_class_v<Capability> &&
                                 std::is_base_of_v<Capability, T> &&
                                 std::is_convertible_v<T*, Capability*>;

    // Components may observe their own destruction
    template<typename T>
    concept HasShutdownHook = requires(T& component, Entity owner)
    {
        component.OnShutdown(owner);
    };

    enum class ComponentStage : std::uint8_t
    {
        Alive,
        PendingRemoval,
        Culled
    };

    // Shared metadata for a registered component type
    struct ComponentDescriptor
    {
        using ShutdownFn = void(void*, Entity);
        using CapabilityCastFn = void*(void*);

        struct CapabilityEntry
        {
            CapabilityID id;
            CapabilityCastFn* cast;
        };

        ComponentTypeID id = INVALID_COMPONENT;
        std::string name;
        std::optional<NetID> netId;
        bool networked = false;

        std::size_t size = 0;
        std::size_t alignment = 0;

        // Null when the type has no OnShutdown hook
        ShutdownFn* shutdown = nullptr;

        std::vector<CapabilityEntry> capabilities;

        QUARRY_NODISCARD bool HasCapability(CapabilityID capability) const noexcept
        {
            return std::any_of(capabilities.begin(), capabilities.end(),
                               [capability](const CapabilityEntry& entry) { return entry.id == capability; });
        }

        // Adjusts a pointer to the concrete type into a pointer to the
        // capability base; nullptr if the type never declared it.
        QUARRY_NODISCARD void* CastTo(CapabilityID capability, void* component) const noexcept
        {
            for (const CapabilityEntry& entry : capabilities)
            {
                if (entry.id == capability)
                    return entry.cast(component);
            }
            return nullptr;
        }
    };

    /**
     * Owning storage for one attached component instance.
     *
     * Records are created and destroyed only by EntityDirectory. Every other
     * module refers to them through non-owning pointers, which stay valid until
     * the record is culled.
     */
    class ComponentRecord
    {
    public:
        ComponentRecord(const ComponentRecord&) = delete;
        ComponentRecord& operator=(const ComponentRecord&) = delete;

        virtual ~ComponentRecord() = default;

        QUARRY_NODISCARD virtual void* Get() noexcept = 0;
        QUARRY_NODISCARD virtual const void* Get() const noexcept = 0;

        QUARRY_NODISCARD ComponentTypeID GetType() const noexcept { return m_descriptor->id; }
        QUARRY_NODISCARD const ComponentDescriptor& GetDescriptor() const noexcept { return *m_descriptor; }
        QUARRY_NODISCARD Entity GetOwner() const noexcept { return m_owner; }
        QUARRY_NODISCARD ComponentStage GetStage() const noexcept { return m_stage; }

        QUARRY_NODISCARD bool IsAlive() const noexcept { return m_stage == ComponentStage::Alive; }
        QUARRY_NODISCARD bool IsPendingRemoval() const noexcept { return m_stage == ComponentStage::PendingRemoval; }
        QUARRY_NODISCARD bool IsCulled() const noexcept { return m_stage == ComponentStage::Culled; }

        void SetStage(ComponentStage stage) noexcept
        {
            QUARRY_ASSERT(m_stage != ComponentStage::Culled || stage == ComponentStage::Culled,
                          "A culled component cannot come back to life");
            m_stage = stage;
        }

        /**
         * Runs the type's OnShutdown hook at most once per instance.
         * @return true if this call performed the shutdown
         */
        bool Shutdown()
        {
            if (m_shutdown)
                return false;

            m_shutdown = true;
            if (m_descriptor->shutdown)
            {
                m_descriptor->shutdown(Get(), m_owner);
            }
            return true;
        }

        QUARRY_NODISCARD bool HasShutdown() const noexcept { return m_shutdown; }

    protected:
        ComponentRecord(const ComponentDescriptor& descriptor, Entity owner) noexcept
            : m_descriptor(&descriptor), m_owner(owner)
        {}

    private:
        const ComponentDescriptor* m_descriptor;
        Entity m_owner;
        ComponentStage m_stage = ComponentStage::Alive;
        bool m_shutdown = false;
    };

    template<Component T>
    class TypedComponentRecord final : public ComponentRecord
    {
    public:
        template<typename... Args>
        TypedComponentRecord(const ComponentDescriptor& descriptor, Entity owner, Args&&... args)
            : ComponentRecord(descriptor, owner), m_value(std::forward<Args>(args)...)
        {}

        QUARRY_NODISCARD void* Get() noexcept override { return &m_value; }
        QUARRY_NODISCARD const void* Get() const noexcept override { return &m_value; }

        QUARRY_NODISCARD T& Value() noexcept { return m_value; }

    private:
        T m_value;
    };

    // Untyped reference to a live component, as produced by enumeration
    struct ComponentRef
    {
        ComponentTypeID type;
        Entity entity;
        void* component;
    };
}
