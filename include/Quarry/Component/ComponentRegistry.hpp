#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "../Core/Config.hpp"
#include "../Core/Log.hpp"
#include "../Core/Result.hpp"
#include "../Core/TypeID.hpp"
#include "Component.hpp"

namespace Quarry
{
    struct ComponentRegistration
    {
        // Defaults to the unqualified type name
        std::string_view name{};

        // Explicit network id; takes precedence over `networked`
        std::optional<NetID> netId{};

        // Receives an id from GenerateNetworkIDs() when no explicit id is given
        bool networked = false;
    };

    /**
     * Catalogue of component types: names, network ids and the capabilities
     * each type declares.
     *
     * Registration is open until Lock() or GenerateNetworkIDs() is called;
     * afterwards the tables are static, so network ids never get renumbered
     * while storage refers to them.
     */
    class ComponentRegistry
    {
    public:
        /**
         * Registers T together with the capability bases it exposes.
         * Registering an already registered type is a no-op returning its id.
         *
         * Example:
         *   registry.RegisterComponent<Door, IInteractable, ILockable>({.name = "Door", .netId = 12});
         */
        template<Component T, typename... Capabilities>
        Result<ComponentTypeID> RegisterComponent(const ComponentRegistration& registration = {})
        {
            static_assert((ProvidesCapability<T, Capabilities> && ...),
                          "A component can only declare capabilities it publicly derives from");

            const ComponentTypeID id = TypeID<T>::Value();
            if (m_components.contains(id))
                return id;

            if (m_locked)
            {
                QUARRY_LOG_WARN("ComponentRegistry::RegisterComponent: Registry is locked, rejecting '{}'",
                                TypeID<T>::Name());
                return Err(ErrorCode::InvalidState, "Component registry is locked");
            }

            std::string name(registration.name.empty() ? TypeID<T>::ShortName() : registration.name);
            if (m_nameToType.contains(name))
            {
                QUARRY_LOG_WARN("ComponentRegistry::RegisterComponent: Name '{}' is already taken", name);
                return Err(ErrorCode::AlreadyExists, "Component name already registered");
            }

            if (registration.netId)
            {
                const NetID netId = *registration.netId;
                if (netId > config::MAX_NET_ID)
                {
                    return Err(ErrorCode::InvalidArgument, "Network id out of range");
                }
                if (m_netToType.contains(netId))
                {
                    QUARRY_LOG_WARN("ComponentRegistry::RegisterComponent: Network id {} is already used by '{}'",
                                    netId, m_components.at(m_netToType.at(netId)).name);
                    return Err(ErrorCode::AlreadyExists, "Network id already in use");
                }
            }

            ComponentDescriptor desc;
            desc.id = id;
            desc.name = name;
            desc.netId = registration.netId;
            desc.networked = registration.networked || registration.netId.has_value();
            desc.size = sizeof(T);
            desc.alignment = alignof(T);

            if constexpr (HasShutdownHook<T>)
            {
                desc.shutdown = &Shutdown<T>;
            }

            desc.capabilities.reserve(sizeof...(Capabilities));
            (desc.capabilities.push_back({TypeID<Capabilities>::Value(), &CastTo<T, Capabilities>}), ...);

            for (const auto& capability : desc.capabilities)
            {
                m_capabilityTypes[capability.id].push_back(id);
            }

            if (desc.netId)
            {
                m_netToType.emplace(*desc.netId, id);
            }
            m_nameToType.emplace(std::move(name), id);

            auto [it, inserted] = m_components.emplace(id, std::move(desc));
            QUARRY_UNUSED(inserted);

            QUARRY_LOG_DEBUG("ComponentRegistry::RegisterComponent: Registered '{}' (type {}, capabilities {})",
                             it->second.name, id, sizeof...(Capabilities));
            return id;
        }

        /**
         * Assigns network ids to every type registered as networked without an
         * explicit id, in name order, skipping ids already taken. Locks the
         * registry.
         * @return number of ids assigned
         */
        Result<std::size_t> GenerateNetworkIDs()
        {
            if (m_locked)
            {
                return Err(ErrorCode::InvalidState, "Network ids were already generated");
            }

            std::vector<ComponentDescriptor*> pending;
            for (auto& [id, desc] : m_components)
            {
                if (desc.networked && !desc.netId)
                    pending.push_back(&desc);
            }

            std::sort(pending.begin(), pending.end(),
                      [](const ComponentDescriptor* a, const ComponentDescriptor* b) { return a->name < b->name; });

            std::uint32_t next = 0;
            for (ComponentDescriptor* desc : pending)
            {
                while (next <= config::MAX_NET_ID && m_netToType.contains(static_cast<NetID>(next)))
                    ++next;

                if (next > config::MAX_NET_ID)
                {
                    QUARRY_LOG_ERROR("ComponentRegistry::GenerateNetworkIDs: Ran out of network ids at '{}'", desc->name);
                    return Err(ErrorCode::InvalidState, "Network id space exhausted");
                }

                desc->netId = static_cast<NetID>(next);
                m_netToType.emplace(static_cast<NetID>(next), desc->id);
                ++next;
            }

            m_locked = true;
            QUARRY_LOG_DEBUG("ComponentRegistry::GenerateNetworkIDs: Assigned {} network ids", pending.size());
            return pending.size();
        }

        void Lock() noexcept { m_locked = true; }
        QUARRY_NODISCARD bool IsLocked() const noexcept { return m_locked; }

        template<Component T>
        QUARRY_NODISCARD bool IsRegistered() const
        {
            return m_components.contains(TypeID<T>::Value());
        }

        QUARRY_NODISCARD bool IsRegistered(ComponentTypeID type) const
        {
            return m_components.contains(type);
        }

        QUARRY_NODISCARD const ComponentDescriptor* GetDescriptor(ComponentTypeID type) const
        {
            auto it = m_components.find(type);
            return it != m_components.end() ? &it->second : nullptr;
        }

        template<Component T>
        QUARRY_NODISCARD const ComponentDescriptor* GetDescriptor() const
        {
            return GetDescriptor(TypeID<T>::Value());
        }

        QUARRY_NODISCARD std::optional<NetID> GetNetID(ComponentTypeID type) const
        {
            const ComponentDescriptor* desc = GetDescriptor(type);
            return desc ? desc->netId : std::nullopt;
        }

        QUARRY_NODISCARD Result<ComponentTypeID> GetTypeByNetID(NetID netId) const
        {
            auto it = m_netToType.find(netId);
            if (it == m_netToType.end())
            {
                return Err(ErrorCode::UnknownNetworkId);
            }
            return it->second;
        }

        QUARRY_NODISCARD Result<ComponentTypeID> GetTypeByName(std::string_view name) const
        {
            auto it = m_nameToType.find(name);
            if (it == m_nameToType.end())
            {
                return Err(ErrorCode::InvalidComponent, "No component registered under that name");
            }
            return it->second;
        }

        // Concrete types that declared the capability, in registration order
        QUARRY_NODISCARD const std::vector<ComponentTypeID>& GetTypesWithCapability(CapabilityID capability) const
        {
            auto it = m_capabilityTypes.find(capability);
            return it != m_capabilityTypes.end() ? it->second : s_noTypes;
        }

        template<typename Capability>
        QUARRY_NODISCARD const std::vector<ComponentTypeID>& GetTypesWithCapability() const
        {
            return GetTypesWithCapability(TypeID<Capability>::Value());
        }

        QUARRY_NODISCARD std::size_t Size() const noexcept
        {
            return m_components.size();
        }

        template<typename Func>
        void ForEachDescriptor(Func&& func) const
        {
            for (const auto& [id, desc] : m_components)
            {
                func(desc);
            }
        }

    private:
        template<typename T>
        static void Shutdown(void* ptr, Entity owner)
        {
            static_cast<T*>(ptr)->OnShutdown(owner);
        }

        template<typename T, typename Capability>
        static void* CastTo(void* ptr)
        {
            return static_cast<Capability*>(static_cast<T*>(ptr));
        }

        inline static const std::vector<ComponentTypeID> s_noTypes{};

        std::unordered_map<ComponentTypeID, ComponentDescriptor> m_components;
        std::map<std::string, ComponentTypeID, std::less<>> m_nameToType;
        std::unordered_map<NetID, ComponentTypeID> m_netToType;
        std::unordered_map<CapabilityID, std::vector<ComponentTypeID>> m_capabilityTypes;
        bool m_locked = false;
    };
}
