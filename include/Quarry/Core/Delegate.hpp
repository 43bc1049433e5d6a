#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>
#include <vector>

#include "Base.hpp"

namespace Quarry
{
    template<typename Signature>
    class Delegate;

    template<typename Signature>
    class MulticastDelegate;

    /**
     * Type-erased callable. Small copyable functors with a nothrow move are
     * stored in place; anything else lives in a shared_ptr so the delegate
     * stays copyable.
     */
    template<typename R, typename... Args>
    class Delegate<R(Args...)>
    {
    public:
        static constexpr std::size_t SmallBufferSize = 32;

        Delegate() noexcept = default;
        Delegate(std::nullptr_t) noexcept {}

        template<typename Func, typename = std::enable_if_t<!std::is_same_v<std::decay_t<Func>, Delegate>>>
        Delegate(Func&& func)
        {
            using Stored = std::decay_t<Func>;

            if constexpr (std::is_pointer_v<Stored>)
            {
                if (static_cast<Stored>(func) == nullptr)
                    return;
            }

            if constexpr (sizeof(Stored) <= SmallBufferSize &&
                          alignof(Stored) <= alignof(std::max_align_t) &&
                          std::is_nothrow_move_constructible_v<Stored> &&
                          std::is_copy_constructible_v<Stored>)
            {
                ::new (static_cast<void*>(m_storage)) Stored(std::forward<Func>(func));
                m_invoker = &InvokeInline<Stored>;
                m_manager = &ManageInline<Stored>;
            }
            else
            {
                using Shared = std::shared_ptr<Stored>;
                ::new (static_cast<void*>(m_storage)) Shared(std::make_shared<Stored>(std::forward<Func>(func)));
                m_invoker = &InvokeShared<Stored>;
                m_manager = &ManageInline<Shared>;
            }
        }

        Delegate(const Delegate& other) : m_invoker(other.m_invoker), m_manager(other.m_manager)
        {
            if (m_manager)
                m_manager(Op::Copy, m_storage, other.m_storage);
        }

        Delegate(Delegate&& other) noexcept : m_invoker(other.m_invoker), m_manager(other.m_manager)
        {
            if (m_manager)
                m_manager(Op::Move, m_storage, other.m_storage);
            other.m_invoker = nullptr;
            other.m_manager = nullptr;
        }

        ~Delegate()
        {
            Reset();
        }

        Delegate& operator=(const Delegate& other)
        {
            if (this != &other)
            {
                Delegate copy(other);
                *this = std::move(copy);
            }
            return *this;
        }

        Delegate& operator=(Delegate&& other) noexcept
        {
            if (this != &other)
            {
                Reset();
                m_invoker = other.m_invoker;
                m_manager = other.m_manager;
                if (m_manager)
                    m_manager(Op::Move, m_storage, other.m_storage);
                other.m_invoker = nullptr;
                other.m_manager = nullptr;
            }
            return *this;
        }

        R operator()(Args... args) const
        {
            QUARRY_ASSERT(m_invoker != nullptr, "Calling empty delegate");
            return m_invoker(m_storage, std::forward<Args>(args)...);
        }

        explicit operator bool() const noexcept
        {
            return m_invoker != nullptr;
        }

        void Reset() noexcept
        {
            if (m_manager)
                m_manager(Op::Destroy, m_storage, nullptr);
            m_invoker = nullptr;
            m_manager = nullptr;
        }

    private:
        enum class Op
        {
            Copy,
            Move,
            Destroy
        };

        using InvokerType = R(*)(const void*, Args...);
        using ManagerType = void(*)(Op, void*, const void*);

        template<typename Func>
        static R InvokeInline(const void* storage, Args... args)
        {
            return (*static_cast<const Func*>(storage))(std::forward<Args>(args)...);
        }

        template<typename Func>
        static R InvokeShared(const void* storage, Args... args)
        {
            const auto& shared = *static_cast<const std::shared_ptr<Func>*>(storage);
            return (*shared)(std::forward<Args>(args)...);
        }

        template<typename Stored>
        static void ManageInline(Op op, void* dst, const void* src)
        {
            switch (op)
            {
                case Op::Copy:
                    ::new (dst) Stored(*static_cast<const Stored*>(src));
                    break;
                case Op::Move:
                {
                    auto* source = static_cast<Stored*>(const_cast<void*>(src));
                    ::new (dst) Stored(std::move(*source));
                    source->~Stored();
                    break;
                }
                case Op::Destroy:
                    static_cast<Stored*>(dst)->~Stored();
                    break;
            }
        }

        alignas(std::max_align_t) mutable std::byte m_storage[SmallBufferSize];
        InvokerType m_invoker = nullptr;
        ManagerType m_manager = nullptr;
    };

    /**
     * Ordered list of delegates invoked in registration order.
     * Handlers registered while an invocation is running are not called by
     * that invocation; handlers unregistered during it are skipped.
     */
    template<typename... Args>
    class MulticastDelegate<void(Args...)>
    {
    public:
        using DelegateType = Delegate<void(Args...)>;
        using HandlerID = std::size_t;

        static constexpr HandlerID INVALID_HANDLER = 0;

        template<typename Func>
        HandlerID Register(Func&& func)
        {
            DelegateType delegate(std::forward<Func>(func));
            if (!delegate)
                return INVALID_HANDLER;

            const HandlerID id = m_nextID++;
            m_handlers.push_back({id, std::move(delegate)});
            return id;
        }

        bool Unregister(HandlerID id)
        {
            auto it = std::find_if(m_handlers.begin(), m_handlers.end(),
                                   [id](const Handler& h) { return h.id == id; });
            if (it == m_handlers.end())
                return false;

            m_handlers.erase(it);
            return true;
        }

        void Clear() noexcept
        {
            m_handlers.clear();
        }

        QUARRY_NODISCARD std::size_t Size() const noexcept { return m_handlers.size(); }
        QUARRY_NODISCARD bool IsEmpty() const noexcept { return m_handlers.empty(); }

        void Invoke(Args... args) const
        {
            if (m_handlers.empty())
                return;

            // Handlers may register or unregister handlers on this delegate
            const std::vector<Handler> snapshot = m_handlers;
            for (const Handler& handler : snapshot)
            {
                if (IsRegistered(handler.id))
                    handler.delegate(args...);
            }
        }

        void operator()(Args... args) const
        {
            Invoke(args...);
        }

    private:
        struct Handler
        {
            HandlerID id;
            DelegateType delegate;
        };

        bool IsRegistered(HandlerID id) const noexcept
        {
            return std::any_of(m_handlers.begin(), m_handlers.end(),
                               [id](const Handler& h) { return h.id == id; });
        }

        std::vector<Handler> m_handlers;
        HandlerID m_nextID = 1;
    };
}
