#pragma once

#include <atomic>
#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>

#include "Base.hpp"

namespace Quarry
{
    // Process-local identifier of a concrete component type or capability tag
    using TypeIndex = std::uint16_t;

    inline constexpr TypeIndex INVALID_TYPE_INDEX = std::numeric_limits<TypeIndex>::max();

    namespace Detail
    {
        // Cross-platform compile-time type name extraction
        template<typename T>
        constexpr std::string_view TypeNameInternal() noexcept
        {
            #if defined(QUARRY_COMPILER_MSVC)
                constexpr std::string_view funcName = __FUNCSIG__;
                constexpr std::string_view prefix = "TypeNameInternal<";
                constexpr std::string_view suffix = ">(void)";
            #elif defined(QUARRY_COMPILER_CLANG)
                constexpr std::string_view funcName = __PRETTY_FUNCTION__;
                constexpr std::string_view prefix = "TypeNameInternal() [T = ";
                constexpr std::string_view suffix = "]";
            #elif defined(QUARRY_COMPILER_GCC)
                constexpr std::string_view funcName = __PRETTY_FUNCTION__;
                constexpr std::string_view prefix = "TypeNameInternal() [with T = ";
                constexpr std::string_view suffix = "]";
            #else
                #error "Unsupported compiler for compile-time type name extraction"
            #endif

            std::size_t start = funcName.find(prefix);
            if (start == std::string_view::npos)
                return "Unknown";
            start += prefix.length();

            // GCC appends "; std::string_view = ..." after the template argument
            std::size_t end = funcName.find(';', start);
            if (end == std::string_view::npos)
                end = funcName.rfind(suffix);
            if (end == std::string_view::npos || end <= start)
                return "Unknown";

            std::string_view typeName = funcName.substr(start, end - start);

            #if defined(QUARRY_COMPILER_MSVC)
                if (typeName.starts_with("class "))
                    typeName.remove_prefix(6);
                else if (typeName.starts_with("struct "))
                    typeName.remove_prefix(7);
            #endif

            return typeName;
        }

        // Strips namespaces and template arguments: "Game::Foo<int>" -> "Foo"
        constexpr std::string_view ShortTypeName(std::string_view name) noexcept
        {
            const std::size_t templateStart = name.find('<');
            if (templateStart != std::string_view::npos)
                name = name.substr(0, templateStart);

            const std::size_t scope = name.rfind("::");
            if (scope != std::string_view::npos)
                name.remove_prefix(scope + 2);

            return name;
        }

        class TypeIndexGenerator
        {
        public:
            QUARRY_NODISCARD static TypeIndex Next() noexcept
            {
                // Only atomicity is needed; each type caches its index in a
                // function-local static.
                return s_nextIndex.fetch_add(1, std::memory_order_relaxed);
            }

        private:
            inline static std::atomic<TypeIndex> s_nextIndex{0};
        };

        template<typename T>
        class TypeIndexStorage
        {
        public:
            QUARRY_NODISCARD static TypeIndex Value() noexcept
            {
                static const TypeIndex s_index = TypeIndexGenerator::Next();
                return s_index;
            }
        };
    }

    template<typename T>
    struct TypeID
    {
        using Type = std::remove_cvref_t<T>;

        // Runtime-assigned id, unique per process but not stable across runs
        QUARRY_NODISCARD static TypeIndex Value() noexcept
        {
            return Detail::TypeIndexStorage<Type>::Value();
        }

        // Fully qualified compile-time name
        QUARRY_NODISCARD static constexpr std::string_view Name() noexcept
        {
            return Detail::TypeNameInternal<Type>();
        }

        // Unqualified name, used as the default registration name
        QUARRY_NODISCARD static constexpr std::string_view ShortName() noexcept
        {
            return Detail::ShortTypeName(Name());
        }
    };
}
