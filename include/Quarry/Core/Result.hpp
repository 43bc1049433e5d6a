#pragma once

#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "Base.hpp"
#include "Error.hpp"

namespace Quarry
{
    template<typename E>
    struct ErrorValue
    {
        E value;

        constexpr explicit ErrorValue(const E& e) : value(e) {}
        constexpr explicit ErrorValue(E&& e) : value(std::move(e)) {}
    };

    template<typename E>
    constexpr ErrorValue<std::decay_t<E>> Err(E&& e)
    {
        return ErrorValue<std::decay_t<E>>(std::forward<E>(e));
    }

    inline constexpr ErrorValue<Error> Err(ErrorCode code, const char* message = nullptr)
    {
        return ErrorValue<Error>(Error(code, message));
    }

    struct OkTag {};
    inline constexpr OkTag OK{};

    /**
     * Value-or-error return type used by every fallible Quarry operation.
     * Holds either a T or an E, never both; accessing the wrong side is a
     * precondition violation checked in debug builds.
     */
    template<typename T, typename E = Error>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        constexpr Result(const T& value) : m_hasValue(true)
        {
            std::construct_at(std::addressof(m_value), value);
        }

        constexpr Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>) : m_hasValue(true)
        {
            std::construct_at(std::addressof(m_value), std::move(value));
        }

        constexpr Result(const ErrorValue<E>& err) : m_hasValue(false)
        {
            std::construct_at(std::addressof(m_error), err.value);
        }

        constexpr Result(ErrorValue<E>&& err) noexcept(std::is_nothrow_move_constructible_v<E>) : m_hasValue(false)
        {
            std::construct_at(std::addressof(m_error), std::move(err.value));
        }

        constexpr Result(const Result& other) : m_hasValue(other.m_hasValue)
        {
            CopyFrom(other);
        }

        constexpr Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            MoveFrom(std::move(other));
        }

        constexpr ~Result()
        {
            Destroy();
        }

        constexpr Result& operator=(const Result& other)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                CopyFrom(other);
            }
            return *this;
        }

        constexpr Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                MoveFrom(std::move(other));
            }
            return *this;
        }

        QUARRY_NODISCARD constexpr bool HasValue() const noexcept { return m_hasValue; }
        QUARRY_NODISCARD constexpr bool IsOk() const noexcept { return m_hasValue; }
        QUARRY_NODISCARD constexpr bool IsErr() const noexcept { return !m_hasValue; }
        QUARRY_NODISCARD constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr T& Value() &
        {
            QUARRY_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr const T& Value() const&
        {
            QUARRY_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr T&& Value() &&
        {
            QUARRY_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return std::move(m_value);
        }

        constexpr E& Error() &
        {
            QUARRY_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        constexpr const E& Error() const&
        {
            QUARRY_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        constexpr T& operator*() & { return Value(); }
        constexpr const T& operator*() const& { return Value(); }

        constexpr T* operator->() noexcept
        {
            QUARRY_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return std::addressof(m_value);
        }

        constexpr const T* operator->() const noexcept
        {
            QUARRY_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return std::addressof(m_value);
        }

        template<typename U>
        QUARRY_NODISCARD constexpr T ValueOr(U&& defaultValue) const&
        {
            return m_hasValue ? m_value : static_cast<T>(std::forward<U>(defaultValue));
        }

    private:
        constexpr void CopyFrom(const Result& other)
        {
            if (m_hasValue)
                std::construct_at(std::addressof(m_value), other.m_value);
            else
                std::construct_at(std::addressof(m_error), other.m_error);
        }

        constexpr void MoveFrom(Result&& other)
        {
            if (m_hasValue)
                std::construct_at(std::addressof(m_value), std::move(other.m_value));
            else
                std::construct_at(std::addressof(m_error), std::move(other.m_error));
        }

        constexpr void Destroy() noexcept
        {
            if (m_hasValue)
                std::destroy_at(std::addressof(m_value));
            else
                std::destroy_at(std::addressof(m_error));
        }

        union
        {
            T m_value;
            E m_error;
        };
        bool m_hasValue;
    };

    template<typename E>
    class Result<void, E>
    {
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = void;
        using ErrorType = E;

        constexpr Result() noexcept : m_hasValue(true) {}
        constexpr Result(OkTag) noexcept : m_hasValue(true) {}

        constexpr Result(const ErrorValue<E>& err) : m_hasValue(false), m_error(err.value) {}
        constexpr Result(ErrorValue<E>&& err) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(false), m_error(std::move(err.value))
        {}

        QUARRY_NODISCARD constexpr bool HasValue() const noexcept { return m_hasValue; }
        QUARRY_NODISCARD constexpr bool IsOk() const noexcept { return m_hasValue; }
        QUARRY_NODISCARD constexpr bool IsErr() const noexcept { return !m_hasValue; }
        QUARRY_NODISCARD constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr const E& Error() const&
        {
            QUARRY_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

    private:
        bool m_hasValue;
        E m_error{};
    };

    inline Result<void, Error> Ok()
    {
        return Result<void, Error>(OK);
    }

    template<typename T>
    inline auto Ok(T&& value) -> Result<std::decay_t<T>, Error>
    {
        return Result<std::decay_t<T>, Error>(std::forward<T>(value));
    }
}
