#pragma once

#include <cstdint>

namespace Quarry
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        InvalidArgument,
        AlreadyExists,
        InvalidState,

        // Entity and component lookup
        InvalidEntity,
        ComponentNotFound,
        AlreadyAttached,
        InvalidComponent,

        // Network id translation
        UnknownNetworkId,

        Unknown = 0xFFFFFFFF
    };

    struct Error
    {
        ErrorCode code;
        const char* message;

        constexpr Error(ErrorCode c = ErrorCode::None, const char* msg = nullptr) noexcept
            : code(c), message(msg ? msg : GetDefaultMessage(c))
        {}

        [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        [[nodiscard]] constexpr bool operator==(ErrorCode other) const noexcept
        {
            return code == other;
        }

        [[nodiscard]] static constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
        {
            switch (code)
            {
                case ErrorCode::None: return "No error";
                case ErrorCode::InvalidArgument: return "Invalid argument";
                case ErrorCode::AlreadyExists: return "Item already exists";
                case ErrorCode::InvalidState: return "Invalid state";
                case ErrorCode::InvalidEntity: return "Invalid entity";
                case ErrorCode::ComponentNotFound: return "Component not found";
                case ErrorCode::AlreadyAttached: return "Component already attached";
                case ErrorCode::InvalidComponent: return "Invalid component";
                case ErrorCode::UnknownNetworkId: return "Unknown network id";
                case ErrorCode::Unknown: return "Unknown error";
                default: return "Unspecified error";
            }
        }
    };
}
