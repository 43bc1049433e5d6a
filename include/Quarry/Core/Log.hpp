#pragma once

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "Config.hpp"

// Level the library logger starts at. Hosts usually raise it through
// Registry::Config::logLevel or Log::SetLevel.
#ifndef QUARRY_DEFAULT_LOG_LEVEL
    #define QUARRY_DEFAULT_LOG_LEVEL spdlog::level::warn
#endif

namespace Quarry::Log
{
    namespace Detail
    {
        inline std::shared_ptr<spdlog::logger>& Instance()
        {
            static std::shared_ptr<spdlog::logger> s_logger = []
            {
                // Reuse a logger the host registered under our name
                if (auto existing = spdlog::get(QUARRY_LOGGER_NAME))
                    return existing;

                auto logger = spdlog::stdout_color_mt(QUARRY_LOGGER_NAME);
                logger->set_level(QUARRY_DEFAULT_LOG_LEVEL);
                logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
                return logger;
            }();
            return s_logger;
        }
    }

    inline spdlog::logger& Get()
    {
        return *Detail::Instance();
    }

    // Routes library output to a host-owned logger (sinks, pattern, level)
    inline void SetLogger(std::shared_ptr<spdlog::logger> logger)
    {
        if (logger)
            Detail::Instance() = std::move(logger);
    }

    inline void SetLevel(spdlog::level::level_enum level)
    {
        Get().set_level(level);
    }

    inline spdlog::level::level_enum GetLevel()
    {
        return Get().level();
    }
}

#define QUARRY_LOG_TRACE(...) ::Quarry::Log::Get().trace(__VA_ARGS__)
#define QUARRY_LOG_DEBUG(...) ::Quarry::Log::Get().debug(__VA_ARGS__)
#define QUARRY_LOG_INFO(...) ::Quarry::Log::Get().info(__VA_ARGS__)
#define QUARRY_LOG_WARN(...) ::Quarry::Log::Get().warn(__VA_ARGS__)
#define QUARRY_LOG_ERROR(...) ::Quarry::Log::Get().error(__VA_ARGS__)
