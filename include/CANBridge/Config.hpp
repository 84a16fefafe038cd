#ifndef CANBRIDGE_CONFIG_HPP
#define CANBRIDGE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

#include <xtr/logger.hpp>

namespace CANBridge
{
    namespace Config
    {
        // Default TCP port of the socketcand daemon
        constexpr uint16_t DEFAULT_SOCKETCAND_PORT = 29536;

        constexpr std::chrono::milliseconds SOCKETCAND_CONNECT_TIMEOUT{3000};

        constexpr size_t MAX_EPOLL_EVENT = 16;

        constexpr std::chrono::milliseconds DEFAULT_NOTIFIER_BACKOFF{10};

        constexpr xtr::log_level_t DEFAULT_LOG_LEVEL = xtr::log_level_t::info;

        inline xtr::log_level_t parse_log_level(const std::string_view name, const xtr::log_level_t fallback)
        {
            if (name == "none") return xtr::log_level_t::none;
            if (name == "fatal") return xtr::log_level_t::fatal;
            if (name == "error") return xtr::log_level_t::error;
            if (name == "warning") return xtr::log_level_t::warning;
            if (name == "info") return xtr::log_level_t::info;
            if (name == "debug") return xtr::log_level_t::debug;
            return fallback;
        }

        // CANBRIDGE_LOG_LEVEL overrides the default sink level
        inline xtr::log_level_t get_log_level()
        {
            if (const char* env_level = std::getenv("CANBRIDGE_LOG_LEVEL"))
            {
                return parse_log_level(env_level, DEFAULT_LOG_LEVEL);
            }
            return DEFAULT_LOG_LEVEL;
        }

        // Pause of the dispatch loop after the transport reported an error
        inline std::chrono::milliseconds get_notifier_backoff()
        {
            if (const char* env_backoff = std::getenv("CANBRIDGE_NOTIFIER_BACKOFF_MS"))
            {
                char* end = nullptr;
                const long value = std::strtol(env_backoff, &end, 10);
                if (end != env_backoff && *end == '\0' && value >= 0)
                {
                    return std::chrono::milliseconds(value);
                }
            }
            return DEFAULT_NOTIFIER_BACKOFF;
        }
    }
}

#endif //CANBRIDGE_CONFIG_HPP
