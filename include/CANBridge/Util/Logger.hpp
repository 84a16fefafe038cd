#ifndef CANBRIDGE_LOGGER_HPP
#define CANBRIDGE_LOGGER_HPP

#include <string_view>

#include <xtr/logger.hpp>

namespace CANBridge::Util
{
    // Process-wide logger, every component takes its own sink from it.
    xtr::logger& logger();

    // Returns a sink named "CANBridge <component>_<channel>" at the configured level.
    xtr::sink make_sink(std::string_view component, std::string_view channel = {});
}

#endif //CANBRIDGE_LOGGER_HPP
