#ifndef CANBRIDGE_BUS_CONFIG_HPP
#define CANBRIDGE_BUS_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace CANBridge
{
    // USB CAN adapter (gs_usb), identified by USB bus number and device address
    struct UsbCanConfig
    {
        uint32_t bitrate{};
        std::string usb_channel;
        uint32_t usb_bus{};
        uint32_t usb_address{};

        bool operator==(const UsbCanConfig&) const = default;
    };

    // Serial line CAN adapter (slcan), e.g. /dev/ttyUSB0
    struct SerialCanConfig
    {
        uint32_t bitrate{};
        std::string serial_port;

        bool operator==(const SerialCanConfig&) const = default;
    };

    // Kernel SocketCAN network interface, e.g. can0 or vcan0
    struct SocketCanConfig
    {
        std::string channel;

        bool operator==(const SocketCanConfig&) const = default;
    };

    // CAN relayed over TCP by a socketcand daemon
    struct SocketcandConfig
    {
        std::string host;
        std::string channel;
        uint16_t port{};

        bool operator==(const SocketcandConfig&) const = default;
    };

    using BusConfig = std::variant<UsbCanConfig, SerialCanConfig, SocketCanConfig, SocketcandConfig>;

    enum class BusKind
    {
        UsbCan,
        SerialCan,
        SocketCan,
        Socketcand,
    };

    constexpr BusKind kind_of(const BusConfig& config) noexcept
    {
        return static_cast<BusKind>(config.index());
    }

    constexpr std::string_view to_string(const BusKind kind) noexcept
    {
        switch (kind)
        {
        case BusKind::UsbCan: return "gs_usb";
        case BusKind::SerialCan: return "slcan";
        case BusKind::SocketCan: return "socketcan";
        case BusKind::Socketcand: return "socketcand";
        }
        return "unknown";
    }

    // One line description for logs, e.g. "socketcand vcan0@side:29536"
    std::string describe(const BusConfig& config);
}

#endif //CANBRIDGE_BUS_CONFIG_HPP
