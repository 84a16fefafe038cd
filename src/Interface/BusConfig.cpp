#include "CANBridge/Interface/BusConfig.hpp"

#include <format>

namespace
{
    template <class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };
}

namespace CANBridge
{
    std::string describe(const BusConfig& config)
    {
        return std::visit(overloaded{
                              [](const UsbCanConfig& c)
                              {
                                  return std::format("gs_usb {}@{}:{} {} bit/s", c.usb_channel, c.usb_bus,
                                                     c.usb_address, c.bitrate);
                              },
                              [](const SerialCanConfig& c)
                              {
                                  return std::format("slcan {} {} bit/s", c.serial_port, c.bitrate);
                              },
                              [](const SocketCanConfig& c)
                              {
                                  return std::format("socketcan {}", c.channel);
                              },
                              [](const SocketcandConfig& c)
                              {
                                  return std::format("socketcand {}@{}:{}", c.channel, c.host, c.port);
                              },
                          }, config);
    }
}
