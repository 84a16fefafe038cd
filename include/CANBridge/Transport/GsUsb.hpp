#ifndef CANBRIDGE_GS_USB_HPP
#define CANBRIDGE_GS_USB_HPP

#include <filesystem>
#include <memory>
#include <string>

#include "CANBridge/Interface/BusConfig.hpp"
#include "CANBridge/Transport/Bus.hpp"

namespace CANBridge
{
    /**
     * @brief Finds the CAN network interface the gs_usb kernel driver created for a USB device.
     *
     * The device is matched on the busnum/devnum of its USB parent in sysfs.
     * A numeric usb_channel selects the adapter channel (dev_port), anything
     * else must be the interface name itself.
     */
    tl::expected<std::string, Error> find_gs_usb_interface(const UsbCanConfig& config,
                                                           const std::filesystem::path& sysfs_net = "/sys/class/net");

    // Applies the bitrate, brings the link up and binds a SocketCanBus to it
    tl::expected<std::unique_ptr<Bus>, Error> open_gs_usb(const UsbCanConfig& config);
}

#endif //CANBRIDGE_GS_USB_HPP
