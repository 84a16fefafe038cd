#include "CANBridge/Transport/TransportRegistry.hpp"
#include "CANBridge/Transport/GsUsb.hpp"
#include "CANBridge/Transport/Slcan.hpp"
#include "CANBridge/Transport/SocketCan.hpp"
#include "CANBridge/Transport/Socketcand.hpp"

#include <format>
#include <stdexcept>

using tl::unexpected, std::format;

namespace CANBridge
{
    TransportRegistry::TransportRegistry()
    {
        restore_defaults();
    }

    TransportRegistry& TransportRegistry::instance()
    {
        static TransportRegistry instance;
        return instance;
    }

    void TransportRegistry::restore_defaults()
    {
        std::lock_guard lock(mutex_);
        drivers_.clear();
        drivers_[BusKind::UsbCan] = [](const BusConfig& c) { return open_gs_usb(std::get<UsbCanConfig>(c)); };
        drivers_[BusKind::SerialCan] = [](const BusConfig& c) { return open_slcan(std::get<SerialCanConfig>(c)); };
        drivers_[BusKind::SocketCan] = [](const BusConfig& c)
        {
            return open_socketcan(std::get<SocketCanConfig>(c));
        };
        drivers_[BusKind::Socketcand] = [](const BusConfig& c)
        {
            return open_socketcand(std::get<SocketcandConfig>(c));
        };
    }

    void TransportRegistry::register_driver(const BusKind kind, Driver driver)
    {
        std::lock_guard lock(mutex_);
        drivers_[kind] = std::move(driver);
    }

    void TransportRegistry::unregister_driver(const BusKind kind)
    {
        std::lock_guard lock(mutex_);
        drivers_.erase(kind);
    }

    bool TransportRegistry::has_driver(const BusKind kind) const
    {
        std::lock_guard lock(mutex_);
        return drivers_.contains(kind);
    }

    tl::expected<std::unique_ptr<Bus>, Error> TransportRegistry::open(const BusConfig& config) const
    {
        Driver driver;
        {
            std::lock_guard lock(mutex_);
            const auto it = drivers_.find(kind_of(config));
            if (it == drivers_.end() || !it->second)
            {
                return unexpected(Error{
                    ErrorCode::TransportUnavailable,
                    format("No transport driver for {}", to_string(kind_of(config)))
                });
            }
            driver = it->second;
        }

        try
        {
            return driver(config);
        }
        catch (const std::exception& e)
        {
            return unexpected(Error{
                ErrorCode::InterfaceCreationFailed, format("Failed to open {}: {}", describe(config), e.what())
            });
        }
    }
}
