#include "CANBridge/Interface/Interface.hpp"
#include "CANBridge/Transport/TransportRegistry.hpp"
#include "CANBridge/Util/Logger.hpp"

#include <format>
#include <stdexcept>

using tl::unexpected, std::format;
using enum CANBridge::ErrorCode;

namespace CANBridge
{
    Interface::Interface(BusConfig config, std::unique_ptr<Bus> bus) : config_(std::move(config)),
                                                                       bus_(std::move(bus)),
                                                                       s(Util::make_sink("Interface",
                                                                           bus_->channel_info())),
                                                                       rx_sink(Util::make_sink("InterfaceRx",
                                                                           bus_->channel_info())),
                                                                       tx_sink(Util::make_sink("InterfaceTx",
                                                                           bus_->channel_info()))
    {
    }

    Interface::~Interface()
    {
        if (notifier_)
        {
            if (const auto stopped = notifier_->stop(); !stopped)
            {
                XTR_LOGL(error, s, "{}", stopped.error().message);
            }
            notifier_.reset();
        }
        XTR_LOGL(info, s, "Closing {}", describe(config_));
    }

    tl::expected<std::unique_ptr<Interface>, Error> Interface::create(BusConfig config)
    {
        auto bus = TransportRegistry::instance().open(config);
        if (!bus)
        {
            return unexpected(bus.error());
        }
        if (!*bus)
        {
            return unexpected(Error{InterfaceCreationFailed, format("Driver returned no bus for {}",
                                                                    describe(config))});
        }

        std::unique_ptr<Interface> interface(new Interface(std::move(config), std::move(*bus)));
        try
        {
            interface->notifier_ = std::make_unique<Notifier>(*interface->bus_, interface->rx_mutex_);
        }
        catch (const std::exception& e)
        {
            return unexpected(Error{NotifierCreationFailed, e.what()});
        }
        XTR_LOGL(info, interface->s, "Opened {}", describe(interface->config_));
        return interface;
    }

    tl::expected<std::optional<CanMessage>, Error> Interface::poll_bus(
        const std::optional<std::chrono::milliseconds> timeout)
    {
        std::lock_guard lock(rx_mutex_);
        if (notifier_->is_running())
        {
            return unexpected(Error{
                ConsumptionModeConflict,
                format("{} is consumed by its notifier, stop it before calling recv", bus_->channel_info())
            });
        }
        auto received = bus_->recv(timeout);
        if (!received)
        {
            XTR_LOGL(warning, rx_sink, "recv failed: {}", received.error().message);
        }
        return received;
    }

    tl::expected<CanMessage, Error> Interface::recv()
    {
        while (true)
        {
            auto received = poll_bus(std::nullopt);
            if (!received)
            {
                return unexpected(received.error());
            }
            if (*received)
            {
                return std::move(**received);
            }
        }
    }

    tl::expected<std::optional<CanMessage>, Error> Interface::recv(const std::chrono::milliseconds timeout)
    {
        return poll_bus(timeout);
    }

    tl::expected<void, Error> Interface::send(const uint32_t id, const std::span<const uint8_t> data)
    {
        return send(make_message(id, data));
    }

    tl::expected<void, Error> Interface::send(const CanMessage& message)
    {
        std::lock_guard lock(tx_mutex_);
        auto sent = bus_->send(message);
        if (!sent)
        {
            XTR_LOGL(warning, tx_sink, "send of 0x{:X} failed: {}", message.arbitration_id, sent.error().message);
        }
        return sent;
    }

    tl::expected<ListenerId, Error> Interface::register_rx_callback(RxCallback on_rx, ErrorCallback on_error)
    {
        if (!on_rx || !on_error)
        {
            return unexpected(Error{
                ListenerRegistrationFailed, "Both the rx and the error callback must be provided"
            });
        }
        return add_listener(std::make_shared<CallbackListener>(std::move(on_rx), std::move(on_error)));
    }

    tl::expected<ListenerId, Error> Interface::recv_spawn(RxCallback on_rx)
    {
        if (!on_rx)
        {
            return unexpected(Error{ListenerRegistrationFailed, "Provided callback function is empty"});
        }
        // Used only on the notifier thread once registered
        auto error_sink = std::make_shared<xtr::sink>(Util::make_sink("RxSpawn", bus_->channel_info()));
        return register_rx_callback(std::move(on_rx), [error_sink](const Error& e)
        {
            XTR_LOGL(error, *error_sink, "Dropped transport error: {}", e.message);
        });
    }

    tl::expected<ListenerId, Error> Interface::add_listener(std::shared_ptr<Listener> listener)
    {
        return notifier_->add_listener(std::move(listener));
    }

    tl::expected<void, Error> Interface::remove_listener(const ListenerId id)
    {
        return notifier_->remove_listener(id);
    }

    tl::expected<void, Error> Interface::stop_notifier()
    {
        return notifier_->stop();
    }
}
