#ifndef CANBRIDGE_INTERFACE_HPP
#define CANBRIDGE_INTERFACE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "BusConfig.hpp"
#include "Listener.hpp"
#include "Message.hpp"
#include "Notifier.hpp"
#include "CANBridge/Transport/Bus.hpp"

namespace CANBridge
{
    /**
     * @brief Opened CAN bus with synchronous recv/send and callback dispatch.
     *
     * recv() and registered listeners are alternative ways of consuming the
     * bus: while the Notifier runs, recv() fails with ConsumptionModeConflict,
     * and a registration that would start it during a recv() fails the same way.
     * send() may be called from any number of threads.
     */
    class Interface
    {
    public:
        static tl::expected<std::unique_ptr<Interface>, Error> create(BusConfig config);

        Interface() = delete;
        Interface(const Interface& other) = delete;
        Interface(Interface&& other) = delete;
        Interface& operator=(const Interface& other) = delete;
        Interface& operator=(Interface&& other) = delete;
        ~Interface();

        [[nodiscard]] const BusConfig& config() const noexcept
        {
            return config_;
        }

        [[nodiscard]] std::string_view channel_info() const noexcept
        {
            return bus_->channel_info();
        }

        // Blocks until a frame arrives
        tl::expected<CanMessage, Error> recv();
        // std::nullopt when nothing arrived within timeout
        tl::expected<std::optional<CanMessage>, Error> recv(std::chrono::milliseconds timeout);

        tl::expected<void, Error> send(uint32_t id, std::span<const uint8_t> data);
        tl::expected<void, Error> send(const CanMessage& message);

        tl::expected<ListenerId, Error> register_rx_callback(RxCallback on_rx, ErrorCallback on_error);
        // Transport errors are only logged in this form
        tl::expected<ListenerId, Error> recv_spawn(RxCallback on_rx);
        tl::expected<ListenerId, Error> add_listener(std::shared_ptr<Listener> listener);
        tl::expected<void, Error> remove_listener(ListenerId id);

        tl::expected<void, Error> stop_notifier();

        [[nodiscard]] Notifier& notifier() noexcept
        {
            return *notifier_;
        }

    private:
        Interface(BusConfig config, std::unique_ptr<Bus> bus);

        tl::expected<std::optional<CanMessage>, Error> poll_bus(std::optional<std::chrono::milliseconds> timeout);

        BusConfig config_;
        std::unique_ptr<Bus> bus_;
        std::mutex rx_mutex_;
        std::mutex tx_mutex_;
        std::unique_ptr<Notifier> notifier_;
        xtr::sink s;
        // Taken only under rx_mutex_ / tx_mutex_, xtr sinks are single producer
        xtr::sink rx_sink;
        xtr::sink tx_sink;
    };
}

#endif //CANBRIDGE_INTERFACE_HPP
