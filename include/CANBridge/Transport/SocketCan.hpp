#ifndef CANBRIDGE_SOCKET_CAN_HPP
#define CANBRIDGE_SOCKET_CAN_HPP

#include <memory>
#include <string>

#include <xtr/logger.hpp>

#include "CANBridge/Interface/BusConfig.hpp"
#include "CANBridge/Transport/Bus.hpp"

namespace CANBridge
{
    /**
     * @brief Raw SocketCAN socket bound to one kernel CAN interface.
     *
     * Error frames are received (CAN_RAW_ERR_FILTER) and every frame carries
     * the kernel receive time (SO_TIMESTAMP).
     */
    class SocketCanBus final : public Bus
    {
    public:
        explicit SocketCanBus(std::string_view interface_name);
        SocketCanBus() = delete;
        ~SocketCanBus() override;

        tl::expected<void, Error> connect() noexcept;
        [[nodiscard]] tl::expected<void, Error> flush() const noexcept;

        tl::expected<std::optional<CanMessage>, Error> recv(std::optional<std::chrono::milliseconds> timeout) override;
        tl::expected<void, Error> send(const CanMessage& message) override;

        [[nodiscard]] int fileno() const noexcept override
        {
            return sock_fd;
        }

        [[nodiscard]] std::string_view channel_info() const noexcept override
        {
            return interface_name;
        }

    private:
        tl::expected<bool, Error> wait_readable(std::optional<std::chrono::milliseconds> timeout) const;

        int sock_fd{-1};
        std::string interface_name;
        xtr::sink s;
    };

    tl::expected<std::unique_ptr<Bus>, Error> open_socketcan(const SocketCanConfig& config);
}

#endif //CANBRIDGE_SOCKET_CAN_HPP
