#ifndef CANBRIDGE_SLCAN_HPP
#define CANBRIDGE_SLCAN_HPP

#include <memory>
#include <optional>
#include <string>

#include <xtr/logger.hpp>

#include "CANBridge/Interface/BusConfig.hpp"
#include "CANBridge/Transport/SocketCan.hpp"

namespace CANBridge
{
    /**
     * @brief Serial line CAN adapter attached through the kernel slcan line discipline.
     *
     * The tty is configured, handed to N_SLCAN and the resulting slcanN
     * interface is served by a SocketCanBus. The tty is restored on destruction.
     */
    class SlcanBus final : public Bus
    {
    public:
        explicit SlcanBus(const SerialCanConfig& config);
        SlcanBus() = delete;
        ~SlcanBus() override;

        tl::expected<void, Error> attach();

        tl::expected<std::optional<CanMessage>, Error> recv(std::optional<std::chrono::milliseconds> timeout) override;
        tl::expected<void, Error> send(const CanMessage& message) override;
        [[nodiscard]] int fileno() const noexcept override;

        [[nodiscard]] std::string_view channel_info() const noexcept override
        {
            return serial_port;
        }

        [[nodiscard]] const std::string& netdev_name() const noexcept
        {
            return netdev;
        }

    private:
        tl::expected<void, Error> write_command(std::string_view command) const;
        void detach() noexcept;

        std::string serial_port;
        uint32_t bitrate;
        int tty_fd{-1};
        bool ldisc_attached{false};
        std::string netdev;
        std::unique_ptr<SocketCanBus> socket;
        xtr::sink s;
    };

    // "S<n>" setup command for a bitrate, nullopt when the adapter has no such speed
    std::optional<std::string> slcan_bitrate_command(uint32_t bitrate);

    tl::expected<std::unique_ptr<Bus>, Error> open_slcan(const SerialCanConfig& config);
}

#endif //CANBRIDGE_SLCAN_HPP
