#ifndef CANBRIDGE_SOCKETCAND_HPP
#define CANBRIDGE_SOCKETCAND_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <xtr/logger.hpp>

#include "CANBridge/Interface/BusConfig.hpp"
#include "CANBridge/Transport/Bus.hpp"

namespace CANBridge
{
    /**
     * @brief Client of a socketcand daemon in rawmode.
     *
     * Handshake: `< hi >`, `< open ch >` / `< ok >`, `< rawmode >` / `< ok >`.
     * Frames arrive as `< frame id sec.usec hexdata >` and leave as
     * `< send id dlc b0 b1 ... >`.
     */
    class SocketcandBus final : public Bus
    {
    public:
        explicit SocketcandBus(const SocketcandConfig& config);
        SocketcandBus() = delete;
        ~SocketcandBus() override;

        tl::expected<void, Error> connect();

        tl::expected<std::optional<CanMessage>, Error> recv(std::optional<std::chrono::milliseconds> timeout) override;
        tl::expected<void, Error> send(const CanMessage& message) override;

        [[nodiscard]] int fileno() const noexcept override
        {
            return sock_fd;
        }

        [[nodiscard]] std::string_view channel_info() const noexcept override
        {
            return info;
        }

    private:
        using Clock = std::chrono::steady_clock;

        // Next complete "< ... >" element, nullopt when the deadline passes first
        tl::expected<std::optional<std::string>, Error> next_element(std::optional<Clock::time_point> deadline);
        tl::expected<void, Error> expect(std::string_view element, Clock::time_point deadline);
        tl::expected<void, Error> write_all(std::string_view text);

        SocketcandConfig config;
        std::string info;
        int sock_fd{-1};
        std::string rx_buffer;
        std::mutex tx_mutex;
        xtr::sink s;
    };

    // Parses one rawmode element; nullopt for elements that are not frames
    tl::expected<std::optional<CanMessage>, Error> parse_socketcand_element(std::string_view element);

    std::string format_socketcand_send(const CanMessage& message);

    tl::expected<std::unique_ptr<Bus>, Error> open_socketcand(const SocketcandConfig& config);
}

#endif //CANBRIDGE_SOCKETCAND_HPP
