#ifndef CANBRIDGE_BUS_HPP
#define CANBRIDGE_BUS_HPP

#include <chrono>
#include <optional>
#include <string_view>

#include <tl/expected.hpp>

#include "CANBridge/Interface/Message.hpp"
#include "CANBridge/Util/Error.hpp"

namespace CANBridge
{
    /**
     * @brief Contract every transport driver implements.
     *
     * recv(std::nullopt) blocks until a frame arrives, recv(0ms) never blocks.
     * fileno() becomes readable whenever recv(0ms) may yield a frame or an error.
     * After an error, frames the driver already buffered stay reachable through
     * further recv(0ms) calls even if fileno() is no longer readable.
     * A Bus owns its OS handle exclusively and releases it on destruction.
     */
    class Bus
    {
    public:
        Bus() = default;
        Bus(const Bus&) = delete;
        Bus& operator=(const Bus&) = delete;
        virtual ~Bus() = default;

        virtual tl::expected<std::optional<CanMessage>, Error> recv(
            std::optional<std::chrono::milliseconds> timeout) = 0;
        virtual tl::expected<void, Error> send(const CanMessage& message) = 0;
        [[nodiscard]] virtual int fileno() const noexcept = 0;
        [[nodiscard]] virtual std::string_view channel_info() const noexcept = 0;
    };
}

#endif //CANBRIDGE_BUS_HPP
