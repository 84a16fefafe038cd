#ifndef CANBRIDGE_MESSAGE_HPP
#define CANBRIDGE_MESSAGE_HPP

#include <cstdint>
#include <format>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <linux/can.h>

#include <tl/expected.hpp>

#include "CANBridge/Util/Error.hpp"

namespace CANBridge
{
    /**
     * @brief Backend independent CAN frame.
     *
     * Frames received from a bus carry the backend timestamp (seconds),
     * frames built locally for transmission leave it empty.
     */
    struct CanMessage
    {
        uint32_t arbitration_id{};
        std::optional<std::vector<uint8_t>> data;
        std::optional<uint8_t> dlc;
        bool is_error_frame{false};
        std::optional<double> timestamp;
        bool is_extended_id{false};
        bool is_remote_frame{false};

        bool operator==(const CanMessage&) const = default;
    };

    // Frame ready for send(): dlc follows the payload, 29-bit ids above 0x7FF.
    CanMessage make_message(uint32_t id, std::span<const uint8_t> data);

    std::string to_string(const CanMessage& message);

    /**
     * @brief One line in the candump text convention.
     *
     * `<iface>  <8-hex-digit-id>   [<dlc>]  <space separated bytes>`
     */
    std::string format_candump(std::string_view iface_name, const CanMessage& message);

    tl::expected<can_frame, Error> to_can_frame(const CanMessage& message);

    CanMessage from_can_frame(const can_frame& frame, std::optional<double> timestamp);

    std::ostream& operator<<(std::ostream& os, const CanMessage& message);
}

template <>
struct std::formatter<CANBridge::CanMessage> : std::formatter<std::string>
{
    auto format(const CANBridge::CanMessage& message, std::format_context& ctx) const
    {
        return std::formatter<std::string>::format(CANBridge::to_string(message), ctx);
    }
};

#endif //CANBRIDGE_MESSAGE_HPP
