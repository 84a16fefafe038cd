#include "CANBridge/Interface/Message.hpp"

#include <algorithm>
#include <cstring>

using std::format, std::string, tl::unexpected;

namespace
{
    constexpr std::string_view NONE = "None";

    string format_timestamp(const std::optional<double>& timestamp)
    {
        if (!timestamp)
        {
            return string(NONE);
        }
        string text = format("{}", *timestamp);
        if (text.find_first_of(".eni") == string::npos)
        {
            text += ".0";
        }
        return text;
    }

    string format_dlc(const std::optional<uint8_t>& dlc)
    {
        return dlc ? format("{:X}", *dlc) : string(NONE);
    }

    string format_data(const std::optional<std::vector<uint8_t>>& data)
    {
        if (!data)
        {
            return string(NONE);
        }
        string text = "[";
        for (size_t i = 0; i < data->size(); ++i)
        {
            if (i != 0)
            {
                text += ", ";
            }
            text += format("{:X}", (*data)[i]);
        }
        text += ']';
        return text;
    }
}

namespace CANBridge
{
    CanMessage make_message(const uint32_t id, const std::span<const uint8_t> data)
    {
        return CanMessage{
            .arbitration_id = id,
            .data = std::vector<uint8_t>(data.begin(), data.end()),
            .dlc = static_cast<uint8_t>(data.size()),
            .is_error_frame = false,
            .timestamp = std::nullopt,
            .is_extended_id = id > CAN_SFF_MASK,
        };
    }

    string to_string(const CanMessage& message)
    {
        const string timestamp = format_timestamp(message.timestamp);
        if (message.is_error_frame)
        {
            return format("PyCanMessage: @{} ERROR FRAME", timestamp);
        }
        return format("PyCanMessage: @{} | id=0x{:03X} | dlc={} | data={}", timestamp, message.arbitration_id,
                      format_dlc(message.dlc), format_data(message.data));
    }

    string format_candump(const std::string_view iface_name, const CanMessage& message)
    {
        const size_t len = message.dlc ? *message.dlc : message.data ? message.data->size() : 0;
        string line = format("{}  {:08X}   [{}]  ", iface_name, message.arbitration_id, len);
        if (message.data && !message.is_remote_frame && !message.is_error_frame)
        {
            for (size_t i = 0; i < message.data->size(); ++i)
            {
                if (i != 0)
                {
                    line += ' ';
                }
                line += format("{:02X}", (*message.data)[i]);
            }
        }
        return line;
    }

    tl::expected<can_frame, Error> to_can_frame(const CanMessage& message)
    {
        const size_t payload_len = message.data ? message.data->size() : 0;
        if (payload_len > CAN_MAX_DLEN)
        {
            return unexpected(Error{
                ErrorCode::InvalidMessage,
                format("Payload of {} bytes exceeds the CAN limit of {}", payload_len, CAN_MAX_DLEN)
            });
        }
        const size_t dlc = message.dlc ? *message.dlc : payload_len;
        if (dlc > CAN_MAX_DLEN)
        {
            return unexpected(Error{ErrorCode::InvalidMessage, format("DLC {} exceeds {}", dlc, CAN_MAX_DLEN)});
        }

        const bool extended = message.is_extended_id || message.arbitration_id > CAN_SFF_MASK;
        if (message.arbitration_id > CAN_EFF_MASK)
        {
            return unexpected(Error{
                ErrorCode::InvalidMessage,
                format("Arbitration id 0x{:X} does not fit in 29 bits", message.arbitration_id)
            });
        }

        can_frame frame{};
        frame.can_id = message.arbitration_id;
        if (extended) frame.can_id |= CAN_EFF_FLAG;
        if (message.is_remote_frame) frame.can_id |= CAN_RTR_FLAG;
        if (message.is_error_frame) frame.can_id |= CAN_ERR_FLAG;
        frame.len = static_cast<__u8>(dlc);
        if (message.data && !message.is_remote_frame)
        {
            std::memcpy(frame.data, message.data->data(), std::min(payload_len, dlc));
        }
        return frame;
    }

    CanMessage from_can_frame(const can_frame& frame, const std::optional<double> timestamp)
    {
        CanMessage message;
        message.is_error_frame = (frame.can_id & CAN_ERR_FLAG) != 0;
        message.is_extended_id = (frame.can_id & CAN_EFF_FLAG) != 0;
        message.is_remote_frame = (frame.can_id & CAN_RTR_FLAG) != 0;
        if (message.is_error_frame)
        {
            message.arbitration_id = frame.can_id & CAN_ERR_MASK;
        }
        else
        {
            message.arbitration_id = frame.can_id & (message.is_extended_id ? CAN_EFF_MASK : CAN_SFF_MASK);
        }
        const uint8_t len = std::min<uint8_t>(frame.len, CAN_MAX_DLEN);
        message.dlc = len;
        if (message.is_remote_frame)
        {
            message.data = std::vector<uint8_t>{};
        }
        else
        {
            message.data = std::vector<uint8_t>(frame.data, frame.data + len);
        }
        message.timestamp = timestamp;
        return message;
    }

    std::ostream& operator<<(std::ostream& os, const CanMessage& message)
    {
        return os << to_string(message);
    }
}
