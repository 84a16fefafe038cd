#ifndef CANBRIDGE_ERROR_HPP
#define CANBRIDGE_ERROR_HPP

#include <string>
#include <string_view>
#include <utility>

namespace CANBridge
{
    enum class ErrorCode
    {
        // Construction
        TransportUnavailable,
        InterfaceCreationFailed,
        NotifierCreationFailed,
        ListenerRegistrationFailed,

        // Bus
        BusRecvError,
        BusSendError,
        BusClosed,
        InvalidMessage,
        ConsumptionModeConflict,

        // Notifier
        EpollError,
        NotifierStopError,
        ListenerCallbackError,

        // Netlink
        NetlinkError,
    };

    struct Error
    {
        Error(const ErrorCode c, std::string msg) : code(c), message(std::move(msg))
        {
        }

        ErrorCode code;
        std::string message;
    };

    constexpr std::string_view to_string(const ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::TransportUnavailable: return "transport module unavailable";
        case ErrorCode::InterfaceCreationFailed: return "interface creation failed";
        case ErrorCode::NotifierCreationFailed: return "notifier creation failed";
        case ErrorCode::ListenerRegistrationFailed: return "listener registration failed";
        case ErrorCode::BusRecvError: return "bus receive error";
        case ErrorCode::BusSendError: return "bus send error";
        case ErrorCode::BusClosed: return "bus closed";
        case ErrorCode::InvalidMessage: return "invalid message";
        case ErrorCode::ConsumptionModeConflict: return "consumption mode conflict";
        case ErrorCode::EpollError: return "epoll error";
        case ErrorCode::NotifierStopError: return "notifier stop error";
        case ErrorCode::ListenerCallbackError: return "listener callback error";
        case ErrorCode::NetlinkError: return "netlink error";
        }
        return "unknown error";
    }
}
#endif //CANBRIDGE_ERROR_HPP
