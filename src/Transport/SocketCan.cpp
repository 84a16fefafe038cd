#include "CANBridge/Transport/SocketCan.hpp"
#include "CANBridge/Util/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <linux/can.h>
#include <linux/can/error.h>
#include <linux/can/raw.h>
#include <net/if.h>

using tl::unexpected, std::format, std::string_view;
using enum CANBridge::ErrorCode;

namespace CANBridge
{
    SocketCanBus::SocketCanBus(const string_view interface_name) : interface_name(interface_name),
                                                                   s(Util::make_sink("SocketCan", interface_name))
    {
    }

    SocketCanBus::~SocketCanBus()
    {
        if (sock_fd != -1)
        {
            close(sock_fd);
        }
    }

    tl::expected<void, Error> SocketCanBus::connect() noexcept
    {
        if (sock_fd != -1)
        {
            close(sock_fd);
            sock_fd = -1;
        }
        sock_fd = socket(PF_CAN, SOCK_RAW, CAN_RAW);
        if (sock_fd == -1)
        {
            const int err = errno;
            // No CAN support in the kernel at all
            const ErrorCode code = (err == EAFNOSUPPORT || err == EPROTONOSUPPORT)
                                       ? TransportUnavailable
                                       : InterfaceCreationFailed;
            return unexpected(Error{code, format("Failed to create CAN socket: {}", strerror(err))});
        }

        if (interface_name.size() >= IFNAMSIZ)
        {
            close(sock_fd);
            sock_fd = -1;
            return unexpected(Error{
                InterfaceCreationFailed, format("CAN interface name '{}' is too long", interface_name)
            });
        }
        ifreq ifr{};
        std::memcpy(ifr.ifr_name, interface_name.data(), interface_name.size());
        ifr.ifr_name[interface_name.size()] = '\0';
        if (ioctl(sock_fd, SIOCGIFINDEX, &ifr) == -1)
        {
            const int err = errno;
            close(sock_fd);
            sock_fd = -1;
            return unexpected(Error{
                InterfaceCreationFailed,
                format("Failed to get CAN interface '{}' index: {}", interface_name, strerror(err))
            });
        }

        constexpr can_err_mask_t err_mask = CAN_ERR_MASK;
        if (setsockopt(sock_fd, SOL_CAN_RAW, CAN_RAW_ERR_FILTER, &err_mask, sizeof(err_mask)) == -1)
        {
            XTR_LOGL(warning, s, "Error frames on {} will not be reported: {}", interface_name, strerror(errno));
        }
        constexpr int enable = 1;
        if (setsockopt(sock_fd, SOL_SOCKET, SO_TIMESTAMP, &enable, sizeof(enable)) == -1)
        {
            XTR_LOGL(warning, s, "Frames on {} will carry no timestamp: {}", interface_name, strerror(errno));
        }

        sockaddr_can addr = {
            .can_family = AF_CAN,
            .can_ifindex = ifr.ifr_ifindex,
        };

        if (bind(sock_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1)
        {
            const int err = errno;
            close(sock_fd);
            sock_fd = -1;
            return unexpected(Error{InterfaceCreationFailed, format("Failed to bind CAN socket: {}", strerror(err))});
        }

        const int flags = fcntl(sock_fd, F_GETFL, 0);
        fcntl(sock_fd, F_SETFL, flags | O_NONBLOCK);
        XTR_LOGL(info, s, "Bound to {}", interface_name);
        return {};
    }

    tl::expected<void, Error> SocketCanBus::flush() const noexcept
    {
        if (sock_fd < 0)
        {
            return unexpected(Error{BusClosed, "Cannot flush with invalid socket descriptor"});
        }
        can_frame frame{};
        while (true)
        {
            if (const ssize_t nbytes = read(sock_fd, &frame, sizeof(can_frame)); nbytes > 0)
            {
            }
            else if (nbytes == -1 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENETDOWN))
            {
                break;
            }
            else
            {
                return unexpected(Error{BusRecvError, format("Failed to flush linux buffer: {}", strerror(errno))});
            }
        }
        return {};
    }

    tl::expected<bool, Error> SocketCanBus::wait_readable(const std::optional<std::chrono::milliseconds> timeout) const
    {
        pollfd pfd{.fd = sock_fd, .events = POLLIN, .revents = 0};
        const int timeout_ms = timeout ? static_cast<int>(timeout->count()) : -1;
        while (true)
        {
            const int ready = poll(&pfd, 1, timeout_ms);
            if (ready == -1)
            {
                if (errno == EINTR && !timeout) continue;
                if (errno == EINTR) return false;
                return unexpected(Error{BusRecvError, format("Failed to poll CAN socket: {}", strerror(errno))});
            }
            return ready > 0;
        }
    }

    tl::expected<std::optional<CanMessage>, Error> SocketCanBus::recv(
        const std::optional<std::chrono::milliseconds> timeout)
    {
        if (sock_fd < 0)
        {
            return unexpected(Error{BusClosed, format("CAN socket on {} is not connected", interface_name)});
        }

        while (true)
        {
            can_frame frame{};
            iovec iov{.iov_base = &frame, .iov_len = sizeof(frame)};
            alignas(cmsghdr) char control[CMSG_SPACE(sizeof(timeval))]{};
            msghdr msg{};
            msg.msg_iov = &iov;
            msg.msg_iovlen = 1;
            msg.msg_control = control;
            msg.msg_controllen = sizeof(control);

            const ssize_t nbytes = recvmsg(sock_fd, &msg, 0);
            if (nbytes == -1)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                {
                    if (timeout && timeout->count() == 0)
                    {
                        return std::nullopt;
                    }
                    auto readable = wait_readable(timeout);
                    if (!readable)
                    {
                        return unexpected(readable.error());
                    }
                    if (!*readable)
                    {
                        return std::nullopt;
                    }
                    continue;
                }
                if (errno == EINTR)
                {
                    continue;
                }
                return unexpected(Error{
                    BusRecvError, format("Failed to read from {}: {}", interface_name, strerror(errno))
                });
            }
            if (static_cast<size_t>(nbytes) != sizeof(can_frame))
            {
                return unexpected(Error{
                    BusRecvError, format("Incomplete CAN frame of {} bytes on {}", nbytes, interface_name)
                });
            }

            std::optional<double> timestamp;
            for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg); cmsg; cmsg = CMSG_NXTHDR(&msg, cmsg))
            {
                if (cmsg->cmsg_level == SOL_SOCKET && cmsg->cmsg_type == SCM_TIMESTAMP)
                {
                    timeval tv{};
                    std::memcpy(&tv, CMSG_DATA(cmsg), sizeof(tv));
                    timestamp = static_cast<double>(tv.tv_sec) + static_cast<double>(tv.tv_usec) / 1e6;
                }
            }
            return from_can_frame(frame, timestamp);
        }
    }

    tl::expected<void, Error> SocketCanBus::send(const CanMessage& message)
    {
        if (sock_fd < 0)
        {
            return unexpected(Error{BusClosed, format("CAN socket on {} is not connected", interface_name)});
        }
        return to_can_frame(message).and_then([&](const can_frame& frame) -> tl::expected<void, Error>
        {
            constexpr int MAX_TX_RETRIES = 50;
            for (int attempt = 0;; ++attempt)
            {
                const ssize_t result = write(sock_fd, &frame, sizeof(frame));
                if (result == -1 && errno == EINTR)
                {
                    continue;
                }
                if (result == -1 && (errno == EAGAIN || errno == ENOBUFS) && attempt < MAX_TX_RETRIES)
                {
                    // Transmit queue full, wait for room instead of dropping the frame
                    pollfd pfd{.fd = sock_fd, .events = POLLOUT, .revents = 0};
                    (void)poll(&pfd, 1, 10);
                    continue;
                }
                if (result == -1)
                {
                    return unexpected(Error{
                        BusSendError, format("Failed to send CAN message: {}", strerror(errno))
                    });
                }
                if (static_cast<size_t>(result) != sizeof(frame))
                {
                    return unexpected(Error{BusSendError, format("Incomplete write of {} bytes", result)});
                }
                return {};
            }
        });
    }

    tl::expected<std::unique_ptr<Bus>, Error> open_socketcan(const SocketCanConfig& config)
    {
        auto bus = std::make_unique<SocketCanBus>(config.channel);
        return bus->connect()
                  .and_then([&] { return bus->flush(); })
                  .map([&]() -> std::unique_ptr<Bus> { return std::move(bus); });
    }
}
