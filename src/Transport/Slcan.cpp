#include "CANBridge/Transport/Slcan.hpp"
#include "CANBridge/Transport/Netlink.hpp"
#include "CANBridge/Util/Logger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <termios.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/tty.h>
#include <net/if.h>

using tl::unexpected, std::format, std::string, std::string_view;
using enum CANBridge::ErrorCode;

namespace
{
    struct BitrateCommand
    {
        uint32_t bitrate;
        std::string_view command;
    };

    constexpr std::array<BitrateCommand, 10> BITRATE_COMMANDS{{
        {10000, "S0"},
        {20000, "S1"},
        {50000, "S2"},
        {100000, "S3"},
        {125000, "S4"},
        {250000, "S5"},
        {500000, "S6"},
        {750000, "S7"},
        {1000000, "S8"},
        {83300, "S9"},
    }};
}

namespace CANBridge
{
    std::optional<string> slcan_bitrate_command(const uint32_t bitrate)
    {
        for (const auto& [rate, command] : BITRATE_COMMANDS)
        {
            if (rate == bitrate)
            {
                return string(command);
            }
        }
        return std::nullopt;
    }

    SlcanBus::SlcanBus(const SerialCanConfig& config) : serial_port(config.serial_port), bitrate(config.bitrate),
                                                        s(Util::make_sink("Slcan", config.serial_port))
    {
    }

    SlcanBus::~SlcanBus()
    {
        detach();
    }

    tl::expected<void, Error> SlcanBus::write_command(const string_view command) const
    {
        const string line = format("{}\r", command);
        if (write(tty_fd, line.data(), line.size()) != static_cast<ssize_t>(line.size()))
        {
            return unexpected(Error{
                InterfaceCreationFailed, format("Failed to write '{}' to {}: {}", command, serial_port, strerror(errno))
            });
        }
        return {};
    }

    tl::expected<void, Error> SlcanBus::attach()
    {
        const auto bitrate_command = slcan_bitrate_command(bitrate);
        if (!bitrate_command)
        {
            return unexpected(Error{
                InterfaceCreationFailed, format("Bitrate {} is not supported by slcan adapters", bitrate)
            });
        }

        tty_fd = open(serial_port.c_str(), O_RDWR | O_NOCTTY);
        if (tty_fd == -1)
        {
            return unexpected(Error{
                InterfaceCreationFailed, format("Failed to open {}: {}", serial_port, strerror(errno))
            });
        }

        termios tios{};
        if (tcgetattr(tty_fd, &tios) == -1)
        {
            return unexpected(Error{
                InterfaceCreationFailed, format("{} is not a terminal: {}", serial_port, strerror(errno))
            });
        }
        cfmakeraw(&tios);
        cfsetispeed(&tios, B115200);
        cfsetospeed(&tios, B115200);
        if (tcsetattr(tty_fd, TCSANOW, &tios) == -1)
        {
            return unexpected(Error{
                InterfaceCreationFailed, format("Failed to configure {}: {}", serial_port, strerror(errno))
            });
        }

        auto configured = write_command("C")
                          .and_then([&] { return write_command(*bitrate_command); })
                          .and_then([&] { return write_command("O"); });
        if (!configured)
        {
            return configured;
        }

        constexpr int ldisc = N_SLCAN;
        if (ioctl(tty_fd, TIOCSETD, &ldisc) == -1)
        {
            const int err = errno;
            return unexpected(Error{
                err == EINVAL ? TransportUnavailable : InterfaceCreationFailed,
                format("Failed to attach slcan line discipline to {}: {}", serial_port, strerror(err))
            });
        }
        ldisc_attached = true;

        char name[IFNAMSIZ]{};
        if (ioctl(tty_fd, SIOCGIFNAME, name) == -1)
        {
            return unexpected(Error{
                InterfaceCreationFailed, format("Failed to get slcan interface of {}: {}", serial_port, strerror(errno))
            });
        }
        netdev = name;
        XTR_LOGL(info, s, "{} attached as {}", serial_port, netdev);

        auto up = Netlink::instance().set(netdev, true);
        if (!up)
        {
            return unexpected(Error{InterfaceCreationFailed, up.error().message});
        }

        socket = std::make_unique<SocketCanBus>(netdev);
        return socket->connect();
    }

    void SlcanBus::detach() noexcept
    {
        socket.reset();
        if (ldisc_attached && !netdev.empty())
        {
            if (auto down = Netlink::instance().set(netdev, false); !down)
            {
                XTR_LOGL(warning, s, "Failed to bring {} down: {}", netdev, down.error().message);
            }
        }
        if (tty_fd != -1)
        {
            if (ldisc_attached)
            {
                constexpr int ldisc = N_TTY;
                if (ioctl(tty_fd, TIOCSETD, &ldisc) == -1)
                {
                    XTR_LOGL(warning, s, "Failed to restore line discipline of {}: {}", serial_port,
                             strerror(errno));
                }
                ldisc_attached = false;
            }
            if (auto closed = write_command("C"); !closed)
            {
                XTR_LOGL(warning, s, "{}", closed.error().message);
            }
            close(tty_fd);
            tty_fd = -1;
        }
    }

    tl::expected<std::optional<CanMessage>, Error> SlcanBus::recv(const std::optional<std::chrono::milliseconds> timeout)
    {
        if (!socket)
        {
            return unexpected(Error{BusClosed, format("{} is not attached", serial_port)});
        }
        return socket->recv(timeout);
    }

    tl::expected<void, Error> SlcanBus::send(const CanMessage& message)
    {
        if (!socket)
        {
            return unexpected(Error{BusClosed, format("{} is not attached", serial_port)});
        }
        return socket->send(message);
    }

    int SlcanBus::fileno() const noexcept
    {
        return socket ? socket->fileno() : -1;
    }

    tl::expected<std::unique_ptr<Bus>, Error> open_slcan(const SerialCanConfig& config)
    {
        auto bus = std::make_unique<SlcanBus>(config);
        return bus->attach().map([&]() -> std::unique_ptr<Bus> { return std::move(bus); });
    }
}
