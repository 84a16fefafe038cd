#include "CANBridge/Transport/Socketcand.hpp"
#include "CANBridge/Config.hpp"
#include "CANBridge/Util/Logger.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <vector>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

using tl::unexpected, std::format, std::string, std::string_view;
using enum CANBridge::ErrorCode;

namespace
{
    std::vector<string_view> split_words(string_view text)
    {
        std::vector<string_view> words;
        while (!text.empty())
        {
            const auto start = text.find_first_not_of(' ');
            if (start == string_view::npos)
            {
                break;
            }
            text.remove_prefix(start);
            const auto end = text.find(' ');
            words.push_back(text.substr(0, end));
            if (end == string_view::npos)
            {
                break;
            }
            text.remove_prefix(end);
        }
        return words;
    }

    tl::expected<std::vector<uint8_t>, CANBridge::Error> parse_hex_payload(const string_view hex)
    {
        if (hex.size() % 2 != 0)
        {
            return unexpected(CANBridge::Error{BusRecvError, format("Odd length payload '{}'", hex)});
        }
        std::vector<uint8_t> data;
        for (size_t i = 0; i < hex.size(); i += 2)
        {
            uint8_t byte{};
            if (const auto [ptr, ec] = std::from_chars(hex.data() + i, hex.data() + i + 2, byte, 16);
                ec != std::errc{} || ptr != hex.data() + i + 2)
            {
                return unexpected(CANBridge::Error{BusRecvError, format("Invalid payload '{}'", hex)});
            }
            data.push_back(byte);
        }
        return data;
    }
}

namespace CANBridge
{
    tl::expected<std::optional<CanMessage>, Error> parse_socketcand_element(const string_view element)
    {
        if (!element.starts_with("<") || !element.ends_with(">"))
        {
            return unexpected(Error{BusRecvError, format("Malformed socketcand element '{}'", element)});
        }
        const auto words = split_words(element.substr(1, element.size() - 2));
        if (words.empty())
        {
            return unexpected(Error{BusRecvError, "Empty socketcand element"});
        }
        if (words[0] == "error")
        {
            return unexpected(Error{BusRecvError, format("socketcand reported {}", element)});
        }
        if (words[0] != "frame")
        {
            return std::nullopt;
        }
        if (words.size() < 3 || words.size() > 4)
        {
            return unexpected(Error{BusRecvError, format("Malformed frame '{}'", element)});
        }

        CanMessage message;
        const string_view id = words[1];
        if (const auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), message.arbitration_id, 16);
            ec != std::errc{} || ptr != id.data() + id.size())
        {
            return unexpected(Error{BusRecvError, format("Invalid arbitration id in '{}'", element)});
        }
        message.is_extended_id = id.size() > 3;

        double timestamp{};
        const string_view ts = words[2];
        if (const auto [ptr, ec] = std::from_chars(ts.data(), ts.data() + ts.size(), timestamp);
            ec != std::errc{} || ptr != ts.data() + ts.size())
        {
            return unexpected(Error{BusRecvError, format("Invalid timestamp in '{}'", element)});
        }
        message.timestamp = timestamp;

        auto data = parse_hex_payload(words.size() == 4 ? words[3] : string_view{});
        if (!data)
        {
            return unexpected(data.error());
        }
        if (data->size() > CAN_MAX_DLEN)
        {
            return unexpected(Error{BusRecvError, format("Payload too long in '{}'", element)});
        }
        message.dlc = static_cast<uint8_t>(data->size());
        message.data = std::move(*data);
        return message;
    }

    string format_socketcand_send(const CanMessage& message)
    {
        const bool extended = message.is_extended_id || message.arbitration_id > CAN_SFF_MASK;
        string text = extended
                          ? format("< send {:08X} ", message.arbitration_id)
                          : format("< send {:03X} ", message.arbitration_id);
        const size_t len = message.data ? message.data->size() : 0;
        text += format("{}", len);
        if (message.data)
        {
            for (const uint8_t byte : *message.data)
            {
                text += format(" {:02X}", byte);
            }
        }
        text += " >";
        return text;
    }

    SocketcandBus::SocketcandBus(const SocketcandConfig& config) : config(config),
                                                                   info(format("{}@{}:{}", config.channel,
                                                                               config.host, config.port)),
                                                                   s(Util::make_sink("Socketcand", config.channel))
    {
    }

    SocketcandBus::~SocketcandBus()
    {
        if (sock_fd != -1)
        {
            close(sock_fd);
        }
    }

    tl::expected<void, Error> SocketcandBus::connect()
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* result = nullptr;
        const string port = format("{}", config.port);
        if (const int err = getaddrinfo(config.host.c_str(), port.c_str(), &hints, &result); err != 0)
        {
            return unexpected(Error{
                InterfaceCreationFailed, format("Failed to resolve {}: {}", config.host, gai_strerror(err))
            });
        }

        const auto deadline = Clock::now() + Config::SOCKETCAND_CONNECT_TIMEOUT;
        string last_error = "no address";
        for (const addrinfo* ai = result; ai; ai = ai->ai_next)
        {
            const int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK, ai->ai_protocol);
            if (fd == -1)
            {
                last_error = strerror(errno);
                continue;
            }
            if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == -1 && errno != EINPROGRESS)
            {
                last_error = strerror(errno);
                close(fd);
                continue;
            }
            pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (poll(&pfd, 1, static_cast<int>(std::max<int64_t>(remaining.count(), 0))) <= 0)
            {
                last_error = "connection timed out";
                close(fd);
                continue;
            }
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == -1 || so_error != 0)
            {
                last_error = strerror(so_error != 0 ? so_error : errno);
                close(fd);
                continue;
            }
            sock_fd = fd;
            break;
        }
        freeaddrinfo(result);

        if (sock_fd == -1)
        {
            return unexpected(Error{
                InterfaceCreationFailed,
                format("Failed to connect to socketcand {}:{}: {}", config.host, config.port, last_error)
            });
        }
        constexpr int enable = 1;
        setsockopt(sock_fd, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable));

        auto handshake = expect("< hi >", deadline)
                         .and_then([&] { return write_all(format("< open {} >", config.channel)); })
                         .and_then([&] { return expect("< ok >", deadline); })
                         .and_then([&] { return write_all("< rawmode >"); })
                         .and_then([&] { return expect("< ok >", deadline); });
        if (!handshake)
        {
            return unexpected(Error{InterfaceCreationFailed, handshake.error().message});
        }
        XTR_LOGL(info, s, "Connected to {}", info);
        return {};
    }

    tl::expected<void, Error> SocketcandBus::expect(const string_view element, const Clock::time_point deadline)
    {
        auto received = next_element(deadline);
        if (!received)
        {
            return unexpected(received.error());
        }
        if (!*received)
        {
            return unexpected(Error{BusRecvError, format("Timed out waiting for '{}'", element)});
        }
        if (**received != element)
        {
            return unexpected(Error{BusRecvError, format("Expected '{}', got '{}'", element, **received)});
        }
        return {};
    }

    tl::expected<std::optional<string>, Error> SocketcandBus::next_element(
        const std::optional<Clock::time_point> deadline)
    {
        while (true)
        {
            if (const auto end = rx_buffer.find('>'); end != string::npos)
            {
                const auto start = rx_buffer.find('<');
                if (start == string::npos || start > end)
                {
                    const string garbage = rx_buffer.substr(0, end + 1);
                    rx_buffer.erase(0, end + 1);
                    return unexpected(Error{BusRecvError, format("Malformed socketcand data '{}'", garbage)});
                }
                string element = rx_buffer.substr(start, end - start + 1);
                rx_buffer.erase(0, end + 1);
                return element;
            }

            char chunk[512];
            const ssize_t nbytes = read(sock_fd, chunk, sizeof(chunk));
            if (nbytes > 0)
            {
                rx_buffer.append(chunk, static_cast<size_t>(nbytes));
                continue;
            }
            if (nbytes == 0)
            {
                return unexpected(Error{BusClosed, format("socketcand {} closed the connection", info)});
            }
            if (errno == EINTR)
            {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK)
            {
                return unexpected(Error{BusRecvError, format("Failed to read from {}: {}", info, strerror(errno))});
            }

            int timeout_ms = -1;
            if (deadline)
            {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
                if (remaining.count() <= 0)
                {
                    return std::nullopt;
                }
                timeout_ms = static_cast<int>(remaining.count());
            }
            pollfd pfd{.fd = sock_fd, .events = POLLIN, .revents = 0};
            if (poll(&pfd, 1, timeout_ms) == -1 && errno != EINTR)
            {
                return unexpected(Error{BusRecvError, format("Failed to poll {}: {}", info, strerror(errno))});
            }
        }
    }

    tl::expected<void, Error> SocketcandBus::write_all(string_view text)
    {
        while (!text.empty())
        {
            const ssize_t written = ::send(sock_fd, text.data(), text.size(), MSG_NOSIGNAL);
            if (written == -1)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                {
                    pollfd pfd{.fd = sock_fd, .events = POLLOUT, .revents = 0};
                    (void)poll(&pfd, 1, -1);
                    continue;
                }
                return unexpected(Error{BusSendError, format("Failed to write to {}: {}", info, strerror(errno))});
            }
            text.remove_prefix(static_cast<size_t>(written));
        }
        return {};
    }

    tl::expected<std::optional<CanMessage>, Error> SocketcandBus::recv(
        const std::optional<std::chrono::milliseconds> timeout)
    {
        if (sock_fd == -1)
        {
            return unexpected(Error{BusClosed, format("socketcand {} is not connected", info)});
        }
        std::optional<Clock::time_point> deadline;
        if (timeout)
        {
            deadline = Clock::now() + *timeout;
        }
        while (true)
        {
            auto element = next_element(deadline);
            if (!element)
            {
                return unexpected(element.error());
            }
            if (!*element)
            {
                return std::nullopt;
            }
            auto message = parse_socketcand_element(**element);
            if (!message)
            {
                return unexpected(message.error());
            }
            if (*message)
            {
                return message;
            }
            XTR_LOGL(debug, s, "Ignoring {}", **element);
        }
    }

    tl::expected<void, Error> SocketcandBus::send(const CanMessage& message)
    {
        if (sock_fd == -1)
        {
            return unexpected(Error{BusClosed, format("socketcand {} is not connected", info)});
        }
        if (message.data && message.data->size() > CAN_MAX_DLEN)
        {
            return unexpected(Error{InvalidMessage, format("Payload exceeds {} bytes", CAN_MAX_DLEN)});
        }
        std::lock_guard lock(tx_mutex);
        return write_all(format_socketcand_send(message));
    }

    tl::expected<std::unique_ptr<Bus>, Error> open_socketcand(const SocketcandConfig& config)
    {
        auto bus = std::make_unique<SocketcandBus>(config);
        return bus->connect().map([&]() -> std::unique_ptr<Bus> { return std::move(bus); });
    }
}
