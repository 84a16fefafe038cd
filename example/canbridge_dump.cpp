#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "CANBridge/Interface/Interface.hpp"

using namespace CANBridge;

static std::atomic<bool> keep_running{true};
static std::atomic<int> exit_status{0};

void signal_handler(const int signum)
{
    if (signum == SIGINT || signum == SIGTERM)
    {
        keep_running = false;
    }
}

static void print_usage(const char* program)
{
    std::cerr << "Usage: " << program << " <bus> [--poll] [--placeholder-name]\n"
        << "  socketcan  CHANNEL\n"
        << "  slcan      PORT BITRATE\n"
        << "  socketcand HOST PORT CHANNEL\n"
        << "  gsusb      BUS ADDRESS CHANNEL BITRATE" << std::endl;
}

static std::optional<uint32_t> parse_number(const std::string_view text)
{
    uint32_t value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

// Positional arguments after the bus kind, flags already removed
static std::optional<BusConfig> parse_bus(const std::vector<std::string_view>& args)
{
    if (args.empty())
    {
        return std::nullopt;
    }
    const std::string_view kind = args[0];
    if (kind == "socketcan" && args.size() == 2)
    {
        return SocketCanConfig{.channel = std::string(args[1])};
    }
    if (kind == "slcan" && args.size() == 3)
    {
        if (const auto bitrate = parse_number(args[2]))
        {
            return SerialCanConfig{.bitrate = *bitrate, .serial_port = std::string(args[1])};
        }
    }
    if (kind == "socketcand" && args.size() == 4)
    {
        if (const auto port = parse_number(args[2]); port && *port <= 0xFFFF)
        {
            return SocketcandConfig{
                .host = std::string(args[1]), .channel = std::string(args[3]), .port = static_cast<uint16_t>(*port)
            };
        }
    }
    if (kind == "gsusb" && args.size() == 5)
    {
        const auto bus = parse_number(args[1]);
        const auto address = parse_number(args[2]);
        const auto bitrate = parse_number(args[4]);
        if (bus && address && bitrate)
        {
            return UsbCanConfig{
                .bitrate = *bitrate, .usb_channel = std::string(args[3]), .usb_bus = *bus, .usb_address = *address
            };
        }
    }
    return std::nullopt;
}

int main(const int argc, char* argv[])
{
    bool poll_mode = false;
    bool placeholder_name = false;
    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--poll")
        {
            poll_mode = true;
        }
        else if (arg == "--placeholder-name")
        {
            placeholder_name = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    const auto config = parse_bus(positional);
    if (!config)
    {
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto interface = Interface::create(*config);
    if (!interface)
    {
        std::cerr << "Failed to open " << describe(*config) << ": " << to_string(interface.error().code) << ": "
            << interface.error().message << std::endl;
        return 1;
    }
    auto& can = **interface;
    const std::string iface_name = placeholder_name
                                       ? std::string(to_string(kind_of(*config)))
                                       : std::string(can.channel_info());

    if (poll_mode)
    {
        while (keep_running)
        {
            auto message = can.recv(std::chrono::milliseconds(100));
            if (!message)
            {
                std::cerr << to_string(message.error().code) << ": " << message.error().message << std::endl;
                return 2;
            }
            if (*message)
            {
                std::cout << format_candump(iface_name, **message) << std::endl;
            }
        }
        return 0;
    }

    auto registered = can.register_rx_callback([&](const CanMessage& message)
    {
        std::cout << format_candump(iface_name, message) << std::endl;
    }, [](const Error& e)
    {
        std::cerr << to_string(e.code) << ": " << e.message << std::endl;
        exit_status = 2;
        keep_running = false;
    });
    if (!registered)
    {
        std::cerr << "Failed to register callback: " << registered.error().message << std::endl;
        return 1;
    }

    while (keep_running)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    (void)can.stop_notifier().or_else([](const Error& e)
    {
        std::cerr << "Failed to stop notifier: " << e.message << std::endl;
    });
    return exit_status.load();
}
