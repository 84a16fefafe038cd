#include "CANBridge/Transport/GsUsb.hpp"
#include "CANBridge/Transport/Netlink.hpp"
#include "CANBridge/Transport/SocketCan.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <optional>
#include <vector>
#include <linux/if_arp.h>

namespace fs = std::filesystem;
using tl::unexpected, std::format, std::string;
using enum CANBridge::ErrorCode;

namespace
{
    std::optional<uint32_t> read_number(const fs::path& file)
    {
        std::ifstream in(file);
        string text;
        if (!(in >> text))
        {
            return std::nullopt;
        }
        int base = 10;
        std::string_view digits = text;
        if (digits.starts_with("0x"))
        {
            digits.remove_prefix(2);
            base = 16;
        }
        uint32_t value{};
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
        if (ec != std::errc{} || ptr != digits.data() + digits.size())
        {
            return std::nullopt;
        }
        return value;
    }

    std::optional<uint32_t> parse_channel_index(const string& channel)
    {
        uint32_t value{};
        const auto [ptr, ec] = std::from_chars(channel.data(), channel.data() + channel.size(), value);
        if (channel.empty() || ec != std::errc{} || ptr != channel.data() + channel.size())
        {
            return std::nullopt;
        }
        return value;
    }

    // The USB device directory is the closest ancestor carrying busnum/devnum
    bool belongs_to_usb_device(const fs::path& netdev, const uint32_t bus, const uint32_t address)
    {
        std::error_code ec;
        fs::path dir = fs::canonical(netdev / "device", ec);
        if (ec)
        {
            return false;
        }
        for (; !dir.empty() && dir != dir.root_path(); dir = dir.parent_path())
        {
            const auto busnum = read_number(dir / "busnum");
            const auto devnum = read_number(dir / "devnum");
            if (busnum && devnum)
            {
                return *busnum == bus && *devnum == address;
            }
        }
        return false;
    }
}

namespace CANBridge
{
    tl::expected<string, Error> find_gs_usb_interface(const UsbCanConfig& config, const fs::path& sysfs_net)
    {
        std::error_code ec;
        fs::directory_iterator it(sysfs_net, ec);
        if (ec)
        {
            return unexpected(Error{
                TransportUnavailable, format("Cannot list {}: {}", sysfs_net.string(), ec.message())
            });
        }

        struct Candidate
        {
            string name;
            uint32_t port;
        };
        std::vector<Candidate> candidates;
        for (const auto& entry : it)
        {
            const auto type = read_number(entry.path() / "type");
            if (!type || *type != ARPHRD_CAN)
            {
                continue;
            }
            if (!belongs_to_usb_device(entry.path(), config.usb_bus, config.usb_address))
            {
                continue;
            }
            auto port = read_number(entry.path() / "dev_port");
            if (!port)
            {
                port = read_number(entry.path() / "dev_id");
            }
            candidates.push_back({entry.path().filename().string(), port.value_or(0)});
        }

        if (candidates.empty())
        {
            return unexpected(Error{
                InterfaceCreationFailed,
                format("No CAN interface found for USB device {}:{}", config.usb_bus, config.usb_address)
            });
        }

        std::ranges::sort(candidates, {}, &Candidate::name);
        if (config.usb_channel.empty())
        {
            return candidates.front().name;
        }

        const auto index = parse_channel_index(config.usb_channel);
        const auto match = std::ranges::find_if(candidates, [&](const Candidate& c)
        {
            return index ? c.port == *index : c.name == config.usb_channel;
        });
        if (match == candidates.end())
        {
            return unexpected(Error{
                InterfaceCreationFailed,
                format("USB device {}:{} has no channel '{}'", config.usb_bus, config.usb_address, config.usb_channel)
            });
        }
        return match->name;
    }

    tl::expected<std::unique_ptr<Bus>, Error> open_gs_usb(const UsbCanConfig& config)
    {
        return find_gs_usb_interface(config).and_then([&](const string& netdev)
        {
            return Netlink::instance()
                   .set(netdev, true, config.bitrate)
                   .map_error([](const Error& e) { return Error{InterfaceCreationFailed, e.message}; })
                   .and_then([&] { return open_socketcan(SocketCanConfig{.channel = netdev}); });
        });
    }
}
