#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

#include "CANBridge/Transport/GsUsb.hpp"

using namespace CANBridge;
namespace fs = std::filesystem;

static int result_code = EXIT_SUCCESS;

static void check(const bool condition, const std::string& what)
{
    if (condition)
    {
        std::cout << "PASS: " << what << std::endl;
    }
    else
    {
        std::cerr << "FAIL: " << what << std::endl;
        result_code = EXIT_FAILURE;
    }
}

static void write_file(const fs::path& file, const std::string& text)
{
    fs::create_directories(file.parent_path());
    std::ofstream(file) << text << "\n";
}

// One network interface under <root>/net whose device link points into a USB interface directory
static void add_netdev(const fs::path& root, const std::string& name, const std::string& type,
                       const fs::path& usb_interface, const std::string& port_file, const std::string& port)
{
    const fs::path netdev = root / "net" / name;
    write_file(netdev / "type", type);
    write_file(netdev / port_file, port);
    fs::create_directory_symlink(usb_interface, netdev / "device");
}

static void add_usb_device(const fs::path& device, const std::string& busnum, const std::string& devnum)
{
    write_file(device / "busnum", busnum);
    write_file(device / "devnum", devnum);
    fs::create_directories(device / (device.filename().string() + ":1.0"));
}

int main()
{
    std::cout << "--- CANBridge gs_usb Discovery Test ---" << std::endl;

    const fs::path root = fs::temp_directory_path() / ("canbridge_sysfs_" + std::to_string(getpid()));
    fs::remove_all(root);

    // Two-channel adapter on 1:4, single-channel adapter on 2:7 exposing only dev_id, one ethernet port
    add_usb_device(root / "devices/usb1/1-1", "1", "4");
    add_usb_device(root / "devices/usb2/2-3", "2", "7");
    add_netdev(root, "can0", "280", root / "devices/usb1/1-1/1-1:1.0", "dev_port", "0");
    add_netdev(root, "can1", "280", root / "devices/usb1/1-1/1-1:1.0", "dev_port", "1");
    add_netdev(root, "can2", "280", root / "devices/usb2/2-3/2-3:1.0", "dev_id", "0x0");
    add_netdev(root, "eth0", "1", root / "devices/usb1/1-1/1-1:1.0", "dev_port", "0");
    const fs::path net = root / "net";

    std::cout << "\nTEST 1: Channel selection" << std::endl;
    auto first = find_gs_usb_interface({.bitrate = 500000, .usb_channel = "", .usb_bus = 1, .usb_address = 4}, net);
    check(first && *first == "can0", "empty channel picks the first interface");
    auto second = find_gs_usb_interface({.bitrate = 500000, .usb_channel = "1", .usb_bus = 1, .usb_address = 4}, net);
    check(second && *second == "can1", "numeric channel matches dev_port");
    auto named = find_gs_usb_interface({.bitrate = 500000, .usb_channel = "can1", .usb_bus = 1, .usb_address = 4},
                                       net);
    check(named && *named == "can1", "channel may name the interface");
    auto by_id = find_gs_usb_interface({.bitrate = 250000, .usb_channel = "0", .usb_bus = 2, .usb_address = 7}, net);
    check(by_id && *by_id == "can2", "dev_id used when dev_port is missing");

    std::cout << "\nTEST 2: Lookup failures" << std::endl;
    auto no_channel = find_gs_usb_interface({.bitrate = 500000, .usb_channel = "5", .usb_bus = 1, .usb_address = 4},
                                            net);
    check(!no_channel && no_channel.error().code == ErrorCode::InterfaceCreationFailed, "unknown channel rejected");
    auto no_device = find_gs_usb_interface({.bitrate = 500000, .usb_channel = "0", .usb_bus = 3, .usb_address = 1},
                                           net);
    check(!no_device && no_device.error().code == ErrorCode::InterfaceCreationFailed, "unknown device rejected");
    auto no_sysfs = find_gs_usb_interface({.bitrate = 500000, .usb_channel = "0", .usb_bus = 1, .usb_address = 4},
                                          root / "missing");
    check(!no_sysfs && no_sysfs.error().code == ErrorCode::TransportUnavailable, "missing sysfs reported");

    std::error_code ec;
    fs::remove_all(root, ec);

    std::cout << "\n--- CANBridge gs_usb Discovery Test Finished ---" << std::endl;
    return result_code;
}
