#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "CANBridge/Interface/Interface.hpp"
#include "CANBridge/Transport/Socketcand.hpp"
#include "CANBridge/Transport/TransportRegistry.hpp"

using namespace CANBridge;

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

// Loopback TCP listener on an ephemeral port
static int listen_loopback(uint16_t& port)
{
    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (fd == -1 || bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1 || listen(fd, 1) == -1)
    {
        std::cerr << "FAIL: cannot listen on loopback: " << strerror(errno) << std::endl;
        std::exit(EXIT_FAILURE);
    }
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
    return fd;
}

static void write_text(const int fd, const std::string& text)
{
    [[maybe_unused]] const ssize_t _ = send(fd, text.data(), text.size(), MSG_NOSIGNAL);
}

// Reads until the accumulated text contains token, returns everything read
static std::string read_until(const int fd, const std::string& token)
{
    std::string text;
    char chunk[256];
    while (text.find(token) == std::string::npos)
    {
        const ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n <= 0)
        {
            break;
        }
        text.append(chunk, static_cast<size_t>(n));
    }
    return text;
}

// Accepts one client and completes the rawmode handshake, -1 on failure
static int accept_rawmode(const int listen_fd, const std::string& channel)
{
    const int fd = accept(listen_fd, nullptr, nullptr);
    if (fd == -1)
    {
        return -1;
    }
    write_text(fd, "< hi >");
    read_until(fd, "< open " + channel + " >");
    write_text(fd, "< ok >");
    read_until(fd, "< rawmode >");
    write_text(fd, "< ok >");
    return fd;
}

int main()
{
    std::cout << "--- CANBridge socketcand Test ---" << std::endl;
    TransportRegistry::instance().restore_defaults();

    std::cout << "\nTEST 1: Element parsing and formatting" << std::endl;
    auto frame = parse_socketcand_element("< frame 123 23.424242 11223344 >");
    check(frame && *frame && (*frame)->arbitration_id == 0x123 && !(*frame)->is_extended_id &&
          (*frame)->dlc == 4 && *(*frame)->data == std::vector<uint8_t>{0x11, 0x22, 0x33, 0x44} &&
          (*frame)->timestamp == 23.424242, "standard frame parsed");
    auto ext = parse_socketcand_element("< frame 18DAF110 1.5 >");
    check(ext && *ext && (*ext)->is_extended_id && (*ext)->arbitration_id == 0x18DAF110 && (*ext)->data->empty(),
          "extended frame without payload parsed");
    auto ok = parse_socketcand_element("< ok >");
    check(ok && !*ok, "non-frame element skipped");
    auto error = parse_socketcand_element("< error bus off >");
    check(!error && error.error().code == ErrorCode::BusRecvError, "server error reported");
    auto odd = parse_socketcand_element("< frame 123 1.0 ABC >");
    check(!odd && odd.error().code == ErrorCode::BusRecvError, "odd payload rejected");
    auto garbage = parse_socketcand_element("frame 123");
    check(!garbage, "element without brackets rejected");
    check(format_socketcand_send(make_message(0x321, std::vector<uint8_t>{1, 2})) == "< send 321 2 01 02 >",
          "standard send command");
    check(format_socketcand_send(make_message(0x18DAF110, {})) == "< send 18DAF110 0 >", "extended send command");

    std::cout << "\nTEST 2: Session against a local socketcand" << std::endl;
    uint16_t port{};
    const int listen_fd = listen_loopback(port);
    std::atomic<bool> handshake_seen{false};
    std::string send_command;
    std::thread server([&]
    {
        const int fd = accept(listen_fd, nullptr, nullptr);
        if (fd == -1)
        {
            return;
        }
        write_text(fd, "< hi >");
        const std::string open = read_until(fd, "< open vcan_sc >");
        write_text(fd, "< ok >");
        const std::string raw = read_until(fd, "< rawmode >");
        write_text(fd, "< ok >");
        handshake_seen = open.find("< open vcan_sc >") != std::string::npos &&
            raw.find("< rawmode >") != std::string::npos;
        // Two frames in one segment, the second split across writes
        write_text(fd, "< frame 123 1700000000.500000 DEADBEEF >< frame 18DA");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        write_text(fd, "F110 1.000000 >");
        send_command = read_until(fd, " >");
        write_text(fd, "< error bus off >");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        close(fd);
    });

    {
        auto interface = Interface::create(SocketcandConfig{.host = "127.0.0.1", .channel = "vcan_sc", .port = port});
        check(interface.has_value(), "connected and switched to rawmode");
        if (interface)
        {
            auto& can = **interface;
            auto first = can.recv();
            check(first && first->arbitration_id == 0x123 && first->data == std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}
                  && first->timestamp == 1700000000.5, "first frame received");
            auto second = can.recv();
            check(second && second->arbitration_id == 0x18DAF110 && second->is_extended_id,
                  "split frame reassembled");
            check(can.send(0x321, std::vector<uint8_t>{1, 2}).has_value(), "send accepted");
            auto error_reply = can.recv();
            check(!error_reply && error_reply.error().code == ErrorCode::BusRecvError, "server error surfaces");
            auto closed = can.recv();
            check(!closed && closed.error().code == ErrorCode::BusClosed, "closed connection surfaces");
        }
    }
    server.join();
    close(listen_fd);
    check(handshake_seen.load(), "client sent open and rawmode");
    check(send_command == "< send 321 2 01 02 >", "server received the send command (got '" + send_command + "')");

    std::cout << "\nTEST 3: Rejected channel and refused connection" << std::endl;
    const int reject_fd = listen_loopback(port);
    std::thread rejecting([&]
    {
        const int fd = accept(reject_fd, nullptr, nullptr);
        if (fd == -1)
        {
            return;
        }
        write_text(fd, "< hi >");
        read_until(fd, " >");
        write_text(fd, "< error could not open bus >");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        close(fd);
    });
    auto rejected = Interface::create(SocketcandConfig{.host = "127.0.0.1", .channel = "nope", .port = port});
    check(!rejected && rejected.error().code == ErrorCode::InterfaceCreationFailed, "handshake failure rejected");
    rejecting.join();
    close(reject_fd);

    auto refused = Interface::create(SocketcandConfig{.host = "127.0.0.1", .channel = "vcan0", .port = port});
    check(!refused && refused.error().code == ErrorCode::InterfaceCreationFailed, "refused connection rejected");

    std::cout << "\nTEST 4: Callback delivery continues past a server error" << std::endl;
    const int callback_fd = listen_loopback(port);
    std::thread callback_server([&]
    {
        const int fd = accept_rawmode(callback_fd, "vcan_cb");
        if (fd == -1)
        {
            return;
        }
        // Everything in one segment, so nothing is left on the socket after the first read
        write_text(fd, "< frame 001 1.0 AA >< error bus off >< frame 002 2.0 BB >");
        // Wait for the client to hang up
        char chunk[64];
        while (read(fd, chunk, sizeof(chunk)) > 0)
        {
        }
        close(fd);
    });
    {
        auto interface = Interface::create(SocketcandConfig{.host = "127.0.0.1", .channel = "vcan_cb", .port = port});
        check(interface.has_value(), "connected for callback mode");
        if (interface)
        {
            std::mutex mutex;
            std::vector<uint32_t> ids;
            std::vector<ErrorCode> errors;
            auto registered = (*interface)->register_rx_callback([&](const CanMessage& message)
            {
                std::lock_guard lock(mutex);
                ids.push_back(message.arbitration_id);
            }, [&](const Error& e)
            {
                std::lock_guard lock(mutex);
                errors.push_back(e.code);
            });
            check(registered.has_value(), "callback registered");

            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (std::chrono::steady_clock::now() < deadline)
            {
                {
                    std::lock_guard lock(mutex);
                    if (ids.size() >= 2) break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            std::lock_guard lock(mutex);
            check(ids == std::vector<uint32_t>{0x001, 0x002}, "both frames delivered around the error");
            check(errors == std::vector<ErrorCode>{ErrorCode::BusRecvError}, "server error reported once");
        }
    }
    callback_server.join();
    close(callback_fd);

    std::cout << "\n--- CANBridge socketcand Test Finished ---" << std::endl;
    return result_code;
}
