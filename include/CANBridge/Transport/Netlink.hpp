#ifndef CANBRIDGE_NETLINK_HPP
#define CANBRIDGE_NETLINK_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "CANBridge/Util/Error.hpp"

struct nl_sock;
struct nl_cache;

namespace CANBridge
{
    /**
     * @brief Singleton wrapper over libnl3 route links.
     *
     * Brings CAN network interfaces up and down and applies the bitrate of
     * adapters whose kernel driver exposes one. Needs CAP_NET_ADMIN for set()
     * and create_vcan().
     */
    class Netlink
    {
    public:
        static Netlink& instance();

        tl::expected<bool, Error> exists(std::string_view interface_name);
        tl::expected<bool, Error> is_up(std::string_view interface_name);
        tl::expected<void, Error> set(std::string_view interface_name, bool up,
                                      std::optional<uint32_t> bitrate = std::nullopt);
        tl::expected<void, Error> create_vcan(std::string_view interface_name);

        ~Netlink();
        Netlink(const Netlink&) = delete;
        Netlink& operator=(const Netlink&) = delete;
        Netlink(Netlink&&) = delete;
        Netlink& operator=(Netlink&&) = delete;

    private:
        Netlink();

        tl::expected<void, Error> ensure_initialized();
        tl::expected<void, Error> refill() const;
        tl::expected<void, Error> set_bitrate(std::string_view interface_name, uint32_t bitrate) const;
        tl::expected<void, Error> set_state(std::string_view interface_name, bool up) const;
        void cleanup();

        nl_sock* nl_socket_{nullptr};
        nl_cache* link_cache_{nullptr};
        std::mutex mutex_;
        xtr::sink s;
    };
}

#endif //CANBRIDGE_NETLINK_HPP
