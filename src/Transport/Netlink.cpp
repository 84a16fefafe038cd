#include "CANBridge/Transport/Netlink.hpp"
#include "CANBridge/Util/Logger.hpp"

#include <format>
#include <string>
#include <net/if.h>

#include <netlink/cache.h>
#include <netlink/errno.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/route/link.h>
#include <netlink/route/link/can.h>

using tl::unexpected, std::format, std::string, std::string_view;
using enum CANBridge::ErrorCode;

namespace CANBridge
{
    Netlink::Netlink() : s(Util::make_sink("Netlink"))
    {
    }

    Netlink::~Netlink()
    {
        cleanup();
    }

    Netlink& Netlink::instance()
    {
        static Netlink instance;
        return instance;
    }

    tl::expected<void, Error> Netlink::ensure_initialized()
    {
        if (nl_socket_ && link_cache_)
        {
            return {};
        }

        nl_socket_ = nl_socket_alloc();
        if (!nl_socket_)
        {
            return unexpected(Error{NetlinkError, "Failed to allocate netlink socket"});
        }

        if (const int err = nl_connect(nl_socket_, NETLINK_ROUTE); err < 0)
        {
            cleanup();
            return unexpected(Error{NetlinkError, format("Failed to connect to netlink: {}", nl_geterror(err))});
        }

        if (const int err = rtnl_link_alloc_cache(nl_socket_, AF_UNSPEC, &link_cache_); err < 0)
        {
            cleanup();
            return unexpected(Error{NetlinkError, format("Failed to allocate link cache: {}", nl_geterror(err))});
        }
        return {};
    }

    void Netlink::cleanup()
    {
        if (link_cache_)
        {
            nl_cache_free(link_cache_);
            link_cache_ = nullptr;
        }
        if (nl_socket_)
        {
            nl_socket_free(nl_socket_);
            nl_socket_ = nullptr;
        }
    }

    tl::expected<void, Error> Netlink::refill() const
    {
        if (const int err = nl_cache_refill(nl_socket_, link_cache_); err < 0)
        {
            return unexpected(Error{NetlinkError, format("Failed to refresh link cache: {}", nl_geterror(err))});
        }
        return {};
    }

    tl::expected<bool, Error> Netlink::exists(const string_view interface_name)
    {
        std::lock_guard lock(mutex_);
        return ensure_initialized()
               .and_then([&] { return refill(); })
               .map([&]
               {
                   rtnl_link* link = rtnl_link_get_by_name(link_cache_, string(interface_name).c_str());
                   if (!link)
                   {
                       return false;
                   }
                   rtnl_link_put(link);
                   return true;
               });
    }

    tl::expected<bool, Error> Netlink::is_up(const string_view interface_name)
    {
        std::lock_guard lock(mutex_);
        return ensure_initialized()
               .and_then([&] { return refill(); })
               .map([&]
               {
                   rtnl_link* link = rtnl_link_get_by_name(link_cache_, string(interface_name).c_str());
                   if (!link)
                   {
                       return false;
                   }
                   const bool up = (rtnl_link_get_flags(link) & IFF_UP) != 0;
                   rtnl_link_put(link);
                   return up;
               });
    }

    tl::expected<void, Error> Netlink::set(const string_view interface_name, const bool up,
                                           const std::optional<uint32_t> bitrate)
    {
        std::lock_guard lock(mutex_);
        XTR_LOGL(info, s, "Setting {} {}", string(interface_name), up ? "up" : "down");
        return ensure_initialized()
               .and_then([&] { return refill(); })
               .and_then([&]() -> tl::expected<void, Error>
               {
                   if (up && bitrate)
                   {
                       // The bitrate can only change while the link is down
                       return set_state(interface_name, false)
                           .and_then([&] { return set_bitrate(interface_name, *bitrate); });
                   }
                   return {};
               })
               .and_then([&] { return set_state(interface_name, up); });
    }

    tl::expected<void, Error> Netlink::set_state(const string_view interface_name, const bool up) const
    {
        rtnl_link* link = rtnl_link_get_by_name(link_cache_, string(interface_name).c_str());
        if (!link)
        {
            return unexpected(Error{NetlinkError, format("Interface {} not found", interface_name)});
        }

        rtnl_link* change = rtnl_link_alloc();
        if (!change)
        {
            rtnl_link_put(link);
            return unexpected(Error{NetlinkError, "Failed to allocate change link object"});
        }

        if (up)
        {
            rtnl_link_set_flags(change, IFF_UP);
        }
        else
        {
            rtnl_link_unset_flags(change, IFF_UP);
        }

        const int result = rtnl_link_change(nl_socket_, link, change, 0);
        rtnl_link_put(change);
        rtnl_link_put(link);

        if (result < 0)
        {
            return unexpected(Error{
                NetlinkError,
                format("Failed to {} {}: {}", up ? "bring up" : "bring down", interface_name, nl_geterror(result))
            });
        }
        return refill();
    }

    tl::expected<void, Error> Netlink::set_bitrate(const string_view interface_name, const uint32_t bitrate) const
    {
        rtnl_link* link = rtnl_link_get_by_name(link_cache_, string(interface_name).c_str());
        if (!link)
        {
            return unexpected(Error{NetlinkError, format("CAN interface {} not found", interface_name)});
        }

        if (!rtnl_link_is_can(link))
        {
            rtnl_link_put(link);
            return unexpected(Error{NetlinkError, format("Interface {} is not a CAN interface", interface_name)});
        }

        rtnl_link* change = rtnl_link_alloc();
        if (!change)
        {
            rtnl_link_put(link);
            return unexpected(Error{NetlinkError, "Failed to allocate change link object for CAN"});
        }

        rtnl_link_set_type(change, "can");
        rtnl_link_can_set_bitrate(change, bitrate);
        const int result = rtnl_link_change(nl_socket_, link, change, 0);
        rtnl_link_put(change);
        rtnl_link_put(link);

        if (result < 0)
        {
            return unexpected(Error{
                NetlinkError,
                format("Failed to set bitrate {} on {}: {}", bitrate, interface_name, nl_geterror(result))
            });
        }
        XTR_LOGL(info, s, "Bitrate of {} set to {}", string(interface_name), bitrate);
        return {};
    }

    tl::expected<void, Error> Netlink::create_vcan(const string_view interface_name)
    {
        std::lock_guard lock(mutex_);
        if (if_nametoindex(string(interface_name).c_str()) != 0)
        {
            XTR_LOGL(info, s, "{} already exists.", string(interface_name));
            return {};
        }

        return ensure_initialized().and_then([&]() -> tl::expected<void, Error>
        {
            rtnl_link* link = rtnl_link_alloc();
            if (!link)
            {
                return unexpected(Error{NetlinkError, "Failed to allocate rtnl_link"});
            }
            rtnl_link_set_name(link, string(interface_name).c_str());
            rtnl_link_set_type(link, "vcan");

            const int err = rtnl_link_add(nl_socket_, link, NLM_F_CREATE);
            rtnl_link_put(link);
            if (err < 0)
            {
                return unexpected(Error{
                    NetlinkError, format("Failed to create vcan {}: {}", interface_name, nl_geterror(err))
                });
            }
            XTR_LOGL(info, s, "Created vcan {}", string(interface_name));
            return refill();
        });
    }
}
