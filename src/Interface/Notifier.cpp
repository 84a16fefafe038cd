#include "CANBridge/Interface/Notifier.hpp"
#include "CANBridge/Config.hpp"
#include "CANBridge/Util/Logger.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <format>
#include <stdexcept>
#include <system_error>

using tl::unexpected, std::format, std::string;
using enum CANBridge::ErrorCode;

namespace CANBridge
{
    Notifier::Notifier(Bus& bus, std::mutex& bus_rx_mutex) : bus(bus), bus_rx_mutex(bus_rx_mutex),
                                                             backoff(Config::get_notifier_backoff()),
                                                             s(Util::make_sink("Notifier", bus.channel_info()))
    {
        epoll_fd = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd == -1)
        {
            throw std::runtime_error(format("Failed to create epoll file descriptor: {}", strerror(errno)));
        }
        thread_event_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (thread_event_fd == -1)
        {
            close(epoll_fd);
            throw std::runtime_error(format("Failed to create thread_event_fd file descriptor: {}", strerror(errno)));
        }
        if (const auto added = epoll_fd_add(thread_event_fd); !added)
        {
            close(thread_event_fd);
            close(epoll_fd);
            throw std::runtime_error(added.error().message);
        }
    }

    Notifier::~Notifier()
    {
        if (const auto stopped = stop(); !stopped)
        {
            XTR_LOGL(error, s, "{}", stopped.error().message);
        }
        if (epoll_fd != -1)
        {
            close(epoll_fd);
        }
        if (thread_event_fd != -1)
        {
            close(thread_event_fd);
        }
    }

    tl::expected<ListenerId, Error> Notifier::add_listener(std::shared_ptr<Listener> listener)
    {
        if (!listener)
        {
            return unexpected(Error{ListenerRegistrationFailed, "Provided listener is empty"});
        }
        ListenerId id;
        {
            std::lock_guard lock(listeners_mutex);
            id = next_id++;
            listeners.emplace_back(id, std::move(listener));
        }
        if (is_running())
        {
            return id;
        }
        return start()
               .map([id] { return id; })
               .map_error([&](const Error& e)
               {
                   std::lock_guard lock(listeners_mutex);
                   std::erase_if(listeners, [id](const auto& entry) { return entry.first == id; });
                   return e;
               });
    }

    tl::expected<void, Error> Notifier::remove_listener(const ListenerId id)
    {
        std::lock_guard lock(listeners_mutex);
        if (std::erase_if(listeners, [id](const auto& entry) { return entry.first == id; }) == 0)
        {
            return unexpected(Error{ListenerRegistrationFailed, format("No listener with id {}", id)});
        }
        return {};
    }

    size_t Notifier::listener_count() const
    {
        std::lock_guard lock(listeners_mutex);
        return listeners.size();
    }

    bool Notifier::on_dispatch_thread() const noexcept
    {
        return dispatch_thread_id.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

    tl::expected<void, Error> Notifier::start() noexcept
    {
        if (on_dispatch_thread())
        {
            return unexpected(Error{NotifierCreationFailed, "Notifier cannot be restarted from its own thread"});
        }
        std::lock_guard lock(control_mutex);
        if (is_running())
        {
            return {};
        }
        if (dispatch_thread.joinable())
        {
            // The previous thread already left its loop after the bus closed
            dispatch_thread.join();
        }
        // Held until running is set, so a recv() either sees the notifier or blocks its start
        std::unique_lock rx_lock(bus_rx_mutex, std::try_to_lock);
        if (!rx_lock.owns_lock())
        {
            return unexpected(Error{
                ConsumptionModeConflict,
                format("{} is being polled by recv, the notifier cannot start", bus.channel_info())
            });
        }
        if (!bus_in_epoll)
        {
            if (bus.fileno() < 0)
            {
                return unexpected(Error{NotifierCreationFailed, format("Bus {} has no pollable descriptor",
                                                                       bus.channel_info())});
            }
            if (auto added = epoll_fd_add(bus.fileno()); !added)
            {
                return unexpected(Error{NotifierCreationFailed, added.error().message});
            }
            bus_in_epoll = true;
        }

        try
        {
            running.store(true, std::memory_order_release);
            dispatch_thread = std::jthread([this](const std::stop_token& stop_token)
            {
                dispatch_process(stop_token);
            });
        }
        catch (const std::system_error& e)
        {
            running.store(false, std::memory_order_release);
            return unexpected(Error{NotifierCreationFailed, format("Failed to spawn notifier thread: {}", e.what())});
        }
        XTR_LOGL(info, s, "Notifier started");
        return {};
    }

    tl::expected<void, Error> Notifier::stop() noexcept
    {
        constexpr uint64_t one = 1;
        if (on_dispatch_thread())
        {
            // Called from a listener: the loop exits once the callback returns
            dispatch_thread.request_stop();
            if (write(thread_event_fd, &one, sizeof(one)) == -1)
            {
                return unexpected(Error{NotifierStopError, format("Failed to wake notifier: {}", strerror(errno))});
            }
            return {};
        }

        std::lock_guard lock(control_mutex);
        if (!dispatch_thread.joinable())
        {
            return {};
        }
        dispatch_thread.request_stop();
        if (write(thread_event_fd, &one, sizeof(one)) == -1)
        {
            return unexpected(Error{
                NotifierStopError, format("Failed to write one bytes to the thread event fd: {}", strerror(errno))
            });
        }
        dispatch_thread.join();
        running.store(false, std::memory_order_release);
        XTR_LOGL(info, s, "Notifier stopped");
        return {};
    }

    void Notifier::dispatch_process(const std::stop_token& stop_token)
    {
        dispatch_thread_id.store(std::this_thread::get_id(), std::memory_order_release);
        xtr::sink thread_sink = Util::make_sink("NotifierThread", bus.channel_info());
        const int bus_fd = bus.fileno();
        epoll_event events[Config::MAX_EPOLL_EVENT]{};
        bool bus_open = true;

        while (bus_open && !stop_token.stop_requested())
        {
            const int nfds = epoll_wait(epoll_fd, events, static_cast<int>(Config::MAX_EPOLL_EVENT), -1);
            if (nfds == -1)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                dispatch_error(Error{EpollError, format("Failed to epoll_wait: {}", strerror(errno))}, thread_sink);
                break;
            }

            for (int i = 0; i < nfds && bus_open; ++i)
            {
                if (events[i].data.fd == thread_event_fd)
                {
                    uint64_t counter{};
                    [[maybe_unused]] const ssize_t _ = read(thread_event_fd, &counter, sizeof(counter));
                    if (stop_token.stop_requested()) break;
                }
                else if (events[i].data.fd == bus_fd)
                {
                    bus_open = drain_bus(stop_token, thread_sink);
                }
            }
        }

        if (!bus_open)
        {
            XTR_LOGL(warning, thread_sink, "Bus closed, notifier leaves its loop");
        }
        dispatch_thread_id.store(std::thread::id{}, std::memory_order_release);
        running.store(false, std::memory_order_release);
    }

    bool Notifier::drain_bus(const std::stop_token& stop_token, xtr::sink& thread_sink)
    {
        while (!stop_token.stop_requested())
        {
            auto received = [this]
            {
                std::lock_guard lock(bus_rx_mutex);
                return bus.recv(std::chrono::milliseconds(0));
            }();
            if (!received)
            {
                dispatch_error(received.error(), thread_sink);
                if (received.error().code == BusClosed)
                {
                    return false;
                }
                // The driver may already hold later frames that will not make its descriptor readable again
                std::this_thread::sleep_for(backoff);
                continue;
            }
            if (!*received)
            {
                return true;
            }
            dispatch_message(**received, thread_sink);
        }
        return true;
    }

    std::vector<std::shared_ptr<Listener>> Notifier::snapshot() const
    {
        std::lock_guard lock(listeners_mutex);
        std::vector<std::shared_ptr<Listener>> copy;
        copy.reserve(listeners.size());
        for (const auto& [id, listener] : listeners)
        {
            copy.push_back(listener);
        }
        return copy;
    }

    void Notifier::dispatch_message(const CanMessage& message, xtr::sink& thread_sink)
    {
        for (const auto& listener : snapshot())
        {
            try
            {
                listener->on_message_received(message);
            }
            catch (const std::exception& e)
            {
                XTR_LOGL(error, thread_sink, "Listener failed on frame 0x{:X}: {}", message.arbitration_id, e.what());
                try
                {
                    listener->on_error(Error{ListenerCallbackError, e.what()});
                }
                catch (const std::exception& nested)
                {
                    XTR_LOGL(error, thread_sink, "Listener error handler failed: {}", nested.what());
                }
            }
        }
    }

    void Notifier::dispatch_error(const Error& error, xtr::sink& thread_sink)
    {
        XTR_LOGL(warning, thread_sink, "Transport error: {}", error.message);
        for (const auto& listener : snapshot())
        {
            try
            {
                listener->on_error(error);
            }
            catch (const std::exception& e)
            {
                XTR_LOGL(error, thread_sink, "Listener error handler failed: {}", e.what());
            }
        }
    }

    tl::expected<void, Error> Notifier::epoll_fd_add(const int fd) const noexcept
    {
        epoll_event ev{};
        ev = {
            .events = EPOLLIN,
            .data = {
                .fd = fd
            }
        };
        if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &ev) == -1)
        {
            return unexpected(Error{EpollError, format("Failed to EPOLL_CTL_ADD fd {}: {}", fd, strerror(errno))});
        }
        return {};
    }
}
