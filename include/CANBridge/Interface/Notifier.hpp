#ifndef CANBRIDGE_NOTIFIER_HPP
#define CANBRIDGE_NOTIFIER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <tl/expected.hpp>
#include <xtr/logger.hpp>

#include "CANBridge/Interface/Listener.hpp"
#include "CANBridge/Transport/Bus.hpp"

namespace CANBridge
{
    /**
     * @brief Background dispatch loop fanning frames of one Bus out to its listeners.
     *
     * The thread starts with the first listener and is shared by all later
     * ones. It waits on the bus descriptor and an eventfd with epoll, so stop()
     * wakes it immediately. Every read of the bus happens under bus_rx_mutex,
     * the lock the owning Interface takes for its own recv(). start() fails
     * with ConsumptionModeConflict while a recv() holds that lock.
     */
    class Notifier
    {
    public:
        Notifier(Bus& bus, std::mutex& bus_rx_mutex);
        Notifier() = delete;
        Notifier(const Notifier& other) = delete;
        Notifier(Notifier&& other) = delete;
        ~Notifier();
        Notifier& operator=(const Notifier& other) = delete;
        Notifier& operator=(Notifier&& other) noexcept = delete;

        tl::expected<ListenerId, Error> add_listener(std::shared_ptr<Listener> listener);
        tl::expected<void, Error> remove_listener(ListenerId id);

        tl::expected<void, Error> start() noexcept;
        tl::expected<void, Error> stop() noexcept;

        [[nodiscard]] bool is_running() const noexcept
        {
            return running.load(std::memory_order_acquire);
        }

        [[nodiscard]] size_t listener_count() const;

    private:
        void dispatch_process(const std::stop_token& stop_token);
        // Returns false once the bus is closed for good
        bool drain_bus(const std::stop_token& stop_token, xtr::sink& thread_sink);
        void dispatch_message(const CanMessage& message, xtr::sink& thread_sink);
        void dispatch_error(const Error& error, xtr::sink& thread_sink);
        std::vector<std::shared_ptr<Listener>> snapshot() const;
        tl::expected<void, Error> epoll_fd_add(int fd) const noexcept;
        [[nodiscard]] bool on_dispatch_thread() const noexcept;

        Bus& bus;
        std::mutex& bus_rx_mutex;
        int thread_event_fd{-1};
        int epoll_fd{-1};
        bool bus_in_epoll{false};
        std::chrono::milliseconds backoff;
        mutable std::mutex listeners_mutex;
        std::vector<std::pair<ListenerId, std::shared_ptr<Listener>>> listeners;
        ListenerId next_id{1};
        std::mutex control_mutex;
        std::atomic<bool> running{false};
        std::atomic<std::thread::id> dispatch_thread_id{};
        xtr::sink s;
        std::jthread dispatch_thread;
    };
}

#endif //CANBRIDGE_NOTIFIER_HPP
