#ifndef CANBRIDGE_VIRTUAL_HPP
#define CANBRIDGE_VIRTUAL_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <variant>

#include "CANBridge/Interface/BusConfig.hpp"
#include "CANBridge/Transport/Bus.hpp"
#include "CANBridge/Transport/TransportRegistry.hpp"

namespace CANBridge
{
    /**
     * @brief In-process bus; every frame sent is delivered to all other buses on the same channel.
     *
     * Readiness is signalled through an eventfd so the Notifier can wait on it
     * like on a socket.
     */
    class VirtualBus final : public Bus
    {
    public:
        explicit VirtualBus(std::string channel, bool receive_own_messages = false);
        VirtualBus() = delete;
        ~VirtualBus() override;

        tl::expected<std::optional<CanMessage>, Error> recv(std::optional<std::chrono::milliseconds> timeout) override;
        tl::expected<void, Error> send(const CanMessage& message) override;

        [[nodiscard]] int fileno() const noexcept override
        {
            return event_fd;
        }

        [[nodiscard]] std::string_view channel_info() const noexcept override
        {
            return channel;
        }

        // Queues a transport fault; the next recv() returns it as an error
        void inject_error(Error error);

        [[nodiscard]] size_t pending() const;

        /**
         * @brief Registry driver opening a VirtualBus for any configuration.
         *
         * Configurations that compare equal share one virtual channel.
         */
        static TransportRegistry::Driver driver(bool receive_own_messages = false);

    private:
        using Entry = std::variant<CanMessage, Error>;

        void deliver(Entry entry);

        std::string channel;
        bool receive_own_messages;
        int event_fd{-1};
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<Entry> queue_;
    };
}

#endif //CANBRIDGE_VIRTUAL_HPP
