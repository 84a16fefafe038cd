#include "CANBridge/Transport/Virtual.hpp"

#include <chrono>
#include <cstring>
#include <format>
#include <map>
#include <stdexcept>
#include <unistd.h>
#include <vector>
#include <sys/eventfd.h>

using tl::unexpected, std::format, std::string;

namespace
{
    struct Channels
    {
        std::mutex mutex;
        std::map<string, std::vector<CANBridge::VirtualBus*>> buses;
    };

    Channels& channels()
    {
        static Channels instance;
        return instance;
    }

    double now_seconds()
    {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(since_epoch).count();
    }
}

namespace CANBridge
{
    VirtualBus::VirtualBus(string channel, const bool receive_own_messages) : channel(std::move(channel)),
        receive_own_messages(receive_own_messages)
    {
        event_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (event_fd == -1)
        {
            throw std::runtime_error(format("Failed to create virtual bus eventfd: {}", strerror(errno)));
        }
        std::lock_guard lock(channels().mutex);
        channels().buses[this->channel].push_back(this);
    }

    VirtualBus::~VirtualBus()
    {
        {
            std::lock_guard lock(channels().mutex);
            auto& peers = channels().buses[channel];
            std::erase(peers, this);
            if (peers.empty())
            {
                channels().buses.erase(channel);
            }
        }
        close(event_fd);
    }

    void VirtualBus::deliver(Entry entry)
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(entry));
        constexpr uint64_t one = 1;
        [[maybe_unused]] const ssize_t _ = write(event_fd, &one, sizeof(one));
        cv_.notify_one();
    }

    void VirtualBus::inject_error(Error error)
    {
        deliver(std::move(error));
    }

    size_t VirtualBus::pending() const
    {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    tl::expected<std::optional<CanMessage>, Error> VirtualBus::recv(
        const std::optional<std::chrono::milliseconds> timeout)
    {
        std::unique_lock lock(mutex_);
        const auto ready = [this] { return !queue_.empty(); };
        if (!timeout)
        {
            cv_.wait(lock, ready);
        }
        else if (!cv_.wait_for(lock, *timeout, ready))
        {
            return std::nullopt;
        }

        Entry entry = std::move(queue_.front());
        queue_.pop_front();
        if (queue_.empty())
        {
            uint64_t counter{};
            [[maybe_unused]] const ssize_t _ = read(event_fd, &counter, sizeof(counter));
        }

        if (auto* error = std::get_if<Error>(&entry))
        {
            return unexpected(std::move(*error));
        }
        return std::get<CanMessage>(std::move(entry));
    }

    tl::expected<void, Error> VirtualBus::send(const CanMessage& message)
    {
        if (auto frame = to_can_frame(message); !frame)
        {
            return unexpected(frame.error());
        }
        CanMessage delivered = message;
        delivered.timestamp = now_seconds();

        std::lock_guard lock(channels().mutex);
        for (VirtualBus* peer : channels().buses[channel])
        {
            if (peer != this || receive_own_messages)
            {
                peer->deliver(delivered);
            }
        }
        return {};
    }

    TransportRegistry::Driver VirtualBus::driver(const bool receive_own_messages)
    {
        return [receive_own_messages](const BusConfig& config) -> tl::expected<std::unique_ptr<Bus>, Error>
        {
            return std::make_unique<VirtualBus>(describe(config), receive_own_messages);
        };
    }
}
