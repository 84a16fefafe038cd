#ifndef CANBRIDGE_TRANSPORT_REGISTRY_HPP
#define CANBRIDGE_TRANSPORT_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include <tl/expected.hpp>

#include "CANBridge/Interface/BusConfig.hpp"
#include "CANBridge/Transport/Bus.hpp"

namespace CANBridge
{
    /**
     * @brief Singleton mapping each BusKind to the driver able to open it.
     *
     * The shipped drivers are installed on first use. Applications and tests
     * may replace them; a kind without a driver reports TransportUnavailable.
     */
    class TransportRegistry
    {
    public:
        using Driver = std::function<tl::expected<std::unique_ptr<Bus>, Error>(const BusConfig&)>;

        static TransportRegistry& instance();

        void register_driver(BusKind kind, Driver driver);
        void unregister_driver(BusKind kind);
        void restore_defaults();
        [[nodiscard]] bool has_driver(BusKind kind) const;

        tl::expected<std::unique_ptr<Bus>, Error> open(const BusConfig& config) const;

        TransportRegistry(const TransportRegistry&) = delete;
        TransportRegistry& operator=(const TransportRegistry&) = delete;

    private:
        TransportRegistry();

        mutable std::mutex mutex_;
        std::map<BusKind, Driver> drivers_;
    };
}

#endif //CANBRIDGE_TRANSPORT_REGISTRY_HPP
