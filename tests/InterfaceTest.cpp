#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "CANBridge/Interface/Interface.hpp"
#include "CANBridge/Transport/TransportRegistry.hpp"
#include "CANBridge/Transport/Virtual.hpp"

using namespace CANBridge;
using namespace std::chrono_literals;

static int result_code = EXIT_SUCCESS;

// Buses opened by the test driver, in opening order
static std::vector<VirtualBus*> g_opened_buses;

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

template <typename Predicate>
static bool wait_until(Predicate predicate, const std::chrono::milliseconds limit = 2000ms)
{
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
        {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

struct Collector
{
    std::mutex mutex;
    std::vector<CanMessage> messages;
    std::vector<Error> errors;

    RxCallback rx()
    {
        return [this](const CanMessage& message)
        {
            std::lock_guard lock(mutex);
            messages.push_back(message);
        };
    }

    ErrorCallback err()
    {
        return [this](const Error& error)
        {
            std::lock_guard lock(mutex);
            errors.push_back(error);
        };
    }

    size_t message_count()
    {
        std::lock_guard lock(mutex);
        return messages.size();
    }

    size_t error_count()
    {
        std::lock_guard lock(mutex);
        return errors.size();
    }
};

static std::unique_ptr<Interface> open_or_die(const std::string& channel)
{
    auto interface = Interface::create(SocketCanConfig{.channel = channel});
    if (!interface)
    {
        std::cerr << "FAIL: " << interface.error().message << std::endl;
        std::exit(EXIT_FAILURE);
    }
    return std::move(*interface);
}

int main()
{
    std::cout << "--- CANBridge Interface Test ---" << std::endl;
    std::cout << "INFO: SocketCAN configurations are served by in-process virtual buses." << std::endl;

    TransportRegistry::instance().register_driver(
        BusKind::SocketCan, [](const BusConfig& config) -> tl::expected<std::unique_ptr<Bus>, Error>
        {
            auto bus = std::make_unique<VirtualBus>(describe(config));
            g_opened_buses.push_back(bus.get());
            return std::unique_ptr<Bus>(std::move(bus));
        });

    // --- Test 1: Round trip through recv ---
    std::cout << "\nTEST 1: Send and poll a frame" << std::endl;
    {
        const auto tx = open_or_die("vtest_roundtrip");
        const auto rx = open_or_die("vtest_roundtrip");
        const std::vector<uint8_t> payload{0xDE, 0xAD, 0xBE, 0xEF};
        const auto sent = tx->send(0x123, payload);
        check(sent.has_value(), "send succeeded");

        auto received = rx->recv();
        check(received.has_value(), "recv returned a frame");
        if (received)
        {
            check(received->arbitration_id == 0x123, "arbitration id preserved");
            check(received->dlc == 4, "dlc computed from payload");
            check(received->data == payload, "payload preserved");
            check(received->timestamp.has_value(), "received frame carries a timestamp");
        }

        auto nothing = rx->recv(50ms);
        check(nothing.has_value() && !nothing->has_value(), "bounded recv times out with nullopt");
    }

    // --- Test 2: Two lazy listeners share one notifier ---
    std::cout << "\nTEST 2: Two rx callbacks both see every frame in order" << std::endl;
    {
        const auto tx = open_or_die("vtest_listeners");
        const auto rx = open_or_die("vtest_listeners");
        Collector first;
        Collector second;
        const auto id_first = rx->register_rx_callback(first.rx(), first.err());
        const auto id_second = rx->register_rx_callback(second.rx(), second.err());
        check(id_first && id_second && *id_first != *id_second, "distinct listener ids");
        check(rx->notifier().is_running() && rx->notifier().listener_count() == 2, "one running notifier, two listeners");

        constexpr int FRAME_COUNT = 100;
        for (int i = 0; i < FRAME_COUNT; ++i)
        {
            const std::vector<uint8_t> payload{static_cast<uint8_t>(i), static_cast<uint8_t>(i >> 8)};
            (void)tx->send(0x200 + (i % 16), payload).or_else([](const Error& e)
            {
                std::cerr << "FAIL: " << e.message << std::endl;
                result_code = EXIT_FAILURE;
            });
        }

        check(wait_until([&] { return first.message_count() == FRAME_COUNT && second.message_count() == FRAME_COUNT; }),
              "both listeners received every frame");
        bool in_order = true;
        {
            std::scoped_lock lock(first.mutex, second.mutex);
            for (int i = 0; i < FRAME_COUNT && i < static_cast<int>(first.messages.size()) &&
                            i < static_cast<int>(second.messages.size()); ++i)
            {
                in_order &= (*first.messages[i].data)[0] == static_cast<uint8_t>(i);
                in_order &= first.messages[i] == second.messages[i];
            }
        }
        check(in_order, "frames delivered in receipt order to both listeners");
        check(first.error_count() == 0 && second.error_count() == 0, "no errors reported");

        // --- Polling is refused while the notifier consumes the bus ---
        auto conflict = rx->recv(10ms);
        check(!conflict && conflict.error().code == ErrorCode::ConsumptionModeConflict,
              "recv refused while the notifier runs");

        check(rx->remove_listener(*id_first).has_value(), "listener removed");
        check(!rx->remove_listener(*id_first).has_value(), "second removal rejected");
        (void)tx->send(0x300, std::vector<uint8_t>{1});
        check(wait_until([&] { return second.message_count() == FRAME_COUNT + 1; }), "remaining listener still served");
        check(first.message_count() == FRAME_COUNT, "removed listener no longer served");

        check(rx->stop_notifier().has_value() && !rx->notifier().is_running(), "explicit stop");
        (void)tx->send(0x301, std::vector<uint8_t>{2});
        auto polled = rx->recv(1000ms);
        check(polled && *polled && (*polled)->arbitration_id == 0x301, "recv usable again after stop");

        Collector third;
        check(rx->register_rx_callback(third.rx(), third.err()).has_value() && rx->notifier().is_running(),
              "registration restarts the notifier");
        (void)tx->send(0x302, std::vector<uint8_t>{3});
        check(wait_until([&] { return third.message_count() == 1; }), "restarted notifier dispatches");
    }

    // --- Test 3: Transport errors go to the error callback only ---
    std::cout << "\nTEST 3: Error callback on transport fault" << std::endl;
    {
        const auto rx = open_or_die("vtest_errors");
        VirtualBus* bus = g_opened_buses.back();
        Collector collector;
        check(rx->register_rx_callback(collector.rx(), collector.err()).has_value(), "listener registered");
        bus->inject_error(Error{ErrorCode::BusRecvError, "malformed frame"});
        check(wait_until([&] { return collector.error_count() == 1; }), "error callback invoked");
        check(collector.message_count() == 0, "rx callback not invoked for the fault");
        {
            std::lock_guard lock(collector.mutex);
            check(!collector.errors.empty() && collector.errors.front().message == "malformed frame",
                  "error carries the transport cause");
        }

        const auto tx = open_or_die("vtest_errors");
        (void)tx->send(0x10, std::vector<uint8_t>{0xAA});
        check(wait_until([&] { return collector.message_count() == 1; }), "dispatch continues after an error");
    }

    // --- Test 4: Polling mode reports the fault as a call failure ---
    std::cout << "\nTEST 4: recv propagates a transport fault" << std::endl;
    {
        const auto rx = open_or_die("vtest_poll_error");
        g_opened_buses.back()->inject_error(Error{ErrorCode::BusRecvError, "bus-off"});
        auto failed = rx->recv();
        check(!failed && failed.error().code == ErrorCode::BusRecvError, "recv fails with BusRecvError");
    }

    // --- Test 5: Registration edge cases ---
    std::cout << "\nTEST 5: Registration edge cases" << std::endl;
    {
        const auto tx = open_or_die("vtest_edges");
        const auto rx = open_or_die("vtest_edges");
        auto missing_error = rx->register_rx_callback([](const CanMessage&) {}, nullptr);
        check(!missing_error && missing_error.error().code == ErrorCode::ListenerRegistrationFailed,
              "rx callback without error callback rejected");
        auto empty = rx->recv_spawn(nullptr);
        check(!empty && empty.error().code == ErrorCode::ListenerRegistrationFailed, "empty recv_spawn rejected");
        auto null_listener = rx->add_listener(nullptr);
        check(!null_listener && null_listener.error().code == ErrorCode::ListenerRegistrationFailed,
              "null listener rejected");
        check(!rx->notifier().is_running(), "failed registrations do not start the notifier");

        std::atomic<int> spawned{0};
        check(rx->recv_spawn([&](const CanMessage&) { spawned.fetch_add(1); }).has_value(), "recv_spawn registered");

        Collector thrower_errors;
        check(rx->register_rx_callback([](const CanMessage&) { throw std::runtime_error("listener bug"); },
                                       thrower_errors.err()).has_value(), "throwing listener registered");

        g_opened_buses.back()->inject_error(Error{ErrorCode::BusRecvError, "dropped"});
        (void)tx->send(0x55, std::vector<uint8_t>{5});
        check(wait_until([&] { return spawned.load() == 1; }), "recv_spawn callback invoked, fault only logged");
        check(wait_until([&] { return thrower_errors.error_count() == 2; }),
              "transport fault and listener exception reach the error callback");
        {
            std::lock_guard lock(thrower_errors.mutex);
            bool callback_error_seen = false;
            for (const auto& e : thrower_errors.errors)
            {
                callback_error_seen |= e.code == ErrorCode::ListenerCallbackError && e.message == "listener bug";
            }
            check(callback_error_seen, "listener exception reported as ListenerCallbackError");
        }
    }

    // --- Test 6: A listener may stop its own notifier ---
    std::cout << "\nTEST 6: Stop requested from inside a callback" << std::endl;
    {
        const auto tx = open_or_die("vtest_self_stop");
        const auto rx = open_or_die("vtest_self_stop");
        std::atomic<int> calls{0};
        Interface* raw = rx.get();
        check(rx->register_rx_callback([&](const CanMessage&)
        {
            calls.fetch_add(1);
            (void)raw->stop_notifier();
        }, [](const Error&) {}).has_value(), "self-stopping listener registered");
        (void)tx->send(0x1, std::vector<uint8_t>{});
        check(wait_until([&] { return !rx->notifier().is_running(); }), "notifier left its loop");
        check(calls.load() == 1, "callback invoked once");
    }

    // --- Test 7: Registration refused while recv() is blocked ---
    std::cout << "\nTEST 7: Registration during a blocking recv" << std::endl;
    {
        const auto tx = open_or_die("vtest_poll_first");
        const auto rx = open_or_die("vtest_poll_first");
        std::atomic<bool> polling{false};
        tl::expected<CanMessage, Error> polled = tl::unexpected(Error{ErrorCode::BusRecvError, "not polled"});
        std::thread poller([&]
        {
            polling.store(true);
            polled = rx->recv();
        });
        check(wait_until([&] { return polling.load(); }), "poller started");
        std::this_thread::sleep_for(100ms);

        Collector late;
        auto refused = rx->register_rx_callback(late.rx(), late.err());
        check(!refused && refused.error().code == ErrorCode::ConsumptionModeConflict,
              "registration rejected with ConsumptionModeConflict");
        check(!rx->notifier().is_running() && rx->notifier().listener_count() == 0,
              "rejected registration leaves no notifier and no listener");

        (void)tx->send(0x77, std::vector<uint8_t>{0x01});
        poller.join();
        check(polled.has_value() && polled->arbitration_id == 0x77, "blocked recv got the frame");
        check(late.message_count() == 0, "frame not split off to the rejected listener");

        check(rx->register_rx_callback(late.rx(), late.err()).has_value(), "registration accepted once recv returned");
        (void)tx->send(0x78, std::vector<uint8_t>{0x02});
        check(wait_until([&] { return late.message_count() == 1; }), "listener served after the poll");
    }

    TransportRegistry::instance().restore_defaults();

    std::cout << "\n--- CANBridge Interface Test Finished ---" << std::endl;
    if (result_code == EXIT_SUCCESS)
    {
        std::cout << "All tests passed successfully." << std::endl;
    }
    else
    {
        std::cout << "One or more tests FAILED." << std::endl;
    }
    return result_code;
}
