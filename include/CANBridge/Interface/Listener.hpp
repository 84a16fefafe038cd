#ifndef CANBRIDGE_LISTENER_HPP
#define CANBRIDGE_LISTENER_HPP

#include <cstdint>
#include <functional>

#include "CANBridge/Interface/Message.hpp"
#include "CANBridge/Util/Error.hpp"

namespace CANBridge
{
    using ListenerId = uint64_t;
    using RxCallback = std::function<void(const CanMessage&)>;
    using ErrorCallback = std::function<void(const Error&)>;

    /**
     * @brief Receiver of frames and transport errors from a Notifier.
     *
     * Both methods run on the Notifier thread, never on the thread that
     * registered the listener, and should return quickly: a slow listener
     * delays every other listener of the same Notifier.
     */
    class Listener
    {
    public:
        virtual ~Listener() = default;
        virtual void on_message_received(const CanMessage& message) = 0;
        virtual void on_error(const Error& error) = 0;
    };

    class CallbackListener final : public Listener
    {
    public:
        CallbackListener(RxCallback on_rx, ErrorCallback on_error) : on_rx_(std::move(on_rx)),
                                                                     on_error_(std::move(on_error))
        {
        }

        void on_message_received(const CanMessage& message) override
        {
            on_rx_(message);
        }

        void on_error(const Error& error) override
        {
            on_error_(error);
        }

    private:
        RxCallback on_rx_;
        ErrorCallback on_error_;
    };
}

#endif //CANBRIDGE_LISTENER_HPP
