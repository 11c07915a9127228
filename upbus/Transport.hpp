#pragma once

#include "upbus/UMessage.hpp"
#include "upbus/Listener.hpp"
#include "upbus/UUri.hpp"

#include <memory>

namespace upbus {

/**
 * @brief the capability set every backend provides
 * @details SimplePublisher and SimpleNotifier only talk to this interface, so a
 * LocalTransport, a NetworkTransport or a test double can be swapped in freely.
 * Failures are reported by throwing TransportError subclasses:
 * InvalidTopic, ListenerNotFound, Unavailable
 */
struct Transport {
    using ptr = std::shared_ptr<Transport>;

    Transport() = default;
    Transport(Transport const&) = delete;
    Transport& operator = (Transport const&) = delete;
    virtual ~Transport() = default;

    /**
     * @brief hand a message over for delivery to the listeners of message.topic()
     * @details fire and forget: no listener is not an error
     */
    virtual void send(UMessage const& message) = 0;

    /**
     * @brief start delivering messages on topic to listener
     * @details idempotent for a (topic, listener) pair that is already registered
     * @return handle that can be used to unregister
     */
    virtual ListenerHandle registerListener(UUri const& topic, Listener::ptr listener) = 0;

    /**
     * @brief stop delivering messages on topic to listener
     * @details throws ListenerNotFound if the pair is not registered
     */
    virtual void unregisterListener(UUri const& topic, Listener::ptr const& listener) = 0;

    /**
     * @brief undo the registration the handle came from
     */
    virtual void unregisterListener(ListenerHandle const& handle) = 0;
};
}
