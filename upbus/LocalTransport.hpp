#pragma once

#include "upbus/Transport.hpp"
#include "upbus/ListenerRegistry.hpp"
#include "upbus/app/Logger.hpp"

#include <memory>

namespace upbus {

/**
 * @brief Transport for senders and receivers sharing one address space
 * @details no serialization: send dispatches synchronously on the calling
 * thread to the listeners registered for message.source(); the message is
 * passed by reference to each of them. PUBLISH and NOTIFICATION route the same
 * way - the destination of a notification is for the receiver to look at.
 * A listener that blocks blocks the sender.
 */
struct LocalTransport
: Transport {
    using ptr = std::shared_ptr<LocalTransport>;

    static ptr create() {
        return std::make_shared<LocalTransport>();
    }

    void send(UMessage const& message) override {
        message.validate();
        auto n = registry_.dispatch(message.topic(), message);
        UPBUS_LOG_D(message, " delivered to ", n, " listener(s)");
    }

    ListenerHandle registerListener(UUri const& topic, Listener::ptr listener) override {
        return registry_.registerListener(topic, std::move(listener));
    }

    void unregisterListener(UUri const& topic, Listener::ptr const& listener) override {
        registry_.unregisterListener(topic, listener);
    }

    void unregisterListener(ListenerHandle const& handle) override {
        registry_.unregisterListener(handle);
    }

    ListenerRegistry const& registry() const {
        return registry_;
    }

private:
    ListenerRegistry registry_;
};
}
