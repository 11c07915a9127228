#pragma once

#include "upbus/Transport.hpp"
#include "upbus/UriProvider.hpp"
#include "upbus/UMessage.hpp"
#include "upbus/Listener.hpp"
#include "upbus/Exception.hpp"
#include "upbus/app/Logger.hpp"

#include <optional>
#include <stdint.h>

namespace upbus { namespace communication {

/**
 * @brief sends NOTIFICATION messages and manages listening for them
 * @details a (topic, listener) pair goes Unregistered -> startListening ->
 * Registered -> stopListening -> Unregistered. startListening on a Registered
 * pair changes nothing; stopListening on an Unregistered pair throws
 * ListenerNotFound.
 */
struct SimpleNotifier {
    SimpleNotifier(Transport::ptr transport, UriProvider::ptr uriProvider)
    : transport_(std::move(transport))
    , uriProvider_(std::move(uriProvider)) {
        if (!transport_ || !uriProvider_) {
            UPBUS_THROW(ConfigurationError, "SimpleNotifier needs a transport and a UriProvider");
        }
    }

    /**
     * @brief notify destination about resourceId of this entity
     *
     * @param resourceId the source of the notification is this resource's UUri
     * @param destination the entity being notified
     * @param payload optional content
     */
    void notify(uint32_t resourceId, UUri const& destination
        , std::optional<UPayload> payload = std::nullopt) {
        auto message = UMessage::notification(uriProvider_->resourceUri(resourceId)
            , destination, std::move(payload));
        transport_->send(message);
    }

    ListenerHandle startListening(UUri const& topic, Listener::ptr listener) {
        auto h = transport_->registerListener(topic, std::move(listener));
        UPBUS_LOG_D("listening on ", topic);
        return h;
    }

    void stopListening(UUri const& topic, Listener::ptr const& listener) {
        transport_->unregisterListener(topic, listener);
        UPBUS_LOG_D("stopped listening on ", topic);
    }

    void stopListening(ListenerHandle const& handle) {
        transport_->unregisterListener(handle);
        UPBUS_LOG_D("stopped ", handle);
    }

    Transport::ptr const& transport() const { return transport_; }
    UriProvider::ptr const& uriProvider() const { return uriProvider_; }

private:
    Transport::ptr transport_;
    UriProvider::ptr uriProvider_;
};
}}
