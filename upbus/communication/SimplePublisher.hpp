#pragma once

#include "upbus/Transport.hpp"
#include "upbus/UriProvider.hpp"
#include "upbus/UMessage.hpp"
#include "upbus/Exception.hpp"
#include "upbus/app/Logger.hpp"

#include <optional>
#include <stdint.h>

namespace upbus { namespace communication {

/**
 * @brief publishes PUBLISH messages on the resources of one entity
 * @details the topic of a resource comes from the UriProvider; the message goes
 * out through Transport::send, so errors are the transport's
 */
struct SimplePublisher {
    SimplePublisher(Transport::ptr transport, UriProvider::ptr uriProvider)
    : transport_(std::move(transport))
    , uriProvider_(std::move(uriProvider)) {
        if (!transport_ || !uriProvider_) {
            UPBUS_THROW(ConfigurationError, "SimplePublisher needs a transport and a UriProvider");
        }
    }

    /**
     * @brief publish on the topic of resourceId
     *
     * @param resourceId resource of this entity the message is about
     * @param payload nothing is legal - a presence or heartbeat style event
     */
    void publish(uint32_t resourceId, std::optional<UPayload> payload = std::nullopt) {
        auto message = UMessage::publish(uriProvider_->resourceUri(resourceId), std::move(payload));
        transport_->send(message);
    }

    Transport::ptr const& transport() const { return transport_; }
    UriProvider::ptr const& uriProvider() const { return uriProvider_; }

private:
    Transport::ptr transport_;
    UriProvider::ptr uriProvider_;
};
}}
