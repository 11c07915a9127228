#pragma once

#include "upbus/UUri.hpp"
#include "upbus/UPayload.hpp"
#include "upbus/Exception.hpp"

#include <optional>
#include <ostream>
#include <stdint.h>

namespace upbus {

enum class UMessageType : uint8_t {
    PUBLISH = 1,
    NOTIFICATION = 2,
};

inline
std::ostream& operator << (std::ostream& os, UMessageType t) {
    switch (t) {
        case UMessageType::PUBLISH: return os << "PUBLISH";
        case UMessageType::NOTIFICATION: return os << "NOTIFICATION";
    }
    return os << "UNKNOWN(" << (int)t << ')';
}

/**
 * @brief message envelope handed to transports and listeners
 * @details immutable once built. For PUBLISH the source is the topic and there is
 * no destination; for NOTIFICATION the source is the notifying resource's topic and
 * destination is the addressed recipient. Either kind may carry no payload, which
 * is different from carrying an empty payload.
 */
struct UMessage {
    static UMessage publish(UUri topic, std::optional<UPayload> payload = std::nullopt) {
        topic.validate();
        return UMessage{std::move(topic), std::nullopt, UMessageType::PUBLISH, std::move(payload)};
    }

    static UMessage notification(UUri source, UUri destination
        , std::optional<UPayload> payload = std::nullopt) {
        source.validate();
        destination.validate();
        return UMessage{std::move(source), std::move(destination)
            , UMessageType::NOTIFICATION, std::move(payload)};
    }

    UUri const& source() const { return source_; }
    std::optional<UUri> const& destination() const { return destination_; }
    UMessageType type() const { return type_; }
    std::optional<UPayload> const& payload() const { return payload_; }

    /**
     * @brief the key listeners are registered under - the source for both kinds
     */
    UUri const& topic() const { return source_; }

    /**
     * @brief the payload as text if there is one and it is valid UTF-8
     */
    std::optional<std::string> extractString() const {
        if (!payload_) return std::nullopt;
        return payload_->asString();
    }

    /**
     * @brief throw InvalidTopic if the message could not have come out of the factories
     */
    void validate() const {
        source_.validate();
        if (type_ == UMessageType::PUBLISH && destination_) {
            UPBUS_THROW(InvalidTopic, "PUBLISH message to " << source_ << " carries a destination");
        }
        if (type_ == UMessageType::NOTIFICATION) {
            if (!destination_) {
                UPBUS_THROW(InvalidTopic, "NOTIFICATION from " << source_ << " has no destination");
            }
            destination_->validate();
        }
    }

    bool operator == (UMessage const& other) const {
        return type_ == other.type_
            && source_ == other.source_
            && destination_ == other.destination_
            && payload_ == other.payload_;
    }

    bool operator != (UMessage const& other) const {
        return !(*this == other);
    }

    friend
    std::ostream& operator << (std::ostream& os, UMessage const& m) {
        os << m.type_ << " source=" << m.source_;
        if (m.destination_) os << " destination=" << *m.destination_;
        if (m.payload_) {
            os << " payload=" << m.payload_->size() << "B";
        } else {
            os << " payload=none";
        }
        return os;
    }

private:
    UMessage(UUri source, std::optional<UUri> destination, UMessageType type
        , std::optional<UPayload> payload)
    : source_(std::move(source))
    , destination_(std::move(destination))
    , type_(type)
    , payload_(std::move(payload)) {
    }

    UUri source_;
    std::optional<UUri> destination_;
    UMessageType type_;
    std::optional<UPayload> payload_;
};
}
