#pragma once

#include "upbus/UMessage.hpp"
#include "upbus/Endian.hpp"
#include "upbus/Exception.hpp"

#include <optional>
#include <stdexcept>
#include <vector>
#include <stdint.h>
#include <string.h>

namespace upbus { namespace net {

#pragma pack(push, 1)
/**
 * @brief leads every datagram, followed by the source UUri, the optional
 * destination UUri and the optional length prefixed payload
 */
struct TransportMessageHeader {
    static constexpr uint32_t MAGIC = 0x55504253u; // "UPBS"
    static constexpr uint8_t WIRE_VERSION = 1;
    enum Flag : uint8_t {
        HAS_DESTINATION = 1u << 0,
        HAS_PAYLOAD = 1u << 1,
    };

    XmitEndian<uint32_t> magic{MAGIC};
    uint8_t wireVersion = WIRE_VERSION;
    uint8_t type = 0;
    uint8_t flags = 0;
    uint8_t reserved = 0;
    XmitEndian<uint32_t> senderId{0};
};
#pragma pack(pop)
static_assert(sizeof(TransportMessageHeader) == 12, "wire header size changed");

/**
 * @brief a datagram after decoding
 */
struct Datagram {
    uint32_t senderId;
    UMessage message;
};

namespace messages_detail {
struct Writer {
    std::vector<uint8_t>& out;

    void put(void const* p, size_t len) {
        auto b = static_cast<uint8_t const*>(p);
        out.insert(out.end(), b, b + len);
    }

    template <typename T>
    void putInt(T v) {
        XmitEndian<T> x{v};
        put(&x, sizeof(x));
    }

    void putUri(UUri const& u) {
        out.push_back(static_cast<uint8_t>(u.authority().size()));
        put(u.authority().data(), u.authority().size());
        putInt<uint32_t>(u.entityId());
        out.push_back(u.version());
        putInt<uint32_t>(u.resourceId());
    }
};

struct Reader {
    uint8_t const* cur;
    uint8_t const* end;

    void need(size_t len, char const* what) {
        if (static_cast<size_t>(end - cur) < len) {
            UPBUS_THROW(std::runtime_error, "truncated " << what);
        }
    }

    uint8_t getByte(char const* what) {
        need(1, what);
        return *cur++;
    }

    template <typename T>
    T getInt(char const* what) {
        need(sizeof(T), what);
        XmitEndian<T> x;
        memcpy(&x, cur, sizeof(x));
        cur += sizeof(x);
        return x;
    }

    UUri getUri(char const* what) {
        auto len = getByte(what);
        need(len, what);
        std::string authority(reinterpret_cast<char const*>(cur), len);
        cur += len;
        auto entityId = getInt<uint32_t>(what);
        auto version = getByte(what);
        auto resourceId = getInt<uint32_t>(what);
        return UUri{std::move(authority), entityId, version, resourceId};
    }
};
} //messages_detail

/**
 * @brief serialize a message into one datagram
 *
 * @param message assumed valid, checked by the caller
 * @param senderId identifies the sending transport instance
 * @return datagram bytes
 */
inline
std::vector<uint8_t>
encode(UMessage const& message, uint32_t senderId) {
    std::vector<uint8_t> res;
    auto const& payload = message.payload();
    res.reserve(sizeof(TransportMessageHeader) + 2 * (10 + message.source().authority().size())
        + (payload ? 4 + payload->size() : 0));
    TransportMessageHeader h;
    h.type = static_cast<uint8_t>(message.type());
    h.flags = (message.destination() ? TransportMessageHeader::HAS_DESTINATION : 0)
        | (payload ? TransportMessageHeader::HAS_PAYLOAD : 0);
    h.senderId = senderId;

    messages_detail::Writer w{res};
    w.put(&h, sizeof(h));
    w.putUri(message.source());
    if (message.destination()) {
        w.putUri(*message.destination());
    }
    if (payload) {
        w.putInt<uint32_t>(static_cast<uint32_t>(payload->size()));
        w.put(payload->data(), payload->size());
    }
    return res;
}

/**
 * @brief parse one datagram
 * @details throws std::runtime_error (InvalidTopic for a bad UUri) when the bytes
 * are not exactly one well formed message
 */
inline
Datagram
decode(void const* bytes, size_t len) {
    messages_detail::Reader r{static_cast<uint8_t const*>(bytes)
        , static_cast<uint8_t const*>(bytes) + len};
    r.need(sizeof(TransportMessageHeader), "header");
    TransportMessageHeader h;
    memcpy(&h, r.cur, sizeof(h));
    r.cur += sizeof(h);
    if (h.magic != TransportMessageHeader::MAGIC) {
        UPBUS_THROW(std::runtime_error, "bad magic " << std::hex << (uint32_t)h.magic);
    }
    if (h.wireVersion != TransportMessageHeader::WIRE_VERSION) {
        UPBUS_THROW(std::runtime_error, "unsupported wire version " << (int)h.wireVersion);
    }
    auto source = r.getUri("source");
    std::optional<UUri> destination;
    if (h.flags & TransportMessageHeader::HAS_DESTINATION) {
        destination = r.getUri("destination");
    }
    std::optional<UPayload> payload;
    if (h.flags & TransportMessageHeader::HAS_PAYLOAD) {
        auto l = r.getInt<uint32_t>("payload length");
        r.need(l, "payload");
        payload = UPayload::fromBytes(r.cur, l);
        r.cur += l;
    }
    if (r.cur != r.end) {
        UPBUS_THROW(std::runtime_error, (r.end - r.cur) << " trailing bytes");
    }

    switch (static_cast<UMessageType>(h.type)) {
        case UMessageType::PUBLISH:
            if (destination) {
                UPBUS_THROW(std::runtime_error, "PUBLISH datagram carries a destination");
            }
            return Datagram{h.senderId, UMessage::publish(std::move(source), std::move(payload))};
        case UMessageType::NOTIFICATION:
            if (!destination) {
                UPBUS_THROW(std::runtime_error, "NOTIFICATION datagram without destination");
            }
            return Datagram{h.senderId, UMessage::notification(std::move(source)
                , std::move(*destination), std::move(payload))};
    }
    UPBUS_THROW(std::runtime_error, "unknown message type " << (int)h.type);
}
}}
