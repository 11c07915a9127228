#pragma once

#include <memory>
#include <vector>
#include <string>
#include <optional>
#include <initializer_list>
#include <stdint.h>

namespace upbus {

/**
 * @brief true if [data, data + len) is well formed UTF-8
 * @details rejects overlong forms, surrogates and code points above U+10FFFF
 */
inline
bool
isValidUtf8(uint8_t const* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        auto c = data[i];
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t n;
        uint32_t cp;
        if ((c & 0xe0) == 0xc0) {
            n = 1; cp = c & 0x1f;
        } else if ((c & 0xf0) == 0xe0) {
            n = 2; cp = c & 0x0f;
        } else if ((c & 0xf8) == 0xf0) {
            n = 3; cp = c & 0x07;
        } else {
            return false;
        }
        if (i + n >= len) return false; //truncated sequence
        for (size_t k = 1; k <= n; ++k) {
            if ((data[i + k] & 0xc0) != 0x80) return false;
            cp = (cp << 6) | (data[i + k] & 0x3f);
        }
        if ((n == 1 && cp < 0x80)
            || (n == 2 && cp < 0x800)
            || (n == 3 && cp < 0x10000)
            || cp > 0x10ffff
            || (cp >= 0xd800 && cp <= 0xdfff)) {
            return false;
        }
        i += n + 1;
    }
    return true;
}

/**
 * @brief immutable payload bytes of a UMessage
 * @details the bytes are shared among copies so handing a message to many
 * listeners never duplicates the payload
 */
struct UPayload {
    using Bytes = std::vector<uint8_t>;

    UPayload()
    : bytes_(std::make_shared<Bytes const>()) {
    }

    explicit UPayload(Bytes bytes)
    : bytes_(std::make_shared<Bytes const>(std::move(bytes))) {
    }

    static UPayload fromString(std::string const& s) {
        return UPayload{Bytes(s.begin(), s.end())};
    }

    static UPayload fromBytes(void const* data, size_t len) {
        auto p = static_cast<uint8_t const*>(data);
        return UPayload{Bytes(p, p + len)};
    }

    static UPayload fromBytes(std::initializer_list<uint8_t> bytes) {
        return UPayload{Bytes(bytes)};
    }

    Bytes const& bytes() const { return *bytes_; }
    uint8_t const* data() const { return bytes_->data(); }
    size_t size() const { return bytes_->size(); }
    bool empty() const { return bytes_->empty(); }

    /**
     * @brief the payload as text
     * @return empty if the bytes are not valid UTF-8
     */
    std::optional<std::string> asString() const {
        if (!isValidUtf8(data(), size())) return std::nullopt;
        return std::string(bytes_->begin(), bytes_->end());
    }

    bool operator == (UPayload const& other) const {
        return bytes_ == other.bytes_ || *bytes_ == *other.bytes_;
    }

    bool operator != (UPayload const& other) const {
        return !(*this == other);
    }

private:
    std::shared_ptr<Bytes const> bytes_;
};
}
