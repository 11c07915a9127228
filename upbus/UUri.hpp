#pragma once

#include "upbus/Exception.hpp"

#include <boost/container_hash/hash.hpp>

#include <string>
#include <sstream>
#include <ostream>
#include <functional>
#include <algorithm>
#include <vector>
#include <cctype>
#include <stdint.h>

namespace upbus {

/**
 * @brief immutable structured address: authority, entity id, version and resource id
 * @details two UUris are equal when all four fields are equal; the listener
 * registries use a UUri as the key to route messages, so a topic is matched
 * exactly - no wildcards
 *
 * text form: //authority/ENTITY_HEX/VERSION_HEX/RESOURCE_HEX, for example //veh/a34b/1/8001
 */
struct UUri {
    static constexpr size_t MAX_AUTHORITY_LEN = 128;
    static constexpr uint32_t MAX_RESOURCE_ID = 0xffffu;

    UUri(std::string authority, uint32_t entityId, uint8_t version, uint32_t resourceId)
    : authority_(std::move(authority))
    , entityId_(entityId)
    , version_(version)
    , resourceId_(resourceId) {
    }

    std::string const& authority() const { return authority_; }
    uint32_t entityId() const { return entityId_; }
    uint8_t version() const { return version_; }
    uint32_t resourceId() const { return resourceId_; }

    /**
     * @brief same entity, different resource
     */
    UUri withResourceId(uint32_t resourceId) const {
        return UUri{authority_, entityId_, version_, resourceId};
    }

    /**
     * @brief empty string when the UUri is well formed; otherwise the first defect found
     */
    std::string defect() const {
        if (authority_.empty()) return "empty authority";
        if (authority_.size() > MAX_AUTHORITY_LEN) return "authority too long";
        auto bad = std::find_if(authority_.begin(), authority_.end()
            , [](char c) {
                return c == '/' || std::isspace(static_cast<unsigned char>(c))
                    || !std::isprint(static_cast<unsigned char>(c));
            });
        if (bad != authority_.end()) return "illegal character in authority";
        if (resourceId_ > MAX_RESOURCE_ID) return "resource id out of range";
        return std::string();
    }

    bool isWellFormed() const {
        return defect().empty();
    }

    /**
     * @brief throw InvalidTopic when the UUri is not well formed
     */
    void validate() const {
        auto d = defect();
        if (!d.empty()) {
            UPBUS_THROW(InvalidTopic, "malformed UUri " << *this << ": " << d);
        }
    }

    std::string toString() const {
        std::ostringstream os;
        os << *this;
        return os.str();
    }

    /**
     * @brief parse the text form
     * @details throws InvalidTopic if the text is not //authority/ENTITY/VERSION/RESOURCE
     * with hex numbers in range, or if the result is not well formed
     */
    static UUri parse(std::string const& text) {
        if (text.size() < 2 || text.compare(0, 2, "//") != 0) {
            UPBUS_THROW(InvalidTopic, "UUri text must start with //, got '" << text << '\'');
        }
        if (text.back() == '/') {   //getline would not see the empty last segment
            UPBUS_THROW(InvalidTopic, "UUri text ends with /, got '" << text << '\'');
        }
        std::vector<std::string> parts;
        std::string part;
        std::istringstream is(text.substr(2));
        while (std::getline(is, part, '/')) {
            parts.push_back(part);
        }
        if (parts.size() != 4) {
            UPBUS_THROW(InvalidTopic, "UUri text needs 4 segments, got '" << text << '\'');
        }
        auto entityId = parseHex(parts[1], 0xffffffffu, text);
        auto version = parseHex(parts[2], 0xffu, text);
        auto resourceId = parseHex(parts[3], MAX_RESOURCE_ID, text);
        UUri res{parts[0], (uint32_t)entityId, (uint8_t)version, (uint32_t)resourceId};
        res.validate();
        return res;
    }

    bool operator == (UUri const& other) const {
        return entityId_ == other.entityId_
            && resourceId_ == other.resourceId_
            && version_ == other.version_
            && authority_ == other.authority_;
    }

    bool operator != (UUri const& other) const {
        return !(*this == other);
    }

    friend
    std::ostream& operator << (std::ostream& os, UUri const& u) {
        auto flags = os.flags();
        os << "//" << u.authority_ << '/' << std::hex << u.entityId_
            << '/' << (uint32_t)u.version_ << '/' << u.resourceId_;
        os.flags(flags);
        return os;
    }

private:
    static uint64_t parseHex(std::string const& s, uint64_t max, std::string const& text) {
        if (s.empty() || s.size() > 8
            || !std::all_of(s.begin(), s.end()
                , [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); })) {
            UPBUS_THROW(InvalidTopic, "bad hex field '" << s << "' in UUri '" << text << '\'');
        }
        auto v = std::stoull(s, nullptr, 16);
        if (v > max) {
            UPBUS_THROW(InvalidTopic, "field '" << s << "' out of range in UUri '" << text << '\'');
        }
        return v;
    }

    std::string authority_;
    uint32_t entityId_;
    uint8_t version_;
    uint32_t resourceId_;
};
}

namespace std {
template <>
struct hash<upbus::UUri> {
    size_t operator()(upbus::UUri const& u) const noexcept {
        size_t seed = 0;
        boost::hash_combine(seed, u.authority());
        boost::hash_combine(seed, u.entityId());
        boost::hash_combine(seed, u.version());
        boost::hash_combine(seed, u.resourceId());
        return seed;
    }
};
}
