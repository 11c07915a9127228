#pragma once

#include "upbus/UUri.hpp"

#include <memory>
#include <string>
#include <stdint.h>

namespace upbus {

/**
 * @brief turns an entity's static identity into the UUris of its resources
 */
struct UriProvider {
    using ptr = std::shared_ptr<UriProvider const>;
    virtual ~UriProvider() = default;

    virtual std::string const& authority() const = 0;
    virtual uint32_t entityId() const = 0;
    virtual uint8_t version() const = 0;

    /**
     * @brief the UUri of a resource of this entity
     */
    virtual UUri resourceUri(uint32_t resourceId) const {
        return UUri{authority(), entityId(), version(), resourceId};
    }

    /**
     * @brief the UUri identifying the entity itself, resource id 0
     */
    virtual UUri sourceUri() const {
        return resourceUri(0);
    }
};

/**
 * @brief UriProvider for an identity fixed at construction
 */
struct StaticUriProvider
: UriProvider {
    StaticUriProvider(std::string authority, uint32_t entityId, uint8_t version)
    : authority_(std::move(authority))
    , entityId_(entityId)
    , version_(version) {
    }

    static ptr create(std::string authority, uint32_t entityId, uint8_t version) {
        return std::make_shared<StaticUriProvider const>(std::move(authority), entityId, version);
    }

    std::string const& authority() const override { return authority_; }
    uint32_t entityId() const override { return entityId_; }
    uint8_t version() const override { return version_; }

private:
    std::string const authority_;
    uint32_t const entityId_;
    uint8_t const version_;
};
}
