#pragma once
#include "upbus/net/UdpFd.hpp"
#include "upbus/net/DefaultUserConfig.hpp"
#include "upbus/comm/inet/Endpoint.hpp"
#include "upbus/app/Logger.hpp"
#include "upbus/Exception.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace upbus { namespace net {

/**
 * @brief sends each datagram to every configured udpcast destination
 * @details send is safe to call from multiple threads, the destinations are
 * fixed at construction
 */
struct SendTransport
: UdpFd {
    explicit SendTransport(Config cfg)
    : SendTransport((cfg.setAdditionalFallbackConfig(Config(DefaultUserConfig))
        , cfg.resetSection("tx", false)), 0) {
    }

    std::vector<comm::inet::Endpoint> const& udpcastDests() const {
        return udpcastDests_;
    }

    /**
     * @brief send one datagram
     * @details throws std::out_of_range when it does not fit the mtu and
     * Unavailable when the OS refuses it
     */
    void send(void const* bytes, size_t len) {
        if (len > mtu_) {
            UPBUS_THROW(std::out_of_range, "datagram of " << len << " bytes does not fit mtu payload of " << mtu_);
        }
        for (auto const& dest : udpcastDests_) {
            auto l = sendto(fd, bytes, len, MSG_NOSIGNAL
                , (struct sockaddr *)&dest.v, sizeof(dest.v));
            if (l < 0) {
                UPBUS_THROW(Unavailable, "sendto " << dest << " failed errno=" << errno);
            }
        }
    }

private:
    SendTransport(Config const& cfg, int)
    : UdpFd(cfg, false)
    , config_(cfg) {
        char loopch = config_.getExt<bool>("loopback")?1:0;
        if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, (char *)&loopch, sizeof(loopch)) < 0) {
            UPBUS_THROW(std::runtime_error, "failed to set loopback=" << config_.getExt<bool>("loopback"));
        }

        auto sz = config_.getExt<int>("udpSendBufferBytes");
        if (sz) {
            if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &sz, sizeof(sz)) < 0) {
                UPBUS_LOG_C("failed to set send buffer size=", sz);
            }
        }

        auto ttl = config_.getExt<int>("ttl");
        if (ttl > 0 && setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
            UPBUS_THROW(std::runtime_error, "failed to set set ttl=" << ttl);
        }

        std::istringstream iss(config_.getExt<std::string>("udpcastDests"));
        comm::inet::Endpoint dest;
        while (iss >> dest) {
            if (std::find(udpcastDests_.begin(), udpcastDests_.end(), dest) == udpcastDests_.end()) {
                udpcastDests_.push_back(dest);
            }
        }
        if (udpcastDests_.empty()) {
            UPBUS_THROW(std::runtime_error, "no udpcastDests configured");
        }
    }

    Config const config_;
    std::vector<comm::inet::Endpoint> udpcastDests_;
};
}}
