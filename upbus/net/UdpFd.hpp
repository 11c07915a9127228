#pragma once

#include "upbus/app/utils/EpollTask.hpp"
#include "upbus/app/Config.hpp"
#include "upbus/comm/inet/Misc.hpp"
#include "upbus/Exception.hpp"

#include <string>
#include <stdexcept>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/ip.h>
#include <arpa/inet.h>
#include <net/if.h>
#include <string.h>

namespace upbus { namespace net {

using Config = upbus::app::Config;

/**
 * @brief an owned UDP socket set up with the settings common to sending and receiving
 */
struct UdpFd
: app::utils::EpollFd {
    UdpFd(Config const& cfg, bool nonBlocking)
    : mtu_(cfg.getExt<size_t>("mtu")) {
        if (mtu_ <= 8u + 20u) {
            UPBUS_THROW(std::out_of_range, "mtu " << mtu_ << " is too small");
        }
        mtu_ -= (8u + 20u);  // 8bytes udp header and 20bytes ip header
        fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC | (nonBlocking ? SOCK_NONBLOCK : 0), 0);
        if(fd < 0) {
            UPBUS_THROW(std::runtime_error, "failed to create socket errno=" << errno);
        }
        if (cfg.getExt<bool>("multicastBoundToIface")) {
            auto iface =
                comm::inet::getLocalIpMatchMask(cfg.getExt<std::string>("ifaceAddr"));
            struct in_addr localInterface;
            localInterface.s_addr = inet_addr(iface.first.c_str());
            if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF
                , (char *)&localInterface, sizeof(localInterface)) < 0) {
                UPBUS_THROW(std::runtime_error, "failed to set ifaceAddr " << cfg.getExt<std::string>("ifaceAddr"));
            }

            struct ifreq ifr;
            memset(&ifr, 0, sizeof(ifr));
            strncpy(ifr.ifr_name, iface.second.c_str(), IFNAMSIZ - 1);
            if (setsockopt(fd, SOL_SOCKET, SO_BINDTODEVICE, &ifr, sizeof(ifr)) < 0) {
                UPBUS_THROW(std::runtime_error, "failed to set SO_BINDTODEVICE " << iface.second
                    << " for ifaceAddr " << cfg.getExt<std::string>("ifaceAddr"));
            }
        }
    }

protected:
    size_t mtu_;    /// largest datagram payload that fits in one IP packet
};
}}
