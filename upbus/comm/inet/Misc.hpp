#pragma once

#include "upbus/Exception.hpp"

#include <string>
#include <stdexcept>
#include <utility>

#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <ifaddrs.h>
#include <stdlib.h>
#include <net/if.h>
#include <string.h>
#include <errno.h>

namespace upbus { namespace comm { namespace inet {
/**
 * @brief resolve a local ip interface using a mask
 *
 * @param mask in this format: "192.168.0.1/24" or "192.168.0.101" which is the same as "192.168.0.101/32"
 * "0.0.0.0/0" picks the first interface that is not a loopback
 * @return a local ip matches the mask and its interface name if no exception is thrown
 */
inline
std::pair<std::string, std::string>
getLocalIpMatchMask(std::string const& mask) {
    bool includeLoopback = mask != "0.0.0.0/0";
    auto offset = mask.find('/');
    auto ip_part = mask;
    uint32_t maskLen = 32;

    if (offset != std::string::npos) {
        ip_part = mask.substr(0, offset);
        auto bit_part = mask.substr(offset + 1u);
        maskLen = atoi(bit_part.c_str());
    }
    in_addr target;
    if (!inet_aton(ip_part.c_str(), &target) || maskLen > 32) {
        UPBUS_THROW(std::runtime_error, mask << " is not an ip mask");
    }
    uint32_t targetIp = target.s_addr;
    struct ifaddrs *ifaddr, *ifa;
    char host[NI_MAXHOST];

    if (getifaddrs(&ifaddr) == -1) {
        UPBUS_THROW(std::runtime_error, " getifaddrs failed errno=" << errno);
    }

    for (ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == NULL || ifa->ifa_addr->sa_family != AF_INET)
            continue;

        auto s = getnameinfo(ifa->ifa_addr,
            sizeof(struct sockaddr_in),
            host, NI_MAXHOST, NULL, 0, NI_NUMERICHOST);
        if (s != 0) {
            freeifaddrs(ifaddr);
            UPBUS_THROW(std::runtime_error, " getnameinfo failed ");
        }
        struct in_addr addr;
        if (inet_aton(host, &addr)
            && (maskLen == 0
                || (ntohl(targetIp) >> (32u - maskLen)) == (ntohl(addr.s_addr) >> (32u - maskLen)))
            && (includeLoopback || !(ifa->ifa_flags & IFF_LOOPBACK))) {
            freeifaddrs(ifaddr);
            return std::make_pair(std::string(host), std::string(ifa->ifa_name));
        }
    }
    freeifaddrs(ifaddr);
    UPBUS_THROW(std::runtime_error, mask << " does not resolve locally");
}

/**
 * @brief true for 224.0.0.0/4
 */
inline
bool
isMulticast(in_addr_t networkOrderAddr) {
    return (ntohl(networkOrderAddr) & 0xf0000000u) == 0xe0000000u;
}
}}}
