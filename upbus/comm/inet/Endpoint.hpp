#pragma once

#include "upbus/Exception.hpp"

#include <string>
#include <iostream>
#include <stdexcept>

#include <netinet/in.h>
#include <arpa/inet.h>
#include <string.h>
#include <stdlib.h>
#include <errno.h>
#include <sys/socket.h>

namespace upbus { namespace comm { namespace inet {
/**
 * @brief an IPv4 address and port, constructed from "ip:port"
 */
struct Endpoint {
    sockaddr_in v;
    Endpoint() {
        memset(&v, 0, sizeof(v));
    }

    explicit Endpoint(std::string const& ipPort) {
        auto pos = ipPort.rfind(':');
        if (pos == std::string::npos || pos == 0 || pos + 1 == ipPort.size()) {
            UPBUS_THROW(std::runtime_error, "incorrect address " << ipPort);
        }
        auto portStr = ipPort.substr(pos + 1);
        char* end = nullptr;
        auto port = strtoul(portStr.c_str(), &end, 10);
        if (*end || port > 0xffffu) {
            UPBUS_THROW(std::runtime_error, "incorrect port in address " << ipPort);
        }
        *this = Endpoint(ipPort.substr(0, pos), (uint16_t)port);
    }

    Endpoint(std::string const& ip, uint16_t port) {
        memset(&v, 0, sizeof(v));
        v.sin_family = AF_INET;
        if (!inet_aton(ip.c_str(), &v.sin_addr)) {
            UPBUS_THROW(std::runtime_error, "incorrect ip " << ip);
        }
        v.sin_port = htons(port);
    }

    std::string ip() const {
        char buf[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &v.sin_addr, buf, sizeof(buf))) {
            UPBUS_THROW(std::runtime_error, "failed to inet_ntop, errno=" << errno);
        }
        return buf;
    }

    uint16_t port() const {
        return ntohs(v.sin_port);
    }

    bool operator == (Endpoint const& other) const {
        return v.sin_addr.s_addr == other.v.sin_addr.s_addr
            && v.sin_port == other.v.sin_port;
    }

    friend
    std::ostream& operator << (std::ostream& os, Endpoint const& ep) {
        os << ep.ip() << ":" << ep.port();
        return os;
    }

    friend
    std::istream& operator >> (std::istream& is, Endpoint& ep) {
        std::string ipPort;
        is >> ipPort;
        if (is) {
            ep = Endpoint(ipPort);
        }
        return is;
    }
};
}}}
