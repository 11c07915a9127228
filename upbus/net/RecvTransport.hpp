#pragma once
#include "upbus/net/UdpFd.hpp"
#include "upbus/net/DefaultUserConfig.hpp"
#include "upbus/comm/inet/Misc.hpp"
#include "upbus/app/utils/EpollTask.hpp"
#include "upbus/app/Logger.hpp"
#include "upbus/Exception.hpp"

#include <functional>
#include <memory>
#include <string>
#include <stdexcept>

namespace upbus { namespace net {

/**
 * @brief binds the udpcast listen address and hands every datagram received
 * to a callback
 * @details runOnce is meant to be called repeatedly from one thread
 */
struct RecvTransport
: UdpFd {
    using DatagramHandler = std::function<void (void const*, size_t, sockaddr_in const&)>;

    RecvTransport(Config cfg, app::utils::EpollTask& epollTask, DatagramHandler handler)
    : RecvTransport((cfg.setAdditionalFallbackConfig(Config(DefaultUserConfig))
        , cfg.resetSection("rx", false)), epollTask, std::move(handler), 0) {
    }

    auto const& listenAddr() const {
        return listenAddr_;
    }

    auto listenPort() const {
        return listenPort_;
    }

    /**
     * @brief wait for the socket to become readable within the epoll wait time
     * and drain it
     */
    void runOnce() {
        if (!isFdReady()) {
            epollTask_.poll();
        }
        resumeRead();
    }

private:
    RecvTransport(Config const& cfg, app::utils::EpollTask& epollTask
        , DatagramHandler handler, int)
    : UdpFd(cfg, true)
    , config_(cfg)
    , epollTask_(epollTask)
    , handler_(std::move(handler))
    , buf_(new char[mtu_]) {
        uint32_t yes = 1;
        if (setsockopt(fd, SOL_SOCKET,SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
            UPBUS_LOG_C("failed to set reuse address errno=", errno);
        }
        auto sz = config_.getExt<int>("udpRecvBufferBytes");
        if (sz) {
            if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &sz, sizeof(sz)) < 0) {
                UPBUS_LOG_C("failed to set recv buffer size=", sz);
            }
        }

        auto udpcastListenPort = config_.getExt<uint16_t>("udpcastListenPort");
        struct sockaddr_in udpcastListenAddrPort;
        memset(&udpcastListenAddrPort, 0, sizeof(udpcastListenAddrPort));
        udpcastListenAddrPort.sin_family = AF_INET;
        auto ipStr = config_.getExt<std::string>("udpcastListenAddr") == std::string("ifaceAddr")
            ? comm::inet::getLocalIpMatchMask(config_.getExt<std::string>("ifaceAddr")).first
            : config_.getExt<std::string>("udpcastListenAddr");
        if (!inet_aton(ipStr.c_str(), &udpcastListenAddrPort.sin_addr)) {
            UPBUS_THROW(std::runtime_error, "incorrect udpcastListenAddr " << ipStr);
        }
        udpcastListenAddrPort.sin_port = htons(udpcastListenPort);
        if (::bind(fd, (struct sockaddr *)&udpcastListenAddrPort, sizeof(udpcastListenAddrPort)) < 0) {
            UPBUS_THROW(std::runtime_error, "failed to bind udpcast listen address "
                << ipStr << ':' << udpcastListenPort << " errno=" << errno);
        }

        socklen_t tmp = sizeof(udpcastListenAddrPort);
        if (udpcastListenPort == 0
            && getsockname(fd, (struct sockaddr *)&udpcastListenAddrPort, &tmp)) {
            UPBUS_THROW(std::runtime_error, "failed getsockname for udpcast listen address "
                << ipStr << " errno=" << errno);
        }

        if (comm::inet::isMulticast(udpcastListenAddrPort.sin_addr.s_addr)) {
            struct ip_mreq mreq;
            mreq.imr_multiaddr.s_addr = udpcastListenAddrPort.sin_addr.s_addr;
            auto iface =
                comm::inet::getLocalIpMatchMask(config_.getExt<std::string>("ifaceAddr"));
            mreq.imr_interface.s_addr = inet_addr(iface.first.c_str());
            if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
                UPBUS_THROW(std::runtime_error, "failed to join " << ipStr << ":"
                    << udpcastListenPort << " errno=" << errno);
            }
        }
        listenAddr_ = ipStr;
        listenPort_ = ntohs(udpcastListenAddrPort.sin_port);
        UPBUS_LOG_N("listen at ", listenAddr_+ ":" + std::to_string(listenPort_));

        auto pollWaitMillisec = config_.getExt<int>("pollWaitMillisec");
        if (pollWaitMillisec <= 0) {
            UPBUS_THROW(std::out_of_range, "pollWaitMillisec needs > 0, got " << pollWaitMillisec);
        }
        epollTask_.setWaitTime(pollWaitMillisec);
        epollTask_.add(app::utils::EpollTask::EPOLLIN
            | app::utils::EpollTask::EPOLLET, *this);
    }

    void resumeRead() {
        while (isFdReady()) {
            sockaddr_in remoteAddr;
            socklen_t addrLen = sizeof(remoteAddr);
            auto l = recvfrom(fd, buf_.get(), mtu_, MSG_NOSIGNAL|MSG_DONTWAIT
                , (struct sockaddr *)&remoteAddr, &addrLen);
            if (l < 0) {
                if (!checkErr()) {
                    UPBUS_THROW(std::runtime_error, "recvfrom failed errno=" << errno);
                }
                return;
            }
            handler_(buf_.get(), static_cast<size_t>(l), remoteAddr);
        }
    }

    Config const config_;
    app::utils::EpollTask& epollTask_;
    DatagramHandler handler_;
    std::unique_ptr<char[]> buf_;
    std::string listenAddr_;
    uint16_t listenPort_ = 0;
};
}}
