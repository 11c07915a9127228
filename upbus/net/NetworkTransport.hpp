#pragma once

#include "upbus/Transport.hpp"
#include "upbus/ListenerRegistry.hpp"
#include "upbus/UUri.hpp"
#include "upbus/net/Messages.hpp"
#include "upbus/net/SendTransport.hpp"
#include "upbus/net/RecvTransport.hpp"
#include "upbus/net/DefaultUserConfig.hpp"
#include "upbus/app/utils/EpollTask.hpp"
#include "upbus/app/Config.hpp"
#include "upbus/app/Logger.hpp"
#include "upbus/os/Thread.hpp"
#include "upbus/Exception.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace upbus { namespace net {

/**
 * @brief Transport carrying messages between processes as UDP datagrams
 * @details every message is one datagram sent to each of the configured
 * udpcastDests; a multicast destination reaches every NetworkTransport listening
 * on that group. Received messages are dispatched by source topic on the receive
 * thread, so a listener that blocks holds up later messages.
 * Not to be destroyed from inside one of its listeners.
 *
 * @code
 * auto transport = net::NetworkTransport::builder("veh")
 *     .withConfig(Config(R"({"tx":{"udpcastDests":"127.0.0.1:4321"}})"))
 *     .build();
 * @endcode
 */
struct NetworkTransport
: upbus::Transport {
    using ptr = std::shared_ptr<NetworkTransport>;

    struct Builder {
        explicit Builder(std::string authority)
        : authority_(std::move(authority)) {
        }

        /**
         * @brief settings overriding DefaultUserConfig
         */
        Builder& withConfig(Config cfg) {
            config_ = std::move(cfg);
            return *this;
        }

        /**
         * @brief open the sockets and start the receive thread
         * @details throws ConfigurationError if the authority is invalid or
         * a socket cannot be set up
         */
        ptr build() const {
            return ptr(new NetworkTransport(authority_, config_));
        }

    private:
        std::string authority_;
        Config config_;
    };

    static Builder builder(std::string authority) {
        return Builder(std::move(authority));
    }

    ~NetworkTransport() {
        stop();
    }

    void send(UMessage const& message) override {
        message.validate();
        if (stopped_) {
            UPBUS_THROW(Unavailable, "transport " << authority_ << " is stopped");
        }
        auto bytes = encode(message, senderId_);
        send_->send(bytes.data(), bytes.size());
        UPBUS_LOG_D("sent ", message, " in ", bytes.size(), " bytes");
    }

    ListenerHandle registerListener(UUri const& topic, Listener::ptr listener) override {
        return registry_.registerListener(topic, std::move(listener));
    }

    void unregisterListener(UUri const& topic, Listener::ptr const& listener) override {
        registry_.unregisterListener(topic, listener);
    }

    void unregisterListener(ListenerHandle const& handle) override {
        registry_.unregisterListener(handle);
    }

    /**
     * @brief stop receiving and sending, listeners stay registered
     * @details returns after the receive thread exits unless called on it;
     * safe to call from several threads
     */
    void stop() {
        stopped_ = true;
        std::lock_guard<std::mutex> g(stopLock_);
        if (rxThread_.joinable()
            && rxThread_.get_id() != std::this_thread::get_id()) {
            rxThread_.join();
        }
    }

    /**
     * @brief true after stop() or after the receive thread died on an error
     */
    bool stopped() const {
        return stopped_;
    }

    std::string const& authority() const { return authority_; }
    std::string const& listenAddr() const { return recv_->listenAddr(); }
    uint16_t listenPort() const { return recv_->listenPort(); }
    uint32_t senderId() const { return senderId_; }
    std::vector<comm::inet::Endpoint> const& udpcastDests() const {
        return send_->udpcastDests();
    }
    ListenerRegistry const& registry() const { return registry_; }

private:
    NetworkTransport(std::string authority, Config cfg)
    : authority_(std::move(authority))
    , senderId_(std::random_device{}()) {
        auto defect = UUri{authority_, 0, 0, 0}.defect();
        if (!defect.empty()) {
            UPBUS_THROW(ConfigurationError, "invalid authority '" << authority_ << "': " << defect);
        }
        try {
            cfg.setAdditionalFallbackConfig(Config(DefaultUserConfig));
            send_.reset(new SendTransport(cfg));
            recv_.reset(new RecvTransport(cfg, epollTask_
                , [this](void const* bytes, size_t len, sockaddr_in const& from) {
                    onDatagram(bytes, len, from);
                }));
            auto rxCfg = cfg;
            rxCfg.resetSection("rx", false);
            rxCfg (threadName_, "threadName")
                (schedPolicy_, "schedPolicy")
                (schedPriority_, "schedPriority")
                (dropOwnMessages_, "dropOwnMessages")
            ;
        } catch (ConfigurationError const&) {
            throw;
        } catch (std::exception const& e) {
            UPBUS_THROW(ConfigurationError, "transport " << authority_ << " setup failed: " << e.what());
        }
        rxThread_ = std::thread([this]() { runRecv(); });
        UPBUS_LOG_N("transport ", authority_, " senderId=", senderId_, " up");
    }

    void runRecv() {
        try {
            os::configureCurrentThread(threadName_.c_str(), schedPolicy_.c_str(), schedPriority_);
        } catch (std::exception const& e) {
            UPBUS_LOG_W(threadName_, " keeps default thread settings: ", e.what());
        }
        try {
            while (!stopped_) {
                recv_->runOnce();
            }
        } catch (std::exception const& e) {
            UPBUS_LOG_C(threadName_, " stopped receiving: ", e.what());
            stopped_ = true;
        } catch (...) {
            UPBUS_LOG_C(threadName_, " stopped receiving: a listener threw a non std::exception");
            stopped_ = true;
        }
    }

    void onDatagram(void const* bytes, size_t len, sockaddr_in const& from) {
        try {
            auto d = decode(bytes, len);
            if (dropOwnMessages_ && d.senderId == senderId_) return;
            auto n = registry_.dispatch(d.message.topic(), d.message);
            UPBUS_LOG_D("received ", d.message, " from ", d.senderId, " delivered to ", n, " listener(s)");
        } catch (std::exception const& e) {
            comm::inet::Endpoint ep;
            ep.v = from;
            UPBUS_LOG_W("dropped ", len, " bytes from ", ep, ": ", e.what());
        }
    }

    std::string const authority_;
    uint32_t const senderId_;
    std::atomic<bool> stopped_{false};
    std::mutex stopLock_;
    ListenerRegistry registry_;
    app::utils::EpollTask epollTask_;
    std::unique_ptr<SendTransport> send_;
    std::unique_ptr<RecvTransport> recv_;
    std::string threadName_;
    std::string schedPolicy_;
    int schedPriority_ = 0;
    bool dropOwnMessages_ = false;
    std::thread rxThread_;
};
}}
