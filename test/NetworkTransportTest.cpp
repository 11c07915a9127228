#include "upbus/net/NetworkTransport.hpp"
#include "upbus/communication/SimplePublisher.hpp"
#include "upbus/UriProvider.hpp"
#include "TestListeners.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

using namespace upbus;
using namespace upbus::net;
using upbus::test::RecordingListener;

namespace {
UUri const topic{"my-vehicle", 0xa34b, 1, 0x8001};

Config unicastConfig(std::string const& dests) {
    Config cfg;
    cfg.put("tx.udpcastDests", dests)
        .put("rx.udpcastListenAddr", std::string("127.0.0.1"))
        .put("rx.udpcastListenPort", 0)
        .put("rx.pollWaitMillisec", 20);
    return cfg;
}

/**
 * @brief a loopback UDP port nobody listens on right now
 */
uint16_t freeLoopbackPort() {
    auto fd = socket(AF_INET, SOCK_DGRAM, 0);
    sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");
    socklen_t len = sizeof(addr);
    if (fd < 0 || bind(fd, (sockaddr*)&addr, sizeof(addr)) < 0
        || getsockname(fd, (sockaddr*)&addr, &len) < 0) {
        ADD_FAILURE() << "cannot get a loopback port";
    }
    close(fd);
    return ntohs(addr.sin_port);
}

/**
 * @brief a transport whose udpcastDests is its own listen port
 */
NetworkTransport::ptr selfAddressed(char const* authority, uint16_t port, bool dropOwnMessages) {
    auto cfg = unicastConfig("127.0.0.1:" + std::to_string(port));
    cfg.put("rx.udpcastListenPort", port)
        .put("rx.dropOwnMessages", dropOwnMessages);
    return NetworkTransport::builder(authority).withConfig(cfg).build();
}

/**
 * @brief a receiving transport and a sending one pointed at it
 */
struct NetworkTransportTest
: ::testing::Test {
    void SetUp() override {
        rx = NetworkTransport::builder("rx-vehicle")
            .withConfig(unicastConfig("127.0.0.1:9")).build();
        tx = NetworkTransport::builder("my-vehicle")
            .withConfig(unicastConfig("127.0.0.1:" + std::to_string(rx->listenPort()))).build();
    }

    NetworkTransport::ptr rx;
    NetworkTransport::ptr tx;
};
}

TEST_F(NetworkTransportTest, BindsTheConfiguredAddress) {
    EXPECT_EQ("127.0.0.1", rx->listenAddr());
    EXPECT_NE(0, rx->listenPort());
    EXPECT_EQ("rx-vehicle", rx->authority());
    ASSERT_EQ(1u, tx->udpcastDests().size());
    EXPECT_EQ(rx->listenPort(), tx->udpcastDests()[0].port());
}

TEST_F(NetworkTransportTest, PublishedMessagesArriveInOrder) {
    auto l = std::make_shared<RecordingListener>();
    rx->registerListener(topic, l);
    communication::SimplePublisher publisher(tx, StaticUriProvider::create("my-vehicle", 0xa34b, 1));
    for (auto i = 1; i <= 5; ++i) {
        publisher.publish(0x8001, UPayload::fromString("Message #" + std::to_string(i)));
    }
    ASSERT_TRUE(l->waitFor(5));
    auto received = l->received();
    for (auto i = 0; i < 5; ++i) {
        EXPECT_EQ(topic, received[i].source());
        EXPECT_EQ("Message #" + std::to_string(i + 1), received[i].extractString().value());
    }
}

TEST_F(NetworkTransportTest, NotificationKeepsDestinationAndRoutesBySource) {
    UUri dest{"rx-vehicle", 1, 1, 0};
    auto bySource = std::make_shared<RecordingListener>();
    auto byDest = std::make_shared<RecordingListener>();
    rx->registerListener(topic, bySource);
    rx->registerListener(dest, byDest);
    auto sent = UMessage::notification(topic, dest, UPayload::fromString("hello"));
    tx->send(sent);
    ASSERT_TRUE(bySource->waitFor(1));
    EXPECT_EQ(sent, bySource->received()[0]);
    EXPECT_EQ(0u, byDest->count());
}

TEST_F(NetworkTransportTest, MalformedDatagramIsDroppedAndReceivingGoesOn) {
    auto l = std::make_shared<RecordingListener>();
    rx->registerListener(topic, l);

    auto fd = socket(AF_INET, SOCK_DGRAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(rx->listenPort());
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");
    char const garbage[] = "not a upbus datagram";
    EXPECT_EQ((ssize_t)sizeof(garbage)
        , sendto(fd, garbage, sizeof(garbage), 0, (sockaddr*)&addr, sizeof(addr)));
    close(fd);

    tx->send(UMessage::publish(topic));
    ASSERT_TRUE(l->waitFor(1));
    EXPECT_EQ(1u, l->count());
}

TEST_F(NetworkTransportTest, OversizedMessageIsRejected) {
    std::string big(2000, 'x');
    EXPECT_THROW(tx->send(UMessage::publish(topic, UPayload::fromString(big))), std::out_of_range);
}

TEST_F(NetworkTransportTest, SendAfterStopIsUnavailable) {
    tx->stop();
    EXPECT_TRUE(tx->stopped());
    try {
        tx->send(UMessage::publish(topic));
        FAIL() << "send should throw";
    } catch (Unavailable const& e) {
        EXPECT_EQ(UCode::UNAVAILABLE, e.code());
    }
    auto l = std::make_shared<RecordingListener>();
    auto h = tx->registerListener(topic, l);
    tx->unregisterListener(h);
    tx->stop();
}

TEST_F(NetworkTransportTest, ConcurrentStopsJoinOnce) {
    std::thread t1([this]() { rx->stop(); });
    std::thread t2([this]() { rx->stop(); });
    rx->stop();
    t1.join();
    t2.join();
    EXPECT_TRUE(rx->stopped());
    EXPECT_THROW(rx->send(UMessage::publish(topic)), Unavailable);
}

TEST_F(NetworkTransportTest, ListenerThrowingNonStdExceptionStopsTheTransport) {
    rx->registerListener(topic, makeListener([](UMessage const&) { throw 42; }));
    tx->send(UMessage::publish(topic));
    for (auto i = 0; i < 300 && !rx->stopped(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(rx->stopped());
    EXPECT_THROW(rx->send(UMessage::publish(topic)), Unavailable);
    EXPECT_FALSE(tx->stopped());
    rx->stop();
}

TEST(NetworkTransportSelfDeliveryTest, OwnMessagesAreDeliveredByDefault) {
    auto self = selfAddressed("my-vehicle", freeLoopbackPort(), false);
    auto l = std::make_shared<RecordingListener>();
    self->registerListener(topic, l);
    self->send(UMessage::publish(topic, UPayload::fromString("to myself")));
    ASSERT_TRUE(l->waitFor(1));
    EXPECT_EQ("to myself", l->received()[0].extractString().value());
}

TEST(NetworkTransportSelfDeliveryTest, DropOwnMessagesSkipsOnlyOwnDatagrams) {
    auto port = freeLoopbackPort();
    auto self = selfAddressed("my-vehicle", port, true);
    auto l = std::make_shared<RecordingListener>();
    self->registerListener(topic, l);
    self->send(UMessage::publish(topic, UPayload::fromString("to myself")));
    EXPECT_FALSE(l->waitFor(1, std::chrono::milliseconds(500)));

    auto other = NetworkTransport::builder("other-vehicle")
        .withConfig(unicastConfig("127.0.0.1:" + std::to_string(port))).build();
    other->send(UMessage::publish(topic, UPayload::fromString("from elsewhere")));
    ASSERT_TRUE(l->waitFor(1));
    EXPECT_EQ(1u, l->count());
    EXPECT_EQ("from elsewhere", l->received()[0].extractString().value());
}

TEST(NetworkTransportBuilderTest, InvalidAuthorityIsAConfigurationError) {
    EXPECT_THROW(NetworkTransport::builder("").withConfig(unicastConfig("127.0.0.1:9")).build()
        , ConfigurationError);
    EXPECT_THROW(NetworkTransport::builder("a/b").withConfig(unicastConfig("127.0.0.1:9")).build()
        , ConfigurationError);
}

TEST(NetworkTransportBuilderTest, BadSettingsAreConfigurationErrors) {
    EXPECT_THROW(NetworkTransport::builder("veh").withConfig(unicastConfig("nowhere")).build()
        , ConfigurationError);
    EXPECT_THROW(NetworkTransport::builder("veh").withConfig(unicastConfig("")).build()
        , ConfigurationError);

    auto badListen = unicastConfig("127.0.0.1:9");
    badListen.put("rx.udpcastListenAddr", std::string("300.1.1.1"));
    EXPECT_THROW(NetworkTransport::builder("veh").withConfig(badListen).build()
        , ConfigurationError);

    for (auto wait : {0, -1}) {
        auto badWait = unicastConfig("127.0.0.1:9");
        badWait.put("rx.pollWaitMillisec", wait);
        EXPECT_THROW(NetworkTransport::builder("veh").withConfig(badWait).build()
            , ConfigurationError) << wait;
    }

    auto badMtu = unicastConfig("127.0.0.1:9");
    badMtu.put("mtu", std::string("lots"));
    try {
        NetworkTransport::builder("veh").withConfig(badMtu).build();
        FAIL() << "build should throw";
    } catch (ConfigurationError const& e) {
        EXPECT_EQ(UCode::FAILED_PRECONDITION, e.code());
    }
}
