#include "upbus/communication/SimplePublisher.hpp"
#include "upbus/communication/SimpleNotifier.hpp"
#include "upbus/LocalTransport.hpp"
#include "upbus/UriProvider.hpp"
#include "TestListeners.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace upbus;
using namespace upbus::communication;
using upbus::test::RecordingListener;

namespace {
/**
 * @brief Transport that only records what it is asked to do
 */
struct FakeTransport
: Transport {
    void send(UMessage const& m) override {
        sent.push_back(m);
    }
    ListenerHandle registerListener(UUri const& topic, Listener::ptr listener) override {
        registered.push_back(topic);
        return registry.registerListener(topic, std::move(listener));
    }
    void unregisterListener(UUri const& topic, Listener::ptr const& listener) override {
        registry.unregisterListener(topic, listener);
    }
    void unregisterListener(ListenerHandle const& handle) override {
        registry.unregisterListener(handle);
    }

    std::vector<UMessage> sent;
    std::vector<UUri> registered;
    ListenerRegistry registry;
};

struct CommunicationTest
: ::testing::Test {
    std::shared_ptr<LocalTransport> transport = LocalTransport::create();
    UriProvider::ptr uriProvider = StaticUriProvider::create("veh", 0xa34b, 0x01);
};
}

TEST_F(CommunicationTest, UriProviderBuildsResourceUris) {
    EXPECT_EQ(UUri("veh", 0xa34b, 1, 0x8001), uriProvider->resourceUri(0x8001));
    EXPECT_EQ(UUri("veh", 0xa34b, 1, 0), uriProvider->sourceUri());
    EXPECT_EQ("veh", uriProvider->authority());
}

TEST_F(CommunicationTest, PublishWithoutListenersSucceeds) {
    SimplePublisher publisher(transport, uriProvider);
    EXPECT_NO_THROW(publisher.publish(0x8001, UPayload::fromString("hi")));
    EXPECT_NO_THROW(publisher.publish(0x8001));
}

TEST_F(CommunicationTest, PublishedMessagesArriveInOrder) {
    SimplePublisher publisher(transport, uriProvider);
    auto l = std::make_shared<RecordingListener>();
    transport->registerListener(uriProvider->resourceUri(0x8001), l);
    for (auto i = 1; i <= 5; ++i) {
        publisher.publish(0x8001, UPayload::fromString("Message #" + std::to_string(i)));
    }
    auto received = l->received();
    ASSERT_EQ(5u, received.size());
    for (auto i = 0; i < 5; ++i) {
        EXPECT_EQ(UMessageType::PUBLISH, received[i].type());
        EXPECT_EQ("Message #" + std::to_string(i + 1), received[i].extractString().value());
    }
}

TEST_F(CommunicationTest, PublishWithInvalidResourceThrows) {
    SimplePublisher publisher(transport, uriProvider);
    EXPECT_THROW(publisher.publish(0x10000), InvalidTopic);
}

TEST_F(CommunicationTest, NotifyDeliversToListenerOnSourceTopic) {
    SimpleNotifier notifier(transport, uriProvider);
    auto topic = uriProvider->resourceUri(0xd100);
    auto l = std::make_shared<RecordingListener>();
    notifier.startListening(topic, l);
    notifier.notify(0xd100, uriProvider->sourceUri(), UPayload::fromString("hello"));
    auto received = l->received();
    ASSERT_EQ(1u, received.size());
    EXPECT_EQ(UMessageType::NOTIFICATION, received[0].type());
    EXPECT_EQ(topic, received[0].source());
    EXPECT_EQ(uriProvider->sourceUri(), received[0].destination().value());
    ASSERT_TRUE(received[0].payload());
    EXPECT_EQ(UPayload::fromString("hello"), *received[0].payload());
}

TEST_F(CommunicationTest, NotifyAfterStopListeningIsNotDelivered) {
    SimpleNotifier notifier(transport, uriProvider);
    auto topic = uriProvider->resourceUri(0xd100);
    auto l = std::make_shared<RecordingListener>();
    notifier.startListening(topic, l);
    notifier.stopListening(topic, l);
    notifier.notify(0xd100, uriProvider->sourceUri(), UPayload::fromString("hello"));
    EXPECT_EQ(0u, l->count());
}

TEST_F(CommunicationTest, ListeningLifecycle) {
    SimpleNotifier notifier(transport, uriProvider);
    auto topic = uriProvider->resourceUri(0xd100);
    auto l = std::make_shared<RecordingListener>();
    EXPECT_THROW(notifier.stopListening(topic, l), ListenerNotFound);

    auto h = notifier.startListening(topic, l);
    EXPECT_EQ(h, notifier.startListening(topic, l));
    notifier.notify(0xd100, uriProvider->sourceUri());
    EXPECT_EQ(1u, l->count());

    notifier.stopListening(h);
    EXPECT_THROW(notifier.stopListening(topic, l), ListenerNotFound);
    EXPECT_THROW(notifier.stopListening(h), ListenerNotFound);
}

TEST_F(CommunicationTest, StartListeningRejectsMalformedTopic) {
    SimpleNotifier notifier(transport, uriProvider);
    EXPECT_THROW(notifier.startListening(UUri("", 1, 1, 1), std::make_shared<RecordingListener>())
        , InvalidTopic);
}

TEST_F(CommunicationTest, MissingCollaboratorsAreRejected) {
    EXPECT_THROW((void)SimplePublisher(nullptr, uriProvider), ConfigurationError);
    EXPECT_THROW((void)SimpleNotifier(transport, nullptr), ConfigurationError);
}

TEST(FakeTransportTest, PublisherAndNotifierOnlyUseTheTransportInterface) {
    auto fake = std::make_shared<FakeTransport>();
    auto uriProvider = StaticUriProvider::create("veh", 0xa34b, 0x01);
    SimplePublisher publisher(fake, uriProvider);
    SimpleNotifier notifier(fake, uriProvider);

    publisher.publish(0x8001, UPayload::fromString("hi"));
    notifier.notify(0xd100, UUri("other", 1, 1, 0));
    auto l = std::make_shared<RecordingListener>();
    notifier.startListening(uriProvider->resourceUri(0xd100), l);
    notifier.stopListening(uriProvider->resourceUri(0xd100), l);

    ASSERT_EQ(2u, fake->sent.size());
    EXPECT_EQ(UMessage::publish(UUri("veh", 0xa34b, 1, 0x8001), UPayload::fromString("hi"))
        , fake->sent[0]);
    EXPECT_EQ(UMessage::notification(UUri("veh", 0xa34b, 1, 0xd100), UUri("other", 1, 1, 0))
        , fake->sent[1]);
    ASSERT_EQ(1u, fake->registered.size());
    EXPECT_EQ(0u, fake->registry.topicCount());
}
