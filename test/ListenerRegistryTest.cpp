#include "upbus/ListenerRegistry.hpp"
#include "TestListeners.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace upbus;
using upbus::test::RecordingListener;

namespace {
UUri const topic{"veh", 0xa34b, 1, 0x8001};
UUri const otherTopic{"veh", 0xa34b, 1, 0x8002};
}

TEST(ListenerRegistryTest, EveryRegisteredListenerIsInvokedOnce) {
    ListenerRegistry reg;
    std::vector<std::shared_ptr<RecordingListener>> listeners;
    for (auto i = 0; i < 3; ++i) {
        listeners.push_back(std::make_shared<RecordingListener>());
        reg.registerListener(topic, listeners.back());
    }
    auto m = UMessage::publish(topic, UPayload::fromString("hi"));
    EXPECT_EQ(3u, reg.dispatch(topic, m));
    for (auto& l : listeners) {
        ASSERT_EQ(1u, l->count());
        EXPECT_EQ(m, l->received()[0]);
    }
}

TEST(ListenerRegistryTest, DuplicateRegistrationDoesNotDoubleDeliver) {
    ListenerRegistry reg;
    auto l = std::make_shared<RecordingListener>();
    auto h1 = reg.registerListener(topic, l);
    auto h2 = reg.registerListener(topic, l);
    EXPECT_EQ(h1, h2);
    EXPECT_EQ(1u, reg.listenerCount(topic));
    reg.dispatch(topic, UMessage::publish(topic));
    EXPECT_EQ(1u, l->count());
}

TEST(ListenerRegistryTest, DispatchIsExactTopicMatch) {
    ListenerRegistry reg;
    auto l = std::make_shared<RecordingListener>();
    reg.registerListener(topic, l);
    EXPECT_EQ(0u, reg.dispatch(otherTopic, UMessage::publish(otherTopic)));
    EXPECT_EQ(0u, l->count());
}

TEST(ListenerRegistryTest, UnregisterUnknownPairThrowsAndKeepsOthers) {
    ListenerRegistry reg;
    auto kept = std::make_shared<RecordingListener>();
    auto stranger = std::make_shared<RecordingListener>();
    reg.registerListener(topic, kept);
    EXPECT_THROW(reg.unregisterListener(topic, stranger), ListenerNotFound);
    EXPECT_THROW(reg.unregisterListener(otherTopic, kept), ListenerNotFound);
    EXPECT_EQ(1u, reg.dispatch(topic, UMessage::publish(topic)));
    EXPECT_EQ(1u, kept->count());
}

TEST(ListenerRegistryTest, UnregisterByHandle) {
    ListenerRegistry reg;
    auto l = std::make_shared<RecordingListener>();
    auto h = reg.registerListener(topic, l);
    ASSERT_TRUE(h);
    ASSERT_NE(nullptr, h.topic());
    EXPECT_EQ(topic, *h.topic());
    reg.unregisterListener(h);
    EXPECT_EQ(0u, reg.listenerCount(topic));
    EXPECT_EQ(0u, reg.topicCount());
    EXPECT_THROW(reg.unregisterListener(h), ListenerNotFound);
    EXPECT_THROW(reg.unregisterListener(ListenerHandle()), ListenerNotFound);
}

TEST(ListenerRegistryTest, ReRegistrationAfterUnregisterGetsNewHandle) {
    ListenerRegistry reg;
    auto l = std::make_shared<RecordingListener>();
    auto h1 = reg.registerListener(topic, l);
    reg.unregisterListener(topic, l);
    auto h2 = reg.registerListener(topic, l);
    EXPECT_NE(h1, h2);
    EXPECT_THROW(reg.unregisterListener(h1), ListenerNotFound);
    reg.unregisterListener(h2);
}

TEST(ListenerRegistryTest, InvalidRegistrationsAreRejected) {
    ListenerRegistry reg;
    EXPECT_THROW(reg.registerListener(UUri("", 1, 1, 1), std::make_shared<RecordingListener>())
        , InvalidTopic);
    EXPECT_THROW(reg.registerListener(topic, nullptr), InvalidTopic);
    EXPECT_EQ(0u, reg.topicCount());
}

TEST(ListenerRegistryTest, ThrowingListenerDoesNotStopDispatch) {
    ListenerRegistry reg;
    auto before = std::make_shared<RecordingListener>();
    auto after = std::make_shared<RecordingListener>();
    reg.registerListener(topic, before);
    reg.registerListener(topic, makeListener([](UMessage const&) {
        throw std::runtime_error("listener failure");
    }));
    reg.registerListener(topic, after);
    EXPECT_EQ(3u, reg.dispatch(topic, UMessage::publish(topic)));
    EXPECT_EQ(1u, before->count());
    EXPECT_EQ(1u, after->count());
}

TEST(ListenerRegistryTest, ListenersMayReenterDuringDispatch) {
    ListenerRegistry reg;
    auto late = std::make_shared<RecordingListener>();
    Listener::ptr self;
    self = makeListener([&](UMessage const&) {
        reg.registerListener(topic, late);
        reg.unregisterListener(topic, self);
    });
    reg.registerListener(topic, self);

    // the snapshot taken at the start of dispatch does not include late
    EXPECT_EQ(1u, reg.dispatch(topic, UMessage::publish(topic)));
    EXPECT_EQ(0u, late->count());

    EXPECT_EQ(1u, reg.dispatch(topic, UMessage::publish(topic)));
    EXPECT_EQ(1u, late->count());
}

TEST(ListenerRegistryTest, ConcurrentRegistrationsAreAllDelivered) {
    ListenerRegistry reg;
    auto const threadCount = 8;
    auto const perThread = 50;
    std::vector<std::shared_ptr<RecordingListener>> listeners(threadCount * perThread);
    for (auto& l : listeners) l = std::make_shared<RecordingListener>();

    std::vector<std::thread> threads;
    for (auto t = 0; t < threadCount; ++t) {
        threads.emplace_back([&, t]() {
            for (auto i = 0; i < perThread; ++i) {
                reg.registerListener(topic, listeners[t * perThread + i]);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(listeners.size(), reg.dispatch(topic, UMessage::publish(topic)));
    for (auto& l : listeners) {
        EXPECT_EQ(1u, l->count());
    }
}

TEST(ListenerRegistryTest, ChurnOnOneTopicLosesNoRegistration) {
    ListenerRegistry reg;
    auto stable = std::make_shared<RecordingListener>();
    std::atomic<bool> done{false};
    std::thread churn([&]() {
        auto l = std::make_shared<RecordingListener>();
        while (!done) {
            reg.registerListener(topic, l);
            reg.unregisterListener(topic, l);
        }
    });
    for (auto i = 0; i < 1000; ++i) {
        reg.registerListener(topic, stable);
        EXPECT_GE(reg.listenerCount(topic), 1u);
        reg.unregisterListener(topic, stable);
    }
    reg.registerListener(topic, stable);
    done = true;
    churn.join();
    EXPECT_EQ(1u, reg.listenerCount(topic));
    reg.dispatch(topic, UMessage::publish(topic));
    EXPECT_EQ(1u, stable->count());
}

TEST(ListenerRegistryTest, ClearDropsEverything) {
    ListenerRegistry reg;
    auto l = std::make_shared<RecordingListener>();
    auto h = reg.registerListener(topic, l);
    reg.registerListener(otherTopic, l);
    EXPECT_EQ(2u, reg.topicCount());
    reg.clear();
    EXPECT_EQ(0u, reg.topicCount());
    EXPECT_THROW(reg.unregisterListener(h), ListenerNotFound);
    EXPECT_EQ(0u, reg.dispatch(topic, UMessage::publish(topic)));
}
