#pragma once

#include "upbus/Listener.hpp"
#include "upbus/UMessage.hpp"
#include "upbus/UUri.hpp"
#include "upbus/Exception.hpp"
#include "upbus/app/Logger.hpp"

#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <memory>
#include <vector>
#include <atomic>
#include <algorithm>
#include <iterator>
#include <stdint.h>

namespace upbus {

namespace listener_registry_detail {
struct Entry {
    Listener::ptr listener;
    uint64_t id;
};

using Snapshot = std::vector<Entry>;

/**
 * @brief listeners of one topic
 * @details the listener list is copy-on-write: a dispatch takes the current
 * snapshot under the mutex and then works on it with no lock held
 */
struct TopicEntry {
    std::mutex lock;
    std::shared_ptr<Snapshot const> listeners = std::make_shared<Snapshot const>();
    bool retired = false;   /// erased from the topic map - re-lookup before using
};
} //listener_registry_detail

/**
 * @class ListenerRegistry
 * @brief concurrent topic to listener set index shared by the transports
 * @details
 * - a listener (by pointer identity) appears at most once per topic
 * - dispatch invokes the listeners registered when it started, each once,
 * on the calling thread, after releasing all locks - listeners may re-enter
 * the registry
 * - the topic map is under a reader writer lock that is only held exclusively
 * when a topic appears or disappears; each topic has its own mutex
 */
struct ListenerRegistry {
    ListenerRegistry() = default;
    ListenerRegistry(ListenerRegistry const&) = delete;
    ListenerRegistry& operator = (ListenerRegistry const&) = delete;

    /**
     * @brief add listener to the set of topic
     * @details registering the same pair again is a no-op
     *
     * @param topic exact topic to listen to
     * @param listener callback; its address is its identity
     * @return the handle of the registration (the existing one if already registered)
     */
    ListenerHandle registerListener(UUri const& topic, Listener::ptr listener) {
        topic.validate();
        if (!listener) {
            UPBUS_THROW(InvalidTopic, "null listener for topic " << topic);
        }
        while (true) {
            auto entry = findOrCreate(topic);
            std::lock_guard<std::mutex> g(entry->lock);
            if (entry->retired) continue;   //lost a race with the last unregister

            auto const& current = *entry->listeners;
            auto it = std::find_if(current.begin(), current.end()
                , [&listener](auto const& e) { return e.listener == listener; });
            if (it != current.end()) {
                UPBUS_LOG_D("listener already registered on ", topic);
                return ListenerHandle{topic, it->id};
            }
            auto next = std::make_shared<listener_registry_detail::Snapshot>(current);
            auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
            next->push_back(listener_registry_detail::Entry{std::move(listener), id});
            entry->listeners = std::move(next);
            return ListenerHandle{topic, id};
        }
    }

    /**
     * @brief remove the listener from the set of topic
     * @details throws ListenerNotFound when the pair is not registered
     */
    void unregisterListener(UUri const& topic, Listener::ptr const& listener) {
        auto removed = remove(topic, [&listener](auto const& e) {
            return e.listener == listener;
        });
        if (!removed) {
            UPBUS_THROW(ListenerNotFound, "no such listener registered on " << topic);
        }
    }

    /**
     * @brief remove the registration a handle stands for
     * @details throws ListenerNotFound for a null, unknown or already used handle
     */
    void unregisterListener(ListenerHandle const& handle) {
        if (!handle) {
            UPBUS_THROW(ListenerNotFound, "null listener handle");
        }
        auto id = handle.id();
        auto removed = remove(*handle.topic(), [id](auto const& e) {
            return e.id == id;
        });
        if (!removed) {
            UPBUS_THROW(ListenerNotFound, handle << " is not registered");
        }
    }

    /**
     * @brief invoke every listener currently registered for topic
     * @details a listener throwing std::exception is logged and the
     * remaining listeners are still invoked
     *
     * @return number of listeners invoked
     */
    size_t dispatch(UUri const& topic, UMessage const& message) const {
        auto listeners = snapshot(topic);
        if (!listeners) return 0;
        for (auto const& e : *listeners) {
            try {
                e.listener->onReceive(message);
            } catch (std::exception const& ex) {
                UPBUS_LOG_C("listener on ", topic, " threw: ", ex.what());
            }
        }
        return listeners->size();
    }

    size_t listenerCount(UUri const& topic) const {
        auto listeners = snapshot(topic);
        return listeners ? listeners->size() : 0;
    }

    size_t topicCount() const {
        std::shared_lock<std::shared_mutex> g(topicsLock_);
        return topics_.size();
    }

    /**
     * @brief drop every registration
     */
    void clear() {
        std::unique_lock<std::shared_mutex> g(topicsLock_);
        for (auto& t : topics_) {
            std::lock_guard<std::mutex> eg(t.second->lock);
            t.second->retired = true;
        }
        topics_.clear();
    }

private:
    using TopicEntryPtr = std::shared_ptr<listener_registry_detail::TopicEntry>;

    std::shared_ptr<listener_registry_detail::Snapshot const>
    snapshot(UUri const& topic) const {
        TopicEntryPtr entry;
        {
            std::shared_lock<std::shared_mutex> g(topicsLock_);
            auto it = topics_.find(topic);
            if (it == topics_.end()) return nullptr;
            entry = it->second;
        }
        std::lock_guard<std::mutex> g(entry->lock);
        return entry->listeners;
    }

    TopicEntryPtr findOrCreate(UUri const& topic) {
        {
            std::shared_lock<std::shared_mutex> g(topicsLock_);
            auto it = topics_.find(topic);
            if (it != topics_.end()) return it->second;
        }
        std::unique_lock<std::shared_mutex> g(topicsLock_);
        auto& entry = topics_[topic];
        if (!entry) {
            entry = std::make_shared<listener_registry_detail::TopicEntry>();
        }
        return entry;
    }

    template <typename Pred>
    bool remove(UUri const& topic, Pred&& pred) {
        TopicEntryPtr entry;
        {
            std::shared_lock<std::shared_mutex> g(topicsLock_);
            auto it = topics_.find(topic);
            if (it == topics_.end()) return false;
            entry = it->second;
        }
        bool becameEmpty = false;
        {
            std::lock_guard<std::mutex> g(entry->lock);
            if (entry->retired) return false;
            auto const& current = *entry->listeners;
            auto it = std::find_if(current.begin(), current.end(), pred);
            if (it == current.end()) return false;
            auto next = std::make_shared<listener_registry_detail::Snapshot>();
            next->reserve(current.size() - 1);
            std::copy_if(current.begin(), current.end(), std::back_inserter(*next)
                , [&it](auto const& e) { return e.id != it->id; });
            entry->listeners = std::move(next);
            becameEmpty = entry->listeners->empty();
        }
        if (becameEmpty) {
            retireIfEmpty(topic, entry);
        }
        return true;
    }

    void retireIfEmpty(UUri const& topic, TopicEntryPtr const& entry) {
        std::unique_lock<std::shared_mutex> g(topicsLock_);
        auto it = topics_.find(topic);
        if (it == topics_.end() || it->second != entry) return;
        std::lock_guard<std::mutex> eg(entry->lock);
        if (entry->listeners->empty()) {
            entry->retired = true;
            topics_.erase(it);
        }
    }

    mutable std::shared_mutex topicsLock_;
    std::unordered_map<UUri, TopicEntryPtr> topics_;
    std::atomic<uint64_t> nextId_{1};
};
}
