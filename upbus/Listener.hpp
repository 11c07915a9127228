#pragma once

#include "upbus/UMessage.hpp"
#include "upbus/UUri.hpp"

#include <memory>
#include <functional>
#include <type_traits>
#include <ostream>
#include <stdint.h>

namespace upbus {

/**
 * @brief callback a transport invokes when a message arrives on a topic it was registered for
 * @details a Listener is identified by the address of the object, so the same
 * shared_ptr used at registration unregisters it later.
 * onReceive is called on the sending thread (LocalTransport) or on the
 * receive thread (NetworkTransport); it may register or unregister listeners
 */
struct Listener {
    using ptr = std::shared_ptr<Listener>;
    virtual void onReceive(UMessage const&) = 0;
    virtual ~Listener() = default;
};

namespace listener_detail {
template <typename Callable>
struct CallableListener
: Listener {
    explicit CallableListener(Callable&& c)
    : callable_(std::forward<Callable>(c)) {
    }

    void onReceive(UMessage const& m) override {
        callable_(m);
    }

private:
    std::decay_t<Callable> callable_;
};
} //listener_detail

/**
 * @brief wrap a void(UMessage const&) callable, typically a lambda, into a Listener
 */
template <typename Callable>
Listener::ptr makeListener(Callable&& c) {
    static_assert(std::is_invocable_v<std::decay_t<Callable>&, UMessage const&>
        , "listener needs to be callable with UMessage const&");
    return std::make_shared<listener_detail::CallableListener<Callable>>(
        std::forward<Callable>(c));
}

/**
 * @brief opaque token identifying one registration
 * @details returned by every register call and accepted by unregister, so a
 * caller never needs to hold on to the listener object to undo a registration
 */
struct ListenerHandle {
    ListenerHandle() = default;

    UUri const* topic() const { return id_ ? &topic_ : nullptr; }
    explicit operator bool() const { return id_ != 0; }

    bool operator == (ListenerHandle const& other) const {
        return id_ == other.id_ && (!id_ || topic_ == other.topic_);
    }
    bool operator != (ListenerHandle const& other) const {
        return !(*this == other);
    }

    friend
    std::ostream& operator << (std::ostream& os, ListenerHandle const& h) {
        if (!h) return os << "ListenerHandle(null)";
        return os << "ListenerHandle(" << h.topic_ << '#' << h.id_ << ')';
    }

private:
    friend struct ListenerRegistry;
    ListenerHandle(UUri topic, uint64_t id)
    : topic_(std::move(topic))
    , id_(id) {
    }

    uint64_t id() const { return id_; }

    UUri topic_{"-", 0, 0, 0};
    uint64_t id_ = 0;
};
}
