#pragma once
#include "upbus/Exception.hpp"

#include <stdexcept>
#include <stdint.h>
#include <errno.h>
#include <unistd.h>
#include <sys/epoll.h>

namespace upbus { namespace app { namespace utils {

struct EpollFd;

/**
 * @brief waits for readiness of a set of EpollFd
 * @details one per IO thread; poll() marks the EpollFds that became ready,
 * their owners then consume the readiness with EpollFd::isFdReady()
 */
struct EpollTask {
    enum {
        EPOLLIN = ::EPOLLIN,
        EPOLLET = ::EPOLLET
    };
    static constexpr int MAX_EVENTS = 16;

    EpollTask() {
        epollFd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epollFd_ == -1) {
            UPBUS_THROW(std::runtime_error, "cannot create epoll errno=" << errno);
        }
    }

    EpollTask(EpollTask const&) = delete;
    EpollTask& operator = (EpollTask const&) = delete;

    ~EpollTask() {
        close(epollFd_);
    }

    void setWaitTime(int t) {
        timeoutMillisec_ = t;
    }

    void add(uint32_t events, EpollFd&);
    bool del(EpollFd&);

    /**
     * @brief wait up to the wait time for any fd to become ready
     * @return number of fds that became ready, 0 on timeout or signal
     */
    int poll();

private:
    int epollFd_;
    int timeoutMillisec_ = 0;
};

/**
 * @brief an owned file descriptor that can be registered in an EpollTask
 */
struct EpollFd {
    EpollFd(EpollFd const&) = delete;
    EpollFd& operator = (EpollFd const&) = delete;
    EpollFd()
    : fd(-1)
    , fdReady_(false)
    , task_(nullptr)
    {}

    virtual
    ~EpollFd() {
        if (fd >= 0) {
            if (task_) task_->del(*this);
            close(fd);
        }
    }

    /**
     * @brief true once until the next time the fd would block
     */
    bool isFdReady() const {
        return fdReady_;
    }

    /**
     * @brief call after an IO call failed; false if the fd is broken
     */
    bool checkErr() {
        fdReady_ = false;
        return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
    }

    int fd;

private:
    friend struct EpollTask;
    bool fdReady_;
    EpollTask* task_;
};

inline
void
EpollTask::
add(uint32_t events, EpollFd& t) {
    struct epoll_event ev;
    ev.events = events;
    ev.data.ptr = &t;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, t.fd, &ev) == -1) {
        UPBUS_THROW(std::runtime_error, "cannot add into epoll, errno=" << errno);
    }
    t.task_ = this;
}

inline
bool
EpollTask::
del(EpollFd& t) {
    t.task_ = nullptr;
    return epoll_ctl(epollFd_, EPOLL_CTL_DEL, t.fd, NULL) != -1;
}

inline
int
EpollTask::
poll() {
    struct epoll_event events[MAX_EVENTS];
    auto nfds = epoll_wait(epollFd_, events, MAX_EVENTS, timeoutMillisec_);
    if (nfds == -1) {
        if (errno == EINTR) return 0;
        UPBUS_THROW(std::runtime_error, "epoll_wait errno=" << errno);
    }
    for (int i = 0; i < nfds; ++i) {
        static_cast<EpollFd*>(events[i].data.ptr)->fdReady_ = true;
    }
    return nfds;
}
}}}
