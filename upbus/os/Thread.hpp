#pragma once
#include "upbus/Exception.hpp"

#include <string>
#include <stdexcept>

#include <unistd.h>
#include <pthread.h>
#include <sched.h>
#include <string.h>

namespace upbus { namespace os {

struct ThreadConfigException : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * @brief name the calling thread and set its scheduling
 *
 * @param threadName truncated to the 15 chars the OS keeps
 * @param schepolicy SCHED_OTHER (priority is the nice value), SCHED_FIFO,
 * SCHED_RR or SCHED_IDLE; empty leaves the policy alone
 * @param priority see schepolicy
 */
inline
void
configureCurrentThread(char const* threadName
    , char const* schepolicy = "SCHED_OTHER", int priority = 0) {
    int res1 = 0;
    sched_param param = {0};
    int policy = 0;
    if (!schepolicy || strlen(schepolicy) == 0) {
        // skip if not set
    } else if (std::string(schepolicy) == "SCHED_FIFO") {
        policy = SCHED_FIFO;
    } else if (std::string(schepolicy) == "SCHED_RR") {
        policy = SCHED_RR;
    } else if (std::string(schepolicy) == "SCHED_IDLE") {
        policy = SCHED_IDLE;
    } else if (std::string(schepolicy) == "SCHED_OTHER") {
        policy = SCHED_OTHER;
        errno = 0;
        if (priority && nice(priority) == -1 && errno) {
            UPBUS_THROW(ThreadConfigException, "nice() failure errno=" << errno);
        }
        priority = 0;
    } else {
        UPBUS_THROW(ThreadConfigException, "Unknown scheduling policy: " << schepolicy);
    }
    param.sched_priority = priority;
    if (policy) {
        res1 = pthread_setschedparam(pthread_self(), policy, &param);
    }
    auto name = std::string(threadName ? threadName : "").substr(0, 15);
    int res2 = pthread_setname_np(pthread_self(), name.c_str());
    if (res1 || res2) {
        UPBUS_THROW(ThreadConfigException, "pthread_setschedparam=" << res1
            << " pthread_setname_np=" << res2 << " errno=" << errno);
    }
}
}}
