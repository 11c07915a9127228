#pragma once

#include "upbus/Exception.hpp"

#include <functional>
#include <stdexcept>
#include <signal.h>
#include <memory.h>

namespace upbus { namespace os {

/**
 * @brief provides functions to handle signals
 */
struct
HandleSignals {
    /**
     * @brief specify what to do when SIGTERM or SIGINT is received
     * @details installs the handlers, replacing earlier ones, so call it once
     *
     * @param doThis runs in the signal handler, keep it async-signal-safe
     */
    static
    void
    onTermIntDo(std::function<void()> doThis) {
        onTermInt_s() = doThis;

        struct sigaction act;
        memset(&act, 0, sizeof(act));
        act.sa_sigaction = handler;
        act.sa_flags = SA_SIGINFO;

        if (sigaction(SIGTERM, &act, NULL) ||
            sigaction(SIGINT, &act, NULL)) {
            UPBUS_THROW(std::runtime_error, "cannot install signal handler");
        }
    }

private:
    static std::function<void()>& onTermInt_s() {
        static std::function<void()> func;
        return func;
    };
    static
    void
    handler(int, siginfo_t *, void *) {
        onTermInt_s()();
    }
};
}}
