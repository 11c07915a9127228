#pragma once

#include "upbus/time/Time.hpp"
#include "upbus/pattern/GuardedSingleton.hpp"
#include  <ostream>
#include  <mutex>

#define UPBUS_LOG_D(...)   if (upbus::app::SyncLogger::initialized()) upbus::app::SyncLogger::instance().LOG_D(upbus::time::SysTime::now(), upbus::app::g_SyncLogLevelStr[0], __VA_ARGS__, upbus::app::LogTrailer(__FILE__, __LINE__))
#define UPBUS_LOG_N(...)   if (upbus::app::SyncLogger::initialized()) upbus::app::SyncLogger::instance().LOG_N(upbus::time::SysTime::now(), upbus::app::g_SyncLogLevelStr[1], __VA_ARGS__, upbus::app::LogTrailer(__FILE__, __LINE__))
#define UPBUS_LOG_W(...)   if (upbus::app::SyncLogger::initialized()) upbus::app::SyncLogger::instance().LOG_W(upbus::time::SysTime::now(), upbus::app::g_SyncLogLevelStr[2], __VA_ARGS__, upbus::app::LogTrailer(__FILE__, __LINE__))
#define UPBUS_LOG_C(...)   if (upbus::app::SyncLogger::initialized()) upbus::app::SyncLogger::instance().LOG_C(upbus::time::SysTime::now(), upbus::app::g_SyncLogLevelStr[3], __VA_ARGS__, upbus::app::LogTrailer(__FILE__, __LINE__))

namespace upbus { namespace app {

char const g_SyncLogLevelStr[][12 + 1] = {
    " DEBUG   :  ",
    " NOTICE  :  ",
    " WARNING :  ",
    " CRITICAL:  "
};


struct LogTrailer {
    LogTrailer(char const* const file,  int line)
    : f(file)
    , l(line) {
    }
    char const* const f;
    int l;

    friend std::ostream& operator << (std::ostream& os, LogTrailer const& t) {
        os << ' ' << t.f << ':' << t.l << std::endl;
        return os;
    }
};

/**
 * @brief a very straightforward logger that works synchronisely.
 * @details Only use the macros defined above. Nothing is logged until a
 * SingletonGuardian<SyncLogger> is alive, so library code can log freely.
 */
struct SyncLogger
: pattern::GuardedSingleton<SyncLogger> {
    friend struct pattern::SingletonGuardian<SyncLogger>;

    enum Level {
        L_DEBUG = 0,
        L_NOTICE,
        L_WARNING,
        L_CRITICAL,
        L_OFF
    };

    void setMinLogLevel(Level minLevel) {
        minLevel_ = minLevel;
    }

    template <typename ...Args>
    void LOG_D(Args&&... args) {
#ifndef NDEBUG
        if (minLevel_ <= L_DEBUG) {
            std::lock_guard<std::recursive_mutex> g(mutex_);
            log(std::forward<Args>(args)...);
        }
#endif
    }

    template <typename ...Args>
    void LOG_N(Args&&... args) {
        if (minLevel_ <= L_NOTICE) {
            std::lock_guard<std::recursive_mutex> g(mutex_);
            log(std::forward<Args>(args)...);
        }
    }
    template <typename ...Args>
    void LOG_W(Args&&... args) {
        if (minLevel_ <= L_WARNING) {
            std::lock_guard<std::recursive_mutex> g(mutex_);
            log(std::forward<Args>(args)...);
        }
    }
    template <typename ...Args>
    void LOG_C(Args&&... args) {
        if (minLevel_ <= L_CRITICAL) {
            std::lock_guard<std::recursive_mutex> g(mutex_);
            log(std::forward<Args>(args)...);
        }
    }

private:
    template <typename Arg, typename ...Args>
    void log(Arg&& arg, Args&&... args) {
        log_ << std::forward<Arg>(arg);
        log(std::forward<Args>(args)...);
    }
    void log() {
    }
    template <typename ... NoOpArgs>
    SyncLogger(std::ostream& log, NoOpArgs&&...)
    : log_(log)
#ifndef NDEBUG
    , minLevel_(L_DEBUG)
#else
    , minLevel_(L_NOTICE)
#endif
    {}
    std::ostream& log_;
    Level minLevel_;
    std::recursive_mutex mutex_;
};
}}
