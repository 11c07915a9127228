#pragma once

#include <iostream>
#include <stdio.h>
#include <stdint.h>
#include <time.h>

namespace upbus { namespace time {
/**
 * @brief wall clock time stamp with nano second resolution
 */
struct SysTime
{
    ///UTC as input
    explicit SysTime(int64_t sec, int64_t usec = 0, int64_t nsec = 0) {
        nsecSinceEpoch_ = sec * 1000000000l + usec*1000l + nsec;
    }

    static SysTime now() {
        struct timespec spec;
        clock_gettime(CLOCK_REALTIME, &spec);
        return SysTime(spec.tv_sec, 0, spec.tv_nsec);
    }

    /// yyyymmdd-hh:mm:ss.uuuuuu in UTC
    friend
    std::ostream& operator << (std::ostream& os, SysTime const& t) {
        char buf[32];
        time_t sec = (time_t)(t.nsecSinceEpoch_ / 1000000000l);
        struct tm ts;
        gmtime_r(&sec, &ts);
        strftime(buf, sizeof(buf), "%Y%m%d-%H:%M:%S", &ts);
        char usec[8];
        snprintf(usec, sizeof(usec), ".%06ld"
            , (long)((t.nsecSinceEpoch_ % 1000000000l) / 1000l));
        os << buf << usec;
        return os;
    }

private:
    int64_t nsecSinceEpoch_;
};
}}
