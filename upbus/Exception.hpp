#pragma once
#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <ostream>

#define UPBUS_THROW(Exception, x) {\
    std::ostringstream os;\
    os << x << " at " << __FILE__ << ':' << __LINE__ << '\n'\
        << boost::lexical_cast<std::string>(boost::stacktrace::stacktrace());\
    throw Exception(os.str()); \
}

namespace upbus {
/**
 * @brief status codes carried by every TransportError
 * @details the numbering follows the uProtocol UCode values so a code
 * can be reported to a peer unchanged
 */
enum class UCode : int {
    OK = 0,
    INVALID_ARGUMENT = 3,
    NOT_FOUND = 5,
    FAILED_PRECONDITION = 9,
    UNAVAILABLE = 14,
};

inline
char const*
toString(UCode c) {
    switch (c) {
        case UCode::OK: return "OK";
        case UCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case UCode::NOT_FOUND: return "NOT_FOUND";
        case UCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case UCode::UNAVAILABLE: return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

inline
std::ostream& operator << (std::ostream& os, UCode c) {
    return os << toString(c);
}

/**
 * @brief base of all errors the transports and their helpers report
 */
struct TransportError
: std::runtime_error {
    TransportError(UCode c, std::string const& what)
    : std::runtime_error(what)
    , code_(c) {
    }

    UCode code() const noexcept { return code_; }

private:
    UCode code_;
};

/**
 * @brief malformed UUri or message handed to register/send
 */
struct InvalidTopic
: TransportError {
    explicit InvalidTopic(std::string const& what)
    : TransportError(UCode::INVALID_ARGUMENT, what) {}
};

/**
 * @brief unregister targeting a (topic, listener) pair or handle that is not registered
 */
struct ListenerNotFound
: TransportError {
    explicit ListenerNotFound(std::string const& what)
    : TransportError(UCode::NOT_FOUND, what) {}
};

/**
 * @brief the backend cannot take the request right now
 */
struct Unavailable
: TransportError {
    explicit Unavailable(std::string const& what)
    : TransportError(UCode::UNAVAILABLE, what) {}
};

/**
 * @brief a transport builder was given a configuration it cannot work with
 */
struct ConfigurationError
: TransportError {
    explicit ConfigurationError(std::string const& what)
    : TransportError(UCode::FAILED_PRECONDITION, what) {}
};

}
