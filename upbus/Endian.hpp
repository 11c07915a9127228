#pragma once
#include  <boost/endian/conversion.hpp>
#include  <stdint.h>

namespace upbus {
/**
 * @brief byte order used on the wire, little endian unless UPBUS_XMIT_BIG_ENDIAN
 */
struct Endian {
    static constexpr bool little = boost::endian::order::native == boost::endian::order::little;
#ifdef UPBUS_XMIT_BIG_ENDIAN
    static constexpr bool match_xmit = !little;
#else
    static constexpr bool match_xmit = little;
#endif
};

/**
 * @brief integer field kept in transmit byte order, converts on access
 */
#pragma pack(push, 1)
template <typename T>
struct XmitEndian {
    using RawType = T;
    static_assert(sizeof(T) > 1, "not effective or apply");
    explicit XmitEndian(T v = 0)
    : vx_(Endian::match_xmit?v:boost::endian::endian_reverse(v)) {
    }

    operator T() const {
        return Endian::match_xmit?vx_:boost::endian::endian_reverse(vx_);
    }

    XmitEndian& operator = (T v) {
        if (Endian::match_xmit) {
            vx_ = v;
        } else {
            vx_ = boost::endian::endian_reverse(v);
        }
        return *this;
    }

private:
    T vx_;
};
#pragma pack(pop)
}
