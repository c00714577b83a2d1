#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "icmpecho/driver.hpp"
#include "icmpecho/error.hpp"
#include "icmpecho/ping.hpp"

namespace icmpecho {
namespace detail {

/**
 * Checks that happen before any OS call: target and source address family,
 * payload length and reply buffer capacity.
 */
inline Error validate_request(AddressFamily family,
                              const Address& dst,
                              const EchoOptions& opt,
                              std::size_t payload_size,
                              std::size_t capacity) noexcept {
    if (!is_valid_target(dst, family))
        return Error::invalid_address();
    if (!opt.source.empty() && opt.source.family() != family)
        return Error::invalid_address();
    if (payload_size > 0xFFFF || required_reply_size(family, payload_size) > capacity)
        return Error::buffer_too_small();
    return Error();
}

inline EchoRequest make_request(const Address& dst,
                                const std::uint8_t* payload,
                                std::size_t payload_size,
                                const EchoOptions& opt) noexcept {
    EchoRequest req;
    req.destination   = dst;
    req.source        = opt.source;
    req.payload       = payload;
    req.payload_size  = static_cast<std::uint16_t>(payload_size);
    req.ttl           = opt.ttl > 255 ? 255 : (opt.ttl > 0 ? opt.ttl : -1);
    req.dont_fragment = opt.dont_fragment;
    req.timeout_ms    = static_cast<std::uint32_t>(opt.timeout_ms < 1 ? 1 : opt.timeout_ms);
    return req;
}

} // namespace detail
} // namespace icmpecho
