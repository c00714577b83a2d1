#include "icmpecho/icmp.hpp"

#include <cstring>

namespace icmpecho {

/**
 * One's-complement sum of 16-bit words, carries folded, result inverted.
 * Words are read with memcpy so odd-aligned packets are fine.
 */
std::uint16_t checksum16(const void* data, std::size_t len) noexcept {
    std::uint32_t sum = 0;
    const auto* p = static_cast<const std::uint8_t*>(data);

    while (len > 1) {
        std::uint16_t w;
        std::memcpy(&w, p, sizeof(w));
        sum += w;
        p += 2;
        len -= 2;
    }

    // Odd trailing byte is padded with zero on the wire
    if (len) {
        std::uint16_t w = 0;
        std::memcpy(&w, p, 1);
        sum += w;
    }

    while (sum >> 16)
        sum = (sum & 0xFFFF) + (sum >> 16);

    return static_cast<std::uint16_t>(~sum);
}

} // namespace icmpecho
