#pragma once
#include <cstddef>
#include <cstdint>
#include "icmpecho/visibility.hpp"

namespace icmpecho {

/** ICMP / ICMPv6 echo message types */
constexpr std::uint8_t kIcmpEchoReply     = 0;
constexpr std::uint8_t kIcmpEchoRequest   = 8;
constexpr std::uint8_t kIcmp6EchoRequest  = 128;
constexpr std::uint8_t kIcmp6EchoReply    = 129;

/**
 * Echo request/reply header, identical for ICMP and ICMPv6.
 * Matches wire format exactly, so keep this struct packed.
 */
#pragma pack(push, 1)
struct IcmpHeader {
    std::uint8_t  type;
    std::uint8_t  code;      // always 0 for echo
    std::uint16_t checksum;
    std::uint16_t id;        // rewritten by the kernel on datagram sockets
    std::uint16_t seq;
    // The variable payload follows immediately
};
#pragma pack(pop)

static_assert(sizeof(IcmpHeader) == 8, "ICMP echo header is 8 bytes");

/**
 * Compute a classic 16-bit Internet checksum (RFC 1071).
 *
 * @param data  Pointer to raw buffer
 * @param len   Buffer length in bytes
 * @return      One's-complement 16-bit checksum, in the buffer's byte order
 */
ICMPECHO_API std::uint16_t checksum16(const void* data, std::size_t len) noexcept;

} // namespace icmpecho
