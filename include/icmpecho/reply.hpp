#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>
#include "icmpecho/address.hpp"
#include "icmpecho/error.hpp"
#include "icmpecho/visibility.hpp"

namespace icmpecho {

/**
 * Byte layout of one reply record as the helper driver writes it.
 *
 * Offsets mirror ICMP_ECHO_REPLY, ICMP_ECHO_REPLY32 and ICMPV6_ECHO_REPLY
 * for the pointer width of this build. The Windows backend static_asserts
 * them against ipexport.h; the Linux backend writes records in the same
 * layout so one decoder serves both.
 */
struct ReplyLayout {
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    AddressFamily family;
    std::size_t header_size;       // bytes of the fixed record
    std::size_t data_offset;       // where the echoed payload starts
    std::size_t address_offset;    // reply source address
    std::size_t status_offset;     // 32-bit IP status
    std::size_t rtt_offset;        // 32-bit round-trip time in ms
    std::size_t data_size_offset;  // 16-bit echoed size, npos if absent
    std::size_t ttl_offset;        // 8-bit TTL, npos if absent
};

namespace detail {
constexpr std::size_t kPtr = sizeof(void*);
constexpr std::size_t round_up(std::size_t v, std::size_t a) { return (v + a - 1) / a * a; }
// IP_OPTION_INFORMATION: Ttl, Tos, Flags, OptionsSize, then a pointer
constexpr std::size_t kOptionsSize = round_up(4, kPtr) + kPtr;
constexpr std::size_t kEchoReplySize = 16 + kPtr + kOptionsSize;
} // namespace detail

/** ICMP_ECHO_REPLY (native pointer width): synchronous IPv4 replies. */
constexpr ReplyLayout kEchoReplyV4{
    AddressFamily::V4,
    detail::kEchoReplySize,
    detail::kEchoReplySize,
    0, 4, 8, 12,
    16 + detail::kPtr
};

/**
 * ICMP_ECHO_REPLY32: what IcmpParseReplies leaves behind for asynchronous
 * IPv4 replies on 64-bit builds. The echoed data stays where the native
 * record put it.
 */
constexpr ReplyLayout kEchoReply32V4{
    AddressFamily::V4,
    28,
    detail::kEchoReplySize,
    0, 4, 8, 12,
    20
};

/** ICMPV6_ECHO_REPLY. No data size and no hop limit are reported. */
constexpr ReplyLayout kEchoReplyV6{
    AddressFamily::V6,
    36,
    36,
    6, 28, 32,
    ReplyLayout::npos,
    ReplyLayout::npos
};

/** ICMP error message plus IO_STATUS_BLOCK the driver may append. */
constexpr std::size_t kReplySlack = 8 + 2 * detail::kPtr;

/**
 * Smallest reply buffer the driver accepts for a family (fixed record only).
 */
constexpr std::size_t min_reply_header_size(AddressFamily family) noexcept {
    return family == AddressFamily::V4 ? kEchoReplyV4.data_offset
                                       : kEchoReplyV6.data_offset;
}

/**
 * Reply buffer size needed to receive an echo of `payload_size` bytes.
 */
constexpr std::size_t required_reply_size(AddressFamily family,
                                          std::size_t payload_size) noexcept {
    return min_reply_header_size(family) + kReplySlack + payload_size;
}

/**
 * Coarse outcome of one echo request.
 */
enum class ReplyStatus : std::uint8_t {
    Success,
    TimedOut,
    Unreachable,
    Error
};

ICMPECHO_API const char* to_string(ReplyStatus status) noexcept;

/**
 * Decoded result of one echo request. Owned by the caller; no ties to the
 * buffer it was decoded from.
 */
struct ICMPECHO_API EchoReply {
    Error error;                     // ok() on success
    std::uint32_t rtt_ms{0};         // round-trip time as written by the driver
    int ttl{-1};                     // reply TTL 0..255, -1 when not reported (IPv6)
    Address source;                  // address the reply came from
    std::uint16_t data_size{0};      // echoed payload bytes
    std::vector<std::uint8_t> data;  // echoed payload

    static EchoReply failure(const Error& e) {
        EchoReply r;
        r.error = e;
        return r;
    }

    ReplyStatus status() const noexcept;
    bool success() const noexcept { return error.ok(); }
};

ICMPECHO_API std::ostream& operator<<(std::ostream& os, const EchoReply& r);

/**
 * Request metadata the decoder needs alongside the raw bytes.
 */
struct ReplyContext {
    const ReplyLayout* layout{&kEchoReplyV4};
    std::size_t request_size{0};     // payload bytes sent (IPv6 echoes report no size)
};

/**
 * Decodes a reply record. Pure: reads only [buf, buf + len).
 *
 * Short buffers, or a data region that does not fit, yield MalformedReply.
 * A non-zero status maps through Error::from_os_code().
 */
ICMPECHO_API EchoReply decode(const std::uint8_t* buf, std::size_t len,
                              const ReplyContext& ctx);

/**
 * Fields of a reply record to be written with encode_reply().
 */
struct ReplyRecord {
    std::uint32_t status{0};
    Address source;
    std::uint32_t rtt_ms{0};
    int ttl{-1};                         // ignored by layouts without a TTL
    const std::uint8_t* data{nullptr};
    std::uint16_t data_size{0};
};

/**
 * Writes a record in driver format. Used by backends that emulate the
 * helper driver.
 *
 * @return false if the buffer cannot hold the record and its data
 *         (nothing is written in that case)
 */
ICMPECHO_API bool encode_reply(const ReplyLayout& layout, const ReplyRecord& rec,
                               std::uint8_t* buf, std::size_t len) noexcept;

} // namespace icmpecho
