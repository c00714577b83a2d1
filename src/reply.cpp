/**
 * Result decoder.
 *
 * Interprets the reply record the helper driver leaves in a reply buffer.
 * Every field read is bounds-checked against the buffer length first;
 * integers are copied out with memcpy so unaligned or foreign buffers never
 * cause an invalid read.
 */

#include "icmpecho/reply.hpp"
#include "icmpecho/ip_status.hpp"

#include <cstring>

namespace icmpecho {

namespace {

template <typename T>
T read_at(const std::uint8_t* buf, std::size_t off) noexcept {
    T v{};
    std::memcpy(&v, buf + off, sizeof(T));
    return v;
}

template <typename T>
void write_at(std::uint8_t* buf, std::size_t off, T v) noexcept {
    std::memcpy(buf + off, &v, sizeof(T));
}

std::size_t address_size(AddressFamily family) noexcept {
    return family == AddressFamily::V4 ? 4 : 16;
}

} // namespace


ReplyStatus EchoReply::status() const noexcept {
    switch (error.kind()) {
        case ErrorKind::None:            return ReplyStatus::Success;
        case ErrorKind::Timeout:         return ReplyStatus::TimedOut;
        case ErrorKind::HostUnreachable: return ReplyStatus::Unreachable;
        default:                         return ReplyStatus::Error;
    }
}

const char* to_string(ReplyStatus status) noexcept {
    switch (status) {
        case ReplyStatus::Success:     return "Success";
        case ReplyStatus::TimedOut:    return "TimedOut";
        case ReplyStatus::Unreachable: return "Unreachable";
        case ReplyStatus::Error:       return "Error";
    }
    return "Error";
}

std::ostream& operator<<(std::ostream& os, const EchoReply& r) {
    if (!r.success()) {
        os << r.error.message();
        if (!r.source.empty())
            os << " (from " << r.source << ")";
        return os;
    }

    os << "Reply from " << r.source << ": bytes=" << r.data_size
       << " time=" << r.rtt_ms << "ms";
    if (r.ttl >= 0)
        os << " TTL=" << r.ttl;
    return os;
}


// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------
EchoReply decode(const std::uint8_t* buf, std::size_t len, const ReplyContext& ctx) {
    const ReplyLayout& L = *ctx.layout;

    if (!buf || len < L.header_size)
        return EchoReply::failure(Error::malformed_reply());

    EchoReply reply;
    (void)Address::from_bytes(buf + L.address_offset, address_size(L.family), reply.source);
    // Timed-out records carry no sender
    if (reply.source.is_unspecified())
        reply.source = Address();

    const auto status = read_at<std::uint32_t>(buf, L.status_offset);
    if (status != ip_status::kSuccess) {
        // Routers answering with an ICMP error still report who sent it
        reply.error = Error::from_os_code(status);
        return reply;
    }

    reply.rtt_ms = read_at<std::uint32_t>(buf, L.rtt_offset);

    if (L.ttl_offset != ReplyLayout::npos)
        reply.ttl = buf[L.ttl_offset];

    std::size_t data_size = ctx.request_size;
    if (L.data_size_offset != ReplyLayout::npos)
        data_size = read_at<std::uint16_t>(buf, L.data_size_offset);

    if (data_size > 0xFFFF)
        return EchoReply::failure(Error::malformed_reply());
    if (data_size > 0 && (L.data_offset > len || data_size > len - L.data_offset))
        return EchoReply::failure(Error::malformed_reply());

    reply.data_size = static_cast<std::uint16_t>(data_size);
    if (data_size > 0)
        reply.data.assign(buf + L.data_offset, buf + L.data_offset + data_size);
    return reply;
}


// ---------------------------------------------------------------------------
// Encode (backends emulating the driver)
// ---------------------------------------------------------------------------
bool encode_reply(const ReplyLayout& layout, const ReplyRecord& rec,
                  std::uint8_t* buf, std::size_t len) noexcept {
    if (!buf || len < layout.header_size)
        return false;
    if (rec.data_size > 0 &&
        (layout.data_offset > len || rec.data_size > len - layout.data_offset))
        return false;

    std::memset(buf, 0, layout.header_size);

    if (!rec.source.empty() && rec.source.size() == address_size(layout.family))
        std::memcpy(buf + layout.address_offset, rec.source.bytes(), rec.source.size());

    write_at<std::uint32_t>(buf, layout.status_offset, rec.status);
    write_at<std::uint32_t>(buf, layout.rtt_offset, rec.rtt_ms);

    if (layout.data_size_offset != ReplyLayout::npos)
        write_at<std::uint16_t>(buf, layout.data_size_offset, rec.data_size);

    if (layout.ttl_offset != ReplyLayout::npos && rec.ttl >= 0)
        buf[layout.ttl_offset] = static_cast<std::uint8_t>(rec.ttl & 0xFF);

    if (rec.data && rec.data_size > 0)
        std::memcpy(buf + layout.data_offset, rec.data, rec.data_size);

    return true;
}

} // namespace icmpecho
