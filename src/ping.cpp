/**
 * Synchronous echo front-end.
 *
 * ping() blocks inside the driver with a reply buffer sized for exactly one
 * reply; Pinger bundles one handle per address family.
 */

#include "icmpecho/ping.hpp"
#include "request.hpp"

#include <memory>

namespace icmpecho {

// ---------------------------------------------------------------------------
// ping()
// ---------------------------------------------------------------------------
EchoReply ping(const EchoHandle& handle,
               const Address& dst,
               const std::vector<std::uint8_t>& payload,
               const EchoOptions& opt)
{
    const AddressFamily family = handle.family();
    const std::size_t size = required_reply_size(family, payload.size());

    const Error invalid = detail::validate_request(family, dst, opt, payload.size(), size);
    if (!invalid.ok())
        return EchoReply::failure(invalid);

    // 8-byte aligned, like the slots of a BufferPool
    std::vector<std::uint64_t> storage((size + 7) / 8, 0);
    auto* buf = reinterpret_cast<std::uint8_t*>(storage.data());

    EchoDriver& drv = handle.driver();
    const EchoRequest req = detail::make_request(dst, payload.data(), payload.size(), opt);

    const std::uint32_t code = drv.send(req, buf, size);
    if (code != 0)
        return EchoReply::failure(Error::from_os_code(code));

    ReplyContext ctx;
    ctx.layout = &drv.sync_layout();
    ctx.request_size = payload.size();
    return decode(buf, size, ctx);
}


// ---------------------------------------------------------------------------
// Pinger
// ---------------------------------------------------------------------------
Pinger::Pinger() {
    try {
        v4_ = std::make_shared<EchoHandle>(EchoHandle::open(AddressFamily::V4));
    } catch (const CreateError& e) {
        v4_error_ = e.code();
    }

    try {
        v6_ = std::make_shared<EchoHandle>(EchoHandle::open(AddressFamily::V6));
    } catch (const CreateError& e) {
        v6_error_ = e.code();
    }

    if (!v4_ && !v6_)
        throw CreateError("neither an IPv4 nor an IPv6 ICMP handle could be opened",
                          v4_error_);
}

const EchoHandle* Pinger::handle_for(AddressFamily family) const noexcept {
    return family == AddressFamily::V4 ? v4_.get() : v6_.get();
}

std::uint32_t Pinger::error_for(AddressFamily family) const noexcept {
    return family == AddressFamily::V4 ? v4_error_ : v6_error_;
}

EchoReply Pinger::send(const Address& dst, const std::vector<std::uint8_t>& payload) const {
    return send_from(Address(), dst, payload);
}

EchoReply Pinger::send_from(const Address& src, const Address& dst,
                            const std::vector<std::uint8_t>& payload) const
{
    if (dst.empty())
        return EchoReply::failure(Error::invalid_address());

    const EchoHandle* h = handle_for(dst.family());
    if (!h)
        return EchoReply::failure(Error::os_error(error_for(dst.family())));

    EchoOptions opt = opt_;
    opt.source = src;
    return ping(*h, dst, payload, opt);
}

} // namespace icmpecho
