/**
 * C API wrapper for icmpecho.
 *
 * Exposes a stable C ABI for:
 * - Opening ICMP handles and reply buffer pools
 * - Blocking echo requests
 * - Asynchronous requests with poll / wait / free
 *
 * No exception crosses this boundary; failures become return codes or
 * reply fields.
 */

#include "icmpecho_capi.h"
#include "icmpecho/engine.hpp"
#include "icmpecho/ip_status.hpp"
#include "icmpecho/ping.hpp"

#include <cstdint>
#include <cstring>
#include <exception>
#include <optional>
#include <string>
#include <vector>

using namespace icmpecho;

struct icmpecho_handle  { EchoHandle handle; };
struct icmpecho_pool    { BufferPool pool; };
struct icmpecho_pending { PendingPing pending; };

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------
static bool to_address(const IcmpEchoAddressC* in, Address& out) {
    if (!in) return false;
    if (in->family == 4) return Address::from_bytes(in->bytes, 4, out);
    if (in->family == 6) return Address::from_bytes(in->bytes, 16, out);
    return false;
}

// False if a source address is given but unusable
static bool to_options(const IcmpEchoOptionsC* in, EchoOptions& opt) {
    opt = EchoOptions{};
    if (!in) return true;

    if (in->timeout_ms > 0) opt.timeout_ms = in->timeout_ms;
    opt.ttl = in->ttl;
    opt.dont_fragment = (in->dont_fragment != 0);
    return !in->source || to_address(in->source, opt.source);
}

static void copy_text(const std::string& s, char* buf, size_t len) {
    if (!buf || len == 0) return;
    const size_t n = s.size() < len - 1 ? s.size() : len - 1;
    std::memcpy(buf, s.data(), n);
    buf[n] = '\0';
}

static void to_out(const EchoReply& in, IcmpEchoReplyC* out) {
    if (!out) return;
    std::memset(out, 0, sizeof(*out));

    out->status     = static_cast<int>(in.status());
    out->error_kind = static_cast<int>(in.error.kind());
    out->reason     = static_cast<int>(in.error.reason());
    out->code       = in.error.code();
    out->rtt_ms     = in.rtt_ms;
    out->ttl        = in.ttl;
    out->data_size  = in.data_size;

    if (!in.source.empty()) {
        out->source.family = in.source.family() == AddressFamily::V4 ? 4 : 6;
        std::memcpy(out->source.bytes, in.source.bytes(), in.source.size());
    }

    copy_text(in.success() ? std::string("Success") : in.error.message(),
              out->message, sizeof(out->message));
}


// ---------------------------------------------------------------------------
// C API implementation
// ---------------------------------------------------------------------------
extern "C" {

ICMPECHO_API icmpecho_handle* icmpecho_open(int family, unsigned int* os_error) {
    if (os_error) *os_error = 0;
    if (family != 4 && family != 6) return nullptr;

    try {
        const AddressFamily f = family == 4 ? AddressFamily::V4 : AddressFamily::V6;
        return new icmpecho_handle{ EchoHandle::open(f) };
    } catch (const CreateError& e) {
        if (os_error) *os_error = e.code();
    } catch (const std::exception&) {
        if (os_error) *os_error = ip_status::kNoResources;
    }
    return nullptr;
}

ICMPECHO_API void icmpecho_close(icmpecho_handle* h) {
    delete h;
}

ICMPECHO_API icmpecho_pool* icmpecho_pool_create(size_t slots,
                                                 size_t slot_capacity,
                                                 int block)
{
    PoolOptions opt;
    opt.slots = slots;
    opt.slot_capacity = slot_capacity;
    opt.policy = block ? ExhaustedPolicy::Block : ExhaustedPolicy::Reject;

    try {
        return new icmpecho_pool{ BufferPool(opt) };
    } catch (const std::exception&) {
        return nullptr;
    }
}

ICMPECHO_API void icmpecho_pool_destroy(icmpecho_pool* pool) {
    delete pool;
}

ICMPECHO_API int icmpecho_ping(icmpecho_handle* h,
                               const IcmpEchoAddressC* dst,
                               const void* payload, size_t payload_size,
                               const IcmpEchoOptionsC* opt,
                               IcmpEchoReplyC* out)
{
    if (!h || !out) return 0;
    if (!payload && payload_size > 0) return 0;

    Address target;
    EchoOptions options;
    if (!to_address(dst, target) || !to_options(opt, options)) {
        to_out(EchoReply::failure(Error::invalid_address()), out);
        return 1;
    }

    try {
        const auto* p = static_cast<const std::uint8_t*>(payload);
        std::vector<std::uint8_t> data(p, p + payload_size);
        to_out(ping(h->handle, target, data, options), out);
        return 1;
    } catch (const std::exception&) {
        return 0;
    }
}

ICMPECHO_API icmpecho_pending* icmpecho_ping_async(icmpecho_handle* h,
                                                   icmpecho_pool* pool,
                                                   const IcmpEchoAddressC* dst,
                                                   const void* payload,
                                                   size_t payload_size,
                                                   const IcmpEchoOptionsC* opt)
{
    if (!h || !pool) return nullptr;
    if (!payload && payload_size > 0) return nullptr;

    // An empty target resolves as InvalidAddress
    Address target;
    EchoOptions options;
    if (!to_address(dst, target) || !to_options(opt, options))
        target = Address();

    try {
        const auto* p = static_cast<const std::uint8_t*>(payload);
        std::vector<std::uint8_t> data(p, p + payload_size);
        return new icmpecho_pending{
            ping_async(h->handle, pool->pool, target, data, options) };
    } catch (const std::exception&) {
        return nullptr;
    }
}

ICMPECHO_API int icmpecho_poll(icmpecho_pending* p, IcmpEchoReplyC* out) {
    if (!p || !p->pending.valid()) return -1;

    try {
        std::optional<EchoReply> r = p->pending.poll();
        if (!r) return 0;
        to_out(*r, out);
        return 1;
    } catch (const std::exception&) {
        return -1;
    }
}

ICMPECHO_API int icmpecho_wait(icmpecho_pending* p, int timeout_ms, IcmpEchoReplyC* out) {
    if (!p || !p->pending.valid()) return -1;

    try {
        std::optional<EchoReply> r = p->pending.wait_for(timeout_ms);
        if (!r) return 0;
        to_out(*r, out);
        return 1;
    } catch (const std::exception&) {
        return -1;
    }
}

ICMPECHO_API void icmpecho_free(icmpecho_pending* p) {
    delete p;
}

ICMPECHO_API size_t icmpecho_describe(unsigned int code, char* buf, size_t len) {
    const std::string s = Error::from_os_code(code).message();
    copy_text(s, buf, len);
    return s.size();
}

} // extern "C"
