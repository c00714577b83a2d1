#pragma once
#include <cstdint>
#include <vector>
#include "icmpecho/address.hpp"
#include "icmpecho/handle.hpp"
#include "icmpecho/reply.hpp"
#include "icmpecho/visibility.hpp"

namespace icmpecho {

/**
 * Per-request options.
 */
struct EchoOptions {
    int timeout_ms{2000};        // request timeout (values below 1 are raised to 1)
    int ttl{-1};                 // IP TTL / hop limit 1..255, 0 or -1 = system default
    bool dont_fragment{false};   // IP Don't Fragment bit (IPv6: never fragment)
    Address source;              // empty = let the OS pick the source address
};

/**
 * Sends one echo request and blocks until the driver completes it.
 *
 * Uses a transient reply buffer; no pool is involved. Safe to call from
 * several threads on the same handle with the built-in drivers. A custom
 * EchoDriver that cannot take concurrent blocking calls needs external
 * synchronization by the caller.
 *
 * Invalid targets and oversized payloads are reported without any OS call.
 */
ICMPECHO_API EchoReply ping(const EchoHandle& handle,
                            const Address& dst,
                            const std::vector<std::uint8_t>& payload,
                            const EchoOptions& opt = EchoOptions{});

/**
 * Blocking pinger holding one IPv4 and one IPv6 handle.
 *
 * Copies share the handles. If one family fails to open, the Pinger still
 * works for the other; sends on the failed family return OsError with the
 * code the OS gave when opening it.
 */
class ICMPECHO_API Pinger {
public:
    /** @throws CreateError if neither family can be opened */
    Pinger();

    bool has_v4() const noexcept { return v4_ != nullptr; }
    bool has_v6() const noexcept { return v6_ != nullptr; }
    std::uint32_t v4_error() const noexcept { return v4_error_; }
    std::uint32_t v6_error() const noexcept { return v6_error_; }

    void set_ttl(int ttl) noexcept { opt_.ttl = ttl; }
    int ttl() const noexcept { return opt_.ttl; }
    void set_df(bool df) noexcept { opt_.dont_fragment = df; }
    bool df() const noexcept { return opt_.dont_fragment; }
    void set_timeout(int timeout_ms) noexcept { opt_.timeout_ms = timeout_ms; }
    int timeout() const noexcept { return opt_.timeout_ms; }

    EchoReply send(const Address& dst,
                   const std::vector<std::uint8_t>& payload = {}) const;

    /** Sends from a specific local address (same family as dst). */
    EchoReply send_from(const Address& src, const Address& dst,
                        const std::vector<std::uint8_t>& payload = {}) const;

private:
    const EchoHandle* handle_for(AddressFamily family) const noexcept;
    std::uint32_t error_for(AddressFamily family) const noexcept;

    std::shared_ptr<EchoHandle> v4_;
    std::shared_ptr<EchoHandle> v6_;
    std::uint32_t v4_error_{0};
    std::uint32_t v6_error_{0};
    EchoOptions opt_{};
};

} // namespace icmpecho
