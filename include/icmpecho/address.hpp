#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include "icmpecho/visibility.hpp"

namespace icmpecho {

/**
 * IP version of an echo target. Each EchoHandle serves exactly one family.
 */
enum class AddressFamily : std::uint8_t {
    V4 = 4,
    V6 = 6
};

/**
 * Immutable IPv4 (4 bytes) or IPv6 (16 bytes) address in network order.
 *
 * A default-constructed Address is empty and is never a valid echo target.
 * No string parsing is offered; callers resolve names and literals themselves.
 */
class ICMPECHO_API Address {
public:
    Address() = default;
    explicit Address(const std::array<std::uint8_t, 4>& v4) noexcept;
    explicit Address(const std::array<std::uint8_t, 16>& v6) noexcept;

    static Address v4(std::uint8_t a, std::uint8_t b,
                      std::uint8_t c, std::uint8_t d) noexcept;

    /**
     * Builds an address from raw network-order bytes.
     *
     * @param data  Address bytes
     * @param len   4 for IPv4, 16 for IPv6
     * @param out   Receives the address on success
     * @return      false if len is neither 4 nor 16 (out is left untouched)
     */
    static bool from_bytes(const void* data, std::size_t len, Address& out) noexcept;

    /** 127.0.0.1 or ::1 */
    static Address loopback(AddressFamily family) noexcept;

    bool empty() const noexcept { return size_ == 0; }
    AddressFamily family() const noexcept;
    const std::uint8_t* bytes() const noexcept { return bytes_.data(); }
    std::size_t size() const noexcept { return size_; }

    /** 0.0.0.0 or :: */
    bool is_unspecified() const noexcept;

    /** Dotted quad / RFC 5952 text. Empty address yields "<none>". */
    std::string to_string() const;

    bool operator==(const Address& o) const noexcept;
    bool operator!=(const Address& o) const noexcept { return !(*this == o); }

private:
    std::array<std::uint8_t, 16> bytes_{};
    std::uint8_t size_{0};
};

ICMPECHO_API std::ostream& operator<<(std::ostream& os, const Address& a);

/**
 * True when `a` may be sent to on a handle of `family`:
 * non-empty, matching family, not the unspecified address.
 */
ICMPECHO_API bool is_valid_target(const Address& a, AddressFamily family) noexcept;

} // namespace icmpecho
