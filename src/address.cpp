/**
 * Address value type.
 *
 * Construction never parses text; callers hand in network-order bytes.
 * Formatting uses inet_ntop so IPv6 output follows the platform's
 * zero-compression rules.
 */

#include "icmpecho/address.hpp"

#include <cstring>

#if defined(_WIN32)
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#endif

namespace icmpecho {

Address::Address(const std::array<std::uint8_t, 4>& v4) noexcept : size_(4) {
    std::memcpy(bytes_.data(), v4.data(), 4);
}

Address::Address(const std::array<std::uint8_t, 16>& v6) noexcept : size_(16) {
    std::memcpy(bytes_.data(), v6.data(), 16);
}

Address Address::v4(std::uint8_t a, std::uint8_t b,
                    std::uint8_t c, std::uint8_t d) noexcept {
    return Address(std::array<std::uint8_t, 4>{ { a, b, c, d } });
}

bool Address::from_bytes(const void* data, std::size_t len, Address& out) noexcept {
    if (!data || (len != 4 && len != 16))
        return false;

    Address a;
    std::memcpy(a.bytes_.data(), data, len);
    a.size_ = static_cast<std::uint8_t>(len);
    out = a;
    return true;
}

Address Address::loopback(AddressFamily family) noexcept {
    if (family == AddressFamily::V4)
        return v4(127, 0, 0, 1);

    std::array<std::uint8_t, 16> b{};
    b[15] = 1;
    return Address(b);
}

AddressFamily Address::family() const noexcept {
    return size_ == 16 ? AddressFamily::V6 : AddressFamily::V4;
}

bool Address::is_unspecified() const noexcept {
    for (std::size_t i = 0; i < size_; ++i) {
        if (bytes_[i] != 0) return false;
    }
    return true;
}

std::string Address::to_string() const {
    if (empty())
        return "<none>";

    char buf[64]{};
    const int af = (size_ == 4) ? AF_INET : AF_INET6;
    if (!inet_ntop(af, bytes_.data(), buf, sizeof(buf)))
        return "<invalid>";
    return buf;
}

bool Address::operator==(const Address& o) const noexcept {
    return size_ == o.size_ && std::memcmp(bytes_.data(), o.bytes_.data(), size_) == 0;
}

std::ostream& operator<<(std::ostream& os, const Address& a) {
    return os << a.to_string();
}

bool is_valid_target(const Address& a, AddressFamily family) noexcept {
    return !a.empty() && a.family() == family && !a.is_unspecified();
}

} // namespace icmpecho
