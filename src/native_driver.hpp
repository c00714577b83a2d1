#pragma once
#include <memory>
#include "icmpecho/driver.hpp"

namespace icmpecho {
namespace detail {

/**
 * Opens the OS backend for `family` (ICMP helper on Windows, ICMP datagram
 * socket on Linux).
 *
 * @throws CreateError if the OS denies it
 */
std::unique_ptr<EchoDriver> open_native_driver(AddressFamily family);

} // namespace detail
} // namespace icmpecho
