#pragma once
#include <memory>
#include <utility>
#include "icmpecho/address.hpp"
#include "icmpecho/driver.hpp"
#include "icmpecho/visibility.hpp"

namespace icmpecho {

/**
 * Shared owner of one open ICMP conversation.
 *
 * Copies share the same native handle; it is closed once, when the last
 * copy (including the copies held by in-flight buffer slots) goes away.
 * There are no move operations: moving copies, so no handle is ever left
 * without a driver.
 */
class ICMPECHO_API EchoHandle {
public:
    /**
     * Opens the OS ICMP helper for `family`.
     * @throws CreateError if the OS denies handle creation
     */
    static EchoHandle open(AddressFamily family = AddressFamily::V4);

    /**
     * Wraps a caller-supplied driver. The driver's destructor performs the
     * close.
     * @throws std::invalid_argument on a null driver
     */
    static EchoHandle adopt(std::unique_ptr<EchoDriver> driver);

    EchoHandle(const EchoHandle&) = default;
    EchoHandle& operator=(const EchoHandle&) = default;

    AddressFamily family() const noexcept { return driver_->family(); }
    EchoDriver& driver() const noexcept { return *driver_; }

    /** Extra owner reference; in-flight slots hold one until the driver is done. */
    std::shared_ptr<EchoDriver> shared_driver() const noexcept { return driver_; }

    /** Number of owners (handles + in-flight slots) currently sharing it. */
    long use_count() const noexcept { return driver_.use_count(); }

private:
    explicit EchoHandle(std::shared_ptr<EchoDriver> d) : driver_(std::move(d)) {}

    std::shared_ptr<EchoDriver> driver_;
};

} // namespace icmpecho
