#pragma once
#include <cstddef>
#include <cstdint>
#include "icmpecho/address.hpp"
#include "icmpecho/reply.hpp"
#include "icmpecho/signal.hpp"
#include "icmpecho/visibility.hpp"

namespace icmpecho {

/**
 * One echo request as handed to a driver.
 */
struct EchoRequest {
    Address destination;
    Address source;                       // empty = let the OS choose
    const std::uint8_t* payload{nullptr};
    std::uint16_t payload_size{0};
    int ttl{-1};                          // -1 = system default
    bool dont_fragment{false};
    std::uint32_t timeout_ms{2000};
};

/**
 * An open ICMP conversation for one address family.
 *
 * The native handle is opened by the concrete driver's factory and closed by
 * its destructor, exactly once. EchoHandle shares ownership of a driver; no
 * other code closes it.
 *
 * Return codes follow the helper API: 0 means success / pending, anything
 * else is an IP status, Win32 error or errno value for Error::from_os_code().
 */
class ICMPECHO_API EchoDriver {
public:
    virtual ~EchoDriver() = default;

    virtual AddressFamily family() const noexcept = 0;

    /**
     * Blocking echo. On 0 the reply record (layout: sync_layout()) is in
     * `reply`; the record's own status may still report a failure.
     */
    virtual std::uint32_t send(const EchoRequest& req,
                               std::uint8_t* reply, std::size_t reply_size) = 0;

    /**
     * Starts a non-blocking echo that completes by setting `done`.
     *
     * On 0 the driver owns `reply` and `done` until it sets `done`, even past
     * the request timeout. On any other code nothing is outstanding.
     */
    virtual std::uint32_t send_async(const EchoRequest& req,
                                     std::uint8_t* reply, std::size_t reply_size,
                                     CompletionSignal& done) = 0;

    /**
     * Post-processes a completed asynchronous reply in place
     * (IcmpParseReplies). Called once, after `done` was observed set.
     */
    virtual std::uint32_t parse(std::uint8_t* reply, std::size_t reply_size) = 0;

    virtual const ReplyLayout& sync_layout() const noexcept = 0;
    virtual const ReplyLayout& async_layout() const noexcept = 0;
};

} // namespace icmpecho
