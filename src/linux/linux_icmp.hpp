#pragma once
#include <memory>
#include <thread>
#include "icmpecho/driver.hpp"

namespace icmpecho {
namespace detail {

class IcmpSocket;

/**
 * Linux rendition of the ICMP helper driver.
 *
 * One unprivileged ICMP datagram socket (SOCK_DGRAM + IPPROTO_ICMP or
 * IPPROTO_ICMPV6) per driver and one listener thread that:
 *  - matches echo replies to outstanding requests by sequence number
 *  - turns queued ICMP errors (IP_RECVERR) into IP status records
 *  - writes a timed-out record once a request's timeout elapses
 * and sets the request's completion signal after writing its record.
 *
 * Requires the caller's group to be inside net.ipv4.ping_group_range.
 */
class LinuxEchoDriver final : public EchoDriver {
public:
    /** @throws CreateError if the socket or listener cannot be set up */
    explicit LinuxEchoDriver(AddressFamily family);
    ~LinuxEchoDriver() override;

    LinuxEchoDriver(const LinuxEchoDriver&) = delete;
    LinuxEchoDriver& operator=(const LinuxEchoDriver&) = delete;

    AddressFamily family() const noexcept override { return family_; }

    std::uint32_t send(const EchoRequest& req,
                       std::uint8_t* reply, std::size_t reply_size) override;

    std::uint32_t send_async(const EchoRequest& req,
                             std::uint8_t* reply, std::size_t reply_size,
                             CompletionSignal& done) override;

    /** Records are written final; nothing to post-process. */
    std::uint32_t parse(std::uint8_t*, std::size_t) override { return 0; }

    const ReplyLayout& sync_layout() const noexcept override;
    const ReplyLayout& async_layout() const noexcept override { return sync_layout(); }

private:
    AddressFamily family_;
    std::shared_ptr<IcmpSocket> sock_;
    std::thread listener_;
};

} // namespace detail
} // namespace icmpecho
