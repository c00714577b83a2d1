#if defined(__linux__)

/**
 * ICMP helper driver (Linux).
 *
 * Implementation notes:
 *  - Uses a datagram ICMP socket (SOCK_DGRAM + IPPROTO_ICMP[V6]); the kernel
 *    owns the echo identifier and only delivers our own replies
 *  - Listener thread waits in poll() on the socket and an eventfd used to
 *    wake it for new deadlines and shutdown
 *  - TTL comes from ancillary data (IP_RECVTTL); ICMP errors from the error
 *    queue (IP_RECVERR / IPV6_RECVERR)
 *  - Every outcome is written as a driver-format reply record before the
 *    request's completion signal is set
 */

#include "linux_icmp.hpp"
#include "../native_driver.hpp"
#include "icmpecho/error.hpp"
#include "icmpecho/icmp.hpp"
#include "icmpecho/ip_status.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <mutex>
#include <system_error>
#include <unordered_map>
#include <vector>

#include <arpa/inet.h>
#include <linux/errqueue.h>
#include <netinet/icmp6.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace icmpecho {
namespace detail {

using Clock = std::chrono::steady_clock;

namespace {

// ============================================================================
// Status mapping
// ============================================================================
std::uint32_t status_from_errno(int err, std::uint32_t fallback) noexcept {
    switch (err) {
        case ENETUNREACH:  return ip_status::kDestNetUnreachable;
        case EHOSTUNREACH: return ip_status::kDestHostUnreachable;
        case EMSGSIZE:     return ip_status::kPacketTooBig;
        case ETIMEDOUT:    return ip_status::kReqTimedOut;
        default:           return fallback;
    }
}

std::uint32_t status_from_icmp4(std::uint8_t type, std::uint8_t code) noexcept {
    using namespace ip_status;
    switch (type) {
        case ICMP_DEST_UNREACH:
            switch (code) {
                case ICMP_NET_UNREACH:  return kDestNetUnreachable;
                case ICMP_HOST_UNREACH: return kDestHostUnreachable;
                case ICMP_PROT_UNREACH: return kDestProtUnreachable;
                case ICMP_PORT_UNREACH: return kDestPortUnreachable;
                case ICMP_FRAG_NEEDED:  return kPacketTooBig;
                default:                return kDestUnreachable;
            }
        case ICMP_TIME_EXCEEDED:
            return code == ICMP_EXC_FRAGTIME ? kTtlExpiredReassem : kTtlExpiredTransit;
        case ICMP_PARAMETERPROB:
            return kParamProblem;
        case ICMP_SOURCE_QUENCH:
            return kSourceQuench;
        default:
            return kIcmpError;
    }
}

std::uint32_t status_from_icmp6(std::uint8_t type, std::uint8_t code) noexcept {
    using namespace ip_status;
    switch (type) {
        case ICMP6_DST_UNREACH:
            switch (code) {
                case ICMP6_DST_UNREACH_NOROUTE:     return kDestNetUnreachable;
                case ICMP6_DST_UNREACH_ADMIN:       return kDestProtUnreachable;
                case ICMP6_DST_UNREACH_BEYONDSCOPE: return kDestScopeMismatch;
                case ICMP6_DST_UNREACH_ADDR:        return kDestHostUnreachable;
                case ICMP6_DST_UNREACH_NOPORT:      return kDestPortUnreachable;
                default:                            return kDestUnreachable;
            }
        case ICMP6_PACKET_TOO_BIG:
            return kPacketTooBig;
        case ICMP6_TIME_EXCEEDED:
            return code == ICMP6_TIME_EXCEED_REASSEMBLY ? kTtlExpiredReassem
                                                        : kTtlExpiredTransit;
        case ICMP6_PARAM_PROB:
            return kParamProblem;
        default:
            return kIcmpError;
    }
}


// ============================================================================
// Address helpers
// ============================================================================
Address address_from(const sockaddr_storage& ss) noexcept {
    Address a;
    if (ss.ss_family == AF_INET) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(&ss);
        (void)Address::from_bytes(&sin->sin_addr, 4, a);
    } else if (ss.ss_family == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&ss);
        (void)Address::from_bytes(&sin6->sin6_addr, 16, a);
    }
    return a;
}

socklen_t sockaddr_for(const Address& a, sockaddr_storage& ss) noexcept {
    std::memset(&ss, 0, sizeof(ss));
    if (a.family() == AddressFamily::V4) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&ss);
        sin->sin_family = AF_INET;
        std::memcpy(&sin->sin_addr, a.bytes(), 4);
        return sizeof(sockaddr_in);
    }
    auto* sin6 = reinterpret_cast<sockaddr_in6*>(&ss);
    sin6->sin6_family = AF_INET6;
    std::memcpy(&sin6->sin6_addr, a.bytes(), 16);
    return sizeof(sockaddr_in6);
}

std::uint32_t elapsed_ms(Clock::time_point from, Clock::time_point to) noexcept {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
    return ms > 0 ? static_cast<std::uint32_t>(ms) : 0;
}

} // namespace


// ============================================================================
// IcmpSocket: socket, outstanding requests, listener loop
// ============================================================================
class IcmpSocket {
public:
    explicit IcmpSocket(AddressFamily family);
    ~IcmpSocket();

    std::uint32_t submit(const EchoRequest& req, std::uint8_t* reply,
                         std::size_t reply_size, CompletionSignal& done);

    void run();
    void stop() noexcept;

private:
    struct Outstanding {
        std::uint8_t* reply;
        std::size_t reply_size;
        CompletionSignal* done;
        Clock::time_point sent;
        Clock::time_point deadline;
    };

    std::uint32_t transmit(const EchoRequest& req, std::uint16_t seq);
    bool take(std::uint16_t seq, Outstanding& out);
    void deliver(const Outstanding& op, const ReplyRecord& rec) noexcept;
    int next_timeout_ms();
    void drain_replies(std::vector<std::uint8_t>& buf);
    void drain_errors(std::vector<std::uint8_t>& buf);
    void expire(bool all);
    void wake() noexcept;

    AddressFamily family_;
    const ReplyLayout& layout_;
    int fd_{-1};
    int wake_fd_{-1};
    std::atomic<bool> running_{true};

    std::mutex mtx_;
    std::unordered_map<std::uint16_t, Outstanding> outstanding_;
    std::uint16_t next_seq_{1};

    // TTL and DF are socket options; each send sets its own under this lock
    std::mutex send_mtx_;
};

IcmpSocket::IcmpSocket(AddressFamily family)
    : family_(family),
      layout_(family == AddressFamily::V4 ? kEchoReplyV4 : kEchoReplyV6)
{
    const bool v4 = family_ == AddressFamily::V4;

    const int domain = v4 ? static_cast<int>(AF_INET) : static_cast<int>(AF_INET6);
    const int proto  = v4 ? static_cast<int>(IPPROTO_ICMP) : static_cast<int>(IPPROTO_ICMPV6);
    fd_ = ::socket(domain, SOCK_DGRAM | SOCK_CLOEXEC, proto);
    if (fd_ < 0)
        throw CreateError(v4 ? "ICMP datagram socket unavailable"
                             : "ICMPv6 datagram socket unavailable",
                          static_cast<std::uint32_t>(errno));

    int one = 1;
    int rc = v4 ? ::setsockopt(fd_, IPPROTO_IP, IP_RECVTTL, &one, sizeof(one)) : 0;
    if (rc == 0)
        rc = v4 ? ::setsockopt(fd_, IPPROTO_IP, IP_RECVERR, &one, sizeof(one))
                : ::setsockopt(fd_, IPPROTO_IPV6, IPV6_RECVERR, &one, sizeof(one));
    if (rc != 0) {
        const int err = errno;
        ::close(fd_);
        throw CreateError("ICMP socket options rejected", static_cast<std::uint32_t>(err));
    }

    wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wake_fd_ < 0) {
        const int err = errno;
        ::close(fd_);
        throw CreateError("eventfd failed", static_cast<std::uint32_t>(err));
    }
}

IcmpSocket::~IcmpSocket() {
    ::close(wake_fd_);
    ::close(fd_);
}

void IcmpSocket::stop() noexcept {
    running_.store(false);
    wake();
}

void IcmpSocket::wake() noexcept {
    const std::uint64_t one = 1;
    const ssize_t n = ::write(wake_fd_, &one, sizeof(one));
    (void)n; // counter saturation still leaves the fd readable
}


// ----------------------------------------------------------------------------
// Submission
// ----------------------------------------------------------------------------
std::uint32_t IcmpSocket::submit(const EchoRequest& req, std::uint8_t* reply,
                                 std::size_t reply_size, CompletionSignal& done)
{
    if (!reply || reply_size < required_reply_size(family_, req.payload_size))
        return ip_status::kBufTooSmall;
    if (req.destination.empty() || req.destination.family() != family_)
        return ip_status::kBadDestination;

    const auto now = Clock::now();
    Outstanding op{ reply, reply_size, &done, now,
                    now + std::chrono::milliseconds(req.timeout_ms) };

    std::uint16_t seq = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        do {
            seq = next_seq_++;
        } while (outstanding_.count(seq) != 0);
        outstanding_.emplace(seq, op);
    }

    const std::uint32_t code = transmit(req, seq);
    if (code != 0) {
        std::lock_guard<std::mutex> lk(mtx_);
        // Already completed from the error queue: the signal is set
        if (outstanding_.erase(seq) == 0)
            return 0;
        return code;
    }

    wake();
    return 0;
}

std::uint32_t IcmpSocket::transmit(const EchoRequest& req, std::uint16_t seq) {
    const bool v4 = family_ == AddressFamily::V4;

    std::vector<std::uint8_t> packet(sizeof(IcmpHeader) + req.payload_size);

    IcmpHeader h{};
    h.type = v4 ? kIcmpEchoRequest : kIcmp6EchoRequest;
    h.code = 0;
    h.id   = 0;
    h.seq  = htons(seq);
    std::memcpy(packet.data(), &h, sizeof(h));
    if (req.payload && req.payload_size > 0)
        std::memcpy(packet.data() + sizeof(h), req.payload, req.payload_size);

    // The kernel fills in the ICMPv6 checksum (pseudo-header) itself
    if (v4) {
        const std::uint16_t sum = checksum16(packet.data(), packet.size());
        std::memcpy(packet.data() + offsetof(IcmpHeader, checksum), &sum, sizeof(sum));
    }

    sockaddr_storage dst{};
    const socklen_t dst_len = sockaddr_for(req.destination, dst);

    iovec iov{ packet.data(), packet.size() };
    msghdr msg{};
    msg.msg_name = &dst;
    msg.msg_namelen = dst_len;
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;

    union {
        cmsghdr align;
        char buf[CMSG_SPACE(sizeof(in6_pktinfo))];
    } ctrl;
    std::memset(&ctrl, 0, sizeof(ctrl));

    if (!req.source.empty()) {
        msg.msg_control = ctrl.buf;
        if (v4) {
            in_pktinfo pi{};
            std::memcpy(&pi.ipi_spec_dst, req.source.bytes(), 4);
            msg.msg_controllen = CMSG_SPACE(sizeof(pi));
            cmsghdr* c = CMSG_FIRSTHDR(&msg);
            c->cmsg_level = IPPROTO_IP;
            c->cmsg_type  = IP_PKTINFO;
            c->cmsg_len   = CMSG_LEN(sizeof(pi));
            std::memcpy(CMSG_DATA(c), &pi, sizeof(pi));
        } else {
            in6_pktinfo pi{};
            std::memcpy(&pi.ipi6_addr, req.source.bytes(), 16);
            msg.msg_controllen = CMSG_SPACE(sizeof(pi));
            cmsghdr* c = CMSG_FIRSTHDR(&msg);
            c->cmsg_level = IPPROTO_IPV6;
            c->cmsg_type  = IPV6_PKTINFO;
            c->cmsg_len   = CMSG_LEN(sizeof(pi));
            std::memcpy(CMSG_DATA(c), &pi, sizeof(pi));
        }
    }

    std::lock_guard<std::mutex> lk(send_mtx_);

    // -1 restores the system default
    const int ttl = req.ttl;
    int rc = v4 ? ::setsockopt(fd_, IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl))
                : ::setsockopt(fd_, IPPROTO_IPV6, IPV6_UNICAST_HOPS, &ttl, sizeof(ttl));
    if (rc != 0)
        return static_cast<std::uint32_t>(errno);

    if (v4) {
        const int pmtu = req.dont_fragment ? IP_PMTUDISC_DO : IP_PMTUDISC_DONT;
        rc = ::setsockopt(fd_, IPPROTO_IP, IP_MTU_DISCOVER, &pmtu, sizeof(pmtu));
    } else {
        const int df = req.dont_fragment ? 1 : 0;
        rc = ::setsockopt(fd_, IPPROTO_IPV6, IPV6_DONTFRAG, &df, sizeof(df));
    }
    if (rc != 0)
        return static_cast<std::uint32_t>(errno);

    for (;;) {
        if (::sendmsg(fd_, &msg, 0) >= 0)
            return 0;
        if (errno != EINTR)
            break;
    }
    const int err = errno;
    return status_from_errno(err, static_cast<std::uint32_t>(err));
}


// ----------------------------------------------------------------------------
// Completion
// ----------------------------------------------------------------------------
bool IcmpSocket::take(std::uint16_t seq, Outstanding& out) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = outstanding_.find(seq);
    if (it == outstanding_.end())
        return false;
    out = it->second;
    outstanding_.erase(it);
    return true;
}

void IcmpSocket::deliver(const Outstanding& op, const ReplyRecord& rec) noexcept {
    if (!encode_reply(layout_, rec, op.reply, op.reply_size)) {
        ReplyRecord small;
        small.status = ip_status::kBufTooSmall;
        small.source = rec.source;
        small.rtt_ms = rec.rtt_ms;
        // The header always fits: submit() checked the size
        (void)encode_reply(layout_, small, op.reply, op.reply_size);
    }
    // Last touch of the buffer
    op.done->set();
}

int IcmpSocket::next_timeout_ms() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (outstanding_.empty())
        return -1;

    auto first = Clock::time_point::max();
    for (const auto& kv : outstanding_) {
        if (kv.second.deadline < first)
            first = kv.second.deadline;
    }

    const auto now = Clock::now();
    if (first <= now)
        return 0;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(first - now).count();
    return static_cast<int>(ms) + 1;
}

void IcmpSocket::expire(bool all) {
    std::vector<Outstanding> due;
    const auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto it = outstanding_.begin(); it != outstanding_.end();) {
            if (all || it->second.deadline <= now) {
                due.push_back(it->second);
                it = outstanding_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& op : due) {
        ReplyRecord rec;
        rec.status = ip_status::kReqTimedOut;
        rec.rtt_ms = elapsed_ms(op.sent, now);
        deliver(op, rec);
    }
}


// ----------------------------------------------------------------------------
// Listener
// ----------------------------------------------------------------------------
void IcmpSocket::run() {
    std::vector<std::uint8_t> buf(65536);

    while (running_.load()) {
        pollfd fds[2]{};
        fds[0].fd = fd_;
        fds[0].events = POLLIN;
        fds[1].fd = wake_fd_;
        fds[1].events = POLLIN;

        const int r = ::poll(fds, 2, next_timeout_ms());
        if (r < 0) {
            if (errno != EINTR)
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }

        if (fds[1].revents & POLLIN) {
            std::uint64_t v = 0;
            const ssize_t n = ::read(wake_fd_, &v, sizeof(v));
            (void)n;
        }

        if (fds[0].revents & POLLERR)
            drain_errors(buf);
        if (fds[0].revents & POLLIN)
            drain_replies(buf);

        expire(false);
    }

    // Nothing may stay owned by a driver that is going away
    expire(true);
}

void IcmpSocket::drain_replies(std::vector<std::uint8_t>& buf) {
    const bool v4 = family_ == AddressFamily::V4;

    for (;;) {
        sockaddr_storage from{};
        char cbuf[256];

        iovec iov{ buf.data(), buf.size() };
        msghdr msg{};
        msg.msg_name = &from;
        msg.msg_namelen = sizeof(from);
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;
        msg.msg_control = cbuf;
        msg.msg_controllen = sizeof(cbuf);

        const ssize_t n = ::recvmsg(fd_, &msg, MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR) continue;
            return; // EAGAIN: drained
        }
        const auto now = Clock::now();

        if (n < static_cast<ssize_t>(sizeof(IcmpHeader)))
            continue;

        IcmpHeader h{};
        std::memcpy(&h, buf.data(), sizeof(h));
        if (h.type != (v4 ? kIcmpEchoReply : kIcmp6EchoReply))
            continue;

        Outstanding op{};
        if (!take(ntohs(h.seq), op))
            continue; // late reply to a request that already timed out

        int ttl = -1;
        for (cmsghdr* c = CMSG_FIRSTHDR(&msg); c; c = CMSG_NXTHDR(&msg, c)) {
            if (c->cmsg_level == IPPROTO_IP && c->cmsg_type == IP_TTL) {
                std::memcpy(&ttl, CMSG_DATA(c), sizeof(ttl));
                break;
            }
        }

        const std::size_t data_size = static_cast<std::size_t>(n) - sizeof(IcmpHeader);

        ReplyRecord rec;
        rec.status    = ip_status::kSuccess;
        rec.source    = address_from(from);
        rec.rtt_ms    = elapsed_ms(op.sent, now);
        rec.ttl       = ttl;
        rec.data      = buf.data() + sizeof(IcmpHeader);
        rec.data_size = static_cast<std::uint16_t>(data_size > 0xFFFF ? 0xFFFF : data_size);
        deliver(op, rec);
    }
}

void IcmpSocket::drain_errors(std::vector<std::uint8_t>& buf) {
    for (;;) {
        sockaddr_storage to{};
        char cbuf[512];

        iovec iov{ buf.data(), buf.size() };
        msghdr msg{};
        msg.msg_name = &to;
        msg.msg_namelen = sizeof(to);
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;
        msg.msg_control = cbuf;
        msg.msg_controllen = sizeof(cbuf);

        const ssize_t n = ::recvmsg(fd_, &msg, MSG_ERRQUEUE | MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        const auto now = Clock::now();

        // The queued payload is our own echo request
        if (n < static_cast<ssize_t>(sizeof(IcmpHeader)))
            continue;

        IcmpHeader h{};
        std::memcpy(&h, buf.data(), sizeof(h));

        const cmsghdr* err_msg = nullptr;
        for (cmsghdr* c = CMSG_FIRSTHDR(&msg); c; c = CMSG_NXTHDR(&msg, c)) {
            if ((c->cmsg_level == SOL_IP && c->cmsg_type == IP_RECVERR) ||
                (c->cmsg_level == SOL_IPV6 && c->cmsg_type == IPV6_RECVERR)) {
                err_msg = c;
                break;
            }
        }
        if (!err_msg)
            continue;

        sock_extended_err ee{};
        std::memcpy(&ee, CMSG_DATA(err_msg), sizeof(ee));

        Outstanding op{};
        if (!take(ntohs(h.seq), op))
            continue;

        ReplyRecord rec;
        rec.rtt_ms = elapsed_ms(op.sent, now);

        if (ee.ee_origin == SO_EE_ORIGIN_ICMP)
            rec.status = status_from_icmp4(ee.ee_type, ee.ee_code);
        else if (ee.ee_origin == SO_EE_ORIGIN_ICMP6)
            rec.status = status_from_icmp6(ee.ee_type, ee.ee_code);
        else
            rec.status = status_from_errno(static_cast<int>(ee.ee_errno),
                                           ip_status::kGeneralFailure);

        // The router (or host) that reported the error follows the error record
        const std::size_t hdr = static_cast<std::size_t>(
            CMSG_DATA(err_msg) - reinterpret_cast<const unsigned char*>(err_msg));
        const std::size_t avail = err_msg->cmsg_len > hdr + sizeof(ee)
                                      ? err_msg->cmsg_len - hdr - sizeof(ee) : 0;
        if (avail > 0) {
            sockaddr_storage offender{};
            std::memcpy(&offender, CMSG_DATA(err_msg) + sizeof(ee),
                        avail < sizeof(offender) ? avail : sizeof(offender));
            rec.source = address_from(offender);
        }

        deliver(op, rec);
    }
}


// ============================================================================
// LinuxEchoDriver
// ============================================================================
LinuxEchoDriver::LinuxEchoDriver(AddressFamily family)
    : family_(family),
      sock_(std::make_shared<IcmpSocket>(family))
{
    try {
        std::shared_ptr<IcmpSocket> s = sock_;
        listener_ = std::thread([s] { s->run(); });
    } catch (const std::system_error& e) {
        throw CreateError("cannot start ICMP listener thread",
                          static_cast<std::uint32_t>(e.code().value()));
    }
}

LinuxEchoDriver::~LinuxEchoDriver() {
    sock_->stop();

    if (!listener_.joinable())
        return;

    // Dropped from a completion callback: the listener owns its socket
    // state and exits on its own
    if (listener_.get_id() == std::this_thread::get_id())
        listener_.detach();
    else
        listener_.join();
}

std::uint32_t LinuxEchoDriver::send(const EchoRequest& req,
                                    std::uint8_t* reply, std::size_t reply_size)
{
    CompletionSignal done;
    const std::uint32_t code = sock_->submit(req, reply, reply_size, done);
    if (code != 0)
        return code;

    // The listener always completes the request by its timeout
    (void)done.wait(-1);
    return 0;
}

std::uint32_t LinuxEchoDriver::send_async(const EchoRequest& req,
                                          std::uint8_t* reply, std::size_t reply_size,
                                          CompletionSignal& done)
{
    return sock_->submit(req, reply, reply_size, done);
}

const ReplyLayout& LinuxEchoDriver::sync_layout() const noexcept {
    return family_ == AddressFamily::V4 ? kEchoReplyV4 : kEchoReplyV6;
}

std::unique_ptr<EchoDriver> open_native_driver(AddressFamily family) {
    return std::unique_ptr<EchoDriver>(new LinuxEchoDriver(family));
}

} // namespace detail
} // namespace icmpecho

#endif
