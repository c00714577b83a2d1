/**
 * Windows ICMP helper driver.
 *
 * Responsibilities:
 * - Open / close the IcmpCreateFile or Icmp6CreateFile handle (once each)
 * - Translate EchoRequest into IP_OPTION_INFORMATION and the send call
 * - Report pending / immediate-failure results the way EchoDriver expects
 *
 * No raw sockets and no elevated rights are involved.
 */

#include <winsock2.h>
#include <ws2tcpip.h>
#include <iphlpapi.h>
#include <icmpapi.h>
#include <windows.h>

#include <cstddef>
#include <cstring>

#include "win_icmp.hpp"
#include "../native_driver.hpp"
#include "icmpecho/error.hpp"
#include "icmpecho/ip_status.hpp"

#pragma comment(lib, "Iphlpapi.lib")
#pragma comment(lib, "Ws2_32.lib")

namespace icmpecho {
namespace detail {

// ---------------------------------------------------------------------------
// Reply layouts must match ipexport.h for this pointer width
// ---------------------------------------------------------------------------
static_assert(sizeof(ICMP_ECHO_REPLY) == kEchoReplyV4.header_size, "ICMP_ECHO_REPLY size");
static_assert(offsetof(ICMP_ECHO_REPLY, Address) == kEchoReplyV4.address_offset, "Address");
static_assert(offsetof(ICMP_ECHO_REPLY, Status) == kEchoReplyV4.status_offset, "Status");
static_assert(offsetof(ICMP_ECHO_REPLY, RoundTripTime) == kEchoReplyV4.rtt_offset, "RTT");
static_assert(offsetof(ICMP_ECHO_REPLY, DataSize) == kEchoReplyV4.data_size_offset, "DataSize");
static_assert(offsetof(ICMP_ECHO_REPLY, Options) + offsetof(IP_OPTION_INFORMATION, Ttl) ==
              kEchoReplyV4.ttl_offset, "Ttl");

#if defined(_WIN64)
static_assert(sizeof(ICMP_ECHO_REPLY32) == kEchoReply32V4.header_size, "ICMP_ECHO_REPLY32 size");
static_assert(offsetof(ICMP_ECHO_REPLY32, Status) == kEchoReply32V4.status_offset, "Status32");
static_assert(offsetof(ICMP_ECHO_REPLY32, Options) + offsetof(IP_OPTION_INFORMATION32, Ttl) ==
              kEchoReply32V4.ttl_offset, "Ttl32");
#endif

static_assert(sizeof(ICMPV6_ECHO_REPLY) == kEchoReplyV6.header_size, "ICMPV6_ECHO_REPLY size");
static_assert(offsetof(ICMPV6_ECHO_REPLY, Address) + offsetof(IPV6_ADDRESS_EX, sin6_addr) ==
              kEchoReplyV6.address_offset, "sin6_addr");
static_assert(offsetof(ICMPV6_ECHO_REPLY, Status) == kEchoReplyV6.status_offset, "Status6");
static_assert(offsetof(ICMPV6_ECHO_REPLY, RoundTripTime) == kEchoReplyV6.rtt_offset, "RTT6");


namespace {

// Windows' own default when only DF is requested
constexpr UCHAR kDefaultTtl = 128;

IP_OPTION_INFORMATION options_for(const EchoRequest& req) {
    IP_OPTION_INFORMATION opt{};
    opt.Ttl   = req.ttl > 0 ? static_cast<UCHAR>(req.ttl) : kDefaultTtl;
    opt.Flags = req.dont_fragment ? IP_FLAG_DF : 0;
    return opt;
}

IPAddr ipv4_of(const Address& a) {
    IPAddr v = 0;
    std::memcpy(&v, a.bytes(), 4);
    return v;
}

sockaddr_in6 sockaddr6_of(const Address& a) {
    sockaddr_in6 sa{};
    sa.sin6_family = AF_INET6;
    if (!a.empty())
        std::memcpy(&sa.sin6_addr, a.bytes(), 16);
    return sa;
}

} // namespace


// ---------------------------------------------------------------------------
// Lifetime
// ---------------------------------------------------------------------------
WinEchoDriver::WinEchoDriver(AddressFamily family) : family_(family) {
    handle_ = family_ == AddressFamily::V4 ? IcmpCreateFile() : Icmp6CreateFile();
    if (handle_ == INVALID_HANDLE_VALUE)
        throw CreateError(family_ == AddressFamily::V4 ? "IcmpCreateFile failed"
                                                       : "Icmp6CreateFile failed",
                          GetLastError());
}

WinEchoDriver::~WinEchoDriver() {
    IcmpCloseHandle(handle_);
}


// ---------------------------------------------------------------------------
// Send
// ---------------------------------------------------------------------------
DWORD WinEchoDriver::issue(const EchoRequest& req, HANDLE event,
                           std::uint8_t* reply, std::size_t reply_size)
{
    const bool default_opts = req.ttl <= 0 && !req.dont_fragment;
    IP_OPTION_INFORMATION opt = options_for(req);
    PIP_OPTION_INFORMATION popt = default_opts ? nullptr : &opt;

    auto* data = const_cast<std::uint8_t*>(req.payload);
    const WORD data_size = req.payload_size;
    const DWORD size = static_cast<DWORD>(reply_size);

    if (family_ == AddressFamily::V6) {
        sockaddr_in6 src = sockaddr6_of(req.source);
        sockaddr_in6 dst = sockaddr6_of(req.destination);
        return Icmp6SendEcho2(handle_, event, nullptr, nullptr, &src, &dst,
                              data, data_size, popt, reply, size, req.timeout_ms);
    }

    if (!req.source.empty()) {
        return IcmpSendEcho2Ex(handle_, event, nullptr, nullptr,
                               ipv4_of(req.source), ipv4_of(req.destination),
                               data, data_size, popt, reply, size, req.timeout_ms);
    }

    return IcmpSendEcho2(handle_, event, nullptr, nullptr, ipv4_of(req.destination),
                         data, data_size, popt, reply, size, req.timeout_ms);
}

std::uint32_t WinEchoDriver::send(const EchoRequest& req,
                                  std::uint8_t* reply, std::size_t reply_size)
{
    if (issue(req, nullptr, reply, reply_size) > 0)
        return 0;

    // Timeouts and ICMP errors arrive here as IP status values
    const DWORD err = GetLastError();
    return err != 0 ? err : ip_status::kGeneralFailure;
}

std::uint32_t WinEchoDriver::send_async(const EchoRequest& req,
                                        std::uint8_t* reply, std::size_t reply_size,
                                        CompletionSignal& done)
{
    HANDLE event = static_cast<HANDLE>(done.native_handle());

    if (issue(req, event, reply, reply_size) > 0) {
        // Completed inline; make sure the waiter sees it
        done.set();
        return 0;
    }

    const DWORD err = GetLastError();
    if (err == win_error::kIoPending)
        return 0;
    return err != 0 ? err : ip_status::kGeneralFailure;
}

std::uint32_t WinEchoDriver::parse(std::uint8_t* reply, std::size_t reply_size) {
    const DWORD n = family_ == AddressFamily::V4
        ? IcmpParseReplies(reply, static_cast<DWORD>(reply_size))
        : Icmp6ParseReplies(reply, static_cast<DWORD>(reply_size));
    if (n > 0)
        return 0;

    const DWORD err = GetLastError();
    return err != 0 ? err : ip_status::kGeneralFailure;
}


// ---------------------------------------------------------------------------
// Layouts
// ---------------------------------------------------------------------------
const ReplyLayout& WinEchoDriver::sync_layout() const noexcept {
    return family_ == AddressFamily::V4 ? kEchoReplyV4 : kEchoReplyV6;
}

const ReplyLayout& WinEchoDriver::async_layout() const noexcept {
    if (family_ == AddressFamily::V6)
        return kEchoReplyV6;
    // IcmpParseReplies rewrites 64-bit records into ICMP_ECHO_REPLY32
    return sizeof(void*) == 8 ? kEchoReply32V4 : kEchoReplyV4;
}

std::unique_ptr<EchoDriver> open_native_driver(AddressFamily family) {
    return std::unique_ptr<EchoDriver>(new WinEchoDriver(family));
}

} // namespace detail
} // namespace icmpecho
