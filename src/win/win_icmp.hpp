#pragma once
#include <winsock2.h>
#include <ws2tcpip.h>
#include <windows.h>
#include "icmpecho/driver.hpp"

namespace icmpecho {
namespace detail {

/**
 * EchoDriver over the Windows ICMP helper API (iphlpapi).
 *
 * IPv4 uses IcmpSendEcho2 / IcmpSendEcho2Ex, IPv6 Icmp6SendEcho2. The
 * asynchronous form completes by signaling the slot's event; the reply is
 * then post-processed in place by IcmpParseReplies / Icmp6ParseReplies.
 */
class WinEchoDriver final : public EchoDriver {
public:
    /** @throws CreateError if IcmpCreateFile / Icmp6CreateFile fails */
    explicit WinEchoDriver(AddressFamily family);

    /** The single IcmpCloseHandle of this conversation */
    ~WinEchoDriver() override;

    WinEchoDriver(const WinEchoDriver&) = delete;
    WinEchoDriver& operator=(const WinEchoDriver&) = delete;

    AddressFamily family() const noexcept override { return family_; }

    std::uint32_t send(const EchoRequest& req,
                       std::uint8_t* reply, std::size_t reply_size) override;

    std::uint32_t send_async(const EchoRequest& req,
                             std::uint8_t* reply, std::size_t reply_size,
                             CompletionSignal& done) override;

    std::uint32_t parse(std::uint8_t* reply, std::size_t reply_size) override;

    const ReplyLayout& sync_layout() const noexcept override;
    const ReplyLayout& async_layout() const noexcept override;

private:
    /** Common IcmpSendEcho2 call; `event` is null for the blocking form. */
    DWORD issue(const EchoRequest& req, HANDLE event,
                std::uint8_t* reply, std::size_t reply_size);

    AddressFamily family_;
    HANDLE handle_{INVALID_HANDLE_VALUE};
};

} // namespace detail
} // namespace icmpecho
