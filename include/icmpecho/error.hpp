#pragma once
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include "icmpecho/visibility.hpp"

namespace icmpecho {

/**
 * Per-request failure categories.
 */
enum class ErrorKind : std::uint8_t {
    None,               // no error (successful reply)
    Timeout,            // no reply within the request timeout
    HostUnreachable,    // driver or router reported the target unreachable
    OsError,            // any other OS / driver code, see Error::code()
    NoBufferAvailable,  // pool exhausted under the Reject policy (or acquire timed out)
    InvalidAddress,     // empty, unspecified or wrong-family target
    MalformedReply,     // reply record too short or inconsistent
    BufferTooSmall      // slot capacity cannot hold the reply for this payload
};

/**
 * Why a target was reported unreachable.
 */
enum class UnreachableReason : std::uint8_t {
    Network,
    Host,
    Protocol,
    Port,
    TtlExpired,
    ReassemblyExpired,
    PacketTooBig,
    ParameterProblem,
    SourceQuench,
    ScopeMismatch,
    Other
};

/**
 * Per-request error value. Default-constructed Error means "no error".
 *
 * Errors are plain values carried inside EchoReply; the engine never throws
 * them.
 */
class ICMPECHO_API Error {
public:
    Error() = default;

    static Error timeout() noexcept { return Error(ErrorKind::Timeout); }
    static Error no_buffer() noexcept { return Error(ErrorKind::NoBufferAvailable); }
    static Error invalid_address() noexcept { return Error(ErrorKind::InvalidAddress); }
    static Error malformed_reply() noexcept { return Error(ErrorKind::MalformedReply); }
    static Error buffer_too_small() noexcept { return Error(ErrorKind::BufferTooSmall); }
    static Error unreachable(UnreachableReason reason, std::uint32_t code = 0) noexcept;
    static Error os_error(std::uint32_t code) noexcept;

    /**
     * Maps a code reported by the driver: an IP status (Status field or
     * GetLastError() after a failed send/parse), a Win32 error, or an errno
     * value from the Linux backend.
     */
    static Error from_os_code(std::uint32_t code) noexcept;

    ErrorKind kind() const noexcept { return kind_; }
    UnreachableReason reason() const noexcept { return reason_; }
    std::uint32_t code() const noexcept { return code_; }
    bool ok() const noexcept { return kind_ == ErrorKind::None; }

    std::string message() const;

    bool operator==(const Error& o) const noexcept {
        return kind_ == o.kind_ && reason_ == o.reason_ && code_ == o.code_;
    }
    bool operator!=(const Error& o) const noexcept { return !(*this == o); }

private:
    explicit Error(ErrorKind k) noexcept : kind_(k) {}

    ErrorKind kind_{ErrorKind::None};
    UnreachableReason reason_{UnreachableReason::Other};
    std::uint32_t code_{0};
};

ICMPECHO_API const char* to_string(ErrorKind kind) noexcept;
ICMPECHO_API const char* to_string(UnreachableReason reason) noexcept;
ICMPECHO_API std::ostream& operator<<(std::ostream& os, const Error& e);

/**
 * Thrown when the OS refuses to open an ICMP handle (driver unavailable,
 * resource exhaustion, permission anomaly) or a completion signal.
 */
class ICMPECHO_API CreateError : public std::runtime_error {
public:
    CreateError(const std::string& what, std::uint32_t code)
        : std::runtime_error(what), code_(code) {}

    /** OS error code (GetLastError() / errno) */
    std::uint32_t code() const noexcept { return code_; }

private:
    std::uint32_t code_;
};

} // namespace icmpecho
