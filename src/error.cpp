/**
 * Error classification and text.
 *
 * Codes reach us from three places:
 *  - the Status field of a reply record (IP status, 11000..11050)
 *  - GetLastError() after a failed IcmpSendEcho2 / IcmpParseReplies
 *    (IP status or Win32 error)
 *  - errno from the Linux backend (unreachable errnos are translated to
 *    IP status values before they get here)
 */

#include "icmpecho/error.hpp"
#include "icmpecho/ip_status.hpp"

#include <sstream>
#include <system_error>

namespace icmpecho {

namespace {

const char* ip_status_text(std::uint32_t code) noexcept {
    using namespace ip_status;
    switch (code) {
        case kBufTooSmall:            return "Reply buffer too small";
        case kDestNetUnreachable:     return "Destination network unreachable";
        case kDestHostUnreachable:    return "Destination host unreachable";
        case kDestProtUnreachable:    return "Destination protocol unreachable";
        case kDestPortUnreachable:    return "Destination port unreachable";
        case kNoResources:            return "Insufficient IP resources";
        case kBadOption:              return "Bad IP option";
        case kHwError:                return "Hardware error";
        case kPacketTooBig:           return "Packet too big";
        case kReqTimedOut:            return "Request timed out";
        case kBadReq:                 return "Bad request";
        case kBadRoute:               return "Bad route";
        case kTtlExpiredTransit:      return "TTL expired in transit";
        case kTtlExpiredReassem:      return "TTL expired during reassembly";
        case kParamProblem:           return "Parameter problem";
        case kSourceQuench:           return "Source quench received";
        case kOptionTooBig:           return "Option too big";
        case kBadDestination:         return "Bad destination";
        case kDestUnreachable:        return "Destination unreachable";
        case kTimeExceeded:           return "Time exceeded";
        case kBadHeader:              return "Bad IP header";
        case kUnrecognizedNextHeader: return "Unrecognized next header";
        case kIcmpError:              return "ICMP error";
        case kDestScopeMismatch:      return "Destination scope mismatch";
        case kGeneralFailure:         return "General failure";
        default:                      return "Unknown IP status";
    }
}

} // namespace


// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Error Error::unreachable(UnreachableReason reason, std::uint32_t code) noexcept {
    Error e(ErrorKind::HostUnreachable);
    e.reason_ = reason;
    e.code_   = code;
    return e;
}

Error Error::os_error(std::uint32_t code) noexcept {
    Error e(ErrorKind::OsError);
    e.code_ = code;
    return e;
}

Error Error::from_os_code(std::uint32_t code) noexcept {
    using namespace ip_status;
    using R = UnreachableReason;

    switch (code) {
        case kSuccess:                 return Error();
        case kReqTimedOut: {
            Error e = timeout();
            e.code_ = code;
            return e;
        }
        case kDestNetUnreachable:
        case kBadRoute:                return unreachable(R::Network, code);
        case kDestHostUnreachable:     return unreachable(R::Host, code);
        case kDestProtUnreachable:     return unreachable(R::Protocol, code);
        case kDestPortUnreachable:     return unreachable(R::Port, code);
        case kPacketTooBig:            return unreachable(R::PacketTooBig, code);
        case kTtlExpiredTransit:
        case kTimeExceeded:            return unreachable(R::TtlExpired, code);
        case kTtlExpiredReassem:       return unreachable(R::ReassemblyExpired, code);
        case kParamProblem:            return unreachable(R::ParameterProblem, code);
        case kSourceQuench:            return unreachable(R::SourceQuench, code);
        case kDestUnreachable:         return unreachable(R::Other, code);
        case kDestScopeMismatch:       return unreachable(R::ScopeMismatch, code);

        case win_error::kNetworkUnreachable:  return unreachable(R::Network, code);
        case win_error::kHostUnreachable:     return unreachable(R::Host, code);
        case win_error::kProtocolUnreachable: return unreachable(R::Protocol, code);
        case win_error::kPortUnreachable:     return unreachable(R::Port, code);

        default:                       return os_error(code);
    }
}


// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------
std::string Error::message() const {
    switch (kind_) {
        case ErrorKind::None:              return "Success";
        case ErrorKind::Timeout:           return "Request timed out";
        case ErrorKind::HostUnreachable:   return to_string(reason_);
        case ErrorKind::NoBufferAvailable: return "No reply buffer available";
        case ErrorKind::InvalidAddress:    return "Invalid destination address";
        case ErrorKind::MalformedReply:    return "Malformed reply";
        case ErrorKind::BufferTooSmall:    return "Reply buffer too small for payload";
        case ErrorKind::OsError:           break;
    }

    std::ostringstream ss;
    if (ip_status::in_range(code_)) {
        ss << "Other IP error (" << code_ << "): " << ip_status_text(code_);
    } else {
        ss << "Other error (" << code_ << "): "
           << std::system_category().message(static_cast<int>(code_));
    }
    return ss.str();
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::Timeout:           return "Timeout";
        case ErrorKind::HostUnreachable:   return "HostUnreachable";
        case ErrorKind::OsError:           return "OsError";
        case ErrorKind::NoBufferAvailable: return "NoBufferAvailable";
        case ErrorKind::InvalidAddress:    return "InvalidAddress";
        case ErrorKind::MalformedReply:    return "MalformedReply";
        case ErrorKind::BufferTooSmall:    return "BufferTooSmall";
    }
    return "Unknown";
}

const char* to_string(UnreachableReason reason) noexcept {
    switch (reason) {
        case UnreachableReason::Network:           return "Destination network unreachable";
        case UnreachableReason::Host:              return "Destination host unreachable";
        case UnreachableReason::Protocol:          return "Destination protocol unreachable";
        case UnreachableReason::Port:              return "Destination port unreachable";
        case UnreachableReason::TtlExpired:        return "TTL expired in transit";
        case UnreachableReason::ReassemblyExpired: return "Reassembly timed out waiting for fragments";
        case UnreachableReason::PacketTooBig:      return "Packet needs fragmented";
        case UnreachableReason::ParameterProblem:  return "Parameter problem";
        case UnreachableReason::SourceQuench:      return "Source quench received";
        case UnreachableReason::ScopeMismatch:     return "Destination scope mismatch";
        case UnreachableReason::Other:             return "Destination unreachable";
    }
    return "Destination unreachable";
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
    return os << e.message();
}

} // namespace icmpecho
