#pragma once
#include <cstdint>

/**
 * Status values written by the ICMP helper driver into the Status field of
 * a reply record, and the Win32 error codes it reports through
 * GetLastError(). Values match ipexport.h / winerror.h so that the decoder
 * stays free of platform headers.
 */
namespace icmpecho {
namespace ip_status {

constexpr std::uint32_t kSuccess                  = 0;
constexpr std::uint32_t kBase                     = 11000;

constexpr std::uint32_t kBufTooSmall              = 11001;
constexpr std::uint32_t kDestNetUnreachable       = 11002;  // v6: no route
constexpr std::uint32_t kDestHostUnreachable      = 11003;  // v6: address unreachable
constexpr std::uint32_t kDestProtUnreachable      = 11004;  // v6: prohibited
constexpr std::uint32_t kDestPortUnreachable      = 11005;
constexpr std::uint32_t kNoResources              = 11006;
constexpr std::uint32_t kBadOption                = 11007;
constexpr std::uint32_t kHwError                  = 11008;
constexpr std::uint32_t kPacketTooBig             = 11009;
constexpr std::uint32_t kReqTimedOut              = 11010;
constexpr std::uint32_t kBadReq                   = 11011;
constexpr std::uint32_t kBadRoute                 = 11012;
constexpr std::uint32_t kTtlExpiredTransit        = 11013;  // v6: hop limit exceeded
constexpr std::uint32_t kTtlExpiredReassem        = 11014;
constexpr std::uint32_t kParamProblem             = 11015;
constexpr std::uint32_t kSourceQuench             = 11016;
constexpr std::uint32_t kOptionTooBig             = 11017;
constexpr std::uint32_t kBadDestination           = 11018;

constexpr std::uint32_t kDestUnreachable          = 11040;
constexpr std::uint32_t kTimeExceeded             = 11041;
constexpr std::uint32_t kBadHeader                = 11042;
constexpr std::uint32_t kUnrecognizedNextHeader   = 11043;
constexpr std::uint32_t kIcmpError                = 11044;
constexpr std::uint32_t kDestScopeMismatch        = 11045;

constexpr std::uint32_t kGeneralFailure           = 11050;
constexpr std::uint32_t kMax                      = kGeneralFailure;

constexpr bool in_range(std::uint32_t code) noexcept {
    return code >= kBase && code <= kMax;
}

} // namespace ip_status

namespace win_error {

constexpr std::uint32_t kIoPending               = 997;
constexpr std::uint32_t kNetworkUnreachable      = 1231;
constexpr std::uint32_t kHostUnreachable         = 1232;
constexpr std::uint32_t kProtocolUnreachable     = 1233;
constexpr std::uint32_t kPortUnreachable         = 1234;

} // namespace win_error
} // namespace icmpecho
