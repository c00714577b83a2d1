#pragma once

#include <stddef.h>
#include "icmpecho/visibility.hpp"

#ifdef __cplusplus
extern "C" {
#endif

/*
 * C representation of the icmpecho engine.
 * Return codes follow the C convention (1=success, 0=failure) unless noted.
 */

typedef struct icmpecho_handle  icmpecho_handle;
typedef struct icmpecho_pool    icmpecho_pool;
typedef struct icmpecho_pending icmpecho_pending;

/* Reply status */
#define ICMPECHO_SUCCESS      0
#define ICMPECHO_TIMED_OUT    1
#define ICMPECHO_UNREACHABLE  2
#define ICMPECHO_ERROR        3

/**
 * IPv4 (family 4, bytes[0..3]) or IPv6 (family 6, bytes[0..15]) address,
 * network byte order.
 */
struct IcmpEchoAddressC {
    int           family;
    unsigned char bytes[16];
};

/**
 * Per-request options. NULL options mean the defaults
 * (timeout 2000 ms, system TTL, fragmentation allowed).
 */
struct IcmpEchoOptionsC {
    int timeout_ms;                          /* <= 0 = default */
    int ttl;                                 /* -1 = system default */
    int dont_fragment;                       /* non-zero = set DF */
    const struct IcmpEchoAddressC* source;   /* NULL = OS chooses */
};

/**
 * Outcome of one request.
 */
struct IcmpEchoReplyC {
    int           status;        /* ICMPECHO_SUCCESS .. ICMPECHO_ERROR */
    int           error_kind;    /* icmpecho::ErrorKind value, 0 = none */
    int           reason;        /* icmpecho::UnreachableReason when unreachable */
    unsigned int  code;          /* raw OS / IP status code, 0 if none */
    unsigned int  rtt_ms;
    int           ttl;           /* -1 if not reported (IPv6) */
    struct IcmpEchoAddressC source;
    unsigned int  data_size;
    char          message[128];  /* NUL-terminated, possibly truncated */
};


// ---------------------------------------------------------------------------
// Handles and pools
// ---------------------------------------------------------------------------
/**
 * Opens an ICMP handle for family 4 or 6.
 * Returns NULL on failure; *os_error (if non-NULL) receives the OS code.
 */
ICMPECHO_API icmpecho_handle* icmpecho_open(int family, unsigned int* os_error);

/** Releases the handle. In-flight requests keep the native handle open. */
ICMPECHO_API void icmpecho_close(icmpecho_handle* h);

/**
 * Creates a pool of `slots` reply buffers of `slot_capacity` bytes.
 * block != 0 selects the Block exhaustion policy, else Reject.
 * Returns NULL on invalid arguments or OS failure.
 */
ICMPECHO_API icmpecho_pool* icmpecho_pool_create(size_t slots,
                                                 size_t slot_capacity,
                                                 int block);

/** Waits for abandoned slots still held by the driver, then frees. */
ICMPECHO_API void icmpecho_pool_destroy(icmpecho_pool* pool);


// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------
/** Blocking echo. */
ICMPECHO_API int icmpecho_ping(icmpecho_handle* h,
                               const struct IcmpEchoAddressC* dst,
                               const void* payload, size_t payload_size,
                               const struct IcmpEchoOptionsC* opt,
                               struct IcmpEchoReplyC* out);

/**
 * Non-blocking echo. Returns NULL only on NULL arguments; every other
 * failure is reported through the pending request's reply.
 */
ICMPECHO_API icmpecho_pending* icmpecho_ping_async(icmpecho_handle* h,
                                                   icmpecho_pool* pool,
                                                   const struct IcmpEchoAddressC* dst,
                                                   const void* payload,
                                                   size_t payload_size,
                                                   const struct IcmpEchoOptionsC* opt);

/**
 * 1 = finished (*out filled), 0 = still running, -1 = reply already taken.
 */
ICMPECHO_API int icmpecho_poll(icmpecho_pending* p, struct IcmpEchoReplyC* out);

/**
 * Like icmpecho_poll but blocks up to timeout_ms (-1 = until finished).
 */
ICMPECHO_API int icmpecho_wait(icmpecho_pending* p, int timeout_ms,
                               struct IcmpEchoReplyC* out);

/** Abandons the request if unfinished and frees `p`. */
ICMPECHO_API void icmpecho_free(icmpecho_pending* p);

/**
 * Writes the description of an OS / IP status code into buf.
 * Returns the full length (excluding NUL), like snprintf.
 */
ICMPECHO_API size_t icmpecho_describe(unsigned int code, char* buf, size_t len);

#ifdef __cplusplus
}
#endif
