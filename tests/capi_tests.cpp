#include "icmpecho_capi.h"
#include "icmpecho/error.hpp"
#include "icmpecho/ip_status.hpp"
#include "test_harness.hpp"

#include <cstring>
#include <string>

// Tests for the C surface. Anything that needs a live ICMP handle skips
// when the host refuses to open one.

namespace {

IcmpEchoAddressC loopback_v4() {
    IcmpEchoAddressC a{};
    a.family = 4;
    a.bytes[0] = 127;
    a.bytes[3] = 1;
    return a;
}

icmpecho_handle* open_or_skip(int family) {
    unsigned int err = 0;
    icmpecho_handle* h = icmpecho_open(family, &err);
    if (!h)
        throw SkipTest{ "cannot open ICMP handle, OS error " + std::to_string(err) };
    return h;
}

} // namespace


bool test_open_rejects_bad_family() {
    unsigned int err = 1234;
    icmpecho_handle* h = icmpecho_open(5, &err);
    return h == nullptr && err == 0;
}

bool test_pool_rejects_bad_config() {
    return icmpecho_pool_create(0, 1024, 0) == nullptr &&
           icmpecho_pool_create(4, 8, 0) == nullptr;
}

bool test_null_arguments() {
    IcmpEchoReplyC out{};
    icmpecho_close(nullptr);
    icmpecho_pool_destroy(nullptr);
    icmpecho_free(nullptr);
    return icmpecho_ping(nullptr, nullptr, nullptr, 0, nullptr, &out) == 0 &&
           icmpecho_ping_async(nullptr, nullptr, nullptr, nullptr, 0, nullptr) == nullptr &&
           icmpecho_poll(nullptr, &out) == -1 &&
           icmpecho_wait(nullptr, 0, &out) == -1;
}

bool test_describe() {
    char buf[64];
    const size_t n = icmpecho_describe(icmpecho::ip_status::kReqTimedOut, buf, sizeof(buf));
    if (std::string(buf) != "Request timed out" || n != std::strlen(buf)) return false;

    // Truncated, still terminated, full length reported
    char small[8];
    const size_t full = icmpecho_describe(icmpecho::ip_status::kDestHostUnreachable,
                                          small, sizeof(small));
    return std::strlen(small) == sizeof(small) - 1 &&
           full == std::strlen("Destination host unreachable");
}

bool test_blocking_ping() {
    icmpecho_handle* h = open_or_skip(4);

    const char payload[] = "icmpecho";
    IcmpEchoAddressC dst = loopback_v4();
    IcmpEchoOptionsC opt{ 1000, -1, 0, nullptr };
    IcmpEchoReplyC out{};

    const int rc = icmpecho_ping(h, &dst, payload, sizeof(payload), &opt, &out);
    icmpecho_close(h);

    if (rc != 1 || out.status != ICMPECHO_SUCCESS) {
        std::cerr << "  Error: " << out.message << "\n";
        return false;
    }
    return out.data_size == sizeof(payload) && out.source.family == 4 &&
           out.source.bytes[0] == 127 && std::string(out.message) == "Success";
}

bool test_async_wait_then_taken() {
    icmpecho_handle* h = open_or_skip(4);
    icmpecho_pool* pool = icmpecho_pool_create(2, 512, 0);
    if (!pool) {
        icmpecho_close(h);
        return false;
    }

    IcmpEchoAddressC dst = loopback_v4();
    icmpecho_pending* p = icmpecho_ping_async(h, pool, &dst, "abcd", 4, nullptr);
    // The pool keeps the native handle alive for in-flight requests
    icmpecho_close(h);
    if (!p) {
        icmpecho_pool_destroy(pool);
        return false;
    }

    IcmpEchoReplyC out{};
    const int first = icmpecho_wait(p, 2000, &out);
    const int again = icmpecho_poll(p, &out);
    icmpecho_free(p);
    icmpecho_pool_destroy(pool);

    return first == 1 && out.status == ICMPECHO_SUCCESS && out.data_size == 4 &&
           again == -1;
}

bool test_invalid_destination() {
    icmpecho_handle* h = open_or_skip(4);
    icmpecho_pool* pool = icmpecho_pool_create(1, 512, 0);

    IcmpEchoAddressC dst{};
    dst.family = 7;
    IcmpEchoReplyC sync_out{};
    IcmpEchoReplyC async_out{};

    const int rc = icmpecho_ping(h, &dst, nullptr, 0, nullptr, &sync_out);
    icmpecho_pending* p = icmpecho_ping_async(h, pool, &dst, nullptr, 0, nullptr);
    const int polled = p ? icmpecho_poll(p, &async_out) : -2;

    icmpecho_free(p);
    icmpecho_pool_destroy(pool);
    icmpecho_close(h);

    const int invalid = static_cast<int>(icmpecho::ErrorKind::InvalidAddress);
    return rc == 1 && sync_out.status == ICMPECHO_ERROR &&
           sync_out.error_kind == invalid &&
           polled == 1 && async_out.error_kind == invalid;
}


bool test_invalid_source() {
    icmpecho_handle* h = open_or_skip(4);
    icmpecho_pool* pool = icmpecho_pool_create(1, 512, 0);

    const IcmpEchoAddressC dst = loopback_v4();
    IcmpEchoAddressC src{};
    src.family = 9;
    IcmpEchoOptionsC opt{ 1000, -1, 0, &src };
    IcmpEchoReplyC sync_out{};
    IcmpEchoReplyC async_out{};

    // Never sent from an address the OS would pick instead
    const int rc = icmpecho_ping(h, &dst, nullptr, 0, &opt, &sync_out);
    icmpecho_pending* p = icmpecho_ping_async(h, pool, &dst, nullptr, 0, &opt);
    const int polled = p ? icmpecho_poll(p, &async_out) : -2;

    icmpecho_free(p);
    icmpecho_pool_destroy(pool);
    icmpecho_close(h);

    const int invalid = static_cast<int>(icmpecho::ErrorKind::InvalidAddress);
    return rc == 1 && sync_out.error_kind == invalid &&
           polled == 1 && async_out.error_kind == invalid;
}

int main() {
    std::cout << "Running icmpecho C API tests...\n";

    run_test("Open Rejects Bad Family", test_open_rejects_bad_family);
    run_test("Pool Rejects Bad Config", test_pool_rejects_bad_config);
    run_test("Null Arguments", test_null_arguments);
    run_test("Describe", test_describe);
    run_test("Blocking Ping", test_blocking_ping);
    run_test("Async Wait Then Taken", test_async_wait_then_taken);
    run_test("Invalid Destination", test_invalid_destination);
    run_test("Invalid Source", test_invalid_source);

    return finish_tests("C API tests");
}
