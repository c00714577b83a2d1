#include "icmpecho/engine.hpp"
#include "icmpecho/ip_status.hpp"
#include "fake_driver.hpp"
#include "test_harness.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace icmpecho;
using Clock = std::chrono::steady_clock;

namespace {

const Address kTarget = Address::v4(192, 0, 2, 7);
const std::vector<std::uint8_t> kPayload{ 'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h' };

long elapsed_ms(Clock::time_point since) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - since).count());
}

PoolOptions pool_of(std::size_t slots, ExhaustedPolicy policy) {
    PoolOptions o;
    o.slots = slots;
    o.policy = policy;
    return o;
}

// Waits until `want` slots are free, sweeping abandoned ones meanwhile
bool free_within(BufferPool& pool, std::size_t want, int ms) {
    const auto until = Clock::now() + std::chrono::milliseconds(ms);
    while (Clock::now() < until) {
        (void)pool.reclaim();
        if (pool.free_count() >= want) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}

} // namespace


// ---------------------------------------------------------------------------
// Completion
// ---------------------------------------------------------------------------
bool test_async_success() {
    auto st = std::make_shared<FakeState>();
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(2, kDefaultSlotCapacity);

    PendingPing p = ping_async(h, pool, kTarget, kPayload);
    if (!p.valid()) return false;

    EchoReply r = p.wait();
    if (!r.success()) {
        std::cerr << "  Error: " << r << "\n";
        return false;
    }
    if (r.source != kTarget || r.ttl != 64 || r.data != kPayload) return false;
    if (st->parses.load() != 1) return false;
    return pool.free_count() == 2 && pool.leased_count() == 0;
}

bool test_sync_ping_uses_no_pool() {
    auto st = std::make_shared<FakeState>();
    EchoHandle h = make_fake_handle(st);

    EchoReply r = ping(h, kTarget, kPayload);
    return r.success() && r.data == kPayload && r.data_size == kPayload.size();
}

bool test_record_status_is_decoded() {
    auto st = std::make_shared<FakeState>();
    st->status = ip_status::kTtlExpiredTransit;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(1, kDefaultSlotCapacity);

    EchoReply r = ping_async(h, pool, kTarget, kPayload).wait();
    return r.status() == ReplyStatus::Unreachable &&
           r.error.reason() == UnreachableReason::TtlExpired &&
           r.source == kTarget;
}

bool test_parse_failure_is_reported() {
    auto st = std::make_shared<FakeState>();
    st->parse_code = ip_status::kReqTimedOut;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(1, kDefaultSlotCapacity);

    EchoReply r = ping_async(h, pool, kTarget, kPayload).wait();
    return r.error.kind() == ErrorKind::Timeout && pool.free_count() == 1;
}

bool test_poll_then_consume_once() {
    auto st = std::make_shared<FakeState>();
    st->delay_ms = 20;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(1, kDefaultSlotCapacity);

    PendingPing p = ping_async(h, pool, kTarget, kPayload);
    if (p.poll().has_value()) return false;   // still in flight

    std::optional<EchoReply> r;
    const auto start = Clock::now();
    while (!r && elapsed_ms(start) < 1000) {
        r = p.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    if (!r || !r->success() || p.valid()) return false;

    try {
        (void)p.poll();
    } catch (const std::future_error& e) {
        return e.code() == std::future_errc::no_state;
    }
    return false;
}

bool test_wait_for_returns_nullopt_while_running() {
    auto st = std::make_shared<FakeState>();
    st->delay_ms = 100;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(1, kDefaultSlotCapacity);

    PendingPing p = ping_async(h, pool, kTarget, kPayload);
    if (p.wait_for(5).has_value()) return false;
    if (!p.valid()) return false;

    std::optional<EchoReply> r = p.wait_for(2000);
    return r && r->success();
}

bool test_later_request_completes_first() {
    auto st = std::make_shared<FakeState>();
    st->delay_ms = 300;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(2, kDefaultSlotCapacity);

    PendingPing slow = ping_async(h, pool, kTarget, kPayload);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));   // worker waits on `slow`

    st->delay_ms = 1;
    const auto start = Clock::now();
    EchoReply fast = ping_async(h, pool, kTarget, kPayload).wait();
    const auto took = elapsed_ms(start);
    if (!fast.success() || fast.rtt_ms != 1 || took > 200) {
        std::cerr << "  Error: short request took " << took << "ms\n";
        return false;
    }

    EchoReply r = slow.wait();
    return r.success() && r.rtt_ms == 300 && st->violations.load() == 0;
}

bool test_on_ready_waker() {
    auto st = std::make_shared<FakeState>();
    st->delay_ms = 10;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(1, kDefaultSlotCapacity);

    std::mutex m;
    std::condition_variable cv;
    bool woke = false;

    PendingPing p = ping_async(h, pool, kTarget, kPayload);
    p.on_ready([&] {
        std::lock_guard<std::mutex> lk(m);
        woke = true;
        cv.notify_all();
    });

    {
        std::unique_lock<std::mutex> lk(m);
        if (!cv.wait_for(lk, std::chrono::seconds(2), [&] { return woke; }))
            return false;
    }

    if (!p.ready()) return false;
    std::optional<EchoReply> r = p.poll();
    return r && r->success();
}


// ---------------------------------------------------------------------------
// Validation and immediate failures
// ---------------------------------------------------------------------------
bool test_invalid_targets_never_reach_driver() {
    auto st = std::make_shared<FakeState>();
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(1, kDefaultSlotCapacity);

    EchoReply a = ping_async(h, pool, Address(), kPayload).wait();
    EchoReply b = ping_async(h, pool, Address::v4(0, 0, 0, 0), kPayload).wait();
    EchoReply c = ping_async(h, pool, Address::loopback(AddressFamily::V6), kPayload).wait();
    EchoReply d = ping(h, Address(), kPayload);

    EchoOptions wrong_source;
    wrong_source.source = Address::loopback(AddressFamily::V6);
    EchoReply e = ping(h, kTarget, kPayload, wrong_source);

    for (const auto* r : { &a, &b, &c, &d, &e }) {
        if (r->error.kind() != ErrorKind::InvalidAddress) return false;
    }
    return st->sends.load() == 0 && pool.free_count() == 1;
}

bool test_payload_larger_than_slot() {
    auto st = std::make_shared<FakeState>();
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(1, 128);

    std::vector<std::uint8_t> big(200, 0x55);
    EchoReply r = ping_async(h, pool, kTarget, big).wait();
    return r.error.kind() == ErrorKind::BufferTooSmall &&
           st->sends.load() == 0 && pool.free_count() == 1;
}

bool test_immediate_send_failure_releases_slot() {
    auto st = std::make_shared<FakeState>();
    st->fail_code = win_error::kHostUnreachable;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(2, kDefaultSlotCapacity);

    PendingPing p = ping_async(h, pool, kTarget, kPayload);
    if (pool.free_count() != 2 || pool.leased_count() != 0) return false;
    if (!p.ready()) return false;

    EchoReply r = p.wait();
    return r.status() == ReplyStatus::Unreachable &&
           r.error.reason() == UnreachableReason::Host &&
           r.error.code() == win_error::kHostUnreachable;
}

bool test_os_error_code_kept() {
    auto st = std::make_shared<FakeState>();
    st->fail_code = 87;
    EchoHandle h = make_fake_handle(st);

    EchoReply r = ping(h, kTarget, kPayload);
    return r.error.kind() == ErrorKind::OsError && r.error.code() == 87 &&
           r.status() == ReplyStatus::Error;
}


// ---------------------------------------------------------------------------
// Pool exhaustion
// ---------------------------------------------------------------------------
bool test_reject_when_exhausted() {
    auto st = std::make_shared<FakeState>();
    st->hold = true;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(pool_of(1, ExhaustedPolicy::Reject));

    PendingPing p1 = ping_async(h, pool, kTarget, kPayload);
    PendingPing p2 = ping_async(h, pool, kTarget, kPayload);

    std::optional<EchoReply> r2 = p2.poll();
    const bool rejected = r2 && r2->error.kind() == ErrorKind::NoBufferAvailable;

    st->release_held();
    EchoReply r1 = p1.wait();
    return rejected && r1.success() && pool.free_count() == 1;
}

bool test_block_waits_for_release() {
    auto st = std::make_shared<FakeState>();
    st->delay_ms = 30;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(pool_of(1, ExhaustedPolicy::Block));

    PendingPing p1 = ping_async(h, pool, kTarget, kPayload);

    std::atomic<bool> issued{false};
    EchoReply r2;
    std::thread second([&] {
        PendingPing p2 = ping_async(h, pool, kTarget, kPayload);
        issued = true;
        r2 = p2.wait();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    const bool blocked = !issued.load();

    EchoReply r1 = p1.wait();
    second.join();

    return blocked && r1.success() && r2.success() &&
           pool.peak_leased() == 1 && pool.free_count() == 1;
}

bool test_block_acquire_timeout() {
    auto st = std::make_shared<FakeState>();
    st->hold = true;
    EchoHandle h = make_fake_handle(st);

    PoolOptions opt = pool_of(1, ExhaustedPolicy::Block);
    opt.acquire_timeout_ms = 20;
    BufferPool pool(opt);

    PendingPing p1 = ping_async(h, pool, kTarget, kPayload);

    const auto start = Clock::now();
    EchoReply r2 = ping_async(h, pool, kTarget, kPayload).wait();
    const long took = elapsed_ms(start);

    st->release_held();
    EchoReply r1 = p1.wait();

    return r2.error.kind() == ErrorKind::NoBufferAvailable &&
           took >= 15 && r1.success();
}

bool test_eight_requests_on_four_slots() {
    auto st = std::make_shared<FakeState>();
    st->delay_ms = 5;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(pool_of(4, ExhaustedPolicy::Block));

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            EchoReply r = ping_async(h, pool, kTarget, kPayload).wait();
            if (r.success()) ok++;
        });
    }
    for (auto& t : threads) t.join();

    if (ok.load() != 8) {
        std::cerr << "  Error: only " << ok.load() << " of 8 succeeded\n";
        return false;
    }
    return pool.peak_leased() <= 4 && st->max_in_flight.load() <= 4 &&
           st->violations.load() == 0 && pool.free_count() == 4;
}

bool test_notify_when_available() {
    auto st = std::make_shared<FakeState>();
    st->hold = true;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(pool_of(1, ExhaustedPolicy::Reject));

    PendingPing p = ping_async(h, pool, kTarget, kPayload);

    std::atomic<int> notified{0};
    pool.notify_when_available([&] { notified++; });
    if (notified.load() != 0) return false;

    st->release_held();
    (void)p.wait();

    return notified.load() == 1;
}

bool test_abandoned_slot_wakes_waiter() {
    auto st = std::make_shared<FakeState>();
    st->hold = true;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(pool_of(1, ExhaustedPolicy::Reject));

    EchoOptions opt;
    opt.timeout_ms = 1;
    EchoReply r = ping_async(h, pool, kTarget, kPayload, opt).wait();
    if (r.error.kind() != ErrorKind::Timeout || pool.abandoned_count() != 1) return false;

    std::mutex m;
    std::condition_variable cv;
    bool woke = false;
    pool.notify_when_available([&] {
        std::lock_guard<std::mutex> lk(m);
        woke = true;
        cv.notify_all();
    });

    // Only the driver finishing with the buffer may free the slot; nobody
    // calls reclaim() here
    st->release_held();

    {
        std::unique_lock<std::mutex> lk(m);
        if (!cv.wait_for(lk, std::chrono::milliseconds(1000), [&] { return woke; })) {
            std::cerr << "  Error: waiter never ran, abandoned=" << pool.abandoned_count() << "\n";
            return false;
        }
    }
    if (pool.abandoned_count() != 0 || pool.free_count() != 1) return false;

    EchoReply next = ping_async(h, pool, kTarget, kPayload).wait();
    return next.success() && st->violations.load() == 0;
}

bool test_one_waiter_per_freed_slot() {
    auto st = std::make_shared<FakeState>();
    st->hold = true;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(pool_of(1, ExhaustedPolicy::Reject));

    PendingPing p = ping_async(h, pool, kTarget, kPayload);

    std::atomic<int> first{0};
    std::atomic<int> second{0};
    pool.notify_when_available([&] { first++; });
    pool.notify_when_available([&] { second++; });

    st->release_held();
    (void)p.wait();
    if (first.load() != 1 || second.load() != 0) return false;

    // The next freed slot goes to the remaining waiter
    EchoReply r = ping_async(h, pool, kTarget, kPayload).wait();
    return r.success() && first.load() == 1 && second.load() == 1;
}


// ---------------------------------------------------------------------------
// Timeout, cancellation and buffer ownership
// ---------------------------------------------------------------------------
bool test_timeout_abandons_slot() {
    auto st = std::make_shared<FakeState>();
    st->hold = true;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(pool_of(1, ExhaustedPolicy::Reject));

    EchoOptions opt;
    opt.timeout_ms = 1;

    const auto start = Clock::now();
    EchoReply r = ping_async(h, pool, kTarget, kPayload, opt).wait();
    const long took = elapsed_ms(start);

    if (r.error.kind() != ErrorKind::Timeout || took > 50) {
        std::cerr << "  Error: " << r << " after " << took << "ms\n";
        return false;
    }
    if (pool.abandoned_count() != 1 || pool.free_count() != 0) return false;

    // Driver still owns the buffer: nothing to reuse yet
    EchoReply again = ping_async(h, pool, kTarget, kPayload).wait();
    if (again.error.kind() != ErrorKind::NoBufferAvailable) return false;
    if (pool.reclaim() != 0) return false;

    st->release_held();
    if (!free_within(pool, 1, 1000)) return false;

    EchoReply after = ping_async(h, pool, kTarget, kPayload).wait();
    return after.success() && st->violations.load() == 0 && pool.abandoned_count() == 0;
}

bool test_cancel_abandons_slot() {
    auto st = std::make_shared<FakeState>();
    st->hold = true;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(pool_of(2, ExhaustedPolicy::Reject));

    PendingPing p = ping_async(h, pool, kTarget, kPayload);
    p.cancel();

    if (p.valid() || pool.abandoned_count() != 1 || pool.free_count() != 1) return false;

    st->release_held();
    return free_within(pool, 2, 1000);
}

bool test_destroying_pending_abandons_slot() {
    auto st = std::make_shared<FakeState>();
    st->hold = true;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(pool_of(1, ExhaustedPolicy::Reject));

    {
        PendingPing p = ping_async(h, pool, kTarget, kPayload);
    }
    if (pool.abandoned_count() != 1) return false;

    st->release_held();
    return free_within(pool, 1, 1000);
}

bool test_blocked_acquire_picks_up_abandoned_slot() {
    auto st = std::make_shared<FakeState>();
    st->hold = true;
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(pool_of(1, ExhaustedPolicy::Block));

    ping_async(h, pool, kTarget, kPayload).cancel();

    std::thread releaser([st] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        st->release_held();
    });

    EchoReply r = ping_async(h, pool, kTarget, kPayload).wait();
    releaser.join();
    return r.success() && st->violations.load() == 0;
}

bool test_moved_pending_keeps_request() {
    auto st = std::make_shared<FakeState>();
    EchoHandle h = make_fake_handle(st);
    BufferPool pool(1, kDefaultSlotCapacity);

    PendingPing a = ping_async(h, pool, kTarget, kPayload);
    PendingPing b = std::move(a);
    if (a.valid() || !b.valid()) return false;

    PendingPing c;
    c = std::move(b);
    return c.wait().success() && pool.free_count() == 1;
}


// ---------------------------------------------------------------------------
// Handle lifetime
// ---------------------------------------------------------------------------
bool test_handle_closed_exactly_once() {
    auto st = std::make_shared<FakeState>();
    st->delay_ms = 20;
    BufferPool pool(1, kDefaultSlotCapacity);

    PendingPing p;
    {
        EchoHandle h = make_fake_handle(st);
        EchoHandle copy = h;
        p = ping_async(copy, pool, kTarget, kPayload);
        if (h.use_count() != 3) return false;   // h, copy, in-flight slot
    }

    // Every handle is gone but the request still pins the driver
    if (st->closes.load() != 0) return false;

    EchoReply r = p.wait();
    return r.success() && st->closes.load() == 1;
}

bool test_moved_handle_stays_valid() {
    auto st = std::make_shared<FakeState>();
    EchoHandle a = make_fake_handle(st);
    EchoHandle b = std::move(a);

    // Moving shares the driver; the source keeps working
    if (a.use_count() != 2 || a.family() != AddressFamily::V4) return false;
    return ping(a, kTarget, kPayload).success() && ping(b, kTarget, kPayload).success();
}

bool test_adopt_rejects_null() {
    try {
        (void)EchoHandle::adopt(nullptr);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

bool test_pool_rejects_bad_config() {
    int thrown = 0;
    try { BufferPool p(0, kDefaultSlotCapacity); } catch (const std::invalid_argument&) { thrown++; }
    try { BufferPool p(4, 8); } catch (const std::invalid_argument&) { thrown++; }
    return thrown == 2;
}


int main() {
    std::cout << "Running icmpecho engine tests...\n";

    run_test("Async Success", test_async_success);
    run_test("Sync Ping Without Pool", test_sync_ping_uses_no_pool);
    run_test("Record Status Decoded", test_record_status_is_decoded);
    run_test("Parse Failure Reported", test_parse_failure_is_reported);
    run_test("Poll Then Consume Once", test_poll_then_consume_once);
    run_test("Wait For While Running", test_wait_for_returns_nullopt_while_running);
    run_test("Later Request Completes First", test_later_request_completes_first);
    run_test("On Ready Waker", test_on_ready_waker);

    run_test("Invalid Targets Rejected", test_invalid_targets_never_reach_driver);
    run_test("Payload Larger Than Slot", test_payload_larger_than_slot);
    run_test("Immediate Failure Releases Slot", test_immediate_send_failure_releases_slot);
    run_test("OS Error Code Kept", test_os_error_code_kept);

    run_test("Reject When Exhausted", test_reject_when_exhausted);
    run_test("Block Waits For Release", test_block_waits_for_release);
    run_test("Block Acquire Timeout", test_block_acquire_timeout);
    run_test("Eight Requests On Four Slots", test_eight_requests_on_four_slots);
    run_test("Notify When Available", test_notify_when_available);
    run_test("Abandoned Slot Wakes Waiter", test_abandoned_slot_wakes_waiter);
    run_test("One Waiter Per Freed Slot", test_one_waiter_per_freed_slot);

    run_test("Timeout Abandons Slot", test_timeout_abandons_slot);
    run_test("Cancel Abandons Slot", test_cancel_abandons_slot);
    run_test("Destroying Pending Abandons Slot", test_destroying_pending_abandons_slot);
    run_test("Blocked Acquire Picks Up Abandoned Slot", test_blocked_acquire_picks_up_abandoned_slot);
    run_test("Moved Pending Keeps Request", test_moved_pending_keeps_request);

    run_test("Handle Closed Exactly Once", test_handle_closed_exactly_once);
    run_test("Moved Handle Stays Valid", test_moved_handle_stays_valid);
    run_test("Adopt Rejects Null", test_adopt_rejects_null);
    run_test("Pool Rejects Bad Config", test_pool_rejects_bad_config);

    return finish_tests("Engine tests");
}
