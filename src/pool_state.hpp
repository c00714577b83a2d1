#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "icmpecho/driver.hpp"
#include "icmpecho/pool.hpp"
#include "icmpecho/signal.hpp"

namespace icmpecho {
namespace detail {

enum class SlotState : std::uint8_t { Free, Leased, Abandoned };

/**
 * One reply buffer and its completion signal.
 *
 * While Leased the bytes belong to the request holding the lease (and to
 * the driver once send_async() accepted them). While Abandoned they belong
 * to the driver alone.
 */
struct Slot {
    std::vector<std::uint64_t> storage;          // 8-byte aligned reply buffer
    std::vector<std::uint8_t> request;           // payload of the in-flight request
    std::unique_ptr<CompletionSignal> signal;
    SlotState state{SlotState::Free};
    std::shared_ptr<EchoDriver> owner;           // keeps the native handle open

    std::uint8_t* buffer() noexcept {
        return reinterpret_cast<std::uint8_t*>(storage.data());
    }
};

/**
 * Shared state behind BufferPool and every PendingPing issued from it.
 */
class PoolState {
public:
    static constexpr std::size_t kNoSlot = static_cast<std::size_t>(-1);

    explicit PoolState(const PoolOptions& opt);
    ~PoolState();

    PoolState(const PoolState&) = delete;
    PoolState& operator=(const PoolState&) = delete;

    const PoolOptions& options() const noexcept { return opt_; }
    std::size_t capacity() const noexcept { return opt_.slot_capacity; }
    Slot& slot(std::size_t i) noexcept { return slots_[i]; }

    /**
     * Leases a free slot, following the exhaustion policy.
     * @return slot index, or kNoSlot if none could be leased
     */
    std::size_t acquire();

    /** Leased -> Free. The driver is done with the buffer. */
    void release(std::size_t i);

    /**
     * Leased -> Abandoned. The driver may still write to the buffer; the
     * slot is swept back to Free from the thread that sets its signal.
     */
    void abandon(std::size_t i);

    std::size_t reclaim();
    void notify_when_available(std::function<void()> cb);

    std::size_t free_count() const;
    std::size_t leased_count() const;
    std::size_t abandoned_count() const;
    std::size_t peak_leased() const;

private:
    using Retired = std::vector<std::shared_ptr<EchoDriver>>;
    using Waiters = std::vector<std::function<void()>>;

    std::size_t sweep_locked(Retired& retired);
    void free_locked(std::size_t i, Retired& retired);
    void take_waiters_locked(std::size_t n, Waiters& out);

    PoolOptions opt_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    Waiters waiters_;                            // oldest first

    std::vector<Slot> slots_;
    std::vector<std::size_t> free_;
    std::size_t leased_{0};
    std::size_t abandoned_{0};
    std::size_t peak_{0};
};

} // namespace detail
} // namespace icmpecho
