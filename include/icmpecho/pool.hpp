#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include "icmpecho/visibility.hpp"

namespace icmpecho {

/**
 * What ping_async() does when every slot is leased.
 */
enum class ExhaustedPolicy : std::uint8_t {
    Block,   // wait for a slot (bounded by acquire_timeout_ms)
    Reject   // fail at once with NoBufferAvailable
};

constexpr std::size_t kDefaultSlotCapacity = 1024;

/**
 * Pool configuration. Fixed once the pool is created.
 */
struct PoolOptions {
    std::size_t slots{4};                          // concurrent requests
    std::size_t slot_capacity{kDefaultSlotCapacity}; // reply buffer bytes per slot
    ExhaustedPolicy policy{ExhaustedPolicy::Reject};
    int acquire_timeout_ms{-1};                    // Block only, -1 = wait indefinitely
    int expiry_grace_ms{5};                        // slack past the request timeout
};

namespace detail { class PoolState; }

/**
 * Fixed set of (reply buffer, completion signal) slots shared by all async
 * requests issued with it.
 *
 * Slots are Free, Leased (one pending request) or Abandoned (the request
 * is gone but the driver may still write to the buffer). Abandoned slots
 * become Free only after their completion signal is observed set.
 *
 * Copies share the same slots. The slots live until the last copy and the
 * last PendingPing are gone; destruction then waits for abandoned slots.
 */
class ICMPECHO_API BufferPool {
public:
    /**
     * @throws std::invalid_argument if slots == 0 or slot_capacity is below
     *         the smallest reply header
     * @throws CreateError if a completion signal cannot be created
     */
    explicit BufferPool(const PoolOptions& opt = PoolOptions{});
    BufferPool(std::size_t slots, std::size_t slot_capacity);

    std::size_t size() const noexcept;
    std::size_t slot_capacity() const noexcept;
    ExhaustedPolicy policy() const noexcept;
    const PoolOptions& options() const noexcept;

    std::size_t free_count() const;
    std::size_t leased_count() const;
    std::size_t abandoned_count() const;

    /** Highest number of simultaneously leased slots seen so far. */
    std::size_t peak_leased() const;

    /**
     * Returns abandoned slots whose driver operation has finished to the
     * free list.
     * @return number of slots recycled
     */
    std::size_t reclaim();

    /**
     * One-shot notification for cooperative callers using the Reject
     * policy: `cb` runs right away if a slot is free now, otherwise on the
     * thread that frees the next one (a completing request, or the driver
     * thread signaling an abandoned slot).
     *
     * Each freed slot wakes one waiter, oldest first. The slot is not
     * reserved for it: a waiter that loses the race to another caller gets
     * NoBufferAvailable and registers again.
     */
    void notify_when_available(std::function<void()> cb);

    /** Engine internals; used by ping_async(). */
    const std::shared_ptr<detail::PoolState>& state() const noexcept { return state_; }

private:
    std::shared_ptr<detail::PoolState> state_;
};

} // namespace icmpecho
