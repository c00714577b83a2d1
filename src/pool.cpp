/**
 * Reply buffer pool.
 *
 * Slot state machine, guarded by one mutex:
 *
 *   Free --acquire--> Leased --release--> Free
 *                       |
 *                       +--abandon--> Abandoned --signal observed--> Free
 *
 * Abandoned slots are swept back to Free from the thread that sets their
 * signal, on acquire(), on reclaim() and while a blocked acquire() waits.
 * The pool is destroyed only after every abandoned slot has been signaled
 * by its driver.
 */

#include "pool_state.hpp"
#include "icmpecho/error.hpp"
#include "icmpecho/reply.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>

namespace icmpecho {

namespace {

// Polling interval of a blocked acquire() while abandoned slots may free up
constexpr auto kSweepSlice = std::chrono::milliseconds(10);

std::size_t smallest_header() noexcept {
    return std::min(min_reply_header_size(AddressFamily::V4),
                    min_reply_header_size(AddressFamily::V6));
}

} // namespace

namespace detail {

// ---------------------------------------------------------------------------
// PoolState
// ---------------------------------------------------------------------------
PoolState::PoolState(const PoolOptions& opt) : opt_(opt) {
    if (opt_.slots == 0)
        throw std::invalid_argument("buffer pool needs at least one slot");
    if (opt_.slot_capacity < smallest_header())
        throw std::invalid_argument("slot capacity below the smallest reply header");

    const std::size_t words = (opt_.slot_capacity + 7) / 8;

    slots_.resize(opt_.slots);
    free_.reserve(opt_.slots);
    for (std::size_t i = 0; i < opt_.slots; ++i) {
        slots_[i].storage.assign(words, 0);
        slots_[i].signal.reset(new CompletionSignal());
    }

    // Stack: slot 0 is handed out first
    for (std::size_t i = opt_.slots; i > 0; --i)
        free_.push_back(i - 1);
}

PoolState::~PoolState() {
    // Waits out sweep callbacks already running on a driver thread
    for (auto& s : slots_)
        s.signal->clear_callback();

    // The driver may still hold abandoned buffers; wait it out
    for (auto& s : slots_) {
        if (s.state == SlotState::Abandoned)
            (void)s.signal->wait(-1);
    }
}

std::size_t PoolState::acquire() {
    Retired retired;
    std::unique_lock<std::mutex> lk(mtx_);

    const bool bounded = opt_.acquire_timeout_ms >= 0;
    const auto give_up = std::chrono::steady_clock::now() +
                         std::chrono::milliseconds(bounded ? opt_.acquire_timeout_ms : 0);

    for (;;) {
        (void)sweep_locked(retired);

        if (!free_.empty()) {
            const std::size_t i = free_.back();
            free_.pop_back();
            slots_[i].state = SlotState::Leased;
            ++leased_;
            peak_ = std::max(peak_, leased_);
            return i;
        }

        if (opt_.policy == ExhaustedPolicy::Reject)
            return kNoSlot;

        const auto now = std::chrono::steady_clock::now();
        if (bounded && now >= give_up)
            return kNoSlot;

        if (abandoned_ > 0) {
            auto until = now + kSweepSlice;
            if (bounded && give_up < until)
                until = give_up;
            cv_.wait_until(lk, until);
        } else if (bounded) {
            cv_.wait_until(lk, give_up);
        } else {
            cv_.wait(lk);
        }
    }
}

void PoolState::release(std::size_t i) {
    Retired retired;
    Waiters ready;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (slots_[i].state != SlotState::Leased)
            return;
        --leased_;
        free_locked(i, retired);
        take_waiters_locked(1, ready);
    }
    cv_.notify_one();

    for (auto& cb : ready)
        cb();
}

void PoolState::abandon(std::size_t i) {
    Slot& s = slots_[i];

    // Armed while the slot is still Leased: nobody else can recycle it, and
    // a callback firing before the state change below finds nothing to sweep.
    // The destructor clears every callback before members go away.
    try {
        s.signal->on_signaled([this] { (void)reclaim(); });
    } catch (const CreateError&) {
        // No wake-up on this slot; acquire() and reclaim() still sweep it
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (s.state != SlotState::Leased)
            return;
        s.state = SlotState::Abandoned;
        --leased_;
        ++abandoned_;
    }

    // Signaled between arming and the state change
    if (s.signal->try_poll())
        (void)reclaim();
}

std::size_t PoolState::reclaim() {
    Retired retired;
    Waiters ready;
    std::size_t n = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        n = sweep_locked(retired);
        take_waiters_locked(n, ready);
    }
    if (n > 0)
        cv_.notify_all();

    for (auto& cb : ready)
        cb();
    return n;
}

void PoolState::notify_when_available(std::function<void()> cb) {
    if (!cb)
        return;

    Retired retired;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        (void)sweep_locked(retired);
        if (free_.empty()) {
            waiters_.push_back(std::move(cb));
            return;
        }
    }
    cb();
}

std::size_t PoolState::free_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return free_.size();
}

std::size_t PoolState::leased_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return leased_;
}

std::size_t PoolState::abandoned_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return abandoned_;
}

std::size_t PoolState::peak_leased() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return peak_;
}

std::size_t PoolState::sweep_locked(Retired& retired) {
    if (abandoned_ == 0)
        return 0;

    std::size_t n = 0;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].state != SlotState::Abandoned || !slots_[i].signal->try_poll())
            continue;
        --abandoned_;
        free_locked(i, retired);
        ++n;
    }
    return n;
}

void PoolState::take_waiters_locked(std::size_t n, Waiters& out) {
    const std::size_t k = std::min(n, waiters_.size());
    if (k == 0)
        return;
    auto first = waiters_.begin();
    auto last  = first + static_cast<std::ptrdiff_t>(k);
    out.assign(std::make_move_iterator(first), std::make_move_iterator(last));
    waiters_.erase(first, last);
}

void PoolState::free_locked(std::size_t i, Retired& retired) {
    Slot& s = slots_[i];
    s.state = SlotState::Free;
    s.request.clear();
    // The last owner may close the native handle; never under the pool lock
    if (s.owner)
        retired.push_back(std::move(s.owner));
    free_.push_back(i);
}

} // namespace detail


// ---------------------------------------------------------------------------
// BufferPool
// ---------------------------------------------------------------------------
BufferPool::BufferPool(const PoolOptions& opt)
    : state_(std::make_shared<detail::PoolState>(opt)) {}

BufferPool::BufferPool(std::size_t slots, std::size_t slot_capacity)
    : BufferPool([&] {
          PoolOptions o;
          o.slots = slots;
          o.slot_capacity = slot_capacity;
          return o;
      }()) {}

std::size_t BufferPool::size() const noexcept { return state_->options().slots; }
std::size_t BufferPool::slot_capacity() const noexcept { return state_->capacity(); }
ExhaustedPolicy BufferPool::policy() const noexcept { return state_->options().policy; }
const PoolOptions& BufferPool::options() const noexcept { return state_->options(); }

std::size_t BufferPool::free_count() const { return state_->free_count(); }
std::size_t BufferPool::leased_count() const { return state_->leased_count(); }
std::size_t BufferPool::abandoned_count() const { return state_->abandoned_count(); }
std::size_t BufferPool::peak_leased() const { return state_->peak_leased(); }

std::size_t BufferPool::reclaim() { return state_->reclaim(); }

void BufferPool::notify_when_available(std::function<void()> cb) {
    state_->notify_when_available(std::move(cb));
}

} // namespace icmpecho
