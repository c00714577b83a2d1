/**
 * Asynchronous echo engine.
 *
 * ping_async() leases a slot, hands its buffer and completion signal to the
 * driver and returns a PendingPing. The PendingPing owns the lease until it
 * observes completion (decode + release), passes its deadline (abandon) or
 * is cancelled (release if already signaled, abandon otherwise).
 *
 * A slot is released to Free only once its signal is known to be set, so
 * the driver never writes into a buffer another request already owns.
 */

#include "icmpecho/engine.hpp"
#include "pool_state.hpp"
#include "request.hpp"

#include <future>
#include <utility>

namespace icmpecho {

namespace detail {

struct EngineAccess {
    static PendingPing resolved(EchoReply reply) {
        return PendingPing::resolved(std::move(reply));
    }

    static PendingPing in_flight(std::shared_ptr<PoolState> pool,
                                 std::size_t slot,
                                 const ReplyContext& ctx,
                                 std::chrono::steady_clock::time_point deadline) {
        PendingPing p;
        p.state_    = PendingPing::State::InFlight;
        p.pool_     = std::move(pool);
        p.slot_     = slot;
        p.ctx_      = ctx;
        p.deadline_ = deadline;
        return p;
    }
};

} // namespace detail

namespace {

int remaining_ms(std::chrono::steady_clock::time_point now,
                 std::chrono::steady_clock::time_point until) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(until - now).count();
    return static_cast<int>(ms) + 1;
}

} // namespace


// ============================================================================
// ping_async
// ============================================================================
PendingPing ping_async(const EchoHandle& handle,
                       BufferPool& pool,
                       const Address& dst,
                       const std::vector<std::uint8_t>& payload,
                       const EchoOptions& opt)
{
    using detail::EngineAccess;

    const AddressFamily family = handle.family();
    const auto& state = pool.state();

    const Error invalid = detail::validate_request(family, dst, opt, payload.size(),
                                                   state->capacity());
    if (!invalid.ok())
        return EngineAccess::resolved(EchoReply::failure(invalid));

    const std::size_t idx = state->acquire();
    if (idx == detail::PoolState::kNoSlot)
        return EngineAccess::resolved(EchoReply::failure(Error::no_buffer()));

    detail::Slot& slot = state->slot(idx);
    slot.signal->reset();
    slot.request.assign(payload.begin(), payload.end());
    slot.owner = handle.shared_driver();

    const EchoRequest req = detail::make_request(dst, slot.request.data(),
                                                 slot.request.size(), opt);
    const auto issued = std::chrono::steady_clock::now();

    std::uint32_t code = 0;
    try {
        code = slot.owner->send_async(req, slot.buffer(), state->capacity(), *slot.signal);
    } catch (...) {
        state->release(idx);
        throw;
    }
    if (code != 0) {
        // Nothing outstanding: the slot is reusable right away
        state->release(idx);
        return EngineAccess::resolved(EchoReply::failure(Error::from_os_code(code)));
    }

    ReplyContext ctx;
    ctx.layout = &slot.owner->async_layout();
    ctx.request_size = slot.request.size();

    const auto deadline = issued +
                          std::chrono::milliseconds(req.timeout_ms) +
                          std::chrono::milliseconds(state->options().expiry_grace_ms);

    return EngineAccess::in_flight(state, idx, ctx, deadline);
}


// ============================================================================
// PendingPing
// ============================================================================
PendingPing PendingPing::resolved(EchoReply reply) {
    PendingPing p;
    p.state_  = State::Resolved;
    p.result_ = std::move(reply);
    return p;
}

PendingPing::~PendingPing() {
    cancel();
}

PendingPing::PendingPing(PendingPing&& o) noexcept
    : state_(o.state_),
      pool_(std::move(o.pool_)),
      slot_(o.slot_),
      ctx_(o.ctx_),
      deadline_(o.deadline_),
      result_(std::move(o.result_))
{
    o.state_ = State::Empty;
    o.slot_  = kNoSlot;
}

PendingPing& PendingPing::operator=(PendingPing&& o) noexcept {
    if (this != &o) {
        cancel();
        state_    = o.state_;
        pool_     = std::move(o.pool_);
        slot_     = o.slot_;
        ctx_      = o.ctx_;
        deadline_ = o.deadline_;
        result_   = std::move(o.result_);
        o.state_  = State::Empty;
        o.slot_   = kNoSlot;
    }
    return *this;
}

bool PendingPing::ready() {
    switch (state_) {
        case State::Empty:    return false;
        case State::Resolved: return true;
        case State::InFlight: break;
    }
    return pool_->slot(slot_).signal->try_poll() ||
           std::chrono::steady_clock::now() >= deadline_;
}

std::optional<EchoReply> PendingPing::poll() {
    ensure_valid();

    if (state_ == State::InFlight) {
        if (pool_->slot(slot_).signal->try_poll())
            complete();
        else if (std::chrono::steady_clock::now() >= deadline_)
            expire();
        else
            return std::nullopt;
    }
    return take();
}

EchoReply PendingPing::wait() {
    ensure_valid();

    if (state_ == State::InFlight) {
        const CompletionSignal& sig = *pool_->slot(slot_).signal;
        for (;;) {
            if (sig.try_poll()) {
                complete();
                break;
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline_) {
                expire();
                break;
            }
            (void)sig.wait(remaining_ms(now, deadline_));
        }
    }
    return take();
}

std::optional<EchoReply> PendingPing::wait_for(int timeout_ms) {
    if (timeout_ms < 0)
        return wait();

    ensure_valid();

    if (state_ == State::InFlight) {
        const CompletionSignal& sig = *pool_->slot(slot_).signal;
        const auto limit = std::chrono::steady_clock::now() +
                           std::chrono::milliseconds(timeout_ms);
        for (;;) {
            if (sig.try_poll()) {
                complete();
                break;
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline_) {
                expire();
                break;
            }
            if (now >= limit)
                return std::nullopt;
            (void)sig.wait(remaining_ms(now, limit < deadline_ ? limit : deadline_));
        }
    }
    return take();
}

void PendingPing::on_ready(std::function<void()> waker) {
    ensure_valid();
    if (!waker)
        return;

    if (state_ == State::InFlight) {
        pool_->slot(slot_).signal->on_signaled(std::move(waker));
        return;
    }
    waker();
}

void PendingPing::cancel() noexcept {
    if (state_ == State::InFlight) {
        detail::Slot& s = pool_->slot(slot_);
        s.signal->clear_callback();
        if (s.signal->try_poll())
            pool_->release(slot_);
        else
            pool_->abandon(slot_);
    }

    state_ = State::Empty;
    slot_  = kNoSlot;
    pool_.reset();
    result_ = EchoReply();
}


// ----------------------------------------------------------------------------
// Internals
// ----------------------------------------------------------------------------
void PendingPing::ensure_valid() const {
    if (state_ == State::Empty)
        throw std::future_error(std::future_errc::no_state);
}

void PendingPing::complete() {
    detail::Slot& s = pool_->slot(slot_);
    const std::size_t cap = pool_->capacity();

    const std::uint32_t code = s.owner->parse(s.buffer(), cap);
    if (code != 0)
        result_ = EchoReply::failure(Error::from_os_code(code));
    else
        result_ = decode(s.buffer(), cap, ctx_);

    release_slot_after_completion();
}

void PendingPing::expire() {
    detail::Slot& s = pool_->slot(slot_);
    s.signal->clear_callback();
    pool_->abandon(slot_);

    slot_   = kNoSlot;
    state_  = State::Resolved;
    result_ = EchoReply::failure(Error::timeout());
}

void PendingPing::release_slot_after_completion() noexcept {
    pool_->slot(slot_).signal->clear_callback();
    pool_->release(slot_);
    slot_  = kNoSlot;
    state_ = State::Resolved;
}

EchoReply PendingPing::take() {
    EchoReply r = std::move(result_);
    result_ = EchoReply();
    state_  = State::Empty;
    pool_.reset();
    return r;
}


// ============================================================================
// AsyncPinger
// ============================================================================
AsyncPinger::AsyncPinger(const PoolOptions& pool) : pool_(pool) {
    try {
        v4_ = std::make_shared<EchoHandle>(EchoHandle::open(AddressFamily::V4));
    } catch (const CreateError& e) {
        v4_error_ = e.code();
    }

    try {
        v6_ = std::make_shared<EchoHandle>(EchoHandle::open(AddressFamily::V6));
    } catch (const CreateError& e) {
        v6_error_ = e.code();
    }

    if (!v4_ && !v6_)
        throw CreateError("neither an IPv4 nor an IPv6 ICMP handle could be opened",
                          v4_error_);
}

PendingPing AsyncPinger::send(const Address& dst, const std::vector<std::uint8_t>& payload) {
    return send_from(Address(), dst, payload);
}

PendingPing AsyncPinger::send_from(const Address& src, const Address& dst,
                                   const std::vector<std::uint8_t>& payload)
{
    using detail::EngineAccess;

    if (dst.empty())
        return EngineAccess::resolved(EchoReply::failure(Error::invalid_address()));

    const bool v4 = dst.family() == AddressFamily::V4;
    const EchoHandle* h = v4 ? v4_.get() : v6_.get();
    if (!h)
        return EngineAccess::resolved(
            EchoReply::failure(Error::os_error(v4 ? v4_error_ : v6_error_)));

    EchoOptions opt = opt_;
    opt.source = src;
    return ping_async(*h, pool_, dst, payload, opt);
}

} // namespace icmpecho
