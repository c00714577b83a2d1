#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "icmpecho/address.hpp"
#include "icmpecho/handle.hpp"
#include "icmpecho/ping.hpp"
#include "icmpecho/pool.hpp"
#include "icmpecho/reply.hpp"
#include "icmpecho/visibility.hpp"

namespace icmpecho {

namespace detail { struct EngineAccess; }

/**
 * Future-like handle for one asynchronous echo request.
 *
 * Move-only. Like std::future it is meant for a single consumer: the reply
 * is delivered exactly once, through poll(), wait() or wait_for(); after
 * that valid() is false and further calls throw
 * std::future_error(no_state).
 *
 * Destroying or cancelling an unfinished request never frees its slot
 * while the driver may still write to it; the slot is abandoned and
 * recycled by the pool once the driver signals.
 */
class ICMPECHO_API PendingPing {
public:
    PendingPing() = default;
    ~PendingPing();

    PendingPing(PendingPing&& o) noexcept;
    PendingPing& operator=(PendingPing&& o) noexcept;
    PendingPing(const PendingPing&) = delete;
    PendingPing& operator=(const PendingPing&) = delete;

    bool valid() const noexcept { return state_ != State::Empty; }

    /** True once poll() would return a reply. Does not consume it. */
    bool ready();

    /** Non-blocking: the reply if the request finished, else nullopt. */
    std::optional<EchoReply> poll();

    /** Blocks until the request finishes (at most its timeout plus grace). */
    EchoReply wait();

    /** Blocks up to timeout_ms; nullopt if the request is still running. */
    std::optional<EchoReply> wait_for(int timeout_ms);

    /**
     * Cooperative wake-up: `waker` runs once the driver signals completion,
     * possibly on another thread. The caller then poll()s. Runs immediately
     * if the reply is already available.
     */
    void on_ready(std::function<void()> waker);

    /** Abandons the request. valid() is false afterwards. */
    void cancel() noexcept;

    /** Deadline after which poll() reports Timeout on its own. */
    std::chrono::steady_clock::time_point deadline() const noexcept { return deadline_; }

private:
    friend struct detail::EngineAccess;

    enum class State : std::uint8_t { Empty, InFlight, Resolved };

    static constexpr std::size_t kNoSlot = static_cast<std::size_t>(-1);

    static PendingPing resolved(EchoReply reply);

    void ensure_valid() const;
    void complete();
    void expire();
    void release_slot_after_completion() noexcept;
    EchoReply take();

    State state_{State::Empty};
    std::shared_ptr<detail::PoolState> pool_;
    std::size_t slot_{kNoSlot};
    ReplyContext ctx_{};
    std::chrono::steady_clock::time_point deadline_{};
    EchoReply result_{};
};

/**
 * Issues a non-blocking echo request using a slot from `pool`.
 *
 * Invalid targets, payloads the slot cannot hold, pool exhaustion under the
 * Reject policy and immediate OS send failures all come back as an already
 * resolved PendingPing carrying the error.
 */
ICMPECHO_API PendingPing ping_async(const EchoHandle& handle,
                                    BufferPool& pool,
                                    const Address& dst,
                                    const std::vector<std::uint8_t>& payload,
                                    const EchoOptions& opt = EchoOptions{});

/**
 * Non-blocking pinger: one IPv4 and one IPv6 handle plus an owned pool.
 * Same open semantics as Pinger.
 */
class ICMPECHO_API AsyncPinger {
public:
    /**
     * @throws CreateError if neither family can be opened
     * @throws std::invalid_argument for a misconfigured pool
     */
    explicit AsyncPinger(const PoolOptions& pool = PoolOptions{});

    bool has_v4() const noexcept { return v4_ != nullptr; }
    bool has_v6() const noexcept { return v6_ != nullptr; }

    void set_ttl(int ttl) noexcept { opt_.ttl = ttl; }
    int ttl() const noexcept { return opt_.ttl; }
    void set_df(bool df) noexcept { opt_.dont_fragment = df; }
    bool df() const noexcept { return opt_.dont_fragment; }
    void set_timeout(int timeout_ms) noexcept { opt_.timeout_ms = timeout_ms; }
    int timeout() const noexcept { return opt_.timeout_ms; }

    BufferPool& pool() noexcept { return pool_; }

    PendingPing send(const Address& dst,
                     const std::vector<std::uint8_t>& payload = {});
    PendingPing send_from(const Address& src, const Address& dst,
                          const std::vector<std::uint8_t>& payload = {});

private:
    std::shared_ptr<EchoHandle> v4_;
    std::shared_ptr<EchoHandle> v6_;
    std::uint32_t v4_error_{0};
    std::uint32_t v6_error_{0};
    BufferPool pool_;
    EchoOptions opt_{};
};

} // namespace icmpecho
