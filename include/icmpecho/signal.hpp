#pragma once
#include <functional>
#include <memory>
#include "icmpecho/visibility.hpp"

namespace icmpecho {

/**
 * Completion signal bound to one reply buffer for the duration of one
 * request. The driver sets it once the reply record (or a timeout/error
 * status) is in the buffer; the driver writes nothing into the buffer after
 * setting it.
 *
 * Windows: a manual-reset event the ICMP helper signals directly.
 * Linux:   mutex + condition variable set by the backend's listener thread.
 *
 * Thread-safety: set() may race with try_poll()/wait(). reset() must only
 * be called while no driver operation is outstanding on the signal.
 */
class ICMPECHO_API CompletionSignal {
public:
    /** @throws CreateError if the OS refuses to create the event */
    CompletionSignal();
    ~CompletionSignal();

    CompletionSignal(const CompletionSignal&) = delete;
    CompletionSignal& operator=(const CompletionSignal&) = delete;

    /** Non-blocking check. */
    bool try_poll() const;

    /**
     * Blocks up to timeout_ms (-1 = indefinitely).
     * @return true if the signal is set
     */
    bool wait(int timeout_ms) const;

    /** Marks the operation complete and fires the wake callback, if any. */
    void set();

    /** Clears the signal and any wake callback before the next request. */
    void reset();

    /**
     * Registers a one-shot callback invoked once the signal is set, possibly
     * on a driver or thread-pool thread. Runs immediately on the calling
     * thread if the signal is already set. Replaces any earlier callback.
     *
     * @throws CreateError if the OS refuses to register the wait (Windows)
     */
    void on_signaled(std::function<void()> cb);

    /** Drops a pending callback without firing it. */
    void clear_callback();

#if defined(_WIN32)
    /** Event HANDLE handed to IcmpSendEcho2 */
    void* native_handle() const noexcept;
#endif

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace icmpecho
