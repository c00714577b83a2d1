#if defined(_WIN32)

/**
 * Completion signal (Windows).
 *
 * Wraps a manual-reset event handed to IcmpSendEcho2 as its completion
 * event. Wake callbacks ride on the system thread pool through
 * RegisterWaitForSingleObject (one-shot).
 */

#include <windows.h>

#include "icmpecho/signal.hpp"
#include "icmpecho/error.hpp"

#include <atomic>
#include <mutex>

namespace icmpecho {

struct CompletionSignal::Impl {
    HANDLE event{nullptr};

    std::mutex mtx;
    HANDLE wait_handle{nullptr};
    std::function<void()> callback;
    std::atomic<DWORD> callback_thread{0};

    static VOID CALLBACK fire(PVOID ctx, BOOLEAN /*timed_out*/) {
        auto* self = static_cast<Impl*>(ctx);
        self->callback_thread.store(GetCurrentThreadId());

        std::function<void()> cb;
        {
            std::lock_guard<std::mutex> lk(self->mtx);
            cb = std::move(self->callback);
            self->callback = nullptr;
        }
        if (cb)
            cb();

        self->callback_thread.store(0);
    }
};


CompletionSignal::CompletionSignal() : impl_(new Impl) {
    // Manual reset, initially non-signaled
    impl_->event = CreateEventW(nullptr, TRUE, FALSE, nullptr);
    if (!impl_->event)
        throw CreateError("CreateEvent failed", GetLastError());
}

CompletionSignal::~CompletionSignal() {
    clear_callback();
    CloseHandle(impl_->event);
}

bool CompletionSignal::try_poll() const {
    return WaitForSingleObject(impl_->event, 0) == WAIT_OBJECT_0;
}

bool CompletionSignal::wait(int timeout_ms) const {
    const DWORD ms = timeout_ms < 0 ? INFINITE : static_cast<DWORD>(timeout_ms);
    return WaitForSingleObject(impl_->event, ms) == WAIT_OBJECT_0;
}

void CompletionSignal::set() {
    SetEvent(impl_->event);
}

void CompletionSignal::reset() {
    clear_callback();
    ResetEvent(impl_->event);
}

void CompletionSignal::on_signaled(std::function<void()> cb) {
    clear_callback();

    if (try_poll()) {
        if (cb)
            cb();
        return;
    }

    std::lock_guard<std::mutex> lk(impl_->mtx);
    impl_->callback = std::move(cb);

    HANDLE wh = nullptr;
    if (!RegisterWaitForSingleObject(&wh, impl_->event, &Impl::fire, impl_.get(),
                                     INFINITE, WT_EXECUTEONLYONCE)) {
        impl_->callback = nullptr;
        throw CreateError("RegisterWaitForSingleObject failed", GetLastError());
    }
    impl_->wait_handle = wh;
}

void CompletionSignal::clear_callback() {
    HANDLE wh = nullptr;
    {
        std::lock_guard<std::mutex> lk(impl_->mtx);
        wh = impl_->wait_handle;
        impl_->wait_handle = nullptr;
    }

    if (wh) {
        // From inside the callback a blocking unregister would wait on itself
        if (impl_->callback_thread.load() == GetCurrentThreadId())
            (void)UnregisterWaitEx(wh, nullptr);
        else
            (void)UnregisterWaitEx(wh, INVALID_HANDLE_VALUE);
    }

    std::lock_guard<std::mutex> lk(impl_->mtx);
    impl_->callback = nullptr;
}

void* CompletionSignal::native_handle() const noexcept {
    return impl_->event;
}

} // namespace icmpecho

#endif
