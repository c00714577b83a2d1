#if !defined(_WIN32)

/**
 * Completion signal (POSIX).
 *
 * Emulates a manual-reset event: a flag guarded by a mutex, a condition
 * variable for blocking waiters and an optional one-shot callback fired by
 * whichever thread calls set().
 */

#include "icmpecho/signal.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace icmpecho {

struct CompletionSignal::Impl {
    mutable std::mutex mtx;
    mutable std::condition_variable cv;
    bool set{false};

    std::function<void()> callback;
    bool firing{false};
    std::thread::id firing_thread;
};


CompletionSignal::CompletionSignal() : impl_(new Impl) {}

CompletionSignal::~CompletionSignal() {
    clear_callback();
}

bool CompletionSignal::try_poll() const {
    std::lock_guard<std::mutex> lk(impl_->mtx);
    return impl_->set;
}

bool CompletionSignal::wait(int timeout_ms) const {
    std::unique_lock<std::mutex> lk(impl_->mtx);
    auto is_set = [this] { return impl_->set; };

    if (timeout_ms < 0) {
        impl_->cv.wait(lk, is_set);
        return true;
    }
    return impl_->cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), is_set);
}

void CompletionSignal::set() {
    std::function<void()> cb;
    {
        std::lock_guard<std::mutex> lk(impl_->mtx);
        if (impl_->set)
            return;
        impl_->set = true;
        cb = std::move(impl_->callback);
        impl_->callback = nullptr;
        if (cb) {
            impl_->firing = true;
            impl_->firing_thread = std::this_thread::get_id();
        }
        impl_->cv.notify_all();
    }

    if (!cb)
        return;

    cb();

    std::lock_guard<std::mutex> lk(impl_->mtx);
    impl_->firing = false;
    impl_->firing_thread = std::thread::id();
    impl_->cv.notify_all();
}

void CompletionSignal::reset() {
    clear_callback();
    std::lock_guard<std::mutex> lk(impl_->mtx);
    impl_->set = false;
}

void CompletionSignal::on_signaled(std::function<void()> cb) {
    {
        std::lock_guard<std::mutex> lk(impl_->mtx);
        if (!impl_->set) {
            impl_->callback = std::move(cb);
            return;
        }
    }
    if (cb)
        cb();
}

void CompletionSignal::clear_callback() {
    std::unique_lock<std::mutex> lk(impl_->mtx);
    impl_->callback = nullptr;

    // A callback already running on another thread is waited out; one
    // running on this thread is the caller itself.
    if (impl_->firing_thread != std::this_thread::get_id())
        impl_->cv.wait(lk, [this] { return !impl_->firing; });
}

} // namespace icmpecho

#endif
