// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace printwatch {

/**
 * @brief Cooperative cancellation signal for a background task
 *
 * Shared (via shared_ptr) between a task's loop and anything that completes
 * work for it asynchronously, so late completions can still wake the loop
 * safely after the owner is gone.
 *
 * The loop observes cancellation at its own checkpoints; nothing is
 * interrupted forcibly.
 *
 * @code
 * auto signal = std::make_shared<CancellationSignal>();
 * while (!signal->is_cancelled()) {
 *     do_work();
 *     if (!signal->sleep_for(std::chrono::milliseconds(500))) {
 *         break; // cancelled during sleep
 *     }
 * }
 * @endcode
 */
class CancellationSignal {
  public:
    enum class WaitResult {
        READY,     ///< Predicate became true
        TIMED_OUT, ///< Deadline passed first
        CANCELLED  ///< cancel() called first
    };

    CancellationSignal() = default;

    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    /// Request cancellation and wake every waiter
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /// Wake waiters so they re-evaluate their predicates
    void notify() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
        }
        cv_.notify_all();
    }

    /**
     * @brief Interruptible sleep
     * @return false if cancelled before the duration elapsed
     */
    bool sleep_for(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, duration, [this] { return cancelled_; });
        return !cancelled_;
    }

    /**
     * @brief Wait until ready() returns true, the timeout passes, or cancel()
     *
     * ready() is evaluated with the signal's mutex held; it must not call back
     * into this signal. Whoever makes ready() true must call notify().
     */
    template <typename Predicate>
    WaitResult wait_for(std::chrono::milliseconds timeout, Predicate ready) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool woke = cv_.wait_for(lock, timeout, [this, &ready] { return cancelled_ || ready(); });
        if (cancelled_) {
            return WaitResult::CANCELLED;
        }
        return woke ? WaitResult::READY : WaitResult::TIMED_OUT;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

} // namespace printwatch
