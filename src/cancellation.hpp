/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation flag shared between the control loop and workers
 */

#ifndef DEEPDIVE_CANCELLATION_HPP
#define DEEPDIVE_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace deepdive {

/**
 * @brief Cancellation token observed by fetches, gate waits and phase transitions
 *
 * Cancellation is one-way: once cancel() is called the token stays cancelled.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool is_cancelled() const { return cancelled_.load(); }

    /**
     * @brief Sleep for the given duration unless cancelled first
     *
     * @return true if the full duration elapsed, false if cancelled
     */
    bool wait_for(std::chrono::milliseconds duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

inline bool is_cancelled(const CancellationToken* token) {
    return token != nullptr && token->is_cancelled();
}

} // namespace deepdive

#endif // DEEPDIVE_CANCELLATION_HPP
