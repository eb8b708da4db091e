/**
 * @file fetch_gate.hpp
 * @brief Global fetch concurrency cap and per-host politeness spacing
 */

#ifndef DEEPDIVE_RETRIEVAL_FETCH_GATE_HPP
#define DEEPDIVE_RETRIEVAL_FETCH_GATE_HPP

#include "cancellation.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>

namespace deepdive {

/**
 * @brief Admission control shared by every fetch of a session
 *
 * acquire() blocks until a global slot is free and the host's politeness
 * delay has elapsed since the previous admission for it. Both conditions are
 * checked together under one lock, so requests to one host are admitted at
 * least the configured delay apart even when they queued for a slot.
 *
 * Usage Example:
 *   @code
 *   FetchGate gate(4, std::chrono::milliseconds(1000));
 *   FetchGate::Permit permit = gate.acquire("example.com", &token);
 *   if (permit) {
 *       // fetch while holding the slot
 *   }
 *   @endcode
 */
class FetchGate {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief RAII slot, released on destruction
     *
     * An empty permit (operator bool false) means the wait was cancelled.
     */
    class Permit {
    public:
        Permit() : gate_(nullptr) {}
        explicit Permit(FetchGate* gate) : gate_(gate) {}
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                gate_ = other.gate_;
                other.gate_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        explicit operator bool() const { return gate_ != nullptr; }

        void release() {
            if (gate_) {
                gate_->release_slot();
                gate_ = nullptr;
            }
        }

    private:
        FetchGate* gate_;
    };

    FetchGate(size_t max_concurrent, std::chrono::milliseconds politeness_delay);

    Permit acquire(const std::string& host, const CancellationToken* cancel = nullptr);

    size_t in_flight() const;
    size_t peak_in_flight() const;

private:
    const size_t max_concurrent_;
    const std::chrono::milliseconds politeness_delay_;

    mutable std::mutex mutex_;
    std::condition_variable slot_available_;
    size_t in_flight_;
    size_t peak_in_flight_;
    std::map<std::string, Clock::time_point> next_allowed_;

    void release_slot();
};

} // namespace deepdive

#endif // DEEPDIVE_RETRIEVAL_FETCH_GATE_HPP
