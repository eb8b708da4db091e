#include "retrieval/fetch_gate.hpp"
#include <algorithm>

namespace deepdive {

FetchGate::FetchGate(size_t max_concurrent, std::chrono::milliseconds politeness_delay)
    : max_concurrent_(std::max<size_t>(1, max_concurrent)),
      politeness_delay_(politeness_delay),
      in_flight_(0),
      peak_in_flight_(0) {}

FetchGate::Permit FetchGate::acquire(const std::string& host, const CancellationToken* cancel) {
    constexpr std::chrono::milliseconds POLL_INTERVAL(50);

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (is_cancelled(cancel)) {
            return Permit();
        }

        Clock::time_point now = Clock::now();
        auto next = next_allowed_.find(host);
        bool host_ready = next == next_allowed_.end() || now >= next->second;
        if (host_ready && in_flight_ < max_concurrent_) {
            break;
        }

        Clock::time_point wake = now + POLL_INTERVAL;
        if (!host_ready) {
            wake = std::min(wake, next->second);
        }
        slot_available_.wait_until(lock, wake);
    }

    // Spacing is measured between admissions, so it holds however long the
    // caller waited for a slot
    next_allowed_[host] = Clock::now() + politeness_delay_;
    ++in_flight_;
    peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
    return Permit(this);
}

void FetchGate::release_slot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    slot_available_.notify_all();
}

size_t FetchGate::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

size_t FetchGate::peak_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_in_flight_;
}

} // namespace deepdive
