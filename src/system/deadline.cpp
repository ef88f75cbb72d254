#include "system/deadline.hpp"

#include "system/signals.hpp"

#include <algorithm>

namespace coldstash {

std::optional<Deadline::Clock::duration> Deadline::Remaining() const {
    if (!at_) return std::nullopt;
    const auto now = Clock::now();
    return now >= *at_ ? Clock::duration::zero() : *at_ - now;
}

void CancellableTimer::Cancel() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellableTimer::Cancelled() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cancelled_;
}

WaitOutcome CancellableTimer::WaitFor(std::chrono::milliseconds interval, const Deadline& deadline) {
    using Clock = Deadline::Clock;
    const auto wake_at = Clock::now() + interval;

    std::unique_lock<std::mutex> lk(mu_);
    while (true) {
        if (cancelled_ || CancelRequested()) return WaitOutcome::Cancelled;
        if (deadline.Expired()) return WaitOutcome::DeadlineExceeded;

        const auto now = Clock::now();
        if (now >= wake_at) return WaitOutcome::Elapsed;

        auto step = std::min<Clock::duration>(wake_at - now, slice_);
        if (auto left = deadline.Remaining()) step = std::min(step, *left);
        cv_.wait_for(lk, step, [this] { return cancelled_; });
    }
}

} // namespace coldstash
