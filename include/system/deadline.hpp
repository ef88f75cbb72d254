#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace coldstash {

// Absolute point after which a long-running operation gives up. A default
// constructed Deadline never expires.
class Deadline {
  public:
    using Clock = std::chrono::steady_clock;

    Deadline() = default;
    static Deadline After(std::chrono::seconds d) { return Deadline(Clock::now() + d); }
    static Deadline Never() { return Deadline(); }

    bool Expired() const { return at_ && Clock::now() >= *at_; }
    // Time left, clamped at zero; nullopt when unbounded.
    std::optional<Clock::duration> Remaining() const;

  private:
    explicit Deadline(Clock::time_point at) : at_(at) {}

    std::optional<Clock::time_point> at_;
};

enum class WaitOutcome { Elapsed, DeadlineExceeded, Cancelled };

// Sleep that wakes early on Cancel(), on SIGINT/SIGTERM (g_cancel, checked
// every poll slice) or when the deadline passes.
class CancellableTimer {
  public:
    explicit CancellableTimer(std::chrono::milliseconds poll_slice = std::chrono::milliseconds(200))
        : slice_(poll_slice) {}

    WaitOutcome WaitFor(std::chrono::milliseconds interval, const Deadline& deadline);
    void Cancel();
    bool Cancelled() const;

  private:
    std::chrono::milliseconds slice_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

} // namespace coldstash
