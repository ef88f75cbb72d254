#include "util/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace coldstash {

unsigned EffectiveWorkers(unsigned requested, size_t count) {
    unsigned n = requested;
    if (n == 0) {
        n = std::max(1u, std::min(std::thread::hardware_concurrency(), kMaxDefaultWorkers));
    }
    if (count < n) n = static_cast<unsigned>(std::max<size_t>(count, 1));
    return n;
}

Result ParallelFor(size_t count, unsigned workers, const std::function<Result(size_t)>& task) {
    if (count == 0) return Result::Ok();

    const unsigned n = EffectiveWorkers(workers, count);
    if (n == 1) {
        for (size_t i = 0; i < count; ++i) {
            auto r = task(i);
            if (!r.is_ok()) return r;
        }
        return Result::Ok();
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex mu;
    Result first_failure = Result::Ok();

    auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            const size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) return;
            auto r = task(i);
            if (!r.is_ok()) {
                std::lock_guard<std::mutex> lk(mu);
                if (!failed.exchange(true)) first_failure = std::move(r);
                return;
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(n);
    for (unsigned t = 0; t < n; ++t) threads.emplace_back(worker);
    for (auto& t : threads) t.join();

    return first_failure;
}

} // namespace coldstash
