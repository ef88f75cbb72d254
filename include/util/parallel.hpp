#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <functional>

namespace coldstash {

// Runs task(i) for i in [0, count) on at most `workers` threads (0 picks
// hardware concurrency, capped at kMaxDefaultWorkers). Tasks are claimed in
// index order; after the first failure no new task starts and that failure
// is returned.
inline constexpr unsigned kMaxDefaultWorkers = 8;

Result ParallelFor(size_t count, unsigned workers, const std::function<Result(size_t)>& task);

unsigned EffectiveWorkers(unsigned requested, size_t count);

} // namespace coldstash
