#pragma once

#include <atomic>

namespace coldstash {

// Set by SIGINT/SIGTERM. Long-running loops (restore polling, bundle reads)
// check it and stop with ErrorCode::Cancelled.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested() { return g_cancel.load(std::memory_order_relaxed); }

} // namespace coldstash
