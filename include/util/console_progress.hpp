#pragma once

#include "util/progress.hpp"

#include <cstdint>
#include <string>

namespace coldstash {

// Single-line "\r" progress on stderr. Not thread-safe; callers that report
// from worker threads serialize their calls.
class ConsoleProgressSink final : public IProgress {
  public:
    explicit ConsoleProgressSink(std::uint64_t min_step_bytes = 4 * 1024 * 1024ULL)
        : min_step_(min_step_bytes) {}

    void OnProgress(const ProgressEvent& e) override;

  private:
    std::uint64_t min_step_ = 0;
    std::uint64_t next_ = 0;
    std::string last_stage_;
};

std::string ReadableBytes(std::uint64_t bytes);

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace coldstash
