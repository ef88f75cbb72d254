#pragma once
#include <cstdint>
#include <string_view>

namespace coldstash {

struct ProgressEvent {
    std::string_view stage;   // "hash", "bundle", "upload", "download", "extract"
    std::string_view subject; // file or object the stage works on
    std::uint64_t done = 0;
    std::uint64_t total = 0;  // 0 => unknown
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace coldstash
