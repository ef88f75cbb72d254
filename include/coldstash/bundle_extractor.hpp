#pragma once

#include "io/io.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace coldstash {

// Unpacks a bundle stream under a destination directory. Member paths are
// re-rooted at the destination; absolute and ".." paths are refused.
class BundleExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        IProgress* progress_sink = nullptr;
        std::uint64_t total_bytes = 0;
    };

    BundleExtractor() = default;
    explicit BundleExtractor(const Options& opt) : opt_(opt) {}

    Result ExtractToDir(IReader& bundle_stream, const std::string& dst_dir) const;

  private:
    Options opt_{};
};

} // namespace coldstash
