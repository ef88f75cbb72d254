#pragma once

#include "coldstash/file_entry.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace coldstash {

inline constexpr std::uint64_t kDefaultMaxSourceBytes = 2'000'000'000'000ULL;

// SizeLimitExceeded when the summed entry sizes exceed `limit`.
Result CheckSizeCeiling(const FileList& files, std::uint64_t limit);

// Writes a gzip-compressed pax tar of `files` (paths relative to `root`).
// Output goes to "<bundle_path>.partial" and is renamed into place only when
// the archive was closed cleanly.
class BundleBuilder {
  public:
    struct Options {
        size_t chunk_bytes = 64 * 1024;
        IProgress* progress_sink = nullptr;
    };

    BundleBuilder() = default;
    explicit BundleBuilder(const Options& opt) : opt_(opt) {}

    Result Build(const std::string& root, const FileList& files, const std::string& bundle_path) const;

  private:
    Options opt_{};
};

} // namespace coldstash
