#pragma once

#include "util/result.hpp"

#include <string>

namespace coldstash {

// Rejects member paths that would escape the extraction directory.
class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    Result NormalizeMemberPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(const std::string& p);

  private:
    bool safe_paths_only_ = true;
};

} // namespace coldstash
