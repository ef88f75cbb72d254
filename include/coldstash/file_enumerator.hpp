#pragma once

#include "coldstash/artifact_naming.hpp"
#include "coldstash/file_entry.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <string>

namespace coldstash {

struct FileSet {
    std::string root; // absolute archive root (the directory, or a file's parent)
    FileList files;   // sorted by path
};

class FileEnumerator {
  public:
    struct Options {
        ArtifactNaming naming;
        unsigned hash_workers = 0; // 0 => hardware concurrency (capped)
        IProgress* progress_sink = nullptr;
    };

    FileEnumerator() = default;
    explicit FileEnumerator(Options opt) : opt_(std::move(opt)) {}

    // Lists and fingerprints `path`. A regular file yields a one-element set
    // rooted at its parent; a directory is walked recursively, skipping hidden
    // entries, symlinks and this tool's own bundle/sidecar artifacts.
    Result Enumerate(const std::string& path, FileSet& out) const;

    // Archive root of `path` without walking or hashing anything.
    static Result ResolveRoot(const std::string& path, std::string& root, bool& is_file);

  private:
    Result Walk(const std::string& root, FileList& out) const;
    Result Fingerprint(const std::string& root, FileList& files) const;

    Options opt_{};
};

} // namespace coldstash
