#pragma once

#include "coldstash/artifact_naming.hpp"
#include "coldstash/manifest.hpp"
#include "coldstash/manifest_index.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace coldstash {

struct CreateOptions {
    bool force = false;     // new id next to existing artifacts
    bool overwrite = false; // reuse the id of the newest existing sidecar
};

// Sidecar manifests in an archive root, mirrored into an optional index.
class ManifestStore {
  public:
    explicit ManifestStore(ArtifactNaming naming, IManifestIndex* index = nullptr)
        : naming_(std::move(naming)), index_(index) {}

    // Resolves the id for a new archive of `root`. Fails with
    // DuplicateArchiveExists when a sidecar exists and neither flag is set.
    Result Create(const std::string& root, const CreateOptions& opt, std::string& out_id) const;

    // Atomically writes <root>/<prefix>.<id>.json, then one index row per file.
    Result Persist(const Manifest& m) const;

    // Most recently written sidecar in `dir` (mtime, then name).
    Result Load(const std::string& dir, Manifest& out) const;

    // Sidecar paths in `dir`, newest first.
    Result ListSidecars(const std::string& dir, std::vector<std::string>& out) const;

    const ArtifactNaming& Naming() const { return naming_; }

  private:
    ArtifactNaming naming_;
    IManifestIndex* index_ = nullptr;
};

} // namespace coldstash
