#pragma once

#include "coldstash/artifact_naming.hpp"
#include "coldstash/bundle_builder.hpp"
#include "coldstash/file_enumerator.hpp"
#include "coldstash/integrity_verifier.hpp"
#include "coldstash/manifest.hpp"
#include "coldstash/manifest_store.hpp"
#include "coldstash/transfer_backend.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <functional>
#include <string>

namespace coldstash {

struct ArchiveRequest {
    std::string path;           // file or directory; a bundle when existing_bundle is set
    BackendDescriptor backend;  // kind DryRun builds and verifies only
    bool force = false;
    bool overwrite = false;
    bool keep_artifacts = false; // keep the local bundle after upload or failure
    bool remove_sources = false; // delete archived files once the manifest is written
    bool existing_bundle = false;
};

struct ArchiveOutcome {
    Manifest manifest;
    std::string bundle_path;
    bool uploaded = false;
    bool persisted = false;
};

// Enumerate -> size ceiling -> build -> verify -> upload -> persist.
class ArchiveService {
  public:
    struct Options {
        ArtifactNaming naming;
        unsigned hash_workers = 0;
        std::uint64_t max_source_bytes = kDefaultMaxSourceBytes;
        IntegrityMode integrity_mode = IntegrityMode::PathKeyed;
        std::string owner;
        IProgress* progress_sink = nullptr;
    };

    // Test seams between pipeline stages.
    struct Hooks {
        std::function<void(const std::string& bundle_path)> on_bundle_built;
    };

    // `backend` may be null when only dry runs are requested.
    ArchiveService(Options opt, const ManifestStore& store, TransferBackend* backend)
        : opt_(std::move(opt)), store_(store), backend_(backend) {}

    void SetHooks(Hooks hooks) { hooks_ = std::move(hooks); }

    Result Archive(const ArchiveRequest& req, ArchiveOutcome& out);

  private:
    Result PrepareFromSources(const ArchiveRequest& req, ArchiveOutcome& out, FileSet& set);
    Result PrepareFromBundle(const ArchiveRequest& req, ArchiveOutcome& out, FileSet& set);
    Result Ship(const ArchiveRequest& req, ArchiveOutcome& out);
    void DiscardBundle(const ArchiveRequest& req, const std::string& bundle_path) const;
    void RemoveSources(const FileSet& set) const;

    Options opt_;
    const ManifestStore& store_;
    TransferBackend* backend_ = nullptr;
    Hooks hooks_;
};

} // namespace coldstash
