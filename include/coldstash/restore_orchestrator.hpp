#pragma once

#include "coldstash/integrity_verifier.hpp"
#include "coldstash/manifest.hpp"
#include "coldstash/transfer_backend.hpp"
#include "system/deadline.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace coldstash {

enum class RestoreState {
    Idle,
    RestoreRequested,
    Restoring,
    Ready,
    Downloaded,
    Verified,
    Extracted,
    Failed,
};

const char* RestoreStateName(RestoreState s);

struct RestoreTransition {
    RestoreState from = RestoreState::Idle;
    RestoreState to = RestoreState::Idle;
    std::string note;
};

// Outcome of one restore invocation. Never persisted.
struct RestoreReport {
    RestoreState state = RestoreState::Idle;
    std::vector<RestoreTransition> trail;
    RemoteLocator locator;
    StorageTier tier = StorageTier::Unknown;
    std::string bundle_path;
    Result failure = Result::Ok();
    int polls = 0;

    bool Visited(RestoreState s) const;
};

// Drives a manifest's bundle from remote storage to verified, extracted
// files, issuing and polling tier restores where the storage class needs one.
class RestoreOrchestrator {
  public:
    struct Options {
        std::chrono::milliseconds poll_interval = std::chrono::seconds(120);
        std::chrono::seconds deadline{0}; // 0 => no deadline
        IntegrityMode integrity_mode = IntegrityMode::PathKeyed;
        bool verify_members = true;
        bool delete_bundle_after_extract = false;
        bool keep_artifacts = false; // keep a bundle that failed verification
        IProgress* progress_sink = nullptr;
    };

    explicit RestoreOrchestrator(TransferBackend& backend) : backend_(backend) {}
    RestoreOrchestrator(TransferBackend& backend, const Options& opt) : backend_(backend), opt_(opt) {}

    // Restores into `restore_dir`. The returned Result mirrors report.failure.
    Result Restore(const Manifest& m, const std::string& restore_dir, RestoreReport& report);

    // Wakes a pending poll wait; the restore ends as Failed(Cancelled).
    void Cancel() { timer_.Cancel(); }

  private:
    void Transition(RestoreReport& report, RestoreState to, std::string note) const;
    Result Fail(RestoreReport& report, Result why) const;

    Result AwaitRestore(RestoreReport& report, const Deadline& deadline);
    Result DownloadVerifyExtract(const Manifest& m, const std::string& restore_dir, RestoreReport& report);

    TransferBackend& backend_;
    Options opt_{};
    CancellableTimer timer_;
};

} // namespace coldstash
