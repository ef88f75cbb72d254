#include "coldstash/restore_orchestrator.hpp"

#include "coldstash/bundle_extractor.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <unistd.h>

namespace coldstash {

namespace fs = std::filesystem;

const char* RestoreStateName(RestoreState s) {
    switch (s) {
        case RestoreState::Idle:             return "Idle";
        case RestoreState::RestoreRequested: return "RestoreRequested";
        case RestoreState::Restoring:        return "Restoring";
        case RestoreState::Ready:            return "Ready";
        case RestoreState::Downloaded:       return "Downloaded";
        case RestoreState::Verified:         return "Verified";
        case RestoreState::Extracted:        return "Extracted";
        case RestoreState::Failed:           return "Failed";
    }
    return "unknown";
}

bool RestoreReport::Visited(RestoreState s) const {
    if (s == RestoreState::Idle) return true;
    return std::any_of(trail.begin(), trail.end(), [s](const RestoreTransition& t) { return t.to == s; });
}

void RestoreOrchestrator::Transition(RestoreReport& report, RestoreState to, std::string note) const {
    LogInfo("restore %s: %s -> %s%s%s",
            report.locator.object.c_str(), RestoreStateName(report.state), RestoreStateName(to),
            note.empty() ? "" : ": ", note.c_str());
    report.trail.push_back({report.state, to, std::move(note)});
    report.state = to;
}

Result RestoreOrchestrator::Fail(RestoreReport& report, Result why) const {
    Transition(report, RestoreState::Failed, std::string(ErrorCodeName(why.code)) + ": " + why.msg);
    report.failure = why;
    return why;
}

Result RestoreOrchestrator::Restore(const Manifest& m, const std::string& restore_dir, RestoreReport& report) {
    report = RestoreReport{};
    report.locator = LocatorFromManifest(m);

    if (m.location == LocationKind::DryRun) {
        return Fail(report, Result::Fail(ErrorCode::RestoreUnsupported,
                                         "archive " + m.id + " was a dry run; nothing was uploaded"));
    }
    if (m.location != backend_.Kind()) {
        return Fail(report, Result::Fail(ErrorCode::RestoreUnsupported,
                                         std::string("archive ") + m.id + " lives on " +
                                             LocationKindName(m.location) +
                                             "; request a manual retrieval of " + report.locator.ToString()));
    }

    auto r = backend_.TierOf(report.locator, report.tier);
    if (!r.is_ok()) return Fail(report, r);

    if (IsInstantAccess(report.tier)) {
        Transition(report, RestoreState::Ready, StorageTierName(report.tier));
    } else if (IsArchival(report.tier)) {
        RestoreStatus status;
        r = backend_.QueryRestore(report.locator, status);
        if (!r.is_ok()) return Fail(report, r);

        switch (status.progress) {
            case RestoreProgress::NotRequested:
                r = backend_.RequestRestore(report.locator);
                if (!r.is_ok()) return Fail(report, r);
                Transition(report, RestoreState::RestoreRequested, StorageTierName(report.tier));
                break;
            case RestoreProgress::Ongoing:
                Transition(report, RestoreState::Restoring, "restore already in progress");
                break;
            case RestoreProgress::Completed:
                Transition(report, RestoreState::Ready, "restored copy available until " + status.expiry);
                break;
        }

        const Deadline deadline =
            opt_.deadline.count() > 0 ? Deadline::After(opt_.deadline) : Deadline::Never();
        r = AwaitRestore(report, deadline);
        if (!r.is_ok()) return r;
    } else {
        return Fail(report, Result::Fail(ErrorCode::RestoreUnsupported,
                                         std::string("storage tier ") + StorageTierName(report.tier) +
                                             " cannot be restored automatically; request a manual retrieval of " +
                                             report.locator.ToString()));
    }

    return DownloadVerifyExtract(m, restore_dir, report);
}

Result RestoreOrchestrator::AwaitRestore(RestoreReport& report, const Deadline& deadline) {
    while (report.state == RestoreState::RestoreRequested || report.state == RestoreState::Restoring) {
        switch (timer_.WaitFor(opt_.poll_interval, deadline)) {
            case WaitOutcome::Cancelled:
                return Fail(report, Result::Fail(ErrorCode::Cancelled,
                                                 "restore of " + report.locator.ToString() + " interrupted"));
            case WaitOutcome::DeadlineExceeded:
                return Fail(report, Result::Fail(ErrorCode::RestoreTimeout,
                                                 "restore of " + report.locator.ToString() +
                                                     " still pending at the deadline; try again later"));
            case WaitOutcome::Elapsed:
                break;
        }

        ++report.polls;
        RestoreStatus status;
        auto r = backend_.QueryRestore(report.locator, status);
        if (!r.is_ok()) return Fail(report, r);

        switch (status.progress) {
            case RestoreProgress::Ongoing:
                if (report.state != RestoreState::Restoring) {
                    Transition(report, RestoreState::Restoring, "");
                } else {
                    LogDebug("restore %s still ongoing (poll %d)", report.locator.object.c_str(), report.polls);
                }
                break;
            case RestoreProgress::Completed:
                Transition(report, RestoreState::Ready, "restored copy available until " + status.expiry);
                break;
            case RestoreProgress::NotRequested:
                return Fail(report, Result::Fail(ErrorCode::TransferFailed,
                                                 "restore request for " + report.locator.ToString() +
                                                     " disappeared while polling"));
        }
    }
    return Result::Ok();
}

Result RestoreOrchestrator::DownloadVerifyExtract(const Manifest& m,
                                                  const std::string& restore_dir,
                                                  RestoreReport& report) {
    std::error_code ec;
    fs::create_directories(restore_dir, ec);
    if (ec) {
        return Fail(report, Result::Fail(ec.value(), "cannot create " + restore_dir + ": " + ec.message()));
    }

    report.bundle_path = (fs::path(restore_dir) / m.filename).string();
    auto r = backend_.Download(report.locator, report.bundle_path, opt_.progress_sink);
    if (!r.is_ok()) return Fail(report, r);
    Transition(report, RestoreState::Downloaded, report.bundle_path);

    IntegrityVerifier verifier(IntegrityVerifier::Options{.mode = opt_.integrity_mode,
                                                          .progress_sink = opt_.progress_sink});
    r = verifier.VerifyBundleFingerprint(report.bundle_path, m.bundle_fingerprint, VerifyPhase::RestoreTime);
    if (r.is_ok() && opt_.verify_members) {
        r = verifier.VerifyMembers(report.bundle_path, m.files, VerifyPhase::RestoreTime);
    }
    if (!r.is_ok()) {
        if (!opt_.keep_artifacts && ::unlink(report.bundle_path.c_str()) != 0) {
            LogWarn("could not delete %s", report.bundle_path.c_str());
        }
        return Fail(report, r);
    }
    Transition(report, RestoreState::Verified, "");

    {
        FileReader bundle;
        r = FileReader::Open(report.bundle_path, bundle);
        if (r.is_ok()) {
            BundleExtractor extractor(BundleExtractor::Options{
                .safe_paths_only = true, .progress_sink = opt_.progress_sink, .total_bytes = TotalSize(m.files)});
            r = extractor.ExtractToDir(bundle, restore_dir);
        }
        if (!r.is_ok()) return Fail(report, r);
    }
    Transition(report, RestoreState::Extracted, restore_dir);

    if (opt_.delete_bundle_after_extract) {
        if (::unlink(report.bundle_path.c_str()) != 0) {
            LogWarn("could not delete %s", report.bundle_path.c_str());
        }
    }
    return Result::Ok();
}

} // namespace coldstash
