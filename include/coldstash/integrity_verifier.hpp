#pragma once

#include "coldstash/file_entry.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace coldstash {

// How member fingerprints are reconciled with the expected file list.
//   PathKeyed:      path -> fingerprint pairs must match as a multiset.
//   FingerprintSet: the distinct fingerprint sets must be equal; paths and
//                   duplicate content are ignored.
enum class IntegrityMode { PathKeyed, FingerprintSet };

// "path" / "set"
std::optional<IntegrityMode> ParseIntegrityMode(std::string_view s);
const char* IntegrityModeName(IntegrityMode mode);

enum class VerifyPhase { BuildTime, TransferTime, RestoreTime };

ErrorCode MismatchCodeFor(VerifyPhase phase);

class IntegrityVerifier {
  public:
    struct Options {
        IntegrityMode mode = IntegrityMode::PathKeyed;
        IProgress* progress_sink = nullptr;
    };

    IntegrityVerifier() = default;
    explicit IntegrityVerifier(const Options& opt) : opt_(opt) {}

    // Lists every regular member with its size and fingerprint, in archive order.
    Result ScanBundle(const std::string& bundle_path, FileList& out) const;

    // Re-reads all members and reconciles them with `expected`. Any failure,
    // including an unreadable bundle, is reported as the phase's mismatch.
    Result VerifyMembers(const std::string& bundle_path, const FileList& expected, VerifyPhase phase) const;

    Result VerifyBuild(const std::string& bundle_path, const FileList& expected) const {
        return VerifyMembers(bundle_path, expected, VerifyPhase::BuildTime);
    }

    Result VerifyBundleFingerprint(const std::string& bundle_path,
                                   std::string_view expected_fingerprint,
                                   VerifyPhase phase) const;

    Result Reconcile(const FileList& expected, const FileList& actual, VerifyPhase phase) const;

  private:
    Options opt_{};
};

} // namespace coldstash
