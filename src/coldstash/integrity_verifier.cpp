#include "coldstash/integrity_verifier.hpp"

#include "coldstash/bundle_reader.hpp"
#include "crypto/sha256.hpp"
#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <utility>
#include <vector>

namespace coldstash {

namespace {

const char* PhaseName(VerifyPhase phase) {
    switch (phase) {
        case VerifyPhase::BuildTime:    return "build";
        case VerifyPhase::TransferTime: return "transfer";
        case VerifyPhase::RestoreTime:  return "restore";
    }
    return "unknown";
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

using Keyed = std::vector<std::pair<std::string, std::string>>;

Keyed SortedPairs(const FileList& files) {
    Keyed out;
    out.reserve(files.size());
    for (const auto& f : files) out.emplace_back(f.path, Lower(f.fingerprint));
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

std::optional<IntegrityMode> ParseIntegrityMode(std::string_view s) {
    if (s == "path") return IntegrityMode::PathKeyed;
    if (s == "set") return IntegrityMode::FingerprintSet;
    return std::nullopt;
}

const char* IntegrityModeName(IntegrityMode mode) {
    return mode == IntegrityMode::FingerprintSet ? "set" : "path";
}

ErrorCode MismatchCodeFor(VerifyPhase phase) {
    switch (phase) {
        case VerifyPhase::BuildTime:    return ErrorCode::IntegrityMismatchBuildTime;
        case VerifyPhase::TransferTime: return ErrorCode::IntegrityMismatchTransferTime;
        case VerifyPhase::RestoreTime:  return ErrorCode::IntegrityMismatchRestoreTime;
    }
    return ErrorCode::IntegrityMismatchBuildTime;
}

Result IntegrityVerifier::ScanBundle(const std::string& bundle_path, FileList& out) const {
    out.clear();

    FileReader file;
    auto r = FileReader::Open(bundle_path, file);
    if (!r.is_ok()) return r;

    BundleReader reader;
    r = reader.Open(file);
    if (!r.is_ok()) return r;

    const std::string subject = std::filesystem::path(bundle_path).filename().string();
    std::uint64_t scanned = 0;

    while (true) {
        BundleMemberInfo info;
        bool eof = false;
        r = reader.Next(info, eof);
        if (!r.is_ok()) return r;
        if (eof) break;

        std::unique_ptr<IReader> member;
        r = reader.OpenCurrentMemberReader(member);
        if (!r.is_ok()) return r;

        FileEntry entry;
        entry.path = info.path;
        entry.size = info.size;
        entry.fingerprint = Sha256Hex(*member);
        if (entry.fingerprint.empty()) {
            return Result::Fail(-1, "cannot read member " + info.path + " of " + bundle_path);
        }

        scanned += info.size;
        if (opt_.progress_sink) {
            opt_.progress_sink->OnProgress({.stage = "verify", .subject = subject, .done = scanned, .total = 0});
        }
        out.push_back(std::move(entry));
    }
    return Result::Ok();
}

Result IntegrityVerifier::VerifyMembers(const std::string& bundle_path,
                                        const FileList& expected,
                                        VerifyPhase phase) const {
    FileList actual;
    auto r = ScanBundle(bundle_path, actual);
    if (!r.is_ok()) {
        return Result::Fail(MismatchCodeFor(phase),
                            std::string(PhaseName(phase)) + "-time verification of " + bundle_path +
                                " failed: " + r.msg);
    }
    r = Reconcile(expected, actual, phase);
    if (!r.is_ok()) return r;

    LogInfo("Verified %zu members of %s (%s-time, %s mode)",
            actual.size(), bundle_path.c_str(), PhaseName(phase), IntegrityModeName(opt_.mode));
    return Result::Ok();
}

Result IntegrityVerifier::VerifyBundleFingerprint(const std::string& bundle_path,
                                                  std::string_view expected_fingerprint,
                                                  VerifyPhase phase) const {
    std::string actual;
    auto r = Sha256HexFile(bundle_path, actual);
    if (!r.is_ok()) {
        return Result::Fail(MismatchCodeFor(phase), "cannot fingerprint " + bundle_path + ": " + r.msg);
    }
    if (!FingerprintsEqual(actual, expected_fingerprint)) {
        return Result::Fail(MismatchCodeFor(phase),
                            "bundle fingerprint mismatch for " + bundle_path + ": expected " +
                                std::string(expected_fingerprint) + ", got " + actual);
    }
    LogDebug("Bundle fingerprint ok (%s-time): %s", PhaseName(phase), actual.c_str());
    return Result::Ok();
}

Result IntegrityVerifier::Reconcile(const FileList& expected,
                                    const FileList& actual,
                                    VerifyPhase phase) const {
    const ErrorCode code = MismatchCodeFor(phase);

    if (opt_.mode == IntegrityMode::FingerprintSet) {
        std::set<std::string> want;
        std::set<std::string> got;
        for (const auto& f : expected) want.insert(Lower(f.fingerprint));
        for (const auto& f : actual) got.insert(Lower(f.fingerprint));
        if (want == got) return Result::Ok();

        for (const auto& f : expected) {
            if (!got.contains(Lower(f.fingerprint))) {
                return Result::Fail(code, "no member matches the fingerprint of " + f.path);
            }
        }
        for (const auto& f : actual) {
            if (!want.contains(Lower(f.fingerprint))) {
                return Result::Fail(code, "unexpected member content: " + f.path);
            }
        }
        return Result::Fail(code, "fingerprint sets differ");
    }

    const Keyed want = SortedPairs(expected);
    const Keyed got = SortedPairs(actual);
    const size_t n = std::min(want.size(), got.size());
    for (size_t i = 0; i < n; ++i) {
        if (want[i].first != got[i].first) {
            const auto& missing = want[i].first < got[i].first ? want[i].first : got[i].first;
            return Result::Fail(code, "member set differs at " + missing);
        }
        if (want[i].second != got[i].second) {
            return Result::Fail(code, "fingerprint mismatch for " + want[i].first);
        }
    }
    if (want.size() > n) return Result::Fail(code, "missing member " + want[n].first);
    if (got.size() > n) return Result::Fail(code, "unexpected member " + got[n].first);
    return Result::Ok();
}

} // namespace coldstash
