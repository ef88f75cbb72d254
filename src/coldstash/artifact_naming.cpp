#include "coldstash/artifact_naming.hpp"

#include <openssl/rand.h>

#include <array>
#include <cctype>

namespace coldstash {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

std::string ArtifactNaming::BundleName(std::string_view id) const {
    return prefix_ + "." + std::string(id) + std::string(kBundleExtension);
}

std::string ArtifactNaming::SidecarName(std::string_view id) const {
    return prefix_ + "." + std::string(id) + std::string(kSidecarExtension);
}

std::string ArtifactNaming::ExtractIdWithExtension(std::string_view name, std::string_view ext) const {
    const size_t head = prefix_.size() + 1;
    if (name.size() <= head + ext.size()) return {};
    if (name.substr(0, prefix_.size()) != prefix_ || name[prefix_.size()] != '.') return {};
    if (!EndsWith(name, ext)) return {};

    const std::string_view id = name.substr(head, name.size() - head - ext.size());
    if (!IsValidArchiveId(id)) return {};
    return std::string(id);
}

bool ArtifactNaming::IsBundleName(std::string_view name) const {
    return !ExtractIdWithExtension(name, kBundleExtension).empty();
}

bool ArtifactNaming::IsSidecarName(std::string_view name) const {
    return !ExtractIdWithExtension(name, kSidecarExtension).empty();
}

bool ArtifactNaming::IsStagingName(std::string_view name) const {
    const size_t ext = name.find(kBundleExtension);
    if (ext == std::string_view::npos) return false;
    const size_t bundle_end = ext + kBundleExtension.size();
    if (!IsBundleName(name.substr(0, bundle_end))) return false;

    std::string_view rest = name.substr(bundle_end);
    if (rest == ".partial" || rest == ".parts.json") return true;
    if (rest.size() <= 5 || rest.substr(0, 5) != ".part") return false;
    for (unsigned char c : rest.substr(5)) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

std::string ArtifactNaming::ExtractId(std::string_view name) const {
    std::string id = ExtractIdWithExtension(name, kBundleExtension);
    if (id.empty()) id = ExtractIdWithExtension(name, kSidecarExtension);
    return id;
}

bool IsValidArchiveId(std::string_view id) {
    if (id.empty()) return false;
    for (unsigned char c : id) {
        if (!std::isalnum(c)) return false;
    }
    return true;
}

Result GenerateArchiveId(std::string& out) {
    // Rejection sampling keeps the alphabet uniform: 248 = 4 * 62.
    constexpr unsigned kLimit = 248;
    out.clear();
    out.reserve(kArchiveIdLength);
    while (out.size() < kArchiveIdLength) {
        std::array<unsigned char, 32> buf{};
        if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
            out.clear();
            return Result::Fail(-1, "RAND_bytes failed while generating archive id");
        }
        for (unsigned char b : buf) {
            if (b >= kLimit) continue;
            out.push_back(kAlphabet[b % kAlphabet.size()]);
            if (out.size() == kArchiveIdLength) break;
        }
    }
    return Result::Ok();
}

} // namespace coldstash
