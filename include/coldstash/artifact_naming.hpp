#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace coldstash {

inline constexpr std::string_view kDefaultArtifactPrefix = "coldstash";
inline constexpr std::string_view kBundleExtension = ".tar.gz";
inline constexpr std::string_view kSidecarExtension = ".json";
inline constexpr size_t kArchiveIdLength = 20;

// Names of the artifacts written next to archived content:
//   <prefix>.<id>.tar.gz  (bundle)
//   <prefix>.<id>.json    (sidecar manifest)
class ArtifactNaming {
  public:
    ArtifactNaming() : prefix_(kDefaultArtifactPrefix) {}
    explicit ArtifactNaming(std::string prefix) : prefix_(std::move(prefix)) {}

    const std::string& Prefix() const { return prefix_; }

    std::string BundleName(std::string_view id) const;
    std::string SidecarName(std::string_view id) const;

    bool IsBundleName(std::string_view name) const;
    bool IsSidecarName(std::string_view name) const;
    // Transient files next to a bundle while it is built or uploaded:
    // <bundle>.partial, <bundle>.partN, <bundle>.parts.json
    bool IsStagingName(std::string_view name) const;
    bool IsArtifactName(std::string_view name) const {
        return IsBundleName(name) || IsSidecarName(name) || IsStagingName(name);
    }

    // "<prefix>.<id>.<ext>" -> id; empty if the name is not an artifact.
    std::string ExtractId(std::string_view name) const;

  private:
    std::string ExtractIdWithExtension(std::string_view name, std::string_view ext) const;

    std::string prefix_;
};

bool IsValidArchiveId(std::string_view id);

// kArchiveIdLength characters from [A-Za-z0-9], drawn from the OpenSSL CSPRNG.
Result GenerateArchiveId(std::string& out);

} // namespace coldstash
