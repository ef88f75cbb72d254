#pragma once

#include "coldstash/manifest.hpp"
#include "coldstash/storage_tier.hpp"
#include "util/progress.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>

namespace coldstash {

// Which backend an archive goes to. Only the resolved container string
// ends up in the manifest (archivePath).
struct BackendDescriptor {
    LocationKind kind = LocationKind::ColdStorage;

    struct ColdStorage {
        std::string bucket;
        std::string region;
        std::string storage_class = "DEEP_ARCHIVE";
    } cold_storage;

    struct RemoteArchive {
        std::string endpoint;       // destination collection
        std::string local_endpoint; // collection that sees this host's files
        std::string path;           // destination directory
    } remote_archive;

    bool overwrite = false;

    // Bucket or remote directory.
    std::string Container() const;
};

struct RemoteLocator {
    std::string container; // bucket or remote directory
    std::string object;    // bundle file name

    std::string ToString() const;
};

RemoteLocator LocatorFromManifest(const Manifest& m);

enum class RestoreProgress { NotRequested, Ongoing, Completed };

struct RestoreStatus {
    RestoreProgress progress = RestoreProgress::NotRequested;
    std::string expiry; // set once completed, if reported
};

// Parses an object-store restore header such as
//   ongoing-request="false", expiry-date="Fri, 21 Dec 2012 00:00:00 GMT"
// An empty header means no restore was requested.
RestoreStatus ParseRestoreHeader(std::string_view header);

class TransferBackend {
  public:
    virtual ~TransferBackend() = default;

    virtual LocationKind Kind() const = 0;

    virtual Result Upload(const std::string& bundle_path,
                          const BackendDescriptor& desc,
                          IProgress* progress,
                          RemoteLocator& out) = 0;
    virtual Result LocatorExists(const BackendDescriptor& desc, const std::string& object_name, bool& exists) = 0;
    virtual Result TierOf(const RemoteLocator& loc, StorageTier& out) = 0;
    virtual Result QueryRestore(const RemoteLocator& loc, RestoreStatus& out) = 0;
    virtual Result RequestRestore(const RemoteLocator& loc) = 0;
    virtual Result Download(const RemoteLocator& loc, const std::string& local_path, IProgress* progress) = 0;
};

} // namespace coldstash
