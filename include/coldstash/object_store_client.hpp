#pragma once

#include "util/progress.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace coldstash {

struct ObjectHead {
    std::uint64_t size = 0;
    std::string storage_class; // empty for STANDARD
    std::string restore;       // raw restore header, empty if none
};

// Object-storage operations the cold storage backend needs. Implementations
// report connectivity and auth problems as BackendUnavailable.
class IObjectStoreClient {
  public:
    virtual ~IObjectStoreClient() = default;

    virtual Result HeadBucket(const std::string& bucket) = 0;
    // `out` stays empty when the object does not exist.
    virtual Result HeadObject(const std::string& bucket, const std::string& key, std::optional<ObjectHead>& out) = 0;
    virtual Result UploadObject(const std::string& local_path,
                                const std::string& bucket,
                                const std::string& key,
                                const std::string& storage_class,
                                IProgress* progress) = 0;
    virtual Result DownloadObject(const std::string& bucket,
                                  const std::string& key,
                                  const std::string& local_path,
                                  IProgress* progress) = 0;
    virtual Result RestoreObject(const std::string& bucket, const std::string& key, int days, const std::string& tier) = 0;
};

} // namespace coldstash
