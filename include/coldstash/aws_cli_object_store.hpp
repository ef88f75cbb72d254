#pragma once

#include "coldstash/object_store_client.hpp"
#include "system/process_runner.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace coldstash {

inline constexpr std::uint64_t kDefaultMultipartThreshold = 25ULL * 1024 * 1024;
inline constexpr std::uint64_t kDefaultMultipartChunk = 25ULL * 1024 * 1024;
inline constexpr unsigned kDefaultUploadConcurrency = 10;
inline constexpr std::uint64_t kMaxMultipartParts = 10000;
inline constexpr std::uint64_t kMaxPartSize = 5ULL * 1024 * 1024 * 1024;

// Byte ranges of a multipart upload; the last part carries the remainder.
struct PartRange {
    int number = 0; // 1-based
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

std::vector<PartRange> SplitIntoParts(std::uint64_t size, std::uint64_t chunk);

// Smallest part size >= `chunk` (rounded up to whole MiB when grown) that
// keeps an object of `size` bytes within kMaxMultipartParts parts.
std::uint64_t PartSizeFor(std::uint64_t size, std::uint64_t chunk);

// IObjectStoreClient on top of `aws s3api`. Responses are parsed as JSON.
class AwsCliObjectStoreClient final : public IObjectStoreClient {
  public:
    struct Options {
        std::string cli = "aws";
        std::string region;
        std::uint64_t multipart_threshold = kDefaultMultipartThreshold;
        std::uint64_t multipart_chunk = kDefaultMultipartChunk;
        unsigned max_concurrency = kDefaultUploadConcurrency;
        int part_attempts = 3;
    };

    explicit AwsCliObjectStoreClient(std::shared_ptr<ICommandRunner> runner);
    AwsCliObjectStoreClient(std::shared_ptr<ICommandRunner> runner, Options opt);

    Result HeadBucket(const std::string& bucket) override;
    Result HeadObject(const std::string& bucket, const std::string& key, std::optional<ObjectHead>& out) override;
    Result UploadObject(const std::string& local_path,
                        const std::string& bucket,
                        const std::string& key,
                        const std::string& storage_class,
                        IProgress* progress) override;
    Result DownloadObject(const std::string& bucket,
                          const std::string& key,
                          const std::string& local_path,
                          IProgress* progress) override;
    Result RestoreObject(const std::string& bucket, const std::string& key, int days, const std::string& tier) override;

  private:
    CommandSpec S3Api(const std::string& op, std::vector<std::string> args) const;
    Result RunChecked(const CommandSpec& spec, CommandOutput& out, ErrorCode on_failure);

    Result PutObject(const std::string& local_path,
                     const std::string& bucket,
                     const std::string& key,
                     const std::string& storage_class);
    Result MultipartUpload(const std::string& local_path,
                           std::uint64_t size,
                           const std::string& bucket,
                           const std::string& key,
                           const std::string& storage_class,
                           IProgress* progress);
    Result UploadPart(const std::string& local_path,
                      const PartRange& part,
                      const std::string& bucket,
                      const std::string& key,
                      const std::string& upload_id,
                      std::string& etag);

    std::shared_ptr<ICommandRunner> runner_;
    Options opt_{};
};

} // namespace coldstash
