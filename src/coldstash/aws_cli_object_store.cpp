#include "coldstash/aws_cli_object_store.hpp"

#include "io/file_reader.hpp"
#include "io/mapped_file.hpp"
#include "util/logger.hpp"
#include "util/parallel.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <expected>
#include <filesystem>
#include <mutex>
#include <unistd.h>

namespace coldstash {

using json = nlohmann::json;

namespace {

bool LooksLikeNotFound(const CommandOutput& out) {
    return out.err.find("404") != std::string::npos || out.err.find("Not Found") != std::string::npos ||
           out.err.find("NoSuchKey") != std::string::npos;
}

std::string Trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

std::expected<json, std::string> ParseObject(const std::string& text) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) return std::unexpected("expected a JSON object");
        return j;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid JSON: ") + e.what());
    }
}

} // namespace

std::vector<PartRange> SplitIntoParts(std::uint64_t size, std::uint64_t chunk) {
    std::vector<PartRange> parts;
    if (chunk == 0) chunk = kDefaultMultipartChunk;
    int number = 1;
    for (std::uint64_t off = 0; off < size; off += chunk) {
        parts.push_back({.number = number++, .offset = off, .length = std::min(chunk, size - off)});
    }
    return parts;
}

std::uint64_t PartSizeFor(std::uint64_t size, std::uint64_t chunk) {
    constexpr std::uint64_t kMiB = 1024 * 1024;
    if (chunk == 0) chunk = kDefaultMultipartChunk;
    if (size <= chunk * kMaxMultipartParts) return chunk;
    const std::uint64_t needed = (size + kMaxMultipartParts - 1) / kMaxMultipartParts;
    return std::max(chunk, (needed + kMiB - 1) / kMiB * kMiB);
}

AwsCliObjectStoreClient::AwsCliObjectStoreClient(std::shared_ptr<ICommandRunner> runner)
    : AwsCliObjectStoreClient(std::move(runner), Options{}) {}

AwsCliObjectStoreClient::AwsCliObjectStoreClient(std::shared_ptr<ICommandRunner> runner, Options opt)
    : runner_(std::move(runner)), opt_(std::move(opt)) {}

CommandSpec AwsCliObjectStoreClient::S3Api(const std::string& op, std::vector<std::string> args) const {
    CommandSpec spec;
    spec.program = opt_.cli;
    spec.args = {"s3api", op};
    spec.args.insert(spec.args.end(), args.begin(), args.end());
    if (!opt_.region.empty()) {
        spec.args.push_back("--region");
        spec.args.push_back(opt_.region);
    }
    spec.args.push_back("--output");
    spec.args.push_back("json");
    return spec;
}

Result AwsCliObjectStoreClient::RunChecked(const CommandSpec& spec, CommandOutput& out, ErrorCode on_failure) {
    auto r = runner_->Run(spec, out);
    if (!r.is_ok()) return Result::Fail(ErrorCode::BackendUnavailable, r.msg);
    if (!out.Succeeded()) {
        return Result::Fail(on_failure, "'" + DescribeCommand(spec) + "' exited with " +
                                            std::to_string(out.exit_code) + ": " + Trimmed(out.err));
    }
    return Result::Ok();
}

Result AwsCliObjectStoreClient::HeadBucket(const std::string& bucket) {
    CommandOutput out;
    return RunChecked(S3Api("head-bucket", {"--bucket", bucket}), out, ErrorCode::BackendUnavailable);
}

Result AwsCliObjectStoreClient::HeadObject(const std::string& bucket,
                                           const std::string& key,
                                           std::optional<ObjectHead>& out) {
    out.reset();
    const auto spec = S3Api("head-object", {"--bucket", bucket, "--key", key});

    CommandOutput res;
    auto r = runner_->Run(spec, res);
    if (!r.is_ok()) return Result::Fail(ErrorCode::BackendUnavailable, r.msg);
    if (!res.Succeeded()) {
        if (LooksLikeNotFound(res)) return Result::Ok();
        return Result::Fail(ErrorCode::BackendUnavailable, "head-object " + key + ": " + Trimmed(res.err));
    }

    auto j = ParseObject(res.out);
    if (!j) return Result::Fail(ErrorCode::BackendUnavailable, "head-object " + key + ": " + j.error());

    ObjectHead head;
    head.size = j->value("ContentLength", 0ULL);
    head.storage_class = j->value("StorageClass", "");
    head.restore = j->value("Restore", "");
    out = std::move(head);
    return Result::Ok();
}

Result AwsCliObjectStoreClient::UploadObject(const std::string& local_path,
                                             const std::string& bucket,
                                             const std::string& key,
                                             const std::string& storage_class,
                                             IProgress* progress) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(local_path, ec);
    if (ec) return Result::Fail(ec.value(), "stat " + local_path + ": " + ec.message());

    Result r = size > opt_.multipart_threshold
                   ? MultipartUpload(local_path, size, bucket, key, storage_class, progress)
                   : PutObject(local_path, bucket, key, storage_class);
    if (r.is_ok() && progress) {
        progress->OnProgress({.stage = "upload", .subject = key, .done = size, .total = size});
    }
    return r;
}

Result AwsCliObjectStoreClient::PutObject(const std::string& local_path,
                                          const std::string& bucket,
                                          const std::string& key,
                                          const std::string& storage_class) {
    CommandOutput out;
    return RunChecked(S3Api("put-object", {"--bucket", bucket, "--key", key, "--body", local_path,
                                           "--storage-class", storage_class}),
                      out, ErrorCode::TransferFailed);
}

Result AwsCliObjectStoreClient::UploadPart(const std::string& local_path,
                                           const PartRange& part,
                                           const std::string& bucket,
                                           const std::string& key,
                                           const std::string& upload_id,
                                           std::string& etag) {
    // upload-part takes its body from a file, so each part is staged
    const std::string part_path = local_path + ".part" + std::to_string(part.number);
    {
        MappedFile src;
        auto r = MappedFile::Open(local_path, src);
        if (!r.is_ok()) return r;
        const auto bytes = src.Bytes().subspan(part.offset, part.length);

        FileWriter writer;
        r = FileWriter::Create(part_path, writer);
        if (r.is_ok()) r = writer.WriteAll(bytes);
        if (r.is_ok()) r = writer.Close();
        if (!r.is_ok()) {
            ::unlink(part_path.c_str());
            return r;
        }
    }

    Result last = Result::Ok();
    for (int attempt = 1; attempt <= std::max(1, opt_.part_attempts); ++attempt) {
        CommandOutput out;
        last = RunChecked(S3Api("upload-part", {"--bucket", bucket, "--key", key, "--part-number",
                                                std::to_string(part.number), "--upload-id", upload_id,
                                                "--body", part_path}),
                          out, ErrorCode::TransferFailed);
        if (last.is_ok()) {
            auto j = ParseObject(out.out);
            if (j && j->contains("ETag") && (*j)["ETag"].is_string()) {
                etag = (*j)["ETag"].get<std::string>();
                break;
            }
            last = Result::Fail(ErrorCode::TransferFailed,
                                "upload-part " + std::to_string(part.number) + ": response has no ETag");
        }
        LogWarn("part %d of %s failed (attempt %d): %s", part.number, key.c_str(), attempt, last.msg.c_str());
    }

    ::unlink(part_path.c_str());
    return last;
}

Result AwsCliObjectStoreClient::MultipartUpload(const std::string& local_path,
                                                std::uint64_t size,
                                                const std::string& bucket,
                                                const std::string& key,
                                                const std::string& storage_class,
                                                IProgress* progress) {
    const std::uint64_t part_size = PartSizeFor(size, opt_.multipart_chunk);
    if (part_size > kMaxPartSize) {
        return Result::Fail(ErrorCode::TransferFailed,
                            key + " is too large for a multipart upload (" + std::to_string(size) + " bytes)");
    }

    CommandOutput out;
    auto r = RunChecked(S3Api("create-multipart-upload",
                              {"--bucket", bucket, "--key", key, "--storage-class", storage_class}),
                        out, ErrorCode::TransferFailed);
    if (!r.is_ok()) return r;

    auto created = ParseObject(out.out);
    if (!created || !created->contains("UploadId") || !(*created)["UploadId"].is_string()) {
        return Result::Fail(ErrorCode::TransferFailed, "create-multipart-upload returned no UploadId");
    }
    const std::string upload_id = (*created)["UploadId"].get<std::string>();

    const auto parts = SplitIntoParts(size, part_size);
    std::vector<std::string> etags(parts.size());
    std::atomic<std::uint64_t> sent{0};
    std::mutex progress_mu;

    LogInfo("Multipart upload of %s: %zu parts, %u concurrent", key.c_str(), parts.size(), opt_.max_concurrency);

    r = ParallelFor(parts.size(), opt_.max_concurrency, [&](size_t i) -> Result {
        auto pr = UploadPart(local_path, parts[i], bucket, key, upload_id, etags[i]);
        if (!pr.is_ok()) return pr;
        const std::uint64_t done = sent.fetch_add(parts[i].length) + parts[i].length;
        if (progress) {
            std::lock_guard<std::mutex> lk(progress_mu);
            progress->OnProgress({.stage = "upload", .subject = key, .done = done, .total = size});
        }
        return Result::Ok();
    });

    if (r.is_ok()) {
        json doc;
        doc["Parts"] = json::array();
        for (size_t i = 0; i < parts.size(); ++i) {
            doc["Parts"].push_back({{"ETag", etags[i]}, {"PartNumber", parts[i].number}});
        }
        const std::string parts_json = local_path + ".parts.json";
        const std::string text = doc.dump();
        r = WriteFileAtomically(parts_json, std::span<const std::uint8_t>(
                                                reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
        if (r.is_ok()) {
            CommandOutput done;
            r = RunChecked(S3Api("complete-multipart-upload", {"--bucket", bucket, "--key", key, "--upload-id",
                                                               upload_id, "--multipart-upload",
                                                               "file://" + parts_json}),
                           done, ErrorCode::TransferFailed);
        }
        ::unlink(parts_json.c_str());
    }

    if (!r.is_ok()) {
        CommandOutput aborted;
        auto ar = RunChecked(S3Api("abort-multipart-upload", {"--bucket", bucket, "--key", key, "--upload-id", upload_id}),
                             aborted, ErrorCode::TransferFailed);
        if (!ar.is_ok()) LogWarn("abort of upload %s failed: %s", upload_id.c_str(), ar.msg.c_str());
        return Result::Fail(ErrorCode::TransferFailed, "multipart upload of " + key + " failed: " + r.msg);
    }
    return Result::Ok();
}

Result AwsCliObjectStoreClient::DownloadObject(const std::string& bucket,
                                               const std::string& key,
                                               const std::string& local_path,
                                               IProgress* progress) {
    CommandOutput out;
    auto r = RunChecked(S3Api("get-object", {"--bucket", bucket, "--key", key, local_path}), out,
                        ErrorCode::TransferFailed);
    if (!r.is_ok()) {
        ::unlink(local_path.c_str());
        return r;
    }
    if (progress) {
        auto j = ParseObject(out.out);
        const std::uint64_t n = j ? j->value("ContentLength", 0ULL) : 0;
        progress->OnProgress({.stage = "download", .subject = key, .done = n, .total = n});
    }
    return Result::Ok();
}

Result AwsCliObjectStoreClient::RestoreObject(const std::string& bucket,
                                              const std::string& key,
                                              int days,
                                              const std::string& tier) {
    const json request = {{"Days", days}, {"GlacierJobParameters", {{"Tier", tier}}}};

    CommandOutput out;
    const auto spec = S3Api("restore-object", {"--bucket", bucket, "--key", key, "--restore-request", request.dump()});
    auto r = RunChecked(spec, out, ErrorCode::TransferFailed);
    if (!r.is_ok() && out.err.find("RestoreAlreadyInProgress") != std::string::npos) {
        LogInfo("Restore of %s is already in progress", key.c_str());
        return Result::Ok();
    }
    return r;
}

} // namespace coldstash
