#include "coldstash/cold_storage_backend.hpp"

#include "util/logger.hpp"

#include <filesystem>

namespace coldstash {

ColdStorageBackend::ColdStorageBackend(std::shared_ptr<IObjectStoreClient> client)
    : ColdStorageBackend(std::move(client), Options{}) {}

ColdStorageBackend::ColdStorageBackend(std::shared_ptr<IObjectStoreClient> client, Options opt)
    : client_(std::move(client)), opt_(std::move(opt)) {}

Result ColdStorageBackend::LocatorExists(const BackendDescriptor& desc,
                                         const std::string& object_name,
                                         bool& exists) {
    exists = false;
    auto r = client_->HeadBucket(desc.cold_storage.bucket);
    if (!r.is_ok()) return r;

    std::optional<ObjectHead> head;
    r = client_->HeadObject(desc.cold_storage.bucket, object_name, head);
    if (!r.is_ok()) return r;
    exists = head.has_value();
    return Result::Ok();
}

Result ColdStorageBackend::Upload(const std::string& bundle_path,
                                  const BackendDescriptor& desc,
                                  IProgress* progress,
                                  RemoteLocator& out) {
    const std::string key = std::filesystem::path(bundle_path).filename().string();
    const std::string& bucket = desc.cold_storage.bucket;

    bool exists = false;
    auto r = LocatorExists(desc, key, exists);
    if (!r.is_ok()) return r;
    if (exists && !desc.overwrite) {
        return Result::Fail(ErrorCode::ObjectAlreadyExists,
                            "s3://" + bucket + "/" + key + " already exists; pass overwrite to replace it");
    }

    LogInfo("Uploading %s to s3://%s/%s (%s)",
            bundle_path.c_str(), bucket.c_str(), key.c_str(), desc.cold_storage.storage_class.c_str());
    r = client_->UploadObject(bundle_path, bucket, key, desc.cold_storage.storage_class, progress);
    if (!r.is_ok()) return r;

    out = RemoteLocator{.container = bucket, .object = key};
    return Result::Ok();
}

Result ColdStorageBackend::Head(const RemoteLocator& loc, ObjectHead& out) {
    std::optional<ObjectHead> head;
    auto r = client_->HeadObject(loc.container, loc.object, head);
    if (!r.is_ok()) return r;
    if (!head) {
        return Result::Fail(ErrorCode::TransferFailed, "object not found: s3://" + loc.ToString());
    }
    out = std::move(*head);
    return Result::Ok();
}

Result ColdStorageBackend::TierOf(const RemoteLocator& loc, StorageTier& out) {
    ObjectHead head;
    auto r = Head(loc, head);
    if (!r.is_ok()) return r;
    out = StorageTierFromClass(head.storage_class);
    LogDebug("s3://%s storage class '%s'", loc.ToString().c_str(), head.storage_class.c_str());
    return Result::Ok();
}

Result ColdStorageBackend::QueryRestore(const RemoteLocator& loc, RestoreStatus& out) {
    ObjectHead head;
    auto r = Head(loc, head);
    if (!r.is_ok()) return r;
    out = ParseRestoreHeader(head.restore);
    return Result::Ok();
}

Result ColdStorageBackend::RequestRestore(const RemoteLocator& loc) {
    LogInfo("Requesting restore of s3://%s (%d days, %s tier)",
            loc.ToString().c_str(), opt_.restore_days, opt_.restore_tier.c_str());
    return client_->RestoreObject(loc.container, loc.object, opt_.restore_days, opt_.restore_tier);
}

Result ColdStorageBackend::Download(const RemoteLocator& loc, const std::string& local_path, IProgress* progress) {
    LogInfo("Downloading s3://%s to %s", loc.ToString().c_str(), local_path.c_str());
    return client_->DownloadObject(loc.container, loc.object, local_path, progress);
}

} // namespace coldstash
