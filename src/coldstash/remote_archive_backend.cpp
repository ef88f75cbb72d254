#include "coldstash/remote_archive_backend.hpp"

#include "util/logger.hpp"

#include <filesystem>

namespace coldstash {

namespace {

std::string JoinRemote(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

} // namespace

Result RemoteArchiveBackend::LocatorExists(const BackendDescriptor& desc,
                                           const std::string& object_name,
                                           bool& exists) {
    const auto& ra = desc.remote_archive;
    return agent_->PathExists(ra.endpoint, JoinRemote(ra.path, object_name), exists);
}

Result RemoteArchiveBackend::Upload(const std::string& bundle_path,
                                    const BackendDescriptor& desc,
                                    IProgress* progress,
                                    RemoteLocator& out) {
    namespace fs = std::filesystem;
    const auto& ra = desc.remote_archive;
    const std::string name = fs::path(bundle_path).filename().string();
    const std::string source_endpoint = ra.local_endpoint.empty() ? ra.endpoint : ra.local_endpoint;

    auto r = agent_->LoginActive();
    if (!r.is_ok()) return r;

    bool dir_exists = false;
    r = agent_->PathExists(ra.endpoint, ra.path, dir_exists);
    if (!r.is_ok()) return r;
    if (!dir_exists) {
        LogInfo("Creating remote directory %s:%s", ra.endpoint.c_str(), ra.path.c_str());
        r = agent_->CreateDirectory(ra.endpoint, ra.path);
        if (!r.is_ok()) return r;
    } else {
        bool exists = false;
        r = LocatorExists(desc, name, exists);
        if (!r.is_ok()) return r;
        if (exists && !desc.overwrite) {
            return Result::Fail(ErrorCode::ObjectAlreadyExists,
                                ra.endpoint + ":" + JoinRemote(ra.path, name) +
                                    " already exists; pass overwrite to replace it");
        }
    }

    std::error_code ec;
    const std::string abs_source = fs::absolute(bundle_path, ec).string();
    std::string task_id;
    r = agent_->SubmitTransfer(source_endpoint + ":" + abs_source,
                               ra.endpoint + ":" + JoinRemote(ra.path, name),
                               /*verify_checksum=*/true, task_id);
    if (!r.is_ok()) return r;
    LogInfo("Transferring %s (task id: %s)", name.c_str(), task_id.c_str());

    r = agent_->WaitForTask(task_id);
    if (!r.is_ok()) return r;

    TaskInfo info;
    r = agent_->TaskStatus(task_id, info);
    if (!r.is_ok()) return r;
    if (info.status != kTaskSucceeded) {
        return Result::Fail(ErrorCode::TransferFailed,
                            "transfer task " + task_id + " ended with status " + info.status +
                                (info.nice_status.empty() ? "" : " (" + info.nice_status + ")") +
                                "; destination " + ra.endpoint + ":" + ra.path);
    }

    if (progress) {
        const auto size = fs::file_size(bundle_path, ec);
        const std::uint64_t n = ec ? 0 : static_cast<std::uint64_t>(size);
        progress->OnProgress({.stage = "upload", .subject = name, .done = n, .total = n});
    }
    out = RemoteLocator{.container = ra.path, .object = name};
    return Result::Ok();
}

Result RemoteArchiveBackend::Unsupported(const RemoteLocator& loc) {
    return Result::Fail(ErrorCode::RestoreUnsupported,
                        loc.ToString() + " is on the managed archive; retrieval must be requested manually");
}

Result RemoteArchiveBackend::TierOf(const RemoteLocator&, StorageTier& out) {
    out = StorageTier::ManagedArchive;
    return Result::Ok();
}

Result RemoteArchiveBackend::QueryRestore(const RemoteLocator& loc, RestoreStatus&) { return Unsupported(loc); }

Result RemoteArchiveBackend::RequestRestore(const RemoteLocator& loc) { return Unsupported(loc); }

Result RemoteArchiveBackend::Download(const RemoteLocator& loc, const std::string&, IProgress*) {
    return Unsupported(loc);
}

} // namespace coldstash
