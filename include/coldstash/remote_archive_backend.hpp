#pragma once

#include "coldstash/transfer_agent.hpp"
#include "coldstash/transfer_backend.hpp"

#include <memory>

namespace coldstash {

// Managed archive filesystem reached through a transfer agent. Uploads are
// checksum-verified; restores are a manual, out-of-band process.
class RemoteArchiveBackend final : public TransferBackend {
  public:
    explicit RemoteArchiveBackend(std::shared_ptr<ITransferAgent> agent) : agent_(std::move(agent)) {}

    LocationKind Kind() const override { return LocationKind::RemoteArchive; }

    Result Upload(const std::string& bundle_path,
                  const BackendDescriptor& desc,
                  IProgress* progress,
                  RemoteLocator& out) override;
    Result LocatorExists(const BackendDescriptor& desc, const std::string& object_name, bool& exists) override;
    Result TierOf(const RemoteLocator& loc, StorageTier& out) override;
    Result QueryRestore(const RemoteLocator& loc, RestoreStatus& out) override;
    Result RequestRestore(const RemoteLocator& loc) override;
    Result Download(const RemoteLocator& loc, const std::string& local_path, IProgress* progress) override;

  private:
    static Result Unsupported(const RemoteLocator& loc);

    std::shared_ptr<ITransferAgent> agent_;
};

} // namespace coldstash
