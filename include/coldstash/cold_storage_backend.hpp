#pragma once

#include "coldstash/object_store_client.hpp"
#include "coldstash/transfer_backend.hpp"

#include <memory>
#include <string>

namespace coldstash {

class ColdStorageBackend final : public TransferBackend {
  public:
    struct Options {
        int restore_days = 7;
        std::string restore_tier = "Bulk"; // Bulk, Standard, Expedited
    };

    explicit ColdStorageBackend(std::shared_ptr<IObjectStoreClient> client);
    ColdStorageBackend(std::shared_ptr<IObjectStoreClient> client, Options opt);

    LocationKind Kind() const override { return LocationKind::ColdStorage; }

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
    Result Head(const RemoteLocator& loc, ObjectHead& out);

    std::shared_ptr<IObjectStoreClient> client_;
    Options opt_{};
};

} // namespace coldstash
