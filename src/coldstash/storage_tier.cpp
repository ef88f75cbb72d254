#include "coldstash/storage_tier.hpp"

namespace coldstash {

StorageTier StorageTierFromClass(std::string_view storage_class) {
    if (storage_class.empty() || storage_class == "STANDARD") return StorageTier::Standard;
    if (storage_class == "STANDARD_IA") return StorageTier::StandardInfrequent;
    if (storage_class == "GLACIER_IR") return StorageTier::GlacierInstant;
    if (storage_class == "GLACIER") return StorageTier::Glacier;
    if (storage_class == "DEEP_ARCHIVE") return StorageTier::DeepArchive;
    return StorageTier::Unknown;
}

const char* StorageTierName(StorageTier tier) {
    switch (tier) {
        case StorageTier::Standard:           return "STANDARD";
        case StorageTier::StandardInfrequent: return "STANDARD_IA";
        case StorageTier::GlacierInstant:     return "GLACIER_IR";
        case StorageTier::Glacier:            return "GLACIER";
        case StorageTier::DeepArchive:        return "DEEP_ARCHIVE";
        case StorageTier::ManagedArchive:     return "MANAGED_ARCHIVE";
        case StorageTier::Unknown:            return "UNKNOWN";
    }
    return "UNKNOWN";
}

bool IsValidStorageClass(std::string_view storage_class) {
    return !storage_class.empty() && StorageTierFromClass(storage_class) != StorageTier::Unknown;
}

} // namespace coldstash
