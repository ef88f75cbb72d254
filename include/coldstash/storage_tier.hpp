#pragma once

#include <string_view>

namespace coldstash {

enum class StorageTier {
    Standard,           // STANDARD
    StandardInfrequent, // STANDARD_IA
    GlacierInstant,     // GLACIER_IR
    Glacier,            // GLACIER
    DeepArchive,        // DEEP_ARCHIVE
    ManagedArchive,     // remote archive filesystem, no self-service restore
    Unknown,
};

// Object-store storage class name -> tier. An empty class is STANDARD.
StorageTier StorageTierFromClass(std::string_view storage_class);
const char* StorageTierName(StorageTier tier);

bool IsValidStorageClass(std::string_view storage_class);

inline bool IsInstantAccess(StorageTier t) {
    return t == StorageTier::Standard || t == StorageTier::StandardInfrequent ||
           t == StorageTier::GlacierInstant;
}

inline bool IsArchival(StorageTier t) {
    return t == StorageTier::Glacier || t == StorageTier::DeepArchive;
}

} // namespace coldstash
