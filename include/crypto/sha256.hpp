#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace coldstash {

// Fingerprints are lowercase hex SHA-256 digests.
inline constexpr size_t kFingerprintHexLength = 64;

std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(std::string_view data);
std::string Sha256Hex(IReader& reader);

// Hashes a whole file through a read-only memory mapping, 1 MiB at a time.
Result Sha256HexFile(const std::string& path, std::string& out_hex);

bool IsFingerprint(std::string_view s);
// Case-insensitive comparison of two hex digests.
bool FingerprintsEqual(std::string_view a, std::string_view b);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    // Returns false once the digest context has failed.
    bool Update(std::span<const std::uint8_t> data);
    // Empty string on failure.
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace coldstash
