#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <cctype>
#include <string>

namespace coldstash {

namespace {

constexpr const char* kAbc = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* kEmpty = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

} // namespace

TEST(Sha256Test, KnownVector) {
    testutil::MemoryReader reader(std::string("abc"));
    EXPECT_EQ(Sha256Hex(reader), kAbc);
    EXPECT_EQ(Sha256Hex(std::string_view("abc")), kAbc);
}

TEST(Sha256Test, EmptyFileHashesToEmptyDigest) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp / "empty", "");

    std::string hex;
    auto res = Sha256HexFile(tmp / "empty", hex);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(hex, kEmpty);
}

TEST(Sha256Test, FileMatchesInMemoryDigest) {
    testutil::TemporaryDirectory tmp;
    std::string data(3 * 1024 * 1024 + 11, '\0');
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<char>((i * 31) & 0xff);
    testutil::WriteFile(tmp / "big", data);

    std::string hex;
    auto res = Sha256HexFile(tmp / "big", hex);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(hex, Sha256Hex(std::string_view(data)));
}

TEST(Sha256Test, MissingFileFails) {
    testutil::TemporaryDirectory tmp;
    std::string hex;
    EXPECT_FALSE(Sha256HexFile(tmp / "missing", hex).is_ok());
}

TEST(Sha256Test, IncrementalHasherMatchesOneShot) {
    Sha256Hasher h;
    const std::string a = "a";
    const std::string bc = "bc";
    ASSERT_TRUE(h.Update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(a.data()), a.size())));
    ASSERT_TRUE(h.Update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(bc.data()), bc.size())));
    EXPECT_EQ(h.FinalHex(), kAbc);
}

TEST(Sha256Test, FingerprintHelpers) {
    EXPECT_TRUE(IsFingerprint(kAbc));
    EXPECT_FALSE(IsFingerprint("abc"));
    EXPECT_FALSE(IsFingerprint(std::string(64, 'g')));

    std::string upper = kAbc;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_TRUE(FingerprintsEqual(kAbc, upper));
    EXPECT_FALSE(FingerprintsEqual(kAbc, kEmpty));
    EXPECT_FALSE(FingerprintsEqual("", ""));
}

} // namespace coldstash
