#include <gtest/gtest.h>

#include "coldstash/file_enumerator.hpp"
#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <filesystem>

namespace coldstash {
namespace {

std::vector<std::string> Paths(const FileSet& set) {
    std::vector<std::string> out;
    for (const auto& f : set.files) out.push_back(f.path);
    return out;
}

TEST(FileEnumeratorTest, WalksDirectorySortedWithFingerprints) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp / "run/b.dat", "bravo");
    testutil::WriteFile(tmp / "run/a.dat", "alpha");
    testutil::WriteFile(tmp / "run/sub/c.dat", "");

    FileSet set;
    auto res = FileEnumerator().Enumerate(tmp / "run", set);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(set.root, tmp / "run");
    EXPECT_EQ(Paths(set), (std::vector<std::string>{"a.dat", "b.dat", "sub/c.dat"}));
    EXPECT_EQ(set.files[0].size, 5u);
    EXPECT_EQ(set.files[0].fingerprint, Sha256Hex(std::string_view("alpha")));
    EXPECT_EQ(set.files[2].size, 0u);
    EXPECT_EQ(set.files[2].fingerprint, Sha256Hex(std::string_view("")));
}

TEST(FileEnumeratorTest, SkipsHiddenEntriesAndArtifacts) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp / "run/keep.txt", "x");
    testutil::WriteFile(tmp / "run/.hidden", "x");
    testutil::WriteFile(tmp / "run/.git/objects/pack", "x");
    testutil::WriteFile(tmp / "run/coldstash.AbCdEfGhIjKlMnOpQrSt.tar.gz", "x");
    testutil::WriteFile(tmp / "run/coldstash.AbCdEfGhIjKlMnOpQrSt.json", "{}");
    testutil::WriteFile(tmp / "run/coldstash.AbCdEfGhIjKlMnOpQrSt.tar.gz.partial", "x");
    testutil::WriteFile(tmp / "run/coldstash.AbCdEfGhIjKlMnOpQrSt.tar.gz.part7", "x");
    testutil::WriteFile(tmp / "run/coldstash.AbCdEfGhIjKlMnOpQrSt.tar.gz.parts.json", "{}");
    std::filesystem::create_symlink(tmp / "run/keep.txt", tmp / "run/link.txt");

    FileSet set;
    auto res = FileEnumerator().Enumerate(tmp / "run", set);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(Paths(set), (std::vector<std::string>{"keep.txt"}));
}

TEST(FileEnumeratorTest, SingleFileIsRootedAtParent) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp / "one/data.bin", "payload");

    FileSet set;
    auto res = FileEnumerator().Enumerate(tmp / "one/data.bin", set);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(set.root, tmp / "one");
    ASSERT_EQ(set.files.size(), 1u);
    EXPECT_EQ(set.files[0].path, "data.bin");
    EXPECT_EQ(set.files[0].size, 7u);
}

TEST(FileEnumeratorTest, TrailingSlashResolvesToDirectory) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp / "run/a", "1");

    std::string root;
    bool is_file = true;
    auto res = FileEnumerator::ResolveRoot(tmp / "run/", root, is_file);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_FALSE(is_file);
    EXPECT_EQ(root, tmp / "run");
}

TEST(FileEnumeratorTest, MissingPathIsInvalidInput) {
    testutil::TemporaryDirectory tmp;
    FileSet set;
    auto res = FileEnumerator().Enumerate(tmp / "nope", set);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::InvalidInputPath);
}

TEST(FileEnumeratorTest, DirectoryWithOnlyHiddenFilesIsEmpty) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp / "run/.cache", "x");

    FileSet set;
    auto res = FileEnumerator().Enumerate(tmp / "run", set);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::EmptyFileSet);
}

TEST(FileEnumeratorTest, SerialAndParallelHashingAgree) {
    testutil::TemporaryDirectory tmp;
    for (int i = 0; i < 40; ++i) {
        testutil::WriteFile(tmp / ("run/f" + std::to_string(i)), std::string(static_cast<size_t>(i) * 97, 'z'));
    }

    FileSet serial;
    FileSet parallel;
    ASSERT_TRUE(FileEnumerator(FileEnumerator::Options{.hash_workers = 1}).Enumerate(tmp / "run", serial).is_ok());
    ASSERT_TRUE(FileEnumerator(FileEnumerator::Options{.hash_workers = 4}).Enumerate(tmp / "run", parallel).is_ok());
    EXPECT_EQ(serial.files, parallel.files);
}

} // namespace
} // namespace coldstash
