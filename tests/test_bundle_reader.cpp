#include "coldstash/bundle_reader.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace coldstash {
namespace {

TEST(BundleReaderTest, IteratesRegularMembersOfGzipTar) {
    testutil::MemoryReader src(testutil::BuildTar(
        {
            {.path = "dir", .contents = "", .file_type = AE_IFDIR},
            {.path = "./dir/a.txt", .contents = "alpha", .file_type = AE_IFREG},
            {.path = "b.txt", .contents = "bravo!", .file_type = AE_IFREG},
        },
        /*gzip=*/true));

    BundleReader reader;
    ASSERT_TRUE(reader.Open(src).is_ok());

    BundleMemberInfo info;
    bool eof = false;
    ASSERT_TRUE(reader.Next(info, eof).is_ok());
    ASSERT_FALSE(eof);
    EXPECT_EQ(info.path, "dir/a.txt");
    EXPECT_EQ(info.size, 5u);

    std::unique_ptr<IReader> member;
    ASSERT_TRUE(reader.OpenCurrentMemberReader(member).is_ok());
    EXPECT_EQ(testutil::ReadAll(*member), "alpha");

    ASSERT_TRUE(reader.Next(info, eof).is_ok());
    ASSERT_FALSE(eof);
    EXPECT_EQ(info.path, "b.txt");
    ASSERT_TRUE(reader.SkipCurrent().is_ok());

    ASSERT_TRUE(reader.Next(info, eof).is_ok());
    EXPECT_TRUE(eof);
}

TEST(BundleReaderTest, ReadsUncompressedTar) {
    testutil::MemoryReader src(testutil::BuildTar({{.path = "x", .contents = "1"}}));

    BundleReader reader;
    ASSERT_TRUE(reader.Open(src).is_ok());
    BundleMemberInfo info;
    bool eof = true;
    ASSERT_TRUE(reader.Next(info, eof).is_ok());
    EXPECT_FALSE(eof);
    EXPECT_EQ(info.path, "x");
}

TEST(BundleReaderTest, RejectsGarbage) {
    testutil::MemoryReader src(std::string(4096, 'q'));
    BundleReader reader;
    auto res = reader.Open(src);
    if (res.is_ok()) {
        BundleMemberInfo info;
        bool eof = false;
        res = reader.Next(info, eof);
    }
    EXPECT_FALSE(res.is_ok());
}

} // namespace
} // namespace coldstash
