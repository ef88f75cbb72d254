#include "coldstash/aws_cli_object_store.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace coldstash {
namespace {

using testutil::ArgAfter;
using testutil::Exited;

const std::string& Op(const CommandSpec& spec) { return spec.args.at(1); }

TEST(SplitIntoPartsTest, CoversFileWithFinalShortPart) {
    const auto parts = SplitIntoParts(25, 10);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0].number, 1);
    EXPECT_EQ(parts[0].offset, 0u);
    EXPECT_EQ(parts[2].number, 3);
    EXPECT_EQ(parts[2].offset, 20u);
    EXPECT_EQ(parts[2].length, 5u);
    EXPECT_TRUE(SplitIntoParts(0, 10).empty());
    EXPECT_EQ(SplitIntoParts(10, 10).size(), 1u);
}

TEST(SplitIntoPartsTest, PartSizeGrowsToStayWithinPartLimit) {
    constexpr std::uint64_t kMiB = 1024 * 1024;
    EXPECT_EQ(PartSizeFor(100 * kMiB, kDefaultMultipartChunk), kDefaultMultipartChunk);
    EXPECT_EQ(PartSizeFor(kDefaultMultipartChunk * kMaxMultipartParts, kDefaultMultipartChunk),
              kDefaultMultipartChunk);

    for (std::uint64_t size : {300ULL * 1024 * kMiB, 2'000'000'000'000ULL}) {
        const std::uint64_t part = PartSizeFor(size, kDefaultMultipartChunk);
        EXPECT_EQ(part % kMiB, 0u) << size;
        EXPECT_LE(part, kMaxPartSize) << size;
        const auto parts = SplitIntoParts(size, part);
        EXPECT_LE(parts.size(), kMaxMultipartParts) << size;
        EXPECT_EQ(parts.back().offset + parts.back().length, size);
    }

    EXPECT_GT(PartSizeFor(kMaxPartSize * kMaxMultipartParts + 1, kDefaultMultipartChunk), kMaxPartSize);
}

TEST(AwsCliObjectStoreTest, CommandsCarryRegionAndJsonOutput) {
    auto runner = std::make_shared<testutil::FakeCommandRunner>();
    AwsCliObjectStoreClient client(runner, AwsCliObjectStoreClient::Options{.cli = "aws", .region = "us-west-2"});
    ASSERT_TRUE(client.HeadBucket("bucket").is_ok());

    const auto calls = runner->Calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].program, "aws");
    EXPECT_EQ(calls[0].args, (std::vector<std::string>{"s3api", "head-bucket", "--bucket", "bucket", "--region",
                                                       "us-west-2", "--output", "json"}));
}

TEST(AwsCliObjectStoreTest, HeadObjectParsesMetadataAndNotFound) {
    auto runner = std::make_shared<testutil::FakeCommandRunner>([](const CommandSpec& spec) {
        if (ArgAfter(spec, "--key") == "missing") return Exited(254, "", "An error occurred (404) when calling the HeadObject operation: Not Found");
        if (ArgAfter(spec, "--key") == "denied") return Exited(254, "", "An error occurred (403) Forbidden");
        return Exited(0, R"({"ContentLength": 42, "StorageClass": "GLACIER", "Restore": "ongoing-request=\"true\""})");
    });
    AwsCliObjectStoreClient client(runner);

    std::optional<ObjectHead> head;
    ASSERT_TRUE(client.HeadObject("bucket", "present", head).is_ok());
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head->size, 42u);
    EXPECT_EQ(head->storage_class, "GLACIER");
    EXPECT_EQ(head->restore, "ongoing-request=\"true\"");

    ASSERT_TRUE(client.HeadObject("bucket", "missing", head).is_ok());
    EXPECT_FALSE(head.has_value());

    auto res = client.HeadObject("bucket", "denied", head);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::BackendUnavailable);
}

TEST(AwsCliObjectStoreTest, SmallFileUsesSinglePut) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp / "b.tar.gz", "tiny");
    auto runner = std::make_shared<testutil::FakeCommandRunner>();
    AwsCliObjectStoreClient client(runner);

    ASSERT_TRUE(client.UploadObject(tmp / "b.tar.gz", "bucket", "b.tar.gz", "DEEP_ARCHIVE", nullptr).is_ok());
    const auto calls = runner->Calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(Op(calls[0]), "put-object");
    EXPECT_EQ(ArgAfter(calls[0], "--body"), tmp / "b.tar.gz");
    EXPECT_EQ(ArgAfter(calls[0], "--storage-class"), "DEEP_ARCHIVE");
}

TEST(AwsCliObjectStoreTest, LargeFileUsesMultipartSequence) {
    testutil::TemporaryDirectory tmp;
    const std::string data(10 * 1024 + 17, 'm');
    testutil::WriteFile(tmp / "big.tar.gz", data);

    std::mutex mu;
    std::map<int, std::string> part_bodies;
    std::string completed_parts;
    auto runner = std::make_shared<testutil::FakeCommandRunner>([&](const CommandSpec& spec) {
        if (Op(spec) == "create-multipart-upload") return Exited(0, R"({"UploadId": "up-1"})");
        if (Op(spec) == "upload-part") {
            const int n = std::stoi(ArgAfter(spec, "--part-number"));
            std::lock_guard<std::mutex> lk(mu);
            part_bodies[n] = testutil::ReadFile(ArgAfter(spec, "--body"));
            return Exited(0, "{\"ETag\": \"\\\"etag-" + std::to_string(n) + "\\\"\"}");
        }
        if (Op(spec) == "complete-multipart-upload") {
            const std::string uri = ArgAfter(spec, "--multipart-upload");
            completed_parts = testutil::ReadFile(uri.substr(std::string("file://").size()));
            return Exited(0, "{}");
        }
        return Exited(1, "", "unexpected " + Op(spec));
    });
    AwsCliObjectStoreClient client(runner, AwsCliObjectStoreClient::Options{
                                               .multipart_threshold = 4096, .multipart_chunk = 4096, .max_concurrency = 2});

    auto res = client.UploadObject(tmp / "big.tar.gz", "bucket", "big.tar.gz", "GLACIER", nullptr);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(runner->CountWhere(1, "create-multipart-upload"), 1u);
    EXPECT_EQ(runner->CountWhere(1, "upload-part"), 3u);
    EXPECT_EQ(runner->CountWhere(1, "complete-multipart-upload"), 1u);
    EXPECT_EQ(runner->CountWhere(1, "abort-multipart-upload"), 0u);

    ASSERT_EQ(part_bodies.size(), 3u);
    EXPECT_EQ(part_bodies[1] + part_bodies[2] + part_bodies[3], data);

    const auto doc = nlohmann::json::parse(completed_parts);
    ASSERT_EQ(doc["Parts"].size(), 3u);
    EXPECT_EQ(doc["Parts"][0]["PartNumber"], 1);
    EXPECT_EQ(doc["Parts"][2]["ETag"], "\"etag-3\"");

    EXPECT_FALSE(testutil::Exists(tmp / "big.tar.gz.part1"));
    EXPECT_FALSE(testutil::Exists(tmp / "big.tar.gz.parts.json"));
}

TEST(AwsCliObjectStoreTest, FailedPartAbortsUpload) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp / "big.tar.gz", std::string(9000, 'x'));

    auto runner = std::make_shared<testutil::FakeCommandRunner>([](const CommandSpec& spec) {
        if (Op(spec) == "create-multipart-upload") return Exited(0, R"({"UploadId": "up-9"})");
        if (Op(spec) == "upload-part" && ArgAfter(spec, "--part-number") == "2") {
            return Exited(255, "", "Connection reset");
        }
        if (Op(spec) == "upload-part") return Exited(0, R"({"ETag": "e"})");
        return Exited(0, "{}");
    });
    AwsCliObjectStoreClient client(runner, AwsCliObjectStoreClient::Options{
                                               .multipart_threshold = 4096, .multipart_chunk = 4096,
                                               .max_concurrency = 1, .part_attempts = 2});

    auto res = client.UploadObject(tmp / "big.tar.gz", "bucket", "big.tar.gz", "GLACIER", nullptr);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::TransferFailed);
    EXPECT_EQ(runner->CountWhere(1, "complete-multipart-upload"), 0u);
    EXPECT_EQ(runner->CountWhere(1, "abort-multipart-upload"), 1u);

    size_t part2_attempts = 0;
    for (const auto& c : runner->Calls()) {
        if (Op(c) == "upload-part" && ArgAfter(c, "--part-number") == "2") ++part2_attempts;
    }
    EXPECT_EQ(part2_attempts, 2u);
}

TEST(AwsCliObjectStoreTest, RestoreRequestBodyAndAlreadyInProgress) {
    auto runner = std::make_shared<testutil::FakeCommandRunner>([](const CommandSpec& spec) {
        if (ArgAfter(spec, "--key") == "busy") {
            return Exited(254, "", "An error occurred (RestoreAlreadyInProgress)");
        }
        return Exited(0, "");
    });
    AwsCliObjectStoreClient client(runner);

    ASSERT_TRUE(client.RestoreObject("bucket", "k", 7, "Bulk").is_ok());
    const auto body = nlohmann::json::parse(ArgAfter(runner->Calls()[0], "--restore-request"));
    EXPECT_EQ(body["Days"], 7);
    EXPECT_EQ(body["GlacierJobParameters"]["Tier"], "Bulk");

    EXPECT_TRUE(client.RestoreObject("bucket", "busy", 7, "Bulk").is_ok());
}

TEST(AwsCliObjectStoreTest, FailedDownloadRemovesPartialFile) {
    testutil::TemporaryDirectory tmp;
    const std::string local = tmp / "partial.tar.gz";
    auto runner = std::make_shared<testutil::FakeCommandRunner>([&](const CommandSpec&) {
        testutil::WriteFile(local, "half");
        return Exited(255, "", "Read timeout");
    });
    AwsCliObjectStoreClient client(runner);

    auto res = client.DownloadObject("bucket", "k", local, nullptr);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::TransferFailed);
    EXPECT_FALSE(testutil::Exists(local));
}

} // namespace
} // namespace coldstash
