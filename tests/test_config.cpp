#include "util/config.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace coldstash::config {
namespace {

TEST(ConfigTest, MissingOptionalFileGivesDefaults) {
    testutil::TemporaryDirectory tmp;
    Config cfg;
    ASSERT_TRUE(cfg.LoadFile(tmp / "absent.json", /*must_exist=*/false).is_ok());
    EXPECT_EQ(cfg.artifact_prefix, "coldstash");
    EXPECT_EQ(cfg.index_table, "archives");
    EXPECT_EQ(cfg.cold_storage.storage_class, "DEEP_ARCHIVE");
    EXPECT_EQ(cfg.cold_storage.restore_tier, "Bulk");
    EXPECT_EQ(cfg.cold_storage.restore_days, 7);
    EXPECT_EQ(cfg.restore.poll_interval_seconds, 120u);
    EXPECT_EQ(cfg.integrity_mode, IntegrityMode::PathKeyed);
    EXPECT_EQ(cfg.owner, CurrentUserName());
}

TEST(ConfigTest, MissingRequiredFileFails) {
    testutil::TemporaryDirectory tmp;
    Config cfg;
    auto r = cfg.LoadFile(tmp / "absent.json", /*must_exist=*/true);
    EXPECT_EQ(r.code, ErrorCode::InvalidConfig);
}

TEST(ConfigTest, FileOverridesDefaults) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp / "cfg.json", R"({
        "artifact_prefix": "lab",
        "owner": "jdoe",
        "index_table": "runs",
        "hash_workers": 3,
        "integrity_mode": "set",
        "log_level": "debug",
        "cold_storage": {"bucket": "cold", "region": "us-west-2", "storage_class": "GLACIER",
                         "restore_days": 2, "restore_tier": "Expedited"},
        "remote_archive": {"endpoint": "ep-1", "path": "/tape/lab"},
        "restore": {"poll_interval_seconds": 30, "deadline_seconds": 600}
    })");

    Config cfg;
    auto r = cfg.LoadFile(tmp / "cfg.json", true);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cfg.artifact_prefix, "lab");
    EXPECT_EQ(cfg.owner, "jdoe");
    EXPECT_EQ(cfg.index_table, "runs");
    EXPECT_EQ(cfg.hash_workers, 3u);
    EXPECT_EQ(cfg.integrity_mode, IntegrityMode::FingerprintSet);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
    EXPECT_EQ(cfg.cold_storage.bucket, "cold");
    EXPECT_EQ(cfg.cold_storage.region, "us-west-2");
    EXPECT_EQ(cfg.cold_storage.storage_class, "GLACIER");
    EXPECT_EQ(cfg.cold_storage.restore_days, 2);
    EXPECT_EQ(cfg.cold_storage.restore_tier, "Expedited");
    EXPECT_EQ(cfg.cold_storage.cli, "aws");
    EXPECT_EQ(cfg.remote_archive.endpoint, "ep-1");
    EXPECT_EQ(cfg.remote_archive.path, "/tape/lab");
    EXPECT_TRUE(cfg.remote_archive.local_endpoint.empty());
    EXPECT_EQ(cfg.restore.poll_interval_seconds, 30u);
    EXPECT_EQ(cfg.restore.deadline_seconds, 600u);
}

TEST(ConfigTest, ReloadResetsPreviousValues) {
    Config cfg;
    ASSERT_TRUE(cfg.LoadString(R"({"cold_storage": {"bucket": "a"}})").is_ok());
    ASSERT_TRUE(cfg.LoadString(R"({})").is_ok());
    EXPECT_TRUE(cfg.cold_storage.bucket.empty());
}

TEST(ConfigTest, RejectsWrongTypes) {
    Config cfg;
    EXPECT_EQ(cfg.LoadString(R"({"hash_workers": "four"})").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"({"hash_workers": -1})").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"({"cold_storage": []})").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"({"restore": {"deadline_seconds": 1.5}})").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"([1, 2])").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString("{not json").code, ErrorCode::InvalidConfig);
}

TEST(ConfigTest, RejectsUnknownEnumeratedValues) {
    Config cfg;
    EXPECT_EQ(cfg.LoadString(R"({"integrity_mode": "fuzzy"})").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"({"log_level": "chatty"})").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"({"cold_storage": {"storage_class": "COLD"}})").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"({"cold_storage": {"restore_tier": "Fast"}})").code, ErrorCode::InvalidConfig);
}

TEST(ConfigTest, ValidateChecksRanges) {
    Config cfg;
    EXPECT_EQ(cfg.LoadString(R"({"index_table": "drop table;"})").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"({"artifact_prefix": "a/b"})").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"({"cold_storage": {"multipart_chunk_bytes": 1048576}})").code,
              ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"({"cold_storage": {"restore_days": 0}})").code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.LoadString(R"({"restore": {"poll_interval_seconds": 0}})").code, ErrorCode::InvalidConfig);
}

TEST(ConfigTest, ValidateForNamesBackendRequirements) {
    Config cfg;
    ASSERT_TRUE(cfg.LoadString("{}").is_ok());
    EXPECT_EQ(cfg.ValidateFor(LocationKind::ColdStorage).code, ErrorCode::InvalidConfig);
    EXPECT_EQ(cfg.ValidateFor(LocationKind::RemoteArchive).code, ErrorCode::InvalidConfig);
    EXPECT_TRUE(cfg.ValidateFor(LocationKind::DryRun).is_ok());

    cfg.cold_storage.bucket = "cold";
    EXPECT_TRUE(cfg.ValidateFor(LocationKind::ColdStorage).is_ok());

    cfg.remote_archive.endpoint = "ep";
    EXPECT_EQ(cfg.ValidateFor(LocationKind::RemoteArchive).code, ErrorCode::InvalidConfig);
    cfg.remote_archive.path = "/tape";
    EXPECT_TRUE(cfg.ValidateFor(LocationKind::RemoteArchive).is_ok());
}

} // namespace
} // namespace coldstash::config
