#include "coldstash/manifest_store.hpp"
#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace coldstash {
namespace {

class FailingIndex final : public IManifestIndex {
  public:
    Result CreateTable() override { return Result::Ok(); }
    Result InsertRows(const std::vector<IndexRow>&) override {
        return Result::Fail(ErrorCode::IndexError, "disk full");
    }
    Result ReplaceArchive(const std::string&, const std::vector<IndexRow>&) override {
        return Result::Fail(ErrorCode::IndexError, "disk full");
    }
    Result SelectAll(std::vector<IndexRow>&) override { return Result::Ok(); }
    Result FindByFile(std::string_view, std::vector<IndexRow>&) override { return Result::Ok(); }
};

class ManifestStoreTest : public ::testing::Test {
  protected:
    Manifest MakeManifest(const std::string& id) const {
        Manifest m;
        m.id = id;
        m.timestamp = "2026-03-01 12:00:00";
        m.location = LocationKind::ColdStorage;
        m.filename = store.Naming().BundleName(id);
        m.local_path = tmp.Path();
        m.archive_path = "bucket";
        m.files = {{.path = "a.txt", .size = 1, .fingerprint = Sha256Hex(std::string_view("a"))}};
        m.bundle_fingerprint = Sha256Hex(std::string_view("b"));
        m.owner = "jdoe";
        return m;
    }

    void Age(const std::string& id, std::chrono::seconds by) {
        const auto path = tmp / store.Naming().SidecarName(id);
        std::filesystem::last_write_time(path, std::filesystem::last_write_time(path) - by);
    }

    testutil::TemporaryDirectory tmp;
    ManifestStore store{ArtifactNaming()};
};

TEST_F(ManifestStoreTest, CreateGeneratesFreshIdWhenNothingArchived) {
    std::string id;
    auto res = store.Create(tmp.Path(), {}, id);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(id.size(), kArchiveIdLength);
}

TEST_F(ManifestStoreTest, PersistThenLoad) {
    const Manifest m = MakeManifest("AAAAAAAAAAAAAAAAAAAA");
    ASSERT_TRUE(store.Persist(m).is_ok());
    EXPECT_TRUE(testutil::Exists(tmp / "coldstash.AAAAAAAAAAAAAAAAAAAA.json"));

    Manifest loaded;
    auto res = store.Load(tmp.Path(), loaded);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(loaded, m);
}

TEST_F(ManifestStoreTest, DuplicateGuard) {
    ASSERT_TRUE(store.Persist(MakeManifest("AAAAAAAAAAAAAAAAAAAA")).is_ok());

    std::string id;
    auto res = store.Create(tmp.Path(), {}, id);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::DuplicateArchiveExists);

    res = store.Create(tmp.Path(), CreateOptions{.force = true}, id);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_NE(id, "AAAAAAAAAAAAAAAAAAAA");

    res = store.Create(tmp.Path(), CreateOptions{.overwrite = true}, id);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(id, "AAAAAAAAAAAAAAAAAAAA");
}

TEST_F(ManifestStoreTest, LoadPicksNewestSidecar) {
    ASSERT_TRUE(store.Persist(MakeManifest("AAAAAAAAAAAAAAAAAAAA")).is_ok());
    ASSERT_TRUE(store.Persist(MakeManifest("BBBBBBBBBBBBBBBBBBBB")).is_ok());
    Age("BBBBBBBBBBBBBBBBBBBB", std::chrono::seconds(3600));

    Manifest loaded;
    ASSERT_TRUE(store.Load(tmp.Path(), loaded).is_ok());
    EXPECT_EQ(loaded.id, "AAAAAAAAAAAAAAAAAAAA");

    std::vector<std::string> sidecars;
    ASSERT_TRUE(store.ListSidecars(tmp.Path(), sidecars).is_ok());
    ASSERT_EQ(sidecars.size(), 2u);
    EXPECT_EQ(std::filesystem::path(sidecars[1]).filename().string(), "coldstash.BBBBBBBBBBBBBBBBBBBB.json");
}

TEST_F(ManifestStoreTest, LoadWithoutSidecarIsInvalidInput) {
    Manifest loaded;
    auto res = store.Load(tmp.Path(), loaded);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::InvalidInputPath);
}

TEST_F(ManifestStoreTest, LoadRejectsMalformedSidecar) {
    testutil::WriteFile(tmp / "coldstash.AAAAAAAAAAAAAAAAAAAA.json", "{\"id\": 7}");
    Manifest loaded;
    auto res = store.Load(tmp.Path(), loaded);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::InvalidManifest);
}

TEST_F(ManifestStoreTest, LoadRejectsIdNameMismatch) {
    testutil::WriteFile(tmp / "coldstash.BBBBBBBBBBBBBBBBBBBB.json",
                        ManifestToJson(MakeManifest("AAAAAAAAAAAAAAAAAAAA")));
    Manifest loaded;
    auto res = store.Load(tmp.Path(), loaded);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::InvalidManifest);
}

TEST_F(ManifestStoreTest, PersistMirrorsIntoIndex) {
    std::unique_ptr<SqliteManifestIndex> index;
    ASSERT_TRUE(SqliteManifestIndex::Open(":memory:", "archives", index).is_ok());
    ManifestStore indexed(ArtifactNaming(), index.get());

    ASSERT_TRUE(indexed.Persist(MakeManifest("AAAAAAAAAAAAAAAAAAAA")).is_ok());
    std::vector<IndexRow> rows;
    ASSERT_TRUE(index->SelectAll(rows).is_ok());
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].file, "a.txt");
}

TEST_F(ManifestStoreTest, OverwriteReplacesIndexRowsOfSameArchive) {
    std::unique_ptr<SqliteManifestIndex> index;
    ASSERT_TRUE(SqliteManifestIndex::Open(":memory:", "archives", index).is_ok());
    ManifestStore indexed(ArtifactNaming(), index.get());

    Manifest first = MakeManifest("AAAAAAAAAAAAAAAAAAAA");
    first.files.push_back({.path = "dropped.txt", .size = 1, .fingerprint = Sha256Hex(std::string_view("d"))});
    ASSERT_TRUE(indexed.Persist(first).is_ok());
    ASSERT_TRUE(indexed.Persist(MakeManifest("BBBBBBBBBBBBBBBBBBBB")).is_ok());

    Manifest second = MakeManifest("AAAAAAAAAAAAAAAAAAAA");
    second.files.push_back({.path = "added.txt", .size = 1, .fingerprint = Sha256Hex(std::string_view("n"))});
    ASSERT_TRUE(indexed.Persist(second).is_ok());

    std::vector<IndexRow> rows;
    ASSERT_TRUE(index->FindByFile("dropped.txt", rows).is_ok());
    EXPECT_TRUE(rows.empty());
    ASSERT_TRUE(index->FindByFile("added.txt", rows).is_ok());
    EXPECT_EQ(rows.size(), 1u);
    ASSERT_TRUE(index->FindByFile("a.txt", rows).is_ok());
    EXPECT_EQ(rows.size(), 2u); // one per archive
}

TEST_F(ManifestStoreTest, IndexFailureKeepsSidecar) {
    FailingIndex failing;
    ManifestStore indexed(ArtifactNaming(), &failing);

    auto res = indexed.Persist(MakeManifest("AAAAAAAAAAAAAAAAAAAA"));
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code, ErrorCode::IndexError);
    EXPECT_TRUE(testutil::Exists(tmp / "coldstash.AAAAAAAAAAAAAAAAAAAA.json"));
}

} // namespace
} // namespace coldstash
