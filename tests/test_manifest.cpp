#include "coldstash/manifest.hpp"
#include "crypto/sha256.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <vector>

using namespace coldstash;

namespace {

Manifest SampleManifest() {
    Manifest m;
    m.id = "AbCdEfGhIjKlMnOpQrSt";
    m.timestamp = "2026-03-01 12:00:00";
    m.location = LocationKind::ColdStorage;
    m.filename = "coldstash.AbCdEfGhIjKlMnOpQrSt.tar.gz";
    m.local_path = "/data/run42";
    m.archive_path = "lab-archive";
    m.files = {
        {.path = "a.dat", .size = 5, .fingerprint = Sha256Hex(std::string_view("alpha"))},
        {.path = "sub/b.dat", .size = 0, .fingerprint = Sha256Hex(std::string_view(""))},
    };
    m.bundle_fingerprint = Sha256Hex(std::string_view("bundle"));
    m.owner = "jdoe";
    return m;
}

} // namespace

TEST(ManifestTest, SerializesDocumentedKeysInOrder) {
    const std::string doc = ManifestToJson(SampleManifest());
    const auto j = nlohmann::ordered_json::parse(doc);

    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"id", "timestamp", "location", "filename", "localPath",
                                              "archivePath", "files", "bundleFingerprint", "owner"}));
    EXPECT_EQ(j["location"], "cold_storage");
    EXPECT_EQ(j["files"][1]["path"], "sub/b.dat");
    EXPECT_EQ(j["files"][0]["size"], 5);
}

TEST(ManifestTest, ParsesWhatItWrites) {
    const Manifest m = SampleManifest();
    auto parsed = ManifestParser{}.Parse(ManifestToJson(m));
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_EQ(*parsed, m);
}

TEST(ManifestTest, DryRunMayHaveEmptyArchivePath) {
    Manifest m = SampleManifest();
    m.location = LocationKind::DryRun;
    m.archive_path.clear();
    EXPECT_TRUE(ManifestParser{}.Parse(ManifestToJson(m)).has_value());

    m.location = LocationKind::RemoteArchive;
    auto bad = ManifestParser{}.Parse(ManifestToJson(m));
    ASSERT_FALSE(bad.has_value());
    EXPECT_NE(bad.error().find("archivePath"), std::string::npos);
}

TEST(ManifestTest, ParserEdgeCases) {
    struct ParseFailCase {
        std::string json;
        std::string expected_error_substr;
    };

    auto with = [](const std::function<void(nlohmann::json&)>& edit) {
        auto j = nlohmann::json::parse(ManifestToJson(SampleManifest()));
        edit(j);
        return j.dump();
    };

    const std::vector<ParseFailCase> fail_cases = {
        {"", "Empty input"},
        {"not json at all", "Syntax Error"},
        {"[1, 2]", "root must be an object"},
        {with([](auto& j) { j.erase("id"); }), "missing 'id'"},
        {with([](auto& j) { j["id"] = "short"; }), "malformed archive id"},
        {with([](auto& j) { j["id"] = "AbCdEfGhIjKlMnOpQr-t"; }), "malformed archive id"},
        {with([](auto& j) { j["location"] = "tape"; }), "unknown location kind"},
        {with([](auto& j) { j["filename"] = "../x.tar.gz"; }), "malformed bundle filename"},
        {with([](auto& j) { j["files"] = nlohmann::json::array(); }), "'files' is empty"},
        {with([](auto& j) { j["files"][0]["path"] = "../etc/passwd"; }), "unsafe path"},
        {with([](auto& j) { j["files"][0]["size"] = -1; }), "'size' must be a non-negative integer"},
        {with([](auto& j) { j["files"][0]["fingerprint"] = "abc"; }), "malformed fingerprint"},
        {with([](auto& j) { j["bundleFingerprint"] = 42; }), "'bundleFingerprint' must be a string"},
        {with([](auto& j) { j.erase("owner"); }), "missing 'owner'"},
    };

    for (const auto& c : fail_cases) {
        auto res = ManifestParser{}.Parse(c.json);
        ASSERT_FALSE(res.has_value()) << "Should have failed: " << c.json;
        EXPECT_NE(res.error().find(c.expected_error_substr), std::string::npos)
            << "Expected '" << c.expected_error_substr << "', got '" << res.error() << "'";
    }
}

TEST(ManifestTest, LocationKindNames) {
    for (auto kind : {LocationKind::ColdStorage, LocationKind::RemoteArchive, LocationKind::DryRun}) {
        EXPECT_EQ(ParseLocationKind(LocationKindName(kind)), kind);
    }
    EXPECT_FALSE(ParseLocationKind("s3").has_value());
}

TEST(ManifestTest, TimestampFormat) {
    const std::string ts = FormatTimestamp(0);
    ASSERT_EQ(ts.size(), 19u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[13], ':');
}
