#include "catch2/catch.hpp"

#include "multidl/session_store.hpp"
#include "test_doubles.hpp"

#include <filesystem>
#include <fstream>

using namespace multidl;
using multidl::test::TempDir;

TEST_CASE("SessionStore sanitizes namespace names") {
    REQUIRE(SessionStore::sanitize("GoogleDrive") == "googledrive");
    REQUIRE(SessionStore::sanitize("  Google Drive!  ") == "google_drive");
    REQUIRE(SessionStore::sanitize("***") == "default");
    REQUIRE(SessionStore::namespaceName(SourceId::YouTube) == "youtube");
}

TEST_CASE("SessionStore namespaces one directory per source") {
    TempDir dir("sess_ns");
    SessionStore store(dir.str());
    REQUIRE(store.namespaceDir(SourceId::Twitter) == dir.str("twitter"));
    REQUIRE(store.defaultCookiePath(SourceId::Twitter) == dir.str("twitter/cookies.txt"));
    REQUIRE(store.defaultMetadataPath(SourceId::Instagram) == dir.str("instagram/meta.json"));
}

TEST_CASE("SessionStore pathFor rejects escaping names") {
    SessionStore store("/tmp/unused");
    std::string path, err;
    REQUIRE_FALSE(store.pathFor(SourceId::Reddit, "", path, err));
    REQUIRE_FALSE(store.pathFor(SourceId::Reddit, "..", path, err));
    REQUIRE_FALSE(store.pathFor(SourceId::Reddit, "../x", path, err));
    REQUIRE_FALSE(store.pathFor(SourceId::Reddit, "a/b", path, err));
    REQUIRE_FALSE(store.pathFor(SourceId::Reddit, "a\\b", path, err));
    REQUIRE(store.pathFor(SourceId::Reddit, "cookies.txt", path, err));
}

TEST_CASE("SessionStore reads of unwritten files are absent") {
    TempDir dir("sess_absent");
    SessionStore store(dir.str());
    mini::Object obj;
    std::string text;
    std::vector<uint8_t> blob;
    SessionMetadata meta;
    REQUIRE(store.readJson(SourceId::Facebook, "meta.json", obj) == ReadStatus::Absent);
    REQUIRE(store.readText(SourceId::Facebook, "cookies.txt", text) == ReadStatus::Absent);
    REQUIRE(store.loadDefaultSession(SourceId::Facebook, blob) == ReadStatus::Absent);
    REQUIRE(store.readMetadata(SourceId::Facebook, meta) == ReadStatus::Absent);
    REQUIRE(store.listFiles(SourceId::Facebook).empty());
    // Reading never creates the namespace.
    REQUIRE_FALSE(std::filesystem::exists(store.namespaceDir(SourceId::Facebook)));
}

TEST_CASE("SessionStore reports corrupt JSON without throwing") {
    TempDir dir("sess_corrupt");
    SessionStore store(dir.str());
    std::string err;
    REQUIRE(store.writeText(SourceId::Instagram, "meta.json", "{\"username\": \"half", err));

    mini::Object obj;
    obj["keep"] = mini::Value::makeString("me");
    REQUIRE(store.readJson(SourceId::Instagram, "meta.json", obj) == ReadStatus::Corrupt);
    // Output untouched on failure.
    REQUIRE(obj.find("keep") != obj.end());

    SessionMetadata meta;
    REQUIRE(store.readMetadata(SourceId::Instagram, meta) == ReadStatus::Corrupt);
    REQUIRE(meta.username.empty());
}

TEST_CASE("SessionStore JSON, text and blob round trip") {
    TempDir dir("sess_rt");
    SessionStore store(dir.str());
    std::string err;

    mini::Object creds;
    creds["access_token"] = mini::Value::makeString("tok");
    REQUIRE(store.writeJson(SourceId::GoogleDrive, kCredentialsFile, creds, err));
    mini::Object back;
    REQUIRE(store.readJson(SourceId::GoogleDrive, kCredentialsFile, back) == ReadStatus::Ok);
    REQUIRE(back.find("access_token")->second.str == "tok");

    const std::vector<uint8_t> blob{0x00, 0xFF, 0x10, 0x0A};
    REQUIRE(store.writeDefaultSession(SourceId::TikTok, blob, err));
    std::vector<uint8_t> blobBack;
    REQUIRE(store.loadDefaultSession(SourceId::TikTok, blobBack) == ReadStatus::Ok);
    REQUIRE(blobBack == blob);

    REQUIRE(store.writeText(SourceId::TikTok, kCookieFile, "# Netscape HTTP Cookie File\n", err));
    const std::vector<std::string> all{"cookies.txt", "session.bin"};
    const std::vector<std::string> jars{"cookies.txt"};
    REQUIRE(store.listFiles(SourceId::TikTok) == all);
    REQUIRE(store.listFiles(SourceId::TikTok, ".txt") == jars);
}

TEST_CASE("SessionStore metadata must reference files in the namespace") {
    TempDir dir("sess_meta");
    SessionStore store(dir.str());
    std::string err;

    REQUIRE_FALSE(store.writeMetadata(SourceId::Instagram, SessionMetadata{"me", "me.session"}, err));
    REQUIRE(err.find("missing file") != std::string::npos);

    REQUIRE(store.writeText(SourceId::Instagram, "me.session", "blob", err));
    REQUIRE(store.writeMetadata(SourceId::Instagram, SessionMetadata{"me", "me.session"}, err));

    SessionMetadata meta;
    REQUIRE(store.readMetadata(SourceId::Instagram, meta) == ReadStatus::Ok);
    REQUIRE(meta.username == "me");
    REQUIRE(meta.filename == "me.session");

    // A dangling reference degrades to corrupt.
    std::filesystem::remove(dir.str("instagram/me.session"));
    SessionMetadata stale;
    REQUIRE(store.readMetadata(SourceId::Instagram, stale) == ReadStatus::Corrupt);
}

TEST_CASE("SessionStore importFile copies external files into the namespace") {
    TempDir dir("sess_import");
    SessionStore store(dir.str("sessions"));
    const std::string external = dir.str("exported.session");
    {
        std::ofstream f(external);
        f << "session-bytes";
    }

    std::string stored, err;
    REQUIRE(store.importFile(SourceId::Instagram, external, "me.session", stored, err));
    REQUIRE(stored == dir.str("sessions/instagram/me.session"));
    std::string text;
    REQUIRE(store.readText(SourceId::Instagram, "me.session", text) == ReadStatus::Ok);
    REQUIRE(text == "session-bytes");

    // Importing the stored file onto itself is a no-op.
    std::string again;
    REQUIRE(store.importFile(SourceId::Instagram, stored, "me.session", again, err));
    REQUIRE(again == stored);

    REQUIRE_FALSE(store.importFile(SourceId::Instagram, dir.str("nope"), "x.session", stored, err));
    REQUIRE(err.find("not found") != std::string::npos);
}
