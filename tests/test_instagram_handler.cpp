#include "catch2/catch.hpp"

#include "multidl/filesystem.hpp"
#include "multidl/instagram_handler.hpp"
#include "test_doubles.hpp"

#include <algorithm>
#include <filesystem>

using namespace multidl;
using multidl::test::argAfter;
using multidl::test::FakeRunner;
using multidl::test::hasArg;
using multidl::test::ScriptedInteraction;
using multidl::test::SleepRecorder;
using multidl::test::TempDir;

namespace {

struct InstaFixture {
    TempDir dir{"insta"};
    SessionStore store{dir.str("sessions")};
    FakeRunner runner;
    SleepRecorder sleeps;
    InstagramHandler handler{store, runner, InstaloaderSettings{}, sleeps.fn()};

    std::string out() const { return dir.str("out"); }

    // Stores a session file plus metadata pointing at it.
    std::string seedSession(const std::string& username) {
        std::string err;
        REQUIRE(store.writeText(SourceId::Instagram, username + ".session", "cached", err));
        REQUIRE(store.writeMetadata(SourceId::Instagram, SessionMetadata{username, username + ".session"}, err));
        std::string path;
        REQUIRE(store.pathFor(SourceId::Instagram, username + ".session", path, err));
        return path;
    }
};

DownloadOptions withAuth(const std::string& mode) {
    DownloadOptions o;
    o.auth = mode;
    return o;
}

// Simulates instaloader writing the session file on a successful login.
FakeRunner::SideEffect writesSessionFile() {
    return [](const std::vector<std::string>& argv) {
        std::string err;
        writeFile(argAfter(argv, "--sessionfile"), "fresh-session", err);
    };
}

const char* kPost = "https://www.instagram.com/p/CxYz_12/?igsh=abc";

} // namespace

TEST_CASE("InstagramHandler buildDownloadCommand") {
    InstaFixture fx;
    const auto anon = fx.handler.buildDownloadCommand("ABC", "/dl", nullptr, DownloadOptions{});
    const std::vector<std::string> expected{"instaloader", "--dirname-pattern", "/dl/{shortcode}", "--quiet", "--",
                                            "-ABC"};
    REQUIRE(anon == expected);

    CredentialHandle session;
    session.username = "me";
    session.artifactPath = "/s/me.session";
    DownloadOptions opts;
    opts.toolArgs = {{"--no-videos", ""}};
    const auto authed = fx.handler.buildDownloadCommand("ABC", "/dl", &session, opts);
    REQUIRE(argAfter(authed, "--login") == "me");
    REQUIRE(argAfter(authed, "--sessionfile") == "/s/me.session");
    REQUIRE(hasArg(authed, "--no-videos"));
    REQUIRE(authed.back() == "-ABC");
}

TEST_CASE("InstagramHandler validates the link and auth mode") {
    InstaFixture fx;
    ErrorInfo err;
    REQUIRE_FALSE(fx.handler.download("https://www.instagram.com/someone/", fx.out(), withAuth("auto"), err));
    REQUIRE(err.category == ErrorCategory::InvalidInput);
    REQUIRE(err.code == ErrorCode::MissingIdentifier);

    REQUIRE_FALSE(fx.handler.download(kPost, fx.out(), withAuth("sometimes"), err));
    REQUIRE(err.category == ErrorCategory::InvalidInput);
    REQUIRE(err.code == ErrorCode::InvalidOption);
    REQUIRE(fx.runner.calls.empty());
}

TEST_CASE("InstagramHandler authenticated mode requires a cached session") {
    InstaFixture fx;
    ErrorInfo err;
    REQUIRE_FALSE(fx.handler.download(kPost, fx.out(), withAuth("authenticated"), err));
    REQUIRE(err.category == ErrorCategory::AuthRequired);
    REQUIRE(err.code == ErrorCode::SessionMissing);
    REQUIRE(fx.runner.calls.empty());
}

TEST_CASE("InstagramHandler auto mode uses a cached session when present") {
    InstaFixture fx;
    ErrorInfo err;

    SECTION("anonymous without a session") {
        REQUIRE(fx.handler.download(kPost, fx.out(), withAuth("auto"), err));
        REQUIRE(fx.runner.calls.size() == 1);
        REQUIRE_FALSE(hasArg(fx.runner.calls[0].argv, "--login"));
        REQUIRE(fx.runner.calls[0].argv.back() == "-CxYz_12");
    }
    SECTION("logged in with a session") {
        const std::string path = fx.seedSession("me");
        REQUIRE(fx.handler.download(kPost, fx.out(), withAuth("auto"), err));
        REQUIRE(argAfter(fx.runner.calls[0].argv, "--login") == "me");
        REQUIRE(argAfter(fx.runner.calls[0].argv, "--sessionfile") == path);
    }
    SECTION("unauthenticated ignores the cached session") {
        fx.seedSession("me");
        REQUIRE(fx.handler.download(kPost, fx.out(), withAuth("unauthenticated"), err));
        REQUIRE_FALSE(hasArg(fx.runner.calls[0].argv, "--login"));
    }
    SECTION("a passed credential wins") {
        fx.seedSession("me");
        auto handle = std::make_shared<CredentialHandle>();
        handle->source = SourceId::Instagram;
        handle->username = "other";
        handle->artifactPath = "/x/other.session";
        DownloadOptions opts = withAuth("authenticated");
        opts.credential = handle;
        REQUIRE(fx.handler.download(kPost, fx.out(), opts, err));
        REQUIRE(argAfter(fx.runner.calls[0].argv, "--login") == "other");
    }
}

TEST_CASE("InstagramHandler tolerates dangling session metadata") {
    InstaFixture fx;
    fx.seedSession("me");
    std::filesystem::remove(fx.dir.str("sessions/instagram/me.session"));
    REQUIRE(fx.handler.loadCachedSession() == nullptr);

    ErrorInfo err;
    REQUIRE(fx.handler.download(kPost, fx.out(), withAuth("auto"), err));
    REQUIRE_FALSE(hasArg(fx.runner.calls[0].argv, "--login"));
}

TEST_CASE("InstagramHandler maps login walls to AuthRequired") {
    InstaFixture fx;
    fx.runner.push(1, "JSON Query to graphql/query: 401 Unauthorized - \"fail\" status, message \"Please wait a few minutes\"\n"
                      "Login required.\n");
    ErrorInfo err;
    REQUIRE_FALSE(fx.handler.download(kPost, fx.out(), withAuth("auto"), err));
    REQUIRE(err.category == ErrorCategory::AuthRequired);
    REQUIRE(err.userMessage.find("multidl auth Instagram") != std::string::npos);
    REQUIRE(fx.runner.calls.size() == 1);
}

TEST_CASE("InstagramHandler retries transient failures") {
    InstaFixture fx;
    fx.runner.push(1, "Connection error: timed out\n");
    fx.runner.push(1, "Connection error: timed out\n");
    ErrorInfo err;
    REQUIRE_FALSE(fx.handler.download(kPost, fx.out(), withAuth("auto"), err));
    REQUIRE(fx.runner.calls.size() == 2);
    REQUIRE(fx.sleeps.delays.size() == 1);
    REQUIRE(err.category == ErrorCategory::TransientIO);
    REQUIRE(err.retryable);
}

TEST_CASE("InstagramHandler authenticate reuses the cached session silently") {
    InstaFixture fx;
    const std::string path = fx.seedSession("me");
    ScriptedInteraction ui;
    CredentialPtr handle = fx.handler.authenticate(&ui);
    REQUIRE(handle != nullptr);
    REQUIRE(handle->username == "me");
    REQUIRE(handle->artifactPath == path);
    REQUIRE(ui.loginPrompts == 0);
    REQUIRE(fx.runner.calls.empty());
}

TEST_CASE("InstagramHandler authenticate without a prompt or cache yields none") {
    InstaFixture fx;
    REQUIRE(fx.handler.authenticate(nullptr) == nullptr);

    ScriptedInteraction ui;
    ui.loginAccepted = false;
    REQUIRE(fx.handler.authenticate(&ui) == nullptr);
    REQUIRE(ui.loginPrompts == 1);
    REQUIRE(fx.runner.calls.empty());
}

TEST_CASE("InstagramHandler password login persists the session") {
    InstaFixture fx;
    fx.runner.push(0, "", writesSessionFile());
    ScriptedInteraction ui;
    ui.login = LoginRequest{"  me  ", "secret", ""};

    CredentialPtr handle = fx.handler.authenticate(&ui);
    REQUIRE(handle != nullptr);
    REQUIRE(handle->username == "me");
    REQUIRE(handle->artifactPath == fx.dir.str("sessions/instagram/me.session"));

    const auto& call = fx.runner.calls.at(0);
    REQUIRE(argAfter(call.argv, "--login") == "me");
    REQUIRE(argAfter(call.argv, "--sessionfile") == handle->artifactPath);
    // The password only travels on stdin.
    REQUIRE_FALSE(hasArg(call.argv, "--password"));
    REQUIRE(std::find(call.argv.begin(), call.argv.end(), "secret") == call.argv.end());
    REQUIRE(call.stdinData == "secret\n");
    REQUIRE(call.detached);

    SessionMetadata meta;
    REQUIRE(fx.store.readMetadata(SourceId::Instagram, meta) == ReadStatus::Ok);
    REQUIRE(meta.username == "me");
    REQUIRE(meta.filename == "me.session");

    // A later authenticate hits the cache.
    ScriptedInteraction again;
    REQUIRE(fx.handler.authenticate(&again)->username == "me");
    REQUIRE(again.loginPrompts == 0);
}

TEST_CASE("InstagramHandler second factor flow") {
    InstaFixture fx;
    fx.runner.push(1, "Login error: Two-factor authentication required.\nEnter 2FA verification code: ");
    ScriptedInteraction ui;
    ui.login = LoginRequest{"me", "secret", ""};

    SECTION("code supplied") {
        fx.runner.push(0, "", writesSessionFile());
        ui.secondFactorCode = " 123456 ";
        CredentialPtr handle = fx.handler.authenticate(&ui);
        REQUIRE(handle != nullptr);
        REQUIRE(ui.secondFactorPrompts == 1);
        REQUIRE(fx.runner.calls.size() == 2);
        REQUIRE(fx.runner.calls[0].stdinData == "secret\n");
        REQUIRE(fx.runner.calls[1].stdinData == "secret\n123456\n");
        REQUIRE(fx.runner.calls[1].detached);
    }
    SECTION("no code aborts without error") {
        ui.secondFactorCode = "";
        REQUIRE(fx.handler.authenticate(&ui) == nullptr);
        REQUIRE(ui.secondFactorPrompts == 1);
        REQUIRE(fx.runner.calls.size() == 1);
        REQUIRE(ui.errors.empty());
        SessionMetadata meta;
        REQUIRE(fx.store.readMetadata(SourceId::Instagram, meta) == ReadStatus::Absent);
    }
}

TEST_CASE("InstagramHandler failed login reports and stores nothing") {
    InstaFixture fx;
    fx.runner.push(1, "Login error: Wrong password.\n");
    ScriptedInteraction ui;
    ui.login = LoginRequest{"me", "bad", ""};

    REQUIRE(fx.handler.authenticate(&ui) == nullptr);
    REQUIRE(ui.secondFactorPrompts == 0);
    REQUIRE(ui.errors.size() == 1);
    SessionMetadata meta;
    REQUIRE(fx.store.readMetadata(SourceId::Instagram, meta) == ReadStatus::Absent);
}

TEST_CASE("InstagramHandler imports an existing session file") {
    InstaFixture fx;
    const std::string external = fx.dir.str("exported.session");
    std::string err;
    REQUIRE(writeFile(external, "imported-bytes", err));

    ScriptedInteraction ui;
    ui.login = LoginRequest{"me", "", external};
    ui.exportPath = fx.dir.str("backup/me.session");

    CredentialPtr handle = fx.handler.authenticate(&ui);
    REQUIRE(handle != nullptr);
    REQUIRE(fx.runner.calls.empty());
    std::string stored;
    REQUIRE(readFile(handle->artifactPath, stored, err));
    REQUIRE(stored == "imported-bytes");
    std::string exported;
    REQUIRE(readFile(ui.exportPath, exported, err));
    REQUIRE(exported == "imported-bytes");
}

TEST_CASE("InstagramHandler import needs a username") {
    InstaFixture fx;
    ScriptedInteraction ui;
    ui.login = LoginRequest{"", "", fx.dir.str("exported.session")};
    REQUIRE(fx.handler.authenticate(&ui) == nullptr);
    REQUIRE(ui.errors.size() == 1);
}
