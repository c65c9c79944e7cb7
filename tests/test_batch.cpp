#include "catch2/catch.hpp"

#include "multidl/batch.hpp"
#include "test_doubles.hpp"

#include <array>
#include <memory>

using namespace multidl;
using multidl::test::FakeHandler;
using multidl::test::TempDir;

namespace {

struct FakeFleet {
    HandlerRegistry registry;
    std::array<FakeHandler*, kSourceCount> handlers{};

    FakeFleet() {
        for (SourceId id : kAllSources) {
            auto h = std::make_unique<FakeHandler>(id);
            handlers[sourceIndex(id)] = h.get();
            registry.add(std::move(h));
        }
    }

    FakeHandler& operator[](SourceId id) { return *handlers[sourceIndex(id)]; }
};

std::vector<ManifestItem> sixItems() {
    return {
        {"twitter", "https://twitter.com/a/status/1"},
        {"", "https://example.com/video/1"},
        {"twitter", "https://twitter.com/b/status/2"},
        {"", "https://www.instagram.com/p/abc/"},
        {"", "https://www.facebook.com/watch?v=123"},
        {"youtube", "https://youtu.be/xyz"},
    };
}

} // namespace

TEST_CASE("executeBatch applies per-source limit and skips unsupported items") {
    TempDir dir("batch");
    FakeFleet fleet;
    BatchOptions opts;
    opts.perSourceLimit = 1;

    BatchResult r = executeBatch(sixItems(), dir.str(), opts, fleet.registry);

    REQUIRE(r.attempted == 4);
    REQUIRE(r.completed.size() == 4);
    REQUIRE(r.errors.empty());
    REQUIRE(r.ok());
    REQUIRE(r.skipped.size() == 2);
    REQUIRE(r.skipped[0].url == "https://example.com/video/1");
    REQUIRE(r.skipped[0].reason == "unsupported");
    REQUIRE(r.skipped[1].url == "https://twitter.com/b/status/2");
    REQUIRE(r.skipped[1].reason == "per-source-limit");
    REQUIRE(fleet[SourceId::Twitter].urls.size() == 1);
}

TEST_CASE("executeBatch processes items in input order") {
    TempDir dir("batch_order");
    FakeFleet fleet;
    BatchResult r = executeBatch(sixItems(), dir.str(), BatchOptions{}, fleet.registry);

    REQUIRE(r.attempted == 5);
    REQUIRE(r.completed.size() == 5);
    REQUIRE(r.completed[0].source == SourceId::Twitter);
    REQUIRE(r.completed[1].url == "https://twitter.com/b/status/2");
    REQUIRE(r.completed[2].source == SourceId::Instagram);
    REQUIRE(r.completed[3].source == SourceId::Facebook);
    REQUIRE(r.completed[4].source == SourceId::YouTube);
}

TEST_CASE("executeBatch builds per-source options") {
    TempDir dir("batch_opts");
    FakeFleet fleet;
    executeBatch(sixItems(), dir.str(), BatchOptions{}, fleet.registry);

    const auto& insta = fleet[SourceId::Instagram].seenOptions;
    REQUIRE(insta.size() == 1);
    REQUIRE(insta[0].auth == std::string("auto"));
    REQUIRE_FALSE(insta[0].useSession.has_value());

    const auto& fb = fleet[SourceId::Facebook].seenOptions;
    REQUIRE(fb.size() == 1);
    REQUIRE(fb[0].useSession == true);
    REQUIRE_FALSE(fb[0].auth.has_value());
}

TEST_CASE("buildOptionsFor leaves Google Drive on its defaults and attaches credentials") {
    BatchOptions batch;
    auto handle = std::make_shared<CredentialHandle>();
    handle->source = SourceId::GoogleDrive;
    handle->token = "tok";
    batch.credentials[sourceIndex(SourceId::GoogleDrive)] = handle;

    DownloadOptions drive = buildOptionsFor(SourceId::GoogleDrive, batch);
    REQUIRE_FALSE(drive.auth.has_value());
    REQUIRE_FALSE(drive.useSession.has_value());
    REQUIRE_FALSE(drive.method.has_value());
    REQUIRE(drive.credential == handle);

    DownloadOptions yt = buildOptionsFor(SourceId::YouTube, batch);
    REQUIRE(yt.useSession == true);
    REQUIRE(yt.credential == nullptr);
}

TEST_CASE("executeBatch records handler exceptions and keeps going") {
    TempDir dir("batch_throw");
    FakeFleet fleet;
    fleet[SourceId::Instagram].throwFor.insert("https://www.instagram.com/p/abc/");

    BatchResult r = executeBatch(sixItems(), dir.str(), BatchOptions{}, fleet.registry);

    REQUIRE(r.attempted == 5);
    REQUIRE(r.errors.size() == 1);
    REQUIRE(r.errors[0].source == SourceId::Instagram);
    REQUIRE(r.errors[0].url == "https://www.instagram.com/p/abc/");
    REQUIRE(r.errors[0].error.category == ErrorCategory::Internal);
    REQUIRE(r.errors[0].message.find("boom") != std::string::npos);
    REQUIRE(r.skipped.size() == 1);
    REQUIRE(r.completed.size() == 4);
    // Items after the failing one still ran.
    REQUIRE(fleet[SourceId::Facebook].urls.size() == 1);
    REQUIRE(fleet[SourceId::YouTube].urls.size() == 1);
    REQUIRE_FALSE(r.ok());
}

TEST_CASE("executeBatch records non-standard throws and keeps going") {
    TempDir dir("batch_throw_value");
    FakeFleet fleet;
    fleet[SourceId::Twitter].throwValueFor.insert("https://twitter.com/a/status/1");

    const std::vector<ManifestItem> items{
        {"twitter", "https://twitter.com/a/status/1"},
        {"youtube", "https://youtu.be/xyz"},
    };
    BatchResult r;
    REQUIRE_NOTHROW(r = executeBatch(items, dir.str(), BatchOptions{}, fleet.registry));

    REQUIRE(r.attempted == 2);
    REQUIRE(r.errors.size() == 1);
    REQUIRE(r.errors[0].source == SourceId::Twitter);
    REQUIRE(r.errors[0].error.category == ErrorCategory::Internal);
    REQUIRE(r.errors[0].message == "Handler threw a non-standard exception");
    REQUIRE(fleet[SourceId::YouTube].urls.size() == 1);
    REQUIRE(r.completed.size() == 1);
    REQUIRE(r.completed[0].source == SourceId::YouTube);
}

TEST_CASE("executeBatch records classified handler failures") {
    TempDir dir("batch_fail");
    FakeFleet fleet;
    fleet[SourceId::YouTube].failFor.insert("https://youtu.be/xyz");
    fleet[SourceId::YouTube].failCategory = ErrorCategory::AuthRequired;

    BatchResult r = executeBatch(sixItems(), dir.str(), BatchOptions{}, fleet.registry);
    REQUIRE(r.errors.size() == 1);
    REQUIRE(r.errors[0].error.category == ErrorCategory::AuthRequired);
    REQUIRE(r.errors[0].message == "fake failure for https://youtu.be/xyz");
}

TEST_CASE("executeBatch with global limit zero still reports unsupported first") {
    TempDir dir("batch_zero");
    FakeFleet fleet;
    BatchOptions opts;
    opts.globalLimit = 0;

    BatchResult r = executeBatch(sixItems(), dir.str(), opts, fleet.registry);
    REQUIRE(r.attempted == 0);
    REQUIRE(r.completed.empty());
    REQUIRE(r.skipped.size() == 6);
    for (const auto& s : r.skipped) {
        if (s.url == "https://example.com/video/1") {
            REQUIRE(s.reason == "unsupported");
        } else {
            REQUIRE(s.reason == "global-limit");
        }
    }
}

TEST_CASE("executeBatch dry run admits without invoking handlers") {
    TempDir dir("batch_dry");
    FakeFleet fleet;
    BatchOptions opts;
    opts.dryRun = true;
    opts.globalLimit = 3;

    BatchResult r = executeBatch(sixItems(), dir.str(), opts, fleet.registry);
    REQUIRE(r.attempted == 3);
    REQUIRE(r.completed.size() == 3);
    REQUIRE(r.skipped.size() == 3);
    for (SourceId id : kAllSources) {
        REQUIRE(fleet[id].urls.empty());
    }
}

TEST_CASE("executeBatch treats sources without a handler as unsupported") {
    TempDir dir("batch_missing");
    HandlerRegistry registry;
    auto yt = std::make_unique<FakeHandler>(SourceId::YouTube);
    FakeHandler* ytPtr = yt.get();
    registry.add(std::move(yt));

    BatchResult r = executeBatch(sixItems(), dir.str(), BatchOptions{}, registry);
    REQUIRE(r.attempted == 1);
    REQUIRE(r.skipped.size() == 5);
    for (const auto& s : r.skipped) REQUIRE(s.reason == "unsupported");
    REQUIRE(ytPtr->urls.size() == 1);
}

TEST_CASE("summarizeBatch renders counters") {
    BatchResult r;
    r.attempted = 3;
    r.completed.push_back({SourceId::YouTube, "u1"});
    r.completed.push_back({SourceId::YouTube, "u2"});
    r.skipped.push_back({"x", "u3", "unsupported"});
    r.errors.push_back({SourceId::Reddit, "u4", "bad", ErrorInfo{}});
    REQUIRE(summarizeBatch(r) == "Attempted: 3, completed: 2, skipped: 1, errors: 1");
}
