#include "catch2/catch.hpp"

#include "multidl/handler_registry.hpp"
#include "test_doubles.hpp"

using namespace multidl;
using multidl::test::FakeAuthHandler;
using multidl::test::FakeHandler;
using multidl::test::ScriptedInteraction;

TEST_CASE("HandlerRegistry finds handlers by source") {
    HandlerRegistry registry;
    REQUIRE(registry.find(SourceId::YouTube) == nullptr);
    REQUIRE(registry.sources().empty());

    registry.add(std::make_unique<FakeHandler>(SourceId::YouTube));
    registry.add(std::make_unique<FakeHandler>(SourceId::GoogleDrive));
    REQUIRE(registry.supports(SourceId::YouTube));
    REQUIRE_FALSE(registry.supports(SourceId::Reddit));
    REQUIRE(registry.find(SourceId::YouTube)->source() == SourceId::YouTube);

    // Declaration order, not registration order.
    const std::vector<SourceId> expected{SourceId::GoogleDrive, SourceId::YouTube};
    REQUIRE(registry.sources() == expected);
}

TEST_CASE("HandlerRegistry authenticate is a no-op for plain handlers") {
    HandlerRegistry registry;
    registry.add(std::make_unique<FakeHandler>(SourceId::Twitter));
    ScriptedInteraction ui;
    REQUIRE_FALSE(registry.canAuthenticate(SourceId::Twitter));
    REQUIRE(registry.authenticate(SourceId::Twitter, &ui) == nullptr);
    REQUIRE(registry.authenticate(SourceId::Reddit, &ui) == nullptr);
    REQUIRE(ui.loginPrompts == 0);
}

TEST_CASE("HandlerRegistry routes authentication to capable handlers") {
    HandlerRegistry registry;
    auto insta = std::make_unique<FakeAuthHandler>(SourceId::Instagram);
    auto handle = std::make_shared<CredentialHandle>();
    handle->username = "me";
    insta->handle = handle;
    FakeAuthHandler* raw = insta.get();
    registry.addAuthenticated(std::move(insta));

    ScriptedInteraction ui;
    REQUIRE(registry.canAuthenticate(SourceId::Instagram));
    CredentialPtr got = registry.authenticate(SourceId::Instagram, &ui);
    REQUIRE(got == handle);
    REQUIRE(raw->authCalls == 1);
    REQUIRE(raw->lastContext == &ui);
    // Authenticated handlers still download.
    REQUIRE(registry.find(SourceId::Instagram) == raw);
}

TEST_CASE("HandlerRegistry re-registration replaces capability") {
    HandlerRegistry registry;
    registry.addAuthenticated(std::make_unique<FakeAuthHandler>(SourceId::Instagram));
    REQUIRE(registry.canAuthenticate(SourceId::Instagram));
    registry.add(std::make_unique<FakeHandler>(SourceId::Instagram));
    REQUIRE_FALSE(registry.canAuthenticate(SourceId::Instagram));
    REQUIRE(registry.authenticate(SourceId::Instagram, nullptr) == nullptr);
}
