#pragma once

#include "multidl/handler.hpp"
#include <array>
#include <memory>
#include <vector>

namespace multidl {

// SourceId-indexed handler table. Authentication capability is fixed at
// registration time. Not thread-safe; use one registry per concurrent batch.
class HandlerRegistry {
public:
    // Replaces any handler already registered for the same source.
    void add(std::unique_ptr<Handler> handler);
    void addAuthenticated(std::unique_ptr<AuthenticatedHandler> handler);

    Handler* find(SourceId source) const;
    bool supports(SourceId source) const { return find(source) != nullptr; }
    bool canAuthenticate(SourceId source) const;

    // Logged no-op returning null for sources without an authenticator.
    CredentialPtr authenticate(SourceId source, InteractionContext* ctx) const;

    std::vector<SourceId> sources() const;

private:
    struct Entry {
        std::unique_ptr<Handler> handler;
        Authenticator* authenticator{nullptr}; // aliases `handler` when set
    };
    std::array<Entry, kSourceCount> entries_{};
};

} // namespace multidl
