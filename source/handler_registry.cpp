#include "multidl/handler_registry.hpp"
#include "multidl/logger.hpp"

namespace multidl {

void HandlerRegistry::add(std::unique_ptr<Handler> handler) {
    if (!handler) return;
    Entry& e = entries_[sourceIndex(handler->source())];
    e.authenticator = nullptr;
    e.handler = std::move(handler);
}

void HandlerRegistry::addAuthenticated(std::unique_ptr<AuthenticatedHandler> handler) {
    if (!handler) return;
    Entry& e = entries_[sourceIndex(handler->source())];
    e.authenticator = handler.get();
    e.handler = std::move(handler);
}

Handler* HandlerRegistry::find(SourceId source) const {
    return entries_[sourceIndex(source)].handler.get();
}

bool HandlerRegistry::canAuthenticate(SourceId source) const {
    return entries_[sourceIndex(source)].authenticator != nullptr;
}

CredentialPtr HandlerRegistry::authenticate(SourceId source, InteractionContext* ctx) const {
    Authenticator* auth = entries_[sourceIndex(source)].authenticator;
    if (!auth) {
        logInfo(std::string("Authentication is not available for ") + sourceDisplayName(source), "AUTH");
        return nullptr;
    }
    logInfo(std::string("Authenticating ") + sourceDisplayName(source), "AUTH");
    return auth->authenticate(ctx);
}

std::vector<SourceId> HandlerRegistry::sources() const {
    std::vector<SourceId> out;
    for (SourceId id : kAllSources) {
        if (entries_[sourceIndex(id)].handler) out.push_back(id);
    }
    return out;
}

} // namespace multidl
