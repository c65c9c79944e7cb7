#pragma once

#include "multidl/errors.hpp"
#include "multidl/options.hpp"
#include "multidl/source_id.hpp"
#include <string>

namespace multidl {

struct LoginRequest {
    std::string username;
    std::string password;
    // Existing session file to import instead of logging in.
    std::string sessionFile;
};

// Interactive prompts used by authentication hooks. Implementations decide
// how to ask (console, GUI, scripted in tests).
class InteractionContext {
public:
    virtual ~InteractionContext() = default;

    // Returns false when the user cancels.
    virtual bool requestLogin(SourceId source, LoginRequest& out) = 0;
    // Empty result aborts the login.
    virtual std::string requestSecondFactorCode(SourceId source) = 0;
    // Optional copy destination for a fresh session; empty skips the export.
    virtual std::string requestExportPath(SourceId /*source*/) { return {}; }
    virtual void showError(const std::string& message) = 0;
};

// Uniform download contract implemented once per backend.
class Handler {
public:
    virtual ~Handler() = default;

    virtual SourceId source() const = 0;
    // Fetch `url` into `destination`. On failure `outError` is classified;
    // Unsupported is never returned from here.
    virtual bool download(const std::string& url,
                          const std::string& destination,
                          const DownloadOptions& options,
                          ErrorInfo& outError) = 0;
};

class Authenticator {
public:
    virtual ~Authenticator() = default;

    // Rehydrates a cached session or runs an interactive login.
    // Returns null when no credential could be obtained.
    virtual CredentialPtr authenticate(InteractionContext* ctx) = 0;
};

// Handlers with a login flow. Registered through HandlerRegistry::addAuthenticated.
class AuthenticatedHandler : public Handler, public Authenticator {};

} // namespace multidl
