#pragma once

#include "multidl/handler.hpp"
#include "multidl/process.hpp"
#include "multidl/retry.hpp"
#include "multidl/session_store.hpp"
#include <string>
#include <vector>

namespace multidl {

struct InstaloaderSettings {
    std::string executable{"instaloader"};
    RetryPolicy retry;
};

// instaloader adapter. Sessions live in the Instagram namespace as
// <username>.session with meta.json naming the active one.
class InstagramHandler : public AuthenticatedHandler {
public:
    InstagramHandler(const SessionStore& store, CommandRunner& runner,
                     InstaloaderSettings settings, SleepFn sleep = sleepFor);

    SourceId source() const override { return SourceId::Instagram; }
    bool download(const std::string& url,
                  const std::string& destination,
                  const DownloadOptions& options,
                  ErrorInfo& outError) override;
    CredentialPtr authenticate(InteractionContext* ctx) override;

    // Session named by meta.json, or null when absent, corrupt or dangling.
    CredentialPtr loadCachedSession() const;

    std::vector<std::string> buildDownloadCommand(const std::string& shortcode,
                                                  const std::string& destination,
                                                  const CredentialHandle* session,
                                                  const DownloadOptions& options) const;

private:
    CredentialPtr importSession(InteractionContext& ctx, const LoginRequest& req);
    CredentialPtr login(InteractionContext& ctx, const LoginRequest& req);
    CredentialPtr finishLogin(InteractionContext* ctx, const std::string& username, const std::string& filename);

    const SessionStore& store_;
    CommandRunner& runner_;
    InstaloaderSettings settings_;
    SleepFn sleep_;
};

} // namespace multidl
