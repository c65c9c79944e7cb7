#pragma once

#include "multidl/handler.hpp"
#include "multidl/identifiers.hpp"
#include "multidl/process.hpp"
#include "multidl/retry.hpp"
#include "multidl/session_store.hpp"
#include <string>
#include <vector>

namespace multidl {

struct GDriveSettings {
    std::string gdownExecutable{"gdown"};
    std::string curlExecutable{"curl"};
    RetryPolicy retry;
};

// Google Drive adapter. `public` mode shells out to gdown; `authenticated`
// mode calls the Drive v3 API through curl with a bearer token.
class GDriveHandler : public Handler {
public:
    GDriveHandler(const SessionStore& store, CommandRunner& runner,
                  GDriveSettings settings, SleepFn sleep = sleepFor);

    SourceId source() const override { return SourceId::GoogleDrive; }
    bool download(const std::string& url,
                  const std::string& destination,
                  const DownloadOptions& options,
                  ErrorInfo& outError) override;

    // Handle token, else access_token from credentials.json; empty when neither exists.
    std::string resolveAccessToken(const DownloadOptions& options) const;

    std::vector<std::string> buildGdownCommand(const DriveTarget& target,
                                               const std::string& destination,
                                               const DownloadOptions& options) const;
    // Bearer header goes in the curl config on stdin, never in argv.
    std::vector<std::string> buildApiCommand(const std::string& fileId,
                                             const std::string& outputPath,
                                             const DownloadOptions& options) const;

private:
    bool runTool(const std::vector<std::string>& argv, const std::string& stdinData,
                 const std::string& tool, const std::string& label, CommandResult& lastResult,
                 ErrorInfo& outError);
    std::string lookupFileName(const std::string& fileId, const std::string& token);

    const SessionStore& store_;
    CommandRunner& runner_;
    GDriveSettings settings_;
    SleepFn sleep_;
};

} // namespace multidl
