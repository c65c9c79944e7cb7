#pragma once

#include "multidl/handler.hpp"
#include "multidl/process.hpp"
#include "multidl/retry.hpp"
#include "multidl/session_store.hpp"
#include <string>
#include <vector>

namespace multidl {

constexpr const char* kDefaultOutputTemplate = "%(title)s [%(id)s].%(ext)s";

// Output layout for one yt-dlp backed source.
struct YtDlpProfile {
    SourceId source{SourceId::YouTube};
    std::string outputTemplate{kDefaultOutputTemplate};
};

// Profiles for TikTok, Threads, Twitter, Reddit, Facebook and YouTube.
YtDlpProfile ytdlpProfileFor(SourceId source);
bool isYtDlpSource(SourceId source);

struct YtDlpSettings {
    std::string executable{"yt-dlp"};
    RetryPolicy retry;
    int concurrentFragments{2};
};

// Cookie-reusing adapter around the yt-dlp CLI.
class YtDlpHandler : public Handler {
public:
    YtDlpHandler(YtDlpProfile profile, const SessionStore& store, CommandRunner& runner,
                 YtDlpSettings settings, SleepFn sleep = sleepFor);

    SourceId source() const override { return profile_.source; }
    bool download(const std::string& url,
                  const std::string& destination,
                  const DownloadOptions& options,
                  ErrorInfo& outError) override;

    // Cookie jar for this item, or empty for none. Creates the parent directory.
    std::string resolveCookiePath(const DownloadOptions& options) const;

    // Full argv. `cookiePath` is passed as-is (the download uses a working copy).
    std::vector<std::string> buildCommand(const std::string& url,
                                          const std::string& destination,
                                          const DownloadOptions& options,
                                          const std::string& cookiePath) const;

private:
    YtDlpProfile profile_;
    const SessionStore& store_;
    CommandRunner& runner_;
    YtDlpSettings settings_;
    SleepFn sleep_;
};

} // namespace multidl
