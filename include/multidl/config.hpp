#pragma once

#include <string>

namespace multidl {

struct Config {
    // Root directory for per-source session namespaces
    std::string sessionRoot{".sessions"};
    // Destination directory for downloads (per-source subfolders come from the tools' templates)
    std::string downloadDir{"downloads"};
    // Logging verbosity (debug, info, warn, error)
    std::string logLevel{"info"};
    // Optional log file; empty logs to stderr only
    std::string logFile;
    // Per-item attempt budget and fixed delay between attempts
    int retryAttempts{2};
    int retryDelayMs{1000};
    // yt-dlp --concurrent-fragments
    int concurrentFragments{2};
    // External tool binaries (PATH lookup when bare names)
    std::string ytdlpPath{"yt-dlp"};
    std::string instaloaderPath{"instaloader"};
    std::string gdownPath{"gdown"};
    std::string curlPath{"curl"};
    // Admission limits; negative means unlimited
    int globalLimit{-1};
    int perSourceLimit{-1};
    bool dryRun{false};
};

// Load configuration from `path` (.env style unless it ends in .json).
// With an empty path, multidl.env then multidl.json in the working directory are tried;
// missing defaults are not an error.
bool loadConfig(const std::string& path, Config& outCfg, std::string& outError);

// Parse from memory; both validate the result.
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError);
bool parseJsonConfigString(const std::string& contents, Config& outCfg, std::string& outError);

bool validateConfig(const Config& cfg, std::string& outError);

} // namespace multidl
