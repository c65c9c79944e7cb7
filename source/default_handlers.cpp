#include "multidl/default_handlers.hpp"

#include "multidl/gdrive_handler.hpp"
#include "multidl/instagram_handler.hpp"
#include "multidl/ytdlp_handler.hpp"

#include <memory>

namespace multidl {

RetryPolicy retryPolicyFromConfig(const Config& cfg) {
    RetryPolicy policy;
    policy.maxAttempts = cfg.retryAttempts;
    policy.delay = std::chrono::milliseconds(cfg.retryDelayMs);
    return policy;
}

HandlerRegistry makeDefaultRegistry(const Config& cfg, const SessionStore& store, CommandRunner& runner,
                                    SleepFn sleep) {
    const RetryPolicy retry = retryPolicyFromConfig(cfg);
    HandlerRegistry registry;

    GDriveSettings drive;
    drive.gdownExecutable = cfg.gdownPath;
    drive.curlExecutable = cfg.curlPath;
    drive.retry = retry;
    registry.add(std::make_unique<GDriveHandler>(store, runner, drive, sleep));

    InstaloaderSettings insta;
    insta.executable = cfg.instaloaderPath;
    insta.retry = retry;
    registry.addAuthenticated(std::make_unique<InstagramHandler>(store, runner, insta, sleep));

    YtDlpSettings ytdlp;
    ytdlp.executable = cfg.ytdlpPath;
    ytdlp.retry = retry;
    ytdlp.concurrentFragments = cfg.concurrentFragments;
    for (SourceId id : kAllSources) {
        if (!isYtDlpSource(id)) continue;
        registry.add(std::make_unique<YtDlpHandler>(ytdlpProfileFor(id), store, runner, ytdlp, sleep));
    }
    return registry;
}

} // namespace multidl
