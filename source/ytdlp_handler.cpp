#include "multidl/ytdlp_handler.hpp"

#include "multidl/filesystem.hpp"
#include "multidl/identifiers.hpp"
#include "multidl/logger.hpp"
#include "multidl/raii.hpp"
#include "multidl/util.hpp"

#include <filesystem>

namespace multidl {

YtDlpProfile ytdlpProfileFor(SourceId source) {
    switch (source) {
        case SourceId::TikTok: return {source, "%(uploader)s/%(title)s [%(id)s].%(ext)s"};
        case SourceId::Twitter: return {source, "twitter/%(uploader_id)s/%(upload_date)s_%(id)s.%(ext)s"};
        case SourceId::Reddit: return {source, "reddit/%(uploader)s/%(title)s [%(id)s].%(ext)s"};
        case SourceId::Facebook: return {source, "facebook/%(uploader)s/%(title)s [%(id)s].%(ext)s"};
        case SourceId::YouTube: return {source, "youtube/%(channel)s/%(title)s [%(id)s].%(ext)s"};
        default: return {source, kDefaultOutputTemplate};
    }
}

bool isYtDlpSource(SourceId source) {
    switch (source) {
        case SourceId::TikTok:
        case SourceId::Threads:
        case SourceId::Twitter:
        case SourceId::Reddit:
        case SourceId::Facebook:
        case SourceId::YouTube:
            return true;
        default:
            return false;
    }
}

YtDlpHandler::YtDlpHandler(YtDlpProfile profile, const SessionStore& store, CommandRunner& runner,
                           YtDlpSettings settings, SleepFn sleep)
    : profile_(std::move(profile)),
      store_(store),
      runner_(runner),
      settings_(std::move(settings)),
      sleep_(std::move(sleep)) {}

std::string YtDlpHandler::resolveCookiePath(const DownloadOptions& options) const {
    if (!options.cookieFile.empty()) {
        ensureParentDirectory(options.cookieFile);
        return options.cookieFile;
    }
    if (options.credential && options.credential->source == profile_.source &&
        !options.credential->artifactPath.empty()) {
        return options.credential->artifactPath;
    }
    if (options.useSession.value_or(true)) {
        std::string err;
        if (!store_.ensureNamespace(profile_.source, err)) logWarn(err, "YTDLP");
        return store_.defaultCookiePath(profile_.source);
    }
    return {};
}

std::vector<std::string> YtDlpHandler::buildCommand(const std::string& url,
                                                    const std::string& destination,
                                                    const DownloadOptions& options,
                                                    const std::string& cookiePath) const {
    ToolArgs args;
    args.emplace_back("--no-playlist", "");
    if (!options.verbose) {
        args.emplace_back("--quiet", "");
        args.emplace_back("--no-warnings", "");
    }
    args.emplace_back("--retries", "2");
    args.emplace_back("--concurrent-fragments", std::to_string(settings_.concurrentFragments));
    args.emplace_back("--output", (std::filesystem::path(destination) / profile_.outputTemplate).string());
    if (!cookiePath.empty()) args.emplace_back("--cookies", cookiePath);
    mergeToolArgs(args, options.toolArgs);

    std::vector<std::string> argv{settings_.executable};
    appendToolArgs(argv, args);
    argv.push_back("--");
    argv.push_back(url);
    return argv;
}

bool YtDlpHandler::download(const std::string& url,
                            const std::string& destination,
                            const DownloadOptions& options,
                            ErrorInfo& outError) {
    const std::string name = sourceDisplayName(profile_.source);
    const std::string id = extractIdentifier(profile_.source, url);
    if (id.empty()) {
        outError = makeError(ErrorCategory::InvalidInput, ErrorCode::MissingIdentifier,
                             "Invalid " + name + " link: " + url, "No media id found in the link.");
        logWarn(outError.detail, "YTDLP");
        return false;
    }
    if (!ensureDirectory(destination)) {
        outError = makeError(ErrorCategory::TransientIO, ErrorCode::FileWrite,
                             "Failed to create destination: " + destination);
        return false;
    }

    // yt-dlp rewrites the jar on exit; work on a copy so a failed run leaves the stored one intact.
    const std::string cookiePath = resolveCookiePath(options);
    std::string workingCookie;
    if (!cookiePath.empty()) {
        workingCookie = cookiePath + ".part";
        removeFile(workingCookie);
        std::string err;
        if (isRegularFile(cookiePath) && !copyFile(cookiePath, workingCookie, err)) {
            logWarn("Running without cookies: " + err, "YTDLP");
            workingCookie.clear();
        }
    }
    auto cleanup = make_scope_guard([&]() {
        if (!workingCookie.empty()) removeFile(workingCookie);
    });

    const std::vector<std::string> argv = buildCommand(url, destination, options, workingCookie);
    logInfo("Fetching " + name + " " + id, "YTDLP");

    auto attempt = [&](std::string& detail) {
        CommandResult result;
        std::string err;
        if (!runner_.run(argv, std::string(), result, err)) {
            detail = err;
            return false;
        }
        if (result.exitCode == 0) return true;
        detail = describeToolFailure(settings_.executable, result);
        return false;
    };
    auto classify = [](const std::string& detail) { return classifyError(detail); };

    if (!runWithRetry(settings_.retry, attempt, classify, outError, name + " " + id, sleep_)) {
        logError("Failed " + name + " " + id + ": " + describeError(outError), "YTDLP");
        return false;
    }

    if (!workingCookie.empty() && isRegularFile(workingCookie)) {
        std::string err;
        if (replaceFile(workingCookie, cookiePath, err)) {
            logDebug("Updated cookie jar " + cookiePath, "YTDLP");
        } else {
            logWarn("PersistenceWarning: cookie jar not updated: " + err, "YTDLP");
        }
    }
    logInfo("Downloaded " + name + " " + id, "YTDLP");
    return true;
}

} // namespace multidl
