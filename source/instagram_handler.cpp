#include "multidl/instagram_handler.hpp"

#include "multidl/filesystem.hpp"
#include "multidl/identifiers.hpp"
#include "multidl/logger.hpp"
#include "multidl/util.hpp"

#include <filesystem>

namespace multidl {

namespace {

bool validAuthMode(const std::string& mode) {
    return mode == kAuthAuto || mode == kAuthAuthenticated || mode == kAuthUnauthenticated;
}

bool looksLikeSecondFactor(const std::string& output) {
    const std::string l = toLowerCopy(output);
    return l.find("two-factor") != std::string::npos || l.find("two factor") != std::string::npos ||
           l.find("2fa") != std::string::npos;
}

} // namespace

InstagramHandler::InstagramHandler(const SessionStore& store, CommandRunner& runner,
                                   InstaloaderSettings settings, SleepFn sleep)
    : store_(store), runner_(runner), settings_(std::move(settings)), sleep_(std::move(sleep)) {}

CredentialPtr InstagramHandler::loadCachedSession() const {
    SessionMetadata meta;
    if (store_.readMetadata(SourceId::Instagram, meta) != ReadStatus::Ok) return nullptr;
    if (meta.username.empty() || meta.filename.empty()) return nullptr;
    std::string path, err;
    if (!store_.pathFor(SourceId::Instagram, meta.filename, path, err)) return nullptr;
    auto handle = std::make_shared<CredentialHandle>();
    handle->source = SourceId::Instagram;
    handle->username = meta.username;
    handle->artifactPath = path;
    return handle;
}

std::vector<std::string> InstagramHandler::buildDownloadCommand(const std::string& shortcode,
                                                                const std::string& destination,
                                                                const CredentialHandle* session,
                                                                const DownloadOptions& options) const {
    ToolArgs args;
    args.emplace_back("--dirname-pattern", (std::filesystem::path(destination) / "{shortcode}").string());
    if (!options.verbose) args.emplace_back("--quiet", "");
    if (session) {
        args.emplace_back("--login", session->username);
        args.emplace_back("--sessionfile", session->artifactPath);
    }
    mergeToolArgs(args, options.toolArgs);

    std::vector<std::string> argv{settings_.executable};
    appendToolArgs(argv, args);
    argv.push_back("--");
    argv.push_back("-" + shortcode);
    return argv;
}

bool InstagramHandler::download(const std::string& url,
                                const std::string& destination,
                                const DownloadOptions& options,
                                ErrorInfo& outError) {
    const std::string shortcode = extractIdentifier(SourceId::Instagram, url);
    if (shortcode.empty()) {
        outError = makeError(ErrorCategory::InvalidInput, ErrorCode::MissingIdentifier,
                             "Invalid Instagram link: " + url, "No post shortcode found in the link.");
        logWarn(outError.detail, "INSTA");
        return false;
    }
    const std::string mode = options.auth.value_or(kAuthAuto);
    if (!validAuthMode(mode)) {
        outError = makeError(ErrorCategory::InvalidInput, ErrorCode::InvalidOption,
                             "Unknown Instagram auth mode: " + mode);
        return false;
    }

    CredentialPtr session;
    if (options.credential && options.credential->source == SourceId::Instagram) {
        session = options.credential;
    } else if (mode != kAuthUnauthenticated) {
        session = loadCachedSession();
    }
    if (mode == kAuthAuthenticated && !session) {
        outError = makeError(ErrorCategory::AuthRequired, ErrorCode::SessionMissing,
                             "No cached Instagram session for " + shortcode,
                             "Instagram requires authentication. Run 'multidl auth Instagram' first.");
        logWarn(outError.detail, "INSTA");
        return false;
    }
    if (!ensureDirectory(destination)) {
        outError = makeError(ErrorCategory::TransientIO, ErrorCode::FileWrite,
                             "Failed to create destination: " + destination);
        return false;
    }

    const std::vector<std::string> argv = buildDownloadCommand(shortcode, destination, session.get(), options);
    logInfo("Fetching Instagram post " + shortcode + (session ? " as " + session->username : " anonymously"),
            "INSTA");

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

    if (!runWithRetry(settings_.retry, attempt, classify, outError, "Instagram " + shortcode, sleep_)) {
        if (outError.category == ErrorCategory::AuthRequired) {
            outError.userMessage = "Instagram requires authentication for this post. Run 'multidl auth Instagram' first.";
        }
        logError("Failed Instagram " + shortcode + ": " + describeError(outError), "INSTA");
        return false;
    }
    logInfo("Downloaded Instagram post " + shortcode, "INSTA");
    return true;
}

CredentialPtr InstagramHandler::authenticate(InteractionContext* ctx) {
    if (CredentialPtr cached = loadCachedSession()) {
        logInfo("Reusing cached Instagram session for " + cached->username, "AUTH");
        return cached;
    }
    if (!ctx) {
        logInfo("No cached Instagram session and no interactive prompt available", "AUTH");
        return nullptr;
    }

    LoginRequest req;
    if (!ctx->requestLogin(SourceId::Instagram, req)) {
        logInfo("Instagram login cancelled", "AUTH");
        return nullptr;
    }
    req.username = util::trimCopy(req.username);
    req.sessionFile = util::trimCopy(req.sessionFile);

    if (!req.sessionFile.empty()) {
        if (req.username.empty()) {
            ctx->showError("A username is required when importing a session file.");
            return nullptr;
        }
        return importSession(*ctx, req);
    }
    if (req.username.empty() || req.password.empty()) {
        ctx->showError("Username and password are required.");
        return nullptr;
    }
    return login(*ctx, req);
}

CredentialPtr InstagramHandler::importSession(InteractionContext& ctx, const LoginRequest& req) {
    const std::string filename = req.username + ".session";
    std::string stored, err;
    if (!store_.importFile(SourceId::Instagram, req.sessionFile, filename, stored, err)) {
        ctx.showError("Could not import session file: " + err);
        logError(err, "AUTH");
        return nullptr;
    }
    return finishLogin(&ctx, req.username, filename);
}

CredentialPtr InstagramHandler::login(InteractionContext& ctx, const LoginRequest& req) {
    const std::string filename = req.username + ".session";
    std::string sessionPath, err;
    if (!store_.pathFor(SourceId::Instagram, filename, sessionPath, err) ||
        !store_.ensureNamespace(SourceId::Instagram, err)) {
        ctx.showError(err);
        return nullptr;
    }

    // No --password: argv is world-readable through /proc. instaloader prompts for it,
    // and with no controlling terminal the prompt reads stdin.
    const std::vector<std::string> argv{settings_.executable, "--login", req.username, "--sessionfile",
                                        sessionPath};
    const std::string passwordLine = req.password + "\n";
    CommandResult result;
    if (!runner_.runDetached(argv, passwordLine, result, err)) {
        ctx.showError("Instagram login failed: " + err);
        logError("Instagram login failed: " + err, "AUTH");
        return nullptr;
    }

    if (result.exitCode != 0 && looksLikeSecondFactor(result.output)) {
        const std::string code = util::trimCopy(ctx.requestSecondFactorCode(SourceId::Instagram));
        if (code.empty()) {
            logInfo("Two-factor login aborted", "AUTH");
            return nullptr;
        }
        // The code follows the password on stdin; instaloader asks for it after the challenge.
        if (!runner_.runDetached(argv, passwordLine + code + "\n", result, err)) {
            ctx.showError("Instagram login failed: " + err);
            logError("Instagram login failed: " + err, "AUTH");
            return nullptr;
        }
    }

    if (result.exitCode != 0 || !isRegularFile(sessionPath)) {
        const ErrorInfo info = classifyError(describeToolFailure(settings_.executable, result));
        ctx.showError("Instagram login failed: " + info.detail);
        logError("Instagram login failed: " + describeError(info), "AUTH");
        return nullptr;
    }
    logInfo("Instagram login succeeded for " + req.username, "AUTH");
    return finishLogin(&ctx, req.username, filename);
}

CredentialPtr InstagramHandler::finishLogin(InteractionContext* ctx, const std::string& username,
                                            const std::string& filename) {
    std::string sessionPath, err;
    if (!store_.pathFor(SourceId::Instagram, filename, sessionPath, err)) {
        logError(err, "AUTH");
        return nullptr;
    }
    if (!store_.writeMetadata(SourceId::Instagram, SessionMetadata{username, filename}, err)) {
        logWarn("PersistenceWarning: session metadata not saved: " + err, "SESS");
    }

    if (ctx) {
        const std::string exportPath = util::trimCopy(ctx->requestExportPath(SourceId::Instagram));
        if (!exportPath.empty()) {
            if (copyFile(sessionPath, exportPath, err)) {
                logInfo("Exported Instagram session to " + exportPath, "AUTH");
            } else {
                logWarn("Session export failed: " + err, "AUTH");
            }
        }
    }

    auto handle = std::make_shared<CredentialHandle>();
    handle->source = SourceId::Instagram;
    handle->username = username;
    handle->artifactPath = sessionPath;
    return handle;
}

} // namespace multidl
