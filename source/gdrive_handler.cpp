#include "multidl/gdrive_handler.hpp"

#include "multidl/filesystem.hpp"
#include "multidl/logger.hpp"
#include "multidl/util.hpp"
#include "mini/json.hpp"

#include <filesystem>

namespace multidl {

namespace {

constexpr const char* kDriveApiFiles = "https://www.googleapis.com/drive/v3/files/";

std::string bearerConfig(const std::string& token) {
    return "header = \"Authorization: Bearer " + token + "\"\n";
}

// Drive names may contain separators; keep them inside the destination.
std::string safeFileName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (c <= 31 || c == '/' || c == '\\') out.push_back('_');
        else out.push_back(static_cast<char>(c));
    }
    out = util::trimCopy(out);
    if (out.empty() || out == "." || out == "..") return {};
    return out;
}

} // namespace

GDriveHandler::GDriveHandler(const SessionStore& store, CommandRunner& runner,
                             GDriveSettings settings, SleepFn sleep)
    : store_(store), runner_(runner), settings_(std::move(settings)), sleep_(std::move(sleep)) {}

std::string GDriveHandler::resolveAccessToken(const DownloadOptions& options) const {
    if (options.credential && options.credential->source == SourceId::GoogleDrive &&
        !options.credential->token.empty()) {
        return options.credential->token;
    }
    mini::Object creds;
    if (store_.readJson(SourceId::GoogleDrive, kCredentialsFile, creds) != ReadStatus::Ok) return {};
    auto it = creds.find("access_token");
    if (it == creds.end() || it->second.type != mini::Value::Type::String) {
        logWarn("credentials.json has no access_token", "GDRIVE");
        return {};
    }
    return it->second.str;
}

std::vector<std::string> GDriveHandler::buildGdownCommand(const DriveTarget& target,
                                                          const std::string& destination,
                                                          const DownloadOptions& options) const {
    ToolArgs args;
    if (target.folder) args.emplace_back("--folder", "");
    if (!options.verbose) args.emplace_back("--quiet", "");
    if (target.folder) {
        args.emplace_back("-O", destination);
    } else {
        // Trailing separator keeps the remote file name.
        args.emplace_back("-O", (std::filesystem::path(destination) / "").string());
    }
    mergeToolArgs(args, options.toolArgs);

    std::vector<std::string> argv{settings_.gdownExecutable};
    appendToolArgs(argv, args);
    argv.push_back(target.folder ? "https://drive.google.com/drive/folders/" + target.id
                                 : "https://drive.google.com/uc?id=" + target.id);
    return argv;
}

std::vector<std::string> GDriveHandler::buildApiCommand(const std::string& fileId,
                                                        const std::string& outputPath,
                                                        const DownloadOptions& options) const {
    ToolArgs args;
    args.emplace_back("--fail", "");
    args.emplace_back("--location", "");
    if (!options.verbose) {
        args.emplace_back("--silent", "");
        args.emplace_back("--show-error", "");
    }
    args.emplace_back("--config", "-");
    args.emplace_back("--output", outputPath);
    mergeToolArgs(args, options.toolArgs);

    std::vector<std::string> argv{settings_.curlExecutable};
    appendToolArgs(argv, args);
    argv.push_back(std::string(kDriveApiFiles) + fileId + "?alt=media&supportsAllDrives=true");
    return argv;
}

bool GDriveHandler::runTool(const std::vector<std::string>& argv, const std::string& stdinData,
                            const std::string& tool, const std::string& label, CommandResult& lastResult,
                            ErrorInfo& outError) {
    auto attempt = [&](std::string& detail) {
        std::string err;
        if (!runner_.run(argv, stdinData, lastResult, err)) {
            detail = err;
            return false;
        }
        if (lastResult.exitCode == 0) return true;
        detail = describeToolFailure(tool, lastResult);
        return false;
    };
    auto classify = [](const std::string& detail) { return classifyError(detail); };
    return runWithRetry(settings_.retry, attempt, classify, outError, label, sleep_);
}

std::string GDriveHandler::lookupFileName(const std::string& fileId, const std::string& token) {
    const std::vector<std::string> argv{settings_.curlExecutable, "--fail", "--silent", "--show-error",
                                        "--location", "--config", "-",
                                        std::string(kDriveApiFiles) + fileId + "?fields=name&supportsAllDrives=true"};
    CommandResult result;
    std::string err;
    if (!runner_.run(argv, bearerConfig(token), result, err) || result.exitCode != 0) {
        logDebug("Drive metadata lookup failed for " + fileId + "; using id as name", "GDRIVE");
        return fileId;
    }
    mini::Object meta;
    if (!mini::parse(util::trimCopy(result.output), meta)) return fileId;
    auto it = meta.find("name");
    if (it == meta.end() || it->second.type != mini::Value::Type::String) return fileId;
    std::string name = safeFileName(it->second.str);
    return name.empty() ? fileId : name;
}

bool GDriveHandler::download(const std::string& url,
                             const std::string& destination,
                             const DownloadOptions& options,
                             ErrorInfo& outError) {
    auto target = parseDriveTarget(url);
    if (!target) {
        outError = makeError(ErrorCategory::InvalidInput, ErrorCode::MissingIdentifier,
                             "Invalid Google Drive link: " + url, "No Drive file or folder id in the link.");
        logWarn(outError.detail, "GDRIVE");
        return false;
    }
    const std::string method = options.method.value_or(kMethodPublic);
    if (method != kMethodPublic && method != kMethodAuthenticated) {
        outError = makeError(ErrorCategory::InvalidInput, ErrorCode::InvalidOption,
                             "Unknown Google Drive method: " + method);
        return false;
    }
    if (!ensureDirectory(destination)) {
        outError = makeError(ErrorCategory::TransientIO, ErrorCode::FileWrite,
                             "Failed to create destination: " + destination);
        return false;
    }

    CommandResult result;
    if (target->folder || method == kMethodPublic) {
        const std::string label = std::string("Google Drive ") + (target->folder ? "folder " : "file ") + target->id;
        logInfo("Fetching " + label + " via gdown", "GDRIVE");
        if (!runTool(buildGdownCommand(*target, destination, options), std::string(),
                     settings_.gdownExecutable, label, result, outError)) {
            logError("Failed " + label + ": " + describeError(outError), "GDRIVE");
            return false;
        }
        logInfo("Downloaded " + label, "GDRIVE");
        return true;
    }

    const std::string token = resolveAccessToken(options);
    if (token.empty()) {
        outError = makeError(ErrorCategory::AuthRequired, ErrorCode::SessionMissing,
                             "No Google Drive credentials for " + target->id,
                             "Place an access token in the GoogleDrive session credentials.json.");
        logWarn(outError.detail, "GDRIVE");
        return false;
    }

    const std::string outputPath =
        (std::filesystem::path(destination) / lookupFileName(target->id, token)).string();
    const std::string label = "Google Drive file " + target->id;
    logInfo("Fetching " + label + " via Drive API", "GDRIVE");
    if (!runTool(buildApiCommand(target->id, outputPath, options), bearerConfig(token),
                 settings_.curlExecutable, label, result, outError)) {
        removeFile(outputPath); // curl leaves a partial body behind
        logError("Failed " + label + ": " + describeError(outError), "GDRIVE");
        return false;
    }
    logInfo("Downloaded " + label + " to " + outputPath, "GDRIVE");
    return true;
}

} // namespace multidl
