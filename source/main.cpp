#include "multidl/batch.hpp"
#include "multidl/config.hpp"
#include "multidl/console_interaction.hpp"
#include "multidl/default_handlers.hpp"
#include "multidl/logger.hpp"
#include "multidl/manifest.hpp"
#include "multidl/process.hpp"
#include "multidl/session_store.hpp"
#include "multidl/version.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

using namespace multidl;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct RunArgs {
    std::string manifest;
    std::string format;
    std::string outDir;
    int limit{-1};
    int perSourceLimit{-1};
    bool dryRun{false};
    bool reauth{false};
};

std::optional<int> limitFrom(const CLI::Option* opt, int cliValue, int cfgValue) {
    if (opt && opt->count() > 0) return cliValue < 0 ? std::nullopt : std::optional<int>(cliValue);
    return cfgValue < 0 ? std::nullopt : std::optional<int>(cfgValue);
}

// Authenticates each source that failed with AuthRequired (once per source)
// and re-runs those items with the new credential.
void reauthAndRetry(BatchResult& result, BatchOptions options, const std::string& outDir,
                    const HandlerRegistry& registry) {
    std::set<SourceId> needAuth;
    for (const auto& e : result.errors) {
        if (e.error.category == ErrorCategory::AuthRequired && registry.canAuthenticate(e.source)) {
            needAuth.insert(e.source);
        }
    }
    if (needAuth.empty()) return;

    ConsoleInteraction console(std::cin, std::cerr);
    std::set<SourceId> authenticated;
    for (SourceId src : needAuth) {
        if (CredentialPtr handle = registry.authenticate(src, &console)) {
            options.credentials[sourceIndex(src)] = handle;
            authenticated.insert(src);
        }
    }
    if (authenticated.empty()) return;

    std::vector<ManifestItem> retryItems;
    std::vector<FailedItem> remaining;
    for (auto& e : result.errors) {
        if (e.error.category == ErrorCategory::AuthRequired && authenticated.count(e.source)) {
            retryItems.push_back({sourceKey(e.source), e.url});
        } else {
            remaining.push_back(std::move(e));
        }
    }

    // Retried items were already charged against the limits.
    options.globalLimit.reset();
    options.perSourceLimit.reset();
    logInfo("Retrying " + std::to_string(retryItems.size()) + " item(s) after authentication", "CLI");
    BatchResult again = executeBatch(retryItems, outDir, options, registry);

    result.errors = std::move(remaining);
    for (auto& c : again.completed) result.completed.push_back(std::move(c));
    for (auto& e : again.errors) result.errors.push_back(std::move(e));
}

int runCommand(const RunArgs& args, const CLI::Option* limitOpt, const CLI::Option* perSourceOpt,
               const Config& cfg, const HandlerRegistry& registry) {
    ManifestFormat format = ManifestFormat::Auto;
    std::string err;
    if (!parseManifestFormat(args.format, format, err)) {
        logError(err, "CLI");
        return kExitUsage;
    }
    std::vector<ManifestItem> items;
    if (!loadManifest(args.manifest, format, items, err)) {
        logError(err, "CLI");
        return kExitUsage;
    }

    BatchOptions options;
    options.globalLimit = limitFrom(limitOpt, args.limit, cfg.globalLimit);
    options.perSourceLimit = limitFrom(perSourceOpt, args.perSourceLimit, cfg.perSourceLimit);
    options.dryRun = args.dryRun || cfg.dryRun;
    const std::string outDir = args.outDir.empty() ? cfg.downloadDir : args.outDir;

    BatchResult result = executeBatch(items, outDir, options, registry);
    if (args.reauth && !options.dryRun) reauthAndRetry(result, options, outDir, registry);

    std::cout << summarizeBatch(result) << std::endl;
    for (const auto& e : result.errors) {
        std::cout << "  [" << sourceDisplayName(e.source) << "] " << e.url << ": "
                  << errorCategoryLabel(e.error.category) << ": " << e.message << std::endl;
    }
    if (!result.ok()) {
        logError("Some downloads failed. See log for details.", "CLI");
        return kExitFailure;
    }
    return 0;
}

int authCommand(const std::string& sourceName, const HandlerRegistry& registry) {
    auto source = parseSourceId(sourceName);
    if (!source) {
        std::cerr << "Unknown source: " << sourceName << std::endl;
        return kExitUsage;
    }
    ConsoleInteraction console(std::cin, std::cerr);
    CredentialPtr handle = registry.authenticate(*source, &console);
    if (!handle) {
        std::cout << "No credential obtained for " << sourceDisplayName(*source) << std::endl;
        return kExitFailure;
    }
    std::cout << "Authenticated " << sourceDisplayName(*source) << " as " << handle->username;
    if (!handle->artifactPath.empty()) std::cout << " (" << handle->artifactPath << ")";
    std::cout << std::endl;
    return 0;
}

int sourcesCommand(const HandlerRegistry& registry) {
    for (SourceId id : registry.sources()) {
        std::cout << sourceKey(id) << "\t" << sourceDisplayName(id)
                  << (registry.canAuthenticate(id) ? "\tauth" : "") << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"multidl: download media from many sources in one batch"};
    app.set_version_flag("--version", std::string(appVersion()));
    app.require_subcommand(1);

    std::string configPath;
    bool verbose = false;
    app.add_option("-c,--config", configPath, "Config file (.env style, or .json)");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    RunArgs runArgs;
    CLI::App* run = app.add_subcommand("run", "Download every item listed in a manifest");
    run->add_option("manifest", runArgs.manifest, "Manifest file (.json or .csv)")->required();
    run->add_option("--format", runArgs.format, "Override the manifest format")
        ->check(CLI::IsMember({"json", "csv"}));
    run->add_option("--out-dir", runArgs.outDir, "Download destination (default: download_dir)");
    CLI::Option* limitOpt = run->add_option("--limit", runArgs.limit, "Maximum items to attempt");
    CLI::Option* perSourceOpt =
        run->add_option("--per-source-limit", runArgs.perSourceLimit, "Maximum items per source");
    run->add_flag("--dry-run", runArgs.dryRun, "Resolve and admit items without downloading");
    run->add_flag("--reauth", runArgs.reauth, "Prompt for login when a source needs it, then retry");

    std::string authSource;
    CLI::App* auth = app.add_subcommand("auth", "Log in to a source and cache the session");
    auth->add_option("source", authSource, "Source name, e.g. Instagram")->required();

    CLI::App* sources = app.add_subcommand("sources", "List supported sources");

    CLI11_PARSE(app, argc, argv);

    Config cfg;
    std::string err;
    if (!loadConfig(configPath, cfg, err)) {
        std::cerr << "Config error: " << err << std::endl;
        return kExitUsage;
    }
    setLogLevelFromString(verbose ? "debug" : cfg.logLevel);
    initLogFile(cfg.logFile);
    logDebug(std::string("multidl ") + appVersion(), "CLI");

    SessionStore store(cfg.sessionRoot);
    PosixCommandRunner runner;
    const HandlerRegistry registry = makeDefaultRegistry(cfg, store, runner);

    int rc = 0;
    if (*run) rc = runCommand(runArgs, limitOpt, perSourceOpt, cfg, registry);
    else if (*auth) rc = authCommand(authSource, registry);
    else if (*sources) rc = sourcesCommand(registry);
    closeLogFile();
    return rc;
}
