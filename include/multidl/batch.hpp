#pragma once

#include "multidl/errors.hpp"
#include "multidl/handler_registry.hpp"
#include "multidl/manifest.hpp"
#include "multidl/options.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace multidl {

struct SkippedItem {
    std::string sourceHint;
    std::string url;
    std::string reason; // unsupported | global-limit | per-source-limit
};

struct CompletedItem {
    SourceId source;
    std::string url;
};

struct FailedItem {
    SourceId source;
    std::string url;
    std::string message;
    ErrorInfo error;
};

struct BatchResult {
    int attempted{0};
    std::vector<CompletedItem> completed;
    std::vector<SkippedItem> skipped;
    std::vector<FailedItem> errors;

    bool ok() const { return errors.empty(); }
};

struct BatchOptions {
    std::optional<int> globalLimit;
    std::optional<int> perSourceLimit;
    bool dryRun{false};
    // Pre-authenticated handles attached to every item of the matching source.
    std::array<CredentialPtr, kSourceCount> credentials{};
};

// Defaults a dispatched item starts with: Instagram gets auth=auto, every
// other source except Google Drive opts into session reuse.
DownloadOptions buildOptionsFor(SourceId source, const BatchOptions& batch);

// Processes items sequentially in input order. Never throws; handler
// failures (including anything thrown) are recorded in `errors`.
BatchResult executeBatch(const std::vector<ManifestItem>& items,
                         const std::string& destination,
                         const BatchOptions& options,
                         const HandlerRegistry& registry);

// "Attempted: A, completed: C, skipped: S, errors: E"
std::string summarizeBatch(const BatchResult& result);

} // namespace multidl
