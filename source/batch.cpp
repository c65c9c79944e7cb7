#include "multidl/batch.hpp"

#include "multidl/admission.hpp"
#include "multidl/filesystem.hpp"
#include "multidl/logger.hpp"
#include "multidl/router.hpp"

#include <exception>

namespace multidl {

DownloadOptions buildOptionsFor(SourceId source, const BatchOptions& batch) {
    DownloadOptions opts;
    if (source == SourceId::Instagram) {
        opts.auth = kAuthAuto;
    } else if (source != SourceId::GoogleDrive) {
        opts.useSession = true;
    }
    opts.credential = batch.credentials[sourceIndex(source)];
    return opts;
}

BatchResult executeBatch(const std::vector<ManifestItem>& items,
                         const std::string& destination,
                         const BatchOptions& options,
                         const HandlerRegistry& registry) {
    BatchResult result;
    AdmissionControl admission(options.globalLimit, options.perSourceLimit);

    if (!ensureDirectory(destination)) {
        logError("Destination unavailable: " + destination + " (handlers will report per item)", "BATCH");
    }
    logInfo("Starting batch of " + std::to_string(items.size()) + " item(s) into " + destination +
                (options.dryRun ? " [dry run]" : ""),
            "BATCH");

    for (const auto& item : items) {
        const std::optional<SourceId> source = resolveSource(item.sourceHint, item.url);
        Handler* handler = source ? registry.find(*source) : nullptr;
        if (!handler) {
            logInfo("Skipping unsupported item: " + item.url, "BATCH");
            result.skipped.push_back({item.sourceHint, item.url, kSkipUnsupported});
            continue;
        }

        const Admission admitted = admission.tryAdmit(*source);
        if (admitted != Admission::Admitted) {
            logInfo(std::string("Skipping ") + item.url + " (" + admissionReason(admitted) + ")", "BATCH");
            result.skipped.push_back({item.sourceHint, item.url, admissionReason(admitted)});
            continue;
        }

        const DownloadOptions opts = buildOptionsFor(*source, options);
        if (options.dryRun) {
            logInfo(std::string("[dry run] ") + sourceDisplayName(*source) + " " + item.url, "BATCH");
            result.completed.push_back({*source, item.url});
            continue;
        }

        ErrorInfo err;
        bool ok = false;
        try {
            ok = handler->download(item.url, destination, opts, err);
        } catch (const std::exception& ex) {
            err = makeError(ErrorCategory::Internal, ErrorCode::Unknown, ex.what());
            ok = false;
        } catch (...) {
            err = makeError(ErrorCategory::Internal, ErrorCode::Unknown, "Handler threw a non-standard exception");
            ok = false;
        }

        if (ok) {
            result.completed.push_back({*source, item.url});
        } else {
            if (err.category == ErrorCategory::None) {
                err = makeError(ErrorCategory::Internal, ErrorCode::Unknown, "Handler reported failure without detail");
            }
            const std::string message = err.detail.empty() ? err.userMessage : err.detail;
            logWarn(std::string(sourceDisplayName(*source)) + " error for " + item.url + ": " + message, "BATCH");
            result.errors.push_back({*source, item.url, message, err});
        }
    }

    result.attempted = admission.attempted();
    logInfo(summarizeBatch(result), "BATCH");
    return result;
}

std::string summarizeBatch(const BatchResult& result) {
    return "Attempted: " + std::to_string(result.attempted) +
           ", completed: " + std::to_string(result.completed.size()) +
           ", skipped: " + std::to_string(result.skipped.size()) +
           ", errors: " + std::to_string(result.errors.size());
}

} // namespace multidl
