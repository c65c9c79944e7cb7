#include "multidl/retry.hpp"
#include "multidl/logger.hpp"
#include "multidl/util.hpp"
#include <algorithm>
#include <thread>

namespace multidl {

void sleepFor(std::chrono::milliseconds delay) {
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
}

bool runWithRetry(const RetryPolicy& policy,
                  const AttemptFn& attempt,
                  const ClassifyFn& classify,
                  ErrorInfo& outError,
                  const std::string& label,
                  const SleepFn& sleep) {
    const int maxAttempts = std::max(1, policy.maxAttempts);
    ErrorInfo last;
    for (int i = 1; i <= maxAttempts; ++i) {
        std::string detail;
        if (attempt(detail)) {
            if (i > 1) logInfo(label + " succeeded on attempt " + std::to_string(i), "RETRY");
            outError = ErrorInfo{};
            return true;
        }
        last = classify(detail);
        if (last.detail.empty()) last.detail = detail;
        if (!last.retryable) {
            logWarn(label + " failed (" + errorCategoryLabel(last.category) + "), not retrying: " +
                        util::ellipsize(last.detail, 200),
                    "RETRY");
            outError = last;
            return false;
        }
        logWarn(label + " attempt " + std::to_string(i) + "/" + std::to_string(maxAttempts) +
                    " failed: " + util::ellipsize(last.detail, 200),
                "RETRY");
        if (i < maxAttempts) sleep(policy.delay);
    }
    outError = last;
    outError.category = ErrorCategory::TransientIO;
    outError.retryable = true;
    return false;
}

} // namespace multidl
