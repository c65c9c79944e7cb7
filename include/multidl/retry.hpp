#pragma once

#include "multidl/errors.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace multidl {

struct RetryPolicy {
    int maxAttempts{2};
    std::chrono::milliseconds delay{1000};
};

// One attempt; returns true on success, otherwise fills `detail` with the failure text.
using AttemptFn = std::function<bool(std::string& detail)>;
// Maps a failure detail onto the taxonomy. `retryable` decides whether to go again.
using ClassifyFn = std::function<ErrorInfo(const std::string& detail)>;
using SleepFn = std::function<void(std::chrono::milliseconds)>;

void sleepFor(std::chrono::milliseconds delay);

// Runs `attempt` up to policy.maxAttempts times with a fixed delay between attempts.
// A non-retryable classification stops immediately and is returned as-is.
// Exhausting the budget yields a TransientIO error carrying the last detail.
bool runWithRetry(const RetryPolicy& policy,
                  const AttemptFn& attempt,
                  const ClassifyFn& classify,
                  ErrorInfo& outError,
                  const std::string& label,
                  const SleepFn& sleep = sleepFor);

} // namespace multidl
