#pragma once

#include "multidl/config.hpp"
#include "multidl/handler_registry.hpp"
#include "multidl/process.hpp"
#include "multidl/retry.hpp"
#include "multidl/session_store.hpp"

namespace multidl {

RetryPolicy retryPolicyFromConfig(const Config& cfg);

// All eight sources wired to their CLI backends. `store` and `runner` must outlive the registry.
HandlerRegistry makeDefaultRegistry(const Config& cfg, const SessionStore& store, CommandRunner& runner,
                                    SleepFn sleep = sleepFor);

} // namespace multidl
