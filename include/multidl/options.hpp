#pragma once

#include "multidl/source_id.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace multidl {

// Result of an authentication hook. Opaque to the dispatcher.
struct CredentialHandle {
    SourceId source{SourceId::Instagram};
    std::string username;
    // Session file or cookie jar backing this credential (may be empty).
    std::string artifactPath;
    // Bearer token for API-style backends (may be empty).
    std::string token;
};

using CredentialPtr = std::shared_ptr<const CredentialHandle>;

constexpr const char* kAuthAuto = "auto";
constexpr const char* kAuthAuthenticated = "authenticated";
constexpr const char* kAuthUnauthenticated = "unauthenticated";
constexpr const char* kMethodPublic = "public";
constexpr const char* kMethodAuthenticated = "authenticated";

using ToolArgs = std::vector<std::pair<std::string, std::string>>;

// Per-item options. Built fresh for every item and passed by value.
struct DownloadOptions {
    // Instagram mode: auto | authenticated | unauthenticated
    std::optional<std::string> auth;
    // Cookie reuse; unset means true
    std::optional<bool> useSession;
    // Google Drive mode: public | authenticated; unset means public
    std::optional<std::string> method;
    CredentialPtr credential;
    // Explicit cookie jar, used verbatim
    std::string cookieFile;
    // Caller flag overrides, applied after the computed defaults.
    // An empty value means a bare flag.
    ToolArgs toolArgs;
    bool verbose{false};
};

// Applies caller overrides on top of computed defaults. A flag already present
// keeps its position and takes the caller's value; new flags are appended.
inline void mergeToolArgs(ToolArgs& defaults, const ToolArgs& overrides) {
    for (const auto& o : overrides) {
        bool replaced = false;
        for (auto& d : defaults) {
            if (d.first == o.first) {
                d.second = o.second;
                replaced = true;
            }
        }
        if (!replaced) defaults.push_back(o);
    }
}

inline void appendToolArgs(std::vector<std::string>& argv, const ToolArgs& args) {
    for (const auto& a : args) {
        argv.push_back(a.first);
        if (!a.second.empty()) argv.push_back(a.second);
    }
}

} // namespace multidl
