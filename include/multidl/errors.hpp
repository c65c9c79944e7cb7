#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace multidl {

enum class ErrorCategory {
    None,
    Config,
    Unsupported,
    InvalidInput,
    AuthRequired,
    TransientIO,
    Persistence,
    Internal
};

enum class ErrorCode {
    None,
    Unknown,
    ConfigMissing,
    ConfigInvalid,
    MissingRequiredField,
    ToolMissing,
    ToolFailed,
    MalformedUrl,
    MissingIdentifier,
    InvalidOption,
    LoginRequired,
    TwoFactorRequired,
    SessionMissing,
    HttpUnauthorized,
    HttpForbidden,
    HttpNotFound,
    HttpStatus,
    RateLimited,
    Timeout,
    DnsFailure,
    ConnectFailure,
    NotFound,
    FileRead,
    FileWrite,
    ParseFailure
};

struct ErrorInfo {
    ErrorCategory category{ErrorCategory::None};
    ErrorCode code{ErrorCode::None};
    int httpStatus{0};
    bool retryable{false};
    std::string userMessage;
    std::string detail;
};

inline const char* errorCategoryLabel(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::Unsupported: return "Unsupported";
        case ErrorCategory::InvalidInput: return "InvalidInput";
        case ErrorCategory::AuthRequired: return "AuthRequired";
        case ErrorCategory::TransientIO: return "TransientIO";
        case ErrorCategory::Persistence: return "Persistence";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

inline const char* errorCodeLabel(ErrorCode c) {
    switch (c) {
        case ErrorCode::None: return "None";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::ConfigMissing: return "ConfigMissing";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
        case ErrorCode::MissingRequiredField: return "MissingRequiredField";
        case ErrorCode::ToolMissing: return "ToolMissing";
        case ErrorCode::ToolFailed: return "ToolFailed";
        case ErrorCode::MalformedUrl: return "MalformedUrl";
        case ErrorCode::MissingIdentifier: return "MissingIdentifier";
        case ErrorCode::InvalidOption: return "InvalidOption";
        case ErrorCode::LoginRequired: return "LoginRequired";
        case ErrorCode::TwoFactorRequired: return "TwoFactorRequired";
        case ErrorCode::SessionMissing: return "SessionMissing";
        case ErrorCode::HttpUnauthorized: return "HttpUnauthorized";
        case ErrorCode::HttpForbidden: return "HttpForbidden";
        case ErrorCode::HttpNotFound: return "HttpNotFound";
        case ErrorCode::HttpStatus: return "HttpStatus";
        case ErrorCode::RateLimited: return "RateLimited";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::DnsFailure: return "DnsFailure";
        case ErrorCode::ConnectFailure: return "ConnectFailure";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::FileRead: return "FileRead";
        case ErrorCode::FileWrite: return "FileWrite";
        case ErrorCode::ParseFailure: return "ParseFailure";
        default: return "Unknown";
    }
}

inline std::string toLowerCopy(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

inline int parseHttpStatusFromMessage(const std::string& msg) {
    // Accept "HTTP 401 ...", "HTTP Error 429: ...", "(HTTP 404)" and curl's "returned error: 403".
    auto pos = msg.find("HTTP ");
    if (pos == std::string::npos) pos = msg.find("HTTP");
    if (pos == std::string::npos) pos = msg.find("returned error");
    if (pos == std::string::npos) return 0;
    pos = msg.find_first_of("0123456789", pos);
    if (pos == std::string::npos) return 0;
    int code = 0;
    int digits = 0;
    while (pos < msg.size() && std::isdigit(static_cast<unsigned char>(msg[pos])) && digits < 3) {
        code = code * 10 + (msg[pos] - '0');
        ++pos;
        ++digits;
    }
    return digits == 3 ? code : 0;
}

// Build an ErrorInfo with a fixed category/code, bypassing message matching.
inline ErrorInfo makeError(ErrorCategory cat, ErrorCode code, const std::string& detail,
                           const std::string& user = std::string()) {
    ErrorInfo out;
    out.category = cat;
    out.code = code;
    out.detail = detail;
    out.userMessage = user;
    return out;
}

inline ErrorInfo classifyError(const std::string& detail, ErrorCategory hint = ErrorCategory::None) {
    ErrorInfo out;
    out.detail = detail;
    out.category = hint;
    out.code = ErrorCode::Unknown;

    const std::string l = toLowerCopy(detail);
    const int http = parseHttpStatusFromMessage(detail);
    if (http > 0) out.httpStatus = http;

    auto has = [&](const char* needle) { return l.find(needle) != std::string::npos; };
    auto set = [&](ErrorCategory cat, ErrorCode code, const char* user, bool retryable) {
        out.category = cat;
        out.code = code;
        out.userMessage = user;
        out.retryable = retryable;
    };

    if (has("missing config")) {
        set(ErrorCategory::Config, ErrorCode::ConfigMissing, "Configuration file is missing.", false);
    } else if (has("invalid config json") || has("failed to parse env") || has("invalid config value")) {
        set(ErrorCategory::Config, ErrorCode::ConfigInvalid, "Configuration format is invalid.", false);
    } else if (has("exec failed") || has("command not found") || has("no such file or directory: '")) {
        set(ErrorCategory::Config, ErrorCode::ToolMissing, "Required download tool is not installed.", false);
    } else if (has("two-factor") || has("two factor") || has("2fa") || has("verification code")) {
        set(ErrorCategory::AuthRequired, ErrorCode::TwoFactorRequired, "Two-factor authentication required.", false);
    } else if (has("login") || has("log in") || has("sign in") || has("sign-in") ||
               has("authenticat") || has("checkpoint") || (has("cookies") && has("required"))) {
        set(ErrorCategory::AuthRequired, ErrorCode::LoginRequired, "Sign-in required for this item.", false);
    } else if (http == 401) {
        set(ErrorCategory::AuthRequired, ErrorCode::HttpUnauthorized, "Authentication failed (401).", false);
    } else if (http == 403) {
        set(ErrorCategory::AuthRequired, ErrorCode::HttpForbidden, "Access denied (403).", false);
    } else if (http == 429 || has("too many requests") || has("rate limit") || has("rate-limit")) {
        set(ErrorCategory::TransientIO, ErrorCode::RateLimited, "Rate limited by the remote service.", true);
    } else if (http == 404) {
        set(ErrorCategory::TransientIO, ErrorCode::HttpNotFound, "Requested media was not found (404).", true);
    } else if (http >= 400 && http < 600) {
        set(ErrorCategory::TransientIO, ErrorCode::HttpStatus, "Remote service returned an HTTP error.", true);
    } else if (has("timeout") || has("timed out")) {
        set(ErrorCategory::TransientIO, ErrorCode::Timeout, "Network operation timed out.", true);
    } else if (has("dns") || has("name resolution") || has("resolve host") || has("getaddrinfo")) {
        set(ErrorCategory::TransientIO, ErrorCode::DnsFailure, "DNS lookup failed.", true);
    } else if (has("connection") || has("connect failed") || has("network is unreachable")) {
        set(ErrorCategory::TransientIO, ErrorCode::ConnectFailure, "Failed to connect to the remote service.", true);
    } else if (has("not found") || has("unsupported url") || has("does not exist") || has("unavailable")) {
        set(ErrorCategory::TransientIO, ErrorCode::NotFound, "Media could not be located.", true);
    }

    // Fill any missing defaults. Unknown tool failures are worth another attempt.
    if (out.category == ErrorCategory::None) {
        out.category = ErrorCategory::TransientIO;
        out.code = ErrorCode::ToolFailed;
        out.retryable = true;
    }
    if (out.userMessage.empty()) {
        switch (out.category) {
            case ErrorCategory::Config: out.userMessage = "Configuration error."; break;
            case ErrorCategory::Unsupported: out.userMessage = "Unsupported source."; break;
            case ErrorCategory::InvalidInput: out.userMessage = "Invalid input."; break;
            case ErrorCategory::AuthRequired: out.userMessage = "Authentication required."; break;
            case ErrorCategory::TransientIO: out.userMessage = "Download failed."; out.retryable = true; break;
            case ErrorCategory::Persistence: out.userMessage = "Failed to save session data."; break;
            case ErrorCategory::Internal: out.userMessage = "Internal application error."; break;
            default: out.userMessage = "Unknown error."; break;
        }
    }

    return out;
}

// One-line rendering for logs and the run summary.
inline std::string describeError(const ErrorInfo& e) {
    std::string out = std::string(errorCategoryLabel(e.category)) + "/" + errorCodeLabel(e.code);
    if (!e.detail.empty()) out += ": " + e.detail;
    else if (!e.userMessage.empty()) out += ": " + e.userMessage;
    return out;
}

} // namespace multidl
