#include "multidl/router.hpp"
#include "multidl/errors.hpp"
#include "multidl/logger.hpp"
#include <cctype>

namespace multidl {

const std::vector<AliasRule>& aliasTable() {
    static const std::vector<AliasRule> kRules = {
        {"drive.google.com", SourceId::GoogleDrive},
        {"docs.google.com", SourceId::GoogleDrive},
        {"googledrive", SourceId::GoogleDrive},
        {"googleusercontent", SourceId::GoogleDrive},
        {"instagram", SourceId::Instagram},
        {"instagr", SourceId::Instagram}, // instagr.am; shadowed by the rule above for full names
        {"ddinstagram", SourceId::Instagram},
        {"threads", SourceId::Threads},
        {"tiktok", SourceId::TikTok},
        {"douyin", SourceId::TikTok},
        {"twitter", SourceId::Twitter},
        {"x.com", SourceId::Twitter},
        {"fxtwitter", SourceId::Twitter},
        {"vxtwitter", SourceId::Twitter},
        {"reddit", SourceId::Reddit},
        {"redd.it", SourceId::Reddit},
        {"facebook", SourceId::Facebook},
        {"fb.watch", SourceId::Facebook},
        {"fbcdn", SourceId::Facebook},
        {"youtube", SourceId::YouTube},
        {"youtu.be", SourceId::YouTube},
        {"youtubekids", SourceId::YouTube},
    };
    return kRules;
}

std::optional<SourceId> matchAlias(const std::string& lowered) {
    if (lowered.empty()) return std::nullopt;
    for (const auto& rule : aliasTable()) {
        if (lowered.find(rule.substring) != std::string::npos) return rule.source;
    }
    return std::nullopt;
}

std::string urlHost(const std::string& url) {
    size_t start = 0;
    if (url.compare(0, 2, "//") == 0) {
        start = 2;
    } else {
        auto pos = url.find("://");
        if (pos == std::string::npos || pos == 0) return {};
        // Only a well-formed scheme may precede the netloc.
        if (!std::isalpha(static_cast<unsigned char>(url[0]))) return {};
        for (size_t i = 1; i < pos; ++i) {
            unsigned char c = static_cast<unsigned char>(url[i]);
            if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return {};
        }
        start = pos + 3;
    }
    size_t end = url.find_first_of("/?#", start);
    if (end == std::string::npos) end = url.size();
    return toLowerCopy(url.substr(start, end - start));
}

std::optional<SourceId> resolveSource(const std::string& hint, const std::string& url) {
    const std::string candidates[] = {toLowerCopy(hint), urlHost(url)};
    for (const auto& candidate : candidates) {
        if (auto id = matchAlias(candidate)) {
            logDebug("Resolved '" + candidate + "' -> " + sourceKey(*id), "ROUTE");
            return id;
        }
    }
    logDebug("No source for hint='" + hint + "' url=" + url, "ROUTE");
    return std::nullopt;
}

} // namespace multidl
