#include "multidl/source_id.hpp"
#include "multidl/errors.hpp"
#include "multidl/util.hpp"

namespace multidl {

const char* sourceKey(SourceId id) {
    switch (id) {
        case SourceId::GoogleDrive: return "GoogleDrive";
        case SourceId::Instagram: return "Instagram";
        case SourceId::TikTok: return "TikTok";
        case SourceId::Threads: return "Threads";
        case SourceId::Twitter: return "Twitter";
        case SourceId::Reddit: return "Reddit";
        case SourceId::Facebook: return "Facebook";
        case SourceId::YouTube: return "YouTube";
    }
    return "Unknown";
}

const char* sourceDisplayName(SourceId id) {
    switch (id) {
        case SourceId::GoogleDrive: return "Google Drive";
        case SourceId::Instagram: return "Instagram";
        case SourceId::TikTok: return "TikTok";
        case SourceId::Threads: return "Threads";
        case SourceId::Twitter: return "Twitter";
        case SourceId::Reddit: return "Reddit";
        case SourceId::Facebook: return "Facebook";
        case SourceId::YouTube: return "YouTube";
    }
    return "Unknown";
}

std::optional<SourceId> parseSourceId(const std::string& text) {
    const std::string l = toLowerCopy(util::trimCopy(text));
    if (l.empty()) return std::nullopt;
    for (SourceId id : kAllSources) {
        if (l == toLowerCopy(sourceKey(id)) || l == toLowerCopy(sourceDisplayName(id))) return id;
    }
    return std::nullopt;
}

} // namespace multidl
