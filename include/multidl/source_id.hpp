#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace multidl {

// Closed set of supported platforms. Values index the handler table.
enum class SourceId {
    GoogleDrive = 0,
    Instagram,
    TikTok,
    Threads,
    Twitter,
    Reddit,
    Facebook,
    YouTube
};

constexpr size_t kSourceCount = 8;

constexpr std::array<SourceId, kSourceCount> kAllSources = {
    SourceId::GoogleDrive, SourceId::Instagram, SourceId::TikTok, SourceId::Threads,
    SourceId::Twitter, SourceId::Reddit, SourceId::Facebook, SourceId::YouTube};

constexpr size_t sourceIndex(SourceId id) { return static_cast<size_t>(id); }

// Stable key used for session namespaces ("GoogleDrive").
const char* sourceKey(SourceId id);
// Human-readable name used in logs ("Google Drive").
const char* sourceDisplayName(SourceId id);
// Accepts the key or the display name, case-insensitively.
std::optional<SourceId> parseSourceId(const std::string& text);

} // namespace multidl
