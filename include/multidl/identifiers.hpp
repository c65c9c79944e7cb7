#pragma once

#include "multidl/source_id.hpp"
#include <optional>
#include <string>

namespace multidl {

// Media identifier for `url` using the source's patterns; empty when none match.
std::string extractIdentifier(SourceId source, const std::string& url);

struct DriveTarget {
    std::string id;
    bool folder{false};
};

// Folder patterns are checked before file patterns.
std::optional<DriveTarget> parseDriveTarget(const std::string& url);

} // namespace multidl
