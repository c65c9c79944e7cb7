#pragma once

#include "multidl/source_id.hpp"
#include <optional>
#include <string>
#include <vector>

namespace multidl {

struct AliasRule {
    const char* substring;
    SourceId source;
};

// Ordered alias table; the first case-insensitive containment match wins.
const std::vector<AliasRule>& aliasTable();

// Scan the alias table against an already lower-cased candidate.
std::optional<SourceId> matchAlias(const std::string& lowered);

// Host (netloc) of a URL, lower-cased. Empty when there is no "//".
std::string urlHost(const std::string& url);

// Map a (hint, url) pair to a source. The hint is checked before the host.
std::optional<SourceId> resolveSource(const std::string& hint, const std::string& url);

} // namespace multidl
