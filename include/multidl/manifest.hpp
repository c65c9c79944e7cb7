#pragma once

#include <string>
#include <vector>

namespace multidl {

struct ManifestItem {
    std::string sourceHint;
    std::string url;
};

enum class ManifestFormat { Auto, Json, Csv };

// "json" / "csv" (case-insensitive); "" or "auto" picks from the file extension.
bool parseManifestFormat(const std::string& text, ManifestFormat& out, std::string& outError);

// Surrounding whitespace only; no other rewriting.
std::string normalizeUrl(const std::string& url);

// Object: {"hint": [urls...]} or {"hint": {"items": [...]}}, key order kept.
// Array: [{"url": ..., "source": ...}, ...].
bool manifestFromJson(const std::string& text, std::vector<ManifestItem>& out, std::string& outError);

// Header row with source/Source and items_comma_separated/items columns.
bool manifestFromCsv(const std::string& text, std::vector<ManifestItem>& out, std::string& outError);

bool loadManifest(const std::string& path, ManifestFormat format,
                  std::vector<ManifestItem>& out, std::string& outError);

} // namespace multidl
