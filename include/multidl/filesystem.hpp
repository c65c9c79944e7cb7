#pragma once

#include <string>

namespace multidl {

// Ensure a directory exists, creating it if necessary.
bool ensureDirectory(const std::string& path);
// Ensure the directory holding `path` exists.
bool ensureParentDirectory(const std::string& path);
// Check if a file exists.
bool fileExists(const std::string& path);
bool isRegularFile(const std::string& path);

// Whole-file helpers; outError carries the path and OS reason.
bool readFile(const std::string& path, std::string& out, std::string& outError);
bool writeFile(const std::string& path, const std::string& data, std::string& outError);
bool copyFile(const std::string& from, const std::string& to, std::string& outError);
// Replace `to` with `from`; falls back to copy+remove across filesystems.
bool replaceFile(const std::string& from, const std::string& to, std::string& outError);
// Best-effort removal; missing files are fine.
void removeFile(const std::string& path);

} // namespace multidl
