#include "multidl/filesystem.hpp"
#include "multidl/logger.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace multidl {

bool ensureDirectory(const std::string& path) {
    if (path.empty()) return false;
    std::filesystem::path p(path);
    std::error_code ec;
    bool ok = std::filesystem::create_directories(p, ec) || std::filesystem::is_directory(p, ec);
    if (!ok) logWarn("Failed to ensure directory: " + path, "FS");
    return ok;
}

bool ensureParentDirectory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return true;
    return ensureDirectory(parent.string());
}

bool fileExists(const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    return std::filesystem::exists(p, ec);
}

bool isRegularFile(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::path(path), ec);
}

bool readFile(const std::string& path, std::string& out, std::string& outError) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        outError = "Failed to open for read: " + path;
        return false;
    }
    out.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        outError = "Failed reading file: " + path;
        return false;
    }
    return true;
}

bool writeFile(const std::string& path, const std::string& data, std::string& outError) {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            outError = "Failed to create dir: " + parent.string() + " err=" + ec.message();
            return false;
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        outError = "Failed to open for write: " + path;
        return false;
    }
    out << data;
    out.flush();
    if (!out.good()) {
        outError = "Failed writing file: " + path;
        return false;
    }
    return true;
}

bool copyFile(const std::string& from, const std::string& to, std::string& outError) {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(to).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        outError = "Failed to copy " + from + " -> " + to + " err=" + ec.message();
        return false;
    }
    return true;
}

bool replaceFile(const std::string& from, const std::string& to, std::string& outError) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) return true;
    // rename(2) fails with EXDEV across mounts.
    if (!copyFile(from, to, outError)) return false;
    removeFile(from);
    return true;
}

void removeFile(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(std::filesystem::path(path), ec); // best effort
}

} // namespace multidl
