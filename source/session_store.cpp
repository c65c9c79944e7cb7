#include "multidl/session_store.hpp"

#include "multidl/filesystem.hpp"
#include "multidl/logger.hpp"
#include "multidl/util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace multidl {

namespace {

bool validFilename(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) return false;
    if (name.find("..") != std::string::npos) return false;
    return true;
}

} // namespace

const char* readStatusLabel(ReadStatus s) {
    switch (s) {
        case ReadStatus::Ok: return "ok";
        case ReadStatus::Absent: return "absent";
        case ReadStatus::Corrupt: return "corrupt";
    }
    return "unknown";
}

SessionStore::SessionStore(std::string root) : root_(std::move(root)) {}

std::string SessionStore::sanitize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        out.push_back(std::isalnum(c) ? static_cast<char>(std::tolower(c)) : '_');
    }
    size_t b = out.find_first_not_of('_');
    if (b == std::string::npos) return "default";
    size_t e = out.find_last_not_of('_');
    return out.substr(b, e - b + 1);
}

std::string SessionStore::namespaceName(SourceId source) {
    return sanitize(sourceKey(source));
}

std::string SessionStore::namespaceDir(SourceId source) const {
    return (std::filesystem::path(root_) / namespaceName(source)).string();
}

bool SessionStore::pathFor(SourceId source, const std::string& filename, std::string& outPath,
                           std::string& outError) const {
    if (!validFilename(filename)) {
        outError = "Invalid session filename: '" + filename + "'";
        return false;
    }
    outPath = (std::filesystem::path(namespaceDir(source)) / filename).string();
    return true;
}

bool SessionStore::ensureNamespace(SourceId source, std::string& outError) const {
    const std::string dir = namespaceDir(source);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        outError = "Failed to create session dir: " + dir + " err=" + ec.message();
        return false;
    }
    return true;
}

ReadStatus SessionStore::readRaw(SourceId source, const std::string& filename, std::string& out) const {
    std::string path, err;
    if (!pathFor(source, filename, path, err)) {
        logWarn(err, "SESS");
        return ReadStatus::Absent;
    }
    if (!isRegularFile(path)) return ReadStatus::Absent;
    if (!readFile(path, out, err)) {
        logWarn("Unreadable session file (" + err + ")", "SESS");
        return ReadStatus::Corrupt;
    }
    return ReadStatus::Ok;
}

ReadStatus SessionStore::readJson(SourceId source, const std::string& filename, mini::Object& out) const {
    std::string contents;
    ReadStatus st = readRaw(source, filename, contents);
    if (st != ReadStatus::Ok) return st;
    mini::Object parsed;
    if (!mini::parse(contents, parsed)) {
        logWarn("Corrupt session JSON: " + namespaceName(source) + "/" + filename, "SESS");
        return ReadStatus::Corrupt;
    }
    out = std::move(parsed);
    return ReadStatus::Ok;
}

bool SessionStore::writeJson(SourceId source, const std::string& filename, const mini::Object& data,
                             std::string& outError) const {
    return writeText(source, filename, mini::dump(data) + "\n", outError);
}

ReadStatus SessionStore::readText(SourceId source, const std::string& filename, std::string& out) const {
    return readRaw(source, filename, out);
}

bool SessionStore::writeText(SourceId source, const std::string& filename, const std::string& text,
                             std::string& outError) const {
    std::string path;
    if (!pathFor(source, filename, path, outError)) return false;
    if (!ensureNamespace(source, outError)) return false;
    return writeFile(path, text, outError);
}

ReadStatus SessionStore::readBlob(SourceId source, const std::string& filename, std::vector<uint8_t>& out) const {
    std::string contents;
    ReadStatus st = readRaw(source, filename, contents);
    if (st != ReadStatus::Ok) return st;
    out.assign(contents.begin(), contents.end());
    return ReadStatus::Ok;
}

bool SessionStore::writeBlob(SourceId source, const std::string& filename, const std::vector<uint8_t>& data,
                             std::string& outError) const {
    return writeText(source, filename, std::string(data.begin(), data.end()), outError);
}

std::vector<std::string> SessionStore::listFiles(SourceId source, const std::string& suffix) const {
    std::vector<std::string> out;
    std::error_code ec;
    std::filesystem::directory_iterator it(namespaceDir(source), ec);
    if (ec) return out; // namespace not created yet
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        std::string name = entry.path().filename().string();
        if (util::endsWith(name, suffix)) out.push_back(std::move(name));
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string SessionStore::defaultCookiePath(SourceId source) const {
    return (std::filesystem::path(namespaceDir(source)) / kCookieFile).string();
}

std::string SessionStore::defaultMetadataPath(SourceId source) const {
    return (std::filesystem::path(namespaceDir(source)) / kMetadataFile).string();
}

ReadStatus SessionStore::loadDefaultSession(SourceId source, std::vector<uint8_t>& out) const {
    return readBlob(source, kSessionBlobFile, out);
}

bool SessionStore::writeDefaultSession(SourceId source, const std::vector<uint8_t>& data, std::string& outError) const {
    return writeBlob(source, kSessionBlobFile, data, outError);
}

ReadStatus SessionStore::readMetadata(SourceId source, SessionMetadata& out) const {
    mini::Object obj;
    ReadStatus st = readJson(source, kMetadataFile, obj);
    if (st != ReadStatus::Ok) return st;

    SessionMetadata meta;
    if (auto it = obj.find("username"); it != obj.end() && it->second.type == mini::Value::Type::String) {
        meta.username = it->second.str;
    }
    if (auto it = obj.find("filename"); it != obj.end() && it->second.type == mini::Value::Type::String) {
        meta.filename = it->second.str;
    }
    if (!meta.filename.empty()) {
        std::string path, err;
        if (!pathFor(source, meta.filename, path, err) || !isRegularFile(path)) {
            logWarn("Session metadata for " + namespaceName(source) + " references missing file '" +
                        meta.filename + "'; ignoring",
                    "SESS");
            return ReadStatus::Corrupt;
        }
    }
    out = std::move(meta);
    return ReadStatus::Ok;
}

bool SessionStore::writeMetadata(SourceId source, const SessionMetadata& meta, std::string& outError) const {
    if (!meta.filename.empty()) {
        std::string path;
        if (!pathFor(source, meta.filename, path, outError)) return false;
        if (!isRegularFile(path)) {
            outError = "Session metadata references missing file: " + path;
            return false;
        }
    }
    mini::Object obj;
    obj["username"] = mini::Value::makeString(meta.username);
    obj["filename"] = mini::Value::makeString(meta.filename);
    return writeJson(source, kMetadataFile, obj, outError);
}

bool SessionStore::importFile(SourceId source, const std::string& externalPath, const std::string& filename,
                              std::string& outPath, std::string& outError) const {
    if (!isRegularFile(externalPath)) {
        outError = "Session file not found: " + externalPath;
        return false;
    }
    std::string dest;
    if (!pathFor(source, filename, dest, outError)) return false;
    if (!ensureNamespace(source, outError)) return false;
    std::error_code ec;
    if (std::filesystem::equivalent(externalPath, dest, ec)) {
        outPath = dest; // already stored
        return true;
    }
    if (!copyFile(externalPath, dest, outError)) return false;
    logInfo("Imported session file into " + namespaceName(source) + "/" + filename, "SESS");
    outPath = dest;
    return true;
}

} // namespace multidl
