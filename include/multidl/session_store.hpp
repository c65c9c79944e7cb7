#pragma once

#include "multidl/source_id.hpp"
#include "mini/json.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace multidl {

constexpr const char* kCookieFile = "cookies.txt";
constexpr const char* kMetadataFile = "meta.json";
constexpr const char* kSessionBlobFile = "session.bin";
constexpr const char* kCredentialsFile = "credentials.json";

// Absent and Corrupt are both "no usable state" to callers; Corrupt is logged.
enum class ReadStatus { Ok, Absent, Corrupt };

const char* readStatusLabel(ReadStatus s);

// meta.json contents. `filename` names a blob in the same namespace.
struct SessionMetadata {
    std::string username;
    std::string filename;
};

// Per-source on-disk persistence for cookies, credential blobs and metadata.
// One directory per SourceId under `root`. Writes are plain overwrites
// (last writer wins); nothing here locks.
class SessionStore {
public:
    explicit SessionStore(std::string root);

    const std::string& root() const { return root_; }

    // Lower-case alphanumerics, others become '_', edges trimmed, "default" if empty.
    static std::string sanitize(const std::string& name);
    static std::string namespaceName(SourceId source);

    std::string namespaceDir(SourceId source) const;
    // Rejects empty names, path separators and "..".
    bool pathFor(SourceId source, const std::string& filename, std::string& outPath, std::string& outError) const;
    bool ensureNamespace(SourceId source, std::string& outError) const;

    ReadStatus readJson(SourceId source, const std::string& filename, mini::Object& out) const;
    bool writeJson(SourceId source, const std::string& filename, const mini::Object& data, std::string& outError) const;

    ReadStatus readText(SourceId source, const std::string& filename, std::string& out) const;
    bool writeText(SourceId source, const std::string& filename, const std::string& text, std::string& outError) const;

    ReadStatus readBlob(SourceId source, const std::string& filename, std::vector<uint8_t>& out) const;
    bool writeBlob(SourceId source, const std::string& filename, const std::vector<uint8_t>& data, std::string& outError) const;

    // Regular files in the namespace whose names end in `suffix`, sorted.
    std::vector<std::string> listFiles(SourceId source, const std::string& suffix = std::string()) const;

    std::string defaultCookiePath(SourceId source) const;
    std::string defaultMetadataPath(SourceId source) const;

    ReadStatus loadDefaultSession(SourceId source, std::vector<uint8_t>& out) const;
    bool writeDefaultSession(SourceId source, const std::vector<uint8_t>& data, std::string& outError) const;

    // A metadata file whose `filename` is missing from the namespace reads as Corrupt.
    ReadStatus readMetadata(SourceId source, SessionMetadata& out) const;
    // Refuses to reference a file that is not in the namespace.
    bool writeMetadata(SourceId source, const SessionMetadata& meta, std::string& outError) const;

    // Copy an external file into the namespace as `filename`; returns the stored path.
    bool importFile(SourceId source, const std::string& externalPath, const std::string& filename,
                    std::string& outPath, std::string& outError) const;

private:
    ReadStatus readRaw(SourceId source, const std::string& filename, std::string& out) const;

    std::string root_;
};

} // namespace multidl
