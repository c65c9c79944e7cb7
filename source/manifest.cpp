#include "multidl/manifest.hpp"

#include "multidl/errors.hpp"
#include "multidl/filesystem.hpp"
#include "multidl/logger.hpp"
#include "multidl/util.hpp"
#include "mini/json.hpp"

#include <cmath>
#include <filesystem>
#include <sstream>

namespace multidl {

namespace {

// Scalars only; anything else is not a URL.
bool scalarToString(const mini::Value& v, std::string& out) {
    if (v.type == mini::Value::Type::String) {
        out = v.str;
        return true;
    }
    if (v.type == mini::Value::Type::Number && std::isfinite(v.number)) {
        const double r = std::round(v.number);
        if (std::fabs(v.number - r) < 1e-9 && std::fabs(r) <= 9e15) {
            out = std::to_string(static_cast<long long>(r));
        } else {
            std::ostringstream oss;
            oss << v.number;
            out = oss.str();
        }
        return true;
    }
    return false;
}

void pushItem(std::vector<ManifestItem>& out, const std::string& hint, const std::string& rawUrl) {
    std::string url = normalizeUrl(rawUrl);
    if (url.empty()) return;
    out.push_back({hint, std::move(url)});
}

// RFC 4180 records: quoted fields, doubled quotes, CRLF or LF endings, newlines inside quotes.
bool parseCsvRecords(const std::string& text, std::vector<std::vector<std::string>>& records, std::string& outError) {
    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool fieldStarted = false;
    size_t i = 0;
    // UTF-8 BOM from spreadsheet exports.
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    auto endField = [&]() {
        row.push_back(std::move(field));
        field.clear();
        fieldStarted = false;
    };
    auto endRow = [&]() {
        endField();
        if (!(row.size() == 1 && row[0].empty())) records.push_back(std::move(row));
        row.clear();
    };

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        if (c == '"' && !fieldStarted) {
            inQuotes = true;
            fieldStarted = true;
        } else if (c == ',') {
            endField();
        } else if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            endRow();
        } else if (c == '\n') {
            endRow();
        } else {
            field.push_back(c);
            fieldStarted = true;
        }
    }
    if (inQuotes) {
        outError = "Malformed CSV manifest: unterminated quoted field";
        return false;
    }
    if (fieldStarted || !field.empty() || !row.empty()) endRow();
    return true;
}

} // namespace

bool parseManifestFormat(const std::string& text, ManifestFormat& out, std::string& outError) {
    const std::string l = toLowerCopy(util::trimCopy(text));
    if (l.empty() || l == "auto") out = ManifestFormat::Auto;
    else if (l == "json") out = ManifestFormat::Json;
    else if (l == "csv") out = ManifestFormat::Csv;
    else {
        outError = "Unsupported manifest format: " + text;
        return false;
    }
    return true;
}

std::string normalizeUrl(const std::string& url) {
    return util::trimCopy(url);
}

bool manifestFromJson(const std::string& text, std::vector<ManifestItem>& out, std::string& outError) {
    mini::Value root;
    if (!mini::parse(text, root)) {
        outError = "Malformed JSON manifest";
        return false;
    }

    if (root.type == mini::Value::Type::Object) {
        for (const auto& kv : root.object) {
            const mini::Value* urls = &kv.second;
            if (urls->type == mini::Value::Type::Object) {
                auto it = urls->object.find("items");
                if (it == urls->object.end()) continue;
                urls = &it->second;
            }
            if (urls->type != mini::Value::Type::Array) continue;
            for (const auto& u : urls->array) {
                std::string url;
                if (scalarToString(u, url)) pushItem(out, kv.first, url);
            }
        }
        return true;
    }

    if (root.type == mini::Value::Type::Array) {
        for (const auto& entry : root.array) {
            if (entry.type != mini::Value::Type::Object) continue;
            auto urlIt = entry.object.find("url");
            if (urlIt == entry.object.end()) continue;
            std::string url;
            if (!scalarToString(urlIt->second, url)) continue;
            std::string hint;
            if (auto srcIt = entry.object.find("source"); srcIt != entry.object.end()) {
                scalarToString(srcIt->second, hint);
            }
            pushItem(out, hint, url);
        }
        return true;
    }

    outError = "JSON manifest must be an object or array";
    return false;
}

bool manifestFromCsv(const std::string& text, std::vector<ManifestItem>& out, std::string& outError) {
    std::vector<std::vector<std::string>> records;
    if (!parseCsvRecords(text, records, outError)) return false;
    if (records.empty()) return true;

    const std::vector<std::string>& header = records.front();
    auto column = [&](const char* name) -> int {
        for (size_t i = 0; i < header.size(); ++i) {
            if (util::trimCopy(header[i]) == name) return static_cast<int>(i);
        }
        return -1;
    };
    const int sourceCols[] = {column("source"), column("Source")};
    const int itemCols[] = {column("items_comma_separated"), column("items")};
    if (itemCols[0] < 0 && itemCols[1] < 0) {
        outError = "CSV manifest needs an items_comma_separated or items column";
        return false;
    }

    auto firstNonEmpty = [](const std::vector<std::string>& row, const int* cols, size_t n) {
        for (size_t i = 0; i < n; ++i) {
            if (cols[i] >= 0 && static_cast<size_t>(cols[i]) < row.size() && !row[cols[i]].empty()) {
                return row[cols[i]];
            }
        }
        return std::string();
    };

    for (size_t r = 1; r < records.size(); ++r) {
        const auto& row = records[r];
        const std::string source = firstNonEmpty(row, sourceCols, 2);
        const std::string itemsField = firstNonEmpty(row, itemCols, 2);
        if (itemsField.empty()) continue;
        std::istringstream parts(itemsField);
        std::string part;
        while (std::getline(parts, part, ',')) {
            pushItem(out, source, part);
        }
    }
    return true;
}

bool loadManifest(const std::string& path, ManifestFormat format,
                  std::vector<ManifestItem>& out, std::string& outError) {
    if (format == ManifestFormat::Auto) {
        std::string ext = std::filesystem::path(path).extension().string();
        if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
        if (!parseManifestFormat(ext.empty() ? "<none>" : ext, format, outError)) return false;
        if (format == ManifestFormat::Auto) {
            outError = "Unsupported manifest format: " + ext;
            return false;
        }
    }

    std::string text;
    if (!readFile(path, text, outError)) return false;

    std::vector<ManifestItem> items;
    const bool ok = format == ManifestFormat::Json ? manifestFromJson(text, items, outError)
                                                   : manifestFromCsv(text, items, outError);
    if (!ok) {
        outError += " (" + path + ")";
        return false;
    }
    logInfo("Loaded " + std::to_string(items.size()) + " manifest item(s) from " + path, "BATCH");
    out = std::move(items);
    return true;
}

} // namespace multidl
