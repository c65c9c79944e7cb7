#include "multidl/config.hpp"
#include "multidl/errors.hpp"
#include "multidl/filesystem.hpp"
#include "multidl/logger.hpp"
#include "multidl/util.hpp"
#include "mini/json.hpp"
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace multidl {

namespace {

bool parseIntValue(const std::string& key, const std::string& val, int& out, std::string& outError) {
    if (val.empty()) {
        outError = "Invalid config value for " + key + ": empty";
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(val.c_str(), &end, 10);
    if (end == val.c_str() || *end != '\0') {
        outError = "Invalid config value for " + key + ": " + val;
        return false;
    }
    if (errno == ERANGE || v < INT_MIN || v > INT_MAX) {
        outError = "Invalid config value for " + key + ": out of range: " + val;
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

bool parseBoolValue(const std::string& val) {
    const std::string v = toLowerCopy(val);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

bool applyKey(const std::string& key, const std::string& val, Config& cfg, std::string& outError) {
    if (key == "session_root") cfg.sessionRoot = val;
    else if (key == "download_dir") cfg.downloadDir = val;
    else if (key == "log_level") cfg.logLevel = toLowerCopy(val);
    else if (key == "log_file") cfg.logFile = val;
    else if (key == "retry_attempts") return parseIntValue(key, val, cfg.retryAttempts, outError);
    else if (key == "retry_delay_ms") return parseIntValue(key, val, cfg.retryDelayMs, outError);
    else if (key == "concurrent_fragments") return parseIntValue(key, val, cfg.concurrentFragments, outError);
    else if (key == "ytdlp_path") cfg.ytdlpPath = val;
    else if (key == "instaloader_path") cfg.instaloaderPath = val;
    else if (key == "gdown_path") cfg.gdownPath = val;
    else if (key == "curl_path") cfg.curlPath = val;
    else if (key == "global_limit") return parseIntValue(key, val, cfg.globalLimit, outError);
    else if (key == "per_source_limit") return parseIntValue(key, val, cfg.perSourceLimit, outError);
    else if (key == "dry_run") cfg.dryRun = parseBoolValue(val);
    else logDebug("Ignoring unknown config key: " + key, "CFG");
    return true;
}

std::string numberToString(double n) {
    const double r = std::round(n);
    if (std::fabs(n - r) < 1e-9) return std::to_string(static_cast<long long>(r));
    std::ostringstream oss;
    oss << n;
    return oss.str();
}

bool hasJsonExtension(const std::string& path) {
    return util::endsWith(toLowerCopy(path), ".json");
}

} // namespace

bool validateConfig(const Config& cfg, std::string& outError) {
    if (cfg.retryAttempts < 1) {
        outError = "Invalid config value for retry_attempts: must be >= 1";
        return false;
    }
    if (cfg.retryDelayMs < 0) {
        outError = "Invalid config value for retry_delay_ms: must be >= 0";
        return false;
    }
    if (cfg.concurrentFragments < 1) {
        outError = "Invalid config value for concurrent_fragments: must be >= 1";
        return false;
    }
    if (cfg.sessionRoot.empty() || cfg.downloadDir.empty()) {
        outError = "Invalid config value: session_root and download_dir must be set";
        return false;
    }
    if (cfg.ytdlpPath.empty() || cfg.instaloaderPath.empty() || cfg.gdownPath.empty() || cfg.curlPath.empty()) {
        outError = "Invalid config value: tool paths must not be empty";
        return false;
    }
    return true;
}

bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError) {
    std::istringstream in(contents);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        lineNo++;
        line = util::trimCopy(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            outError = "Failed to parse env line " + std::to_string(lineNo) + ": missing '='";
            return false;
        }
        std::string key = util::trimCopy(toLowerCopy(line.substr(0, pos)));
        std::string val = util::trimCopy(line.substr(pos + 1));
        if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                                (val.front() == '\'' && val.back() == '\''))) {
            val = val.substr(1, val.size() - 2);
        }
        if (!applyKey(key, val, outCfg, outError)) return false;
    }
    return validateConfig(outCfg, outError);
}

bool parseJsonConfigString(const std::string& contents, Config& outCfg, std::string& outError) {
    mini::Object obj;
    if (!mini::parse(contents, obj)) {
        outError = "Invalid config JSON.";
        return false;
    }
    for (const auto& kv : obj) {
        const mini::Value& v = kv.second;
        std::string val;
        switch (v.type) {
            case mini::Value::Type::String: val = v.str; break;
            case mini::Value::Type::Number: val = numberToString(v.number); break;
            case mini::Value::Type::Bool: val = v.boolean ? "true" : "false"; break;
            case mini::Value::Type::Null: continue;
            default:
                outError = "Invalid config value for " + kv.first + ": expected scalar";
                return false;
        }
        if (!applyKey(toLowerCopy(kv.first), val, outCfg, outError)) return false;
    }
    return validateConfig(outCfg, outError);
}

bool loadConfig(const std::string& path, Config& outCfg, std::string& outError) {
    auto loadOne = [&](const std::string& p) {
        std::string contents;
        if (!readFile(p, contents, outError)) return false;
        logDebug("Loading config from " + p, "CFG");
        return hasJsonExtension(p) ? parseJsonConfigString(contents, outCfg, outError)
                                   : parseEnvString(contents, outCfg, outError);
    };

    if (!path.empty()) {
        if (!fileExists(path)) {
            outError = "Missing config: " + path;
            return false;
        }
        return loadOne(path);
    }

    for (const char* candidate : {"multidl.env", "multidl.json"}) {
        if (fileExists(candidate)) return loadOne(candidate);
    }
    return validateConfig(outCfg, outError);
}

} // namespace multidl
