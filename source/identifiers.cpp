#include "multidl/identifiers.hpp"

#include <regex>
#include <vector>

namespace multidl {

namespace {

using PatternList = std::vector<std::regex>;

PatternList compile(std::initializer_list<const char*> patterns) {
    PatternList out;
    out.reserve(patterns.size());
    for (const char* p : patterns) out.emplace_back(p, std::regex::ECMAScript | std::regex::icase);
    return out;
}

const PatternList& patternsFor(SourceId source) {
    static const PatternList kYouTube = compile({R"((?:[?&]v=|youtu\.be/|shorts/|embed/|live/)([\w-]+))"});
    static const PatternList kTwitter = compile({R"(/status(?:es)?/(\d+))"});
    static const PatternList kTikTok = compile({
        R"(/video/(\d+))",
        R"(/photo/(\d+))",
        R"((?:^|//)(?:vm|vt)\.[^/]+/([\w-]+))",
    });
    static const PatternList kThreads = compile({R"(/post/([\w-]+))"});
    static const PatternList kReddit = compile({
        R"(/comments/(\w+))",
        R"(redd\.it/(\w+))",
        R"(/s/(\w+))",
    });
    static const PatternList kFacebook = compile({
        R"([?&]v=(\d+))",
        R"(/videos/(?:[^/?#]+/)?(\d+))",
        R"(/reel/(\d+))",
        R"(fb\.watch/([\w-]+))",
        R"(story_fbid=(\w+))",
    });
    static const PatternList kInstagram = compile({R"(/(?:p|reels?|tv)/([\w-]+))"});
    static const PatternList kDriveFile = compile({
        R"(/d/([\w-]+))",
        R"([?&]id=([\w-]+))",
    });

    switch (source) {
        case SourceId::YouTube: return kYouTube;
        case SourceId::Twitter: return kTwitter;
        case SourceId::TikTok: return kTikTok;
        case SourceId::Threads: return kThreads;
        case SourceId::Reddit: return kReddit;
        case SourceId::Facebook: return kFacebook;
        case SourceId::Instagram: return kInstagram;
        case SourceId::GoogleDrive: return kDriveFile;
    }
    return kDriveFile;
}

std::string firstCapture(const PatternList& patterns, const std::string& text) {
    std::smatch m;
    for (const auto& re : patterns) {
        if (!std::regex_search(text, m, re)) continue;
        for (size_t i = 1; i < m.size(); ++i) {
            if (m[i].matched && m[i].length() > 0) return m[i].str();
        }
    }
    return {};
}

} // namespace

std::string extractIdentifier(SourceId source, const std::string& url) {
    if (source == SourceId::GoogleDrive) {
        auto target = parseDriveTarget(url);
        return target ? target->id : std::string();
    }
    if (source == SourceId::Instagram) {
        // Tracking parameters are not part of the post path.
        const std::string clean = url.substr(0, url.find_first_of("?#"));
        return firstCapture(patternsFor(source), clean);
    }
    return firstCapture(patternsFor(source), url);
}

std::optional<DriveTarget> parseDriveTarget(const std::string& url) {
    static const PatternList kFolder = compile({
        R"(folders/([\w-]+))",
        R"(folderview\?id=([\w-]+))",
    });
    if (std::string id = firstCapture(kFolder, url); !id.empty()) return DriveTarget{id, true};
    if (std::string id = firstCapture(patternsFor(SourceId::GoogleDrive), url); !id.empty()) {
        return DriveTarget{id, false};
    }
    return std::nullopt;
}

} // namespace multidl
