#include "lsmux/release_index_parser.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

namespace lsmux {

using json = nlohmann::json;

namespace {

std::expected<std::vector<BuildArtifact>, std::string> ParseBuildsArray(const json& arr) {
    if (!arr.is_array()) {
        return std::unexpected("'builds' must be an array");
    }

    std::vector<BuildArtifact> out;
    out.reserve(arr.size());

    for (const auto& item : arr) {
        if (!item.is_object()) {
            return std::unexpected("build entry must be an object");
        }
        BuildArtifact b;
        b.os = item.value("os", "");
        b.arch = item.value("arch", "");
        b.url = item.value("url", "");
        b.filename = item.value("filename", "");
        out.push_back(std::move(b));
    }

    return out;
}

} // namespace

std::expected<ReleaseIndex, std::string> ReleaseIndexParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        const json* versions = &j;
        if (auto it = j.find("versions"); it != j.end()) {
            if (!it->is_object()) return std::unexpected("'versions' must be an object");
            versions = &*it;
        }

        ReleaseIndex index;
        for (const auto& [key, val] : versions->items()) {
            if (!val.is_object()) {
                LogWarn("release index: skipping non-object entry '%s'", key.c_str());
                continue;
            }

            const std::string text = val.value("version", key);
            auto parsed = SemanticVersion::Parse(text);
            if (!parsed) {
                LogWarn("release index: skipping '%s': %s", key.c_str(), parsed.error().c_str());
                continue;
            }

            Release r;
            r.version = std::move(*parsed);
            r.version_text = text;
            r.shasums = val.value("shasums", "");
            r.shasums_signature = val.value("shasums_signature", "");
            if (val.contains("builds")) {
                auto builds = ParseBuildsArray(val["builds"]);
                if (!builds)
                    return std::unexpected("release " + key + ": " + builds.error());
                r.builds = std::move(*builds);
            }
            index.emplace(key, std::move(r));
        }

        return index;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

} // namespace lsmux
