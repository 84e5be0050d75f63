#include "lsmux/events.hpp"

#include <nlohmann/json.hpp>

namespace lsmux {

namespace {

using nlohmann::json;

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

std::expected<std::string, std::string> RequireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::unexpected(std::string("missing string field '") + key + "'");
    }
    return it->get<std::string>();
}

std::expected<std::vector<WorkspaceFolder>, std::string> ParseFolders(const json& j, const char* key) {
    std::vector<WorkspaceFolder> out;
    auto it = j.find(key);
    if (it == j.end()) return out;
    if (!it->is_array()) return std::unexpected(std::string("'") + key + "' must be an array");

    for (const auto& item : *it) {
        WorkspaceFolder f;
        if (item.is_string()) {
            f.uri = item.get<std::string>();
        } else if (item.is_object()) {
            auto uri = RequireString(item, "uri");
            if (!uri) return std::unexpected(uri.error());
            f.uri = *uri;
            if (auto n = item.find("name"); n != item.end() && n->is_string()) f.name = n->get<std::string>();
        } else {
            return std::unexpected(std::string("invalid entry in '") + key + "'");
        }
        out.push_back(std::move(f));
    }
    return out;
}

} // namespace

const char* EventName(const Event& e) {
    return std::visit(Overloaded{
                          [](const DocumentOpened&) { return "didOpen"; },
                          [](const DocumentClosed&) { return "didClose"; },
                          [](const FoldersChanged&) { return "workspaceFolders"; },
                          [](const ConfigChanged&) { return "configChanged"; },
                          [](const ToggleEnabled& t) { return t.enabled ? "enable" : "disable"; },
                          [](const Shutdown&) { return "shutdown"; },
                      },
                      e);
}

std::expected<Event, std::string> ParseEventLine(std::string_view line) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded()) return std::unexpected("invalid JSON");
    if (!j.is_object()) return std::unexpected("event must be a JSON object");

    auto name = RequireString(j, "event");
    if (!name) return std::unexpected(name.error());

    if (*name == "didOpen" || *name == "didClose") {
        auto uri = RequireString(j, "uri");
        if (!uri) return std::unexpected(uri.error());
        if (*name == "didOpen") return Event{DocumentOpened{*uri}};
        return Event{DocumentClosed{*uri}};
    }
    if (*name == "workspaceFolders") {
        auto added = ParseFolders(j, "added");
        if (!added) return std::unexpected(added.error());
        auto removed = ParseFolders(j, "removed");
        if (!removed) return std::unexpected(removed.error());
        return Event{FoldersChanged{std::move(*added), std::move(*removed)}};
    }
    if (*name == "configChanged") {
        ConfigChanged c;
        auto it = j.find("sections");
        if (it != j.end()) {
            if (!it->is_array()) return std::unexpected("'sections' must be an array");
            for (const auto& s : *it) {
                if (!s.is_string()) return std::unexpected("'sections' must hold strings");
                c.sections.push_back(s.get<std::string>());
            }
        }
        return Event{std::move(c)};
    }
    if (*name == "enable") return Event{ToggleEnabled{true}};
    if (*name == "disable") return Event{ToggleEnabled{false}};
    if (*name == "shutdown") return Event{Shutdown{}};

    return std::unexpected("unknown event '" + *name + "'");
}

} // namespace lsmux
