#pragma once

#include "lsmux/workspace.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lsmux {

struct DocumentOpened {
    std::string uri;
};

struct DocumentClosed {
    std::string uri;
};

struct FoldersChanged {
    std::vector<WorkspaceFolder> added;
    std::vector<WorkspaceFolder> removed;
};

struct ConfigChanged {
    std::vector<std::string> sections; // e.g. "terraform", "terraform-ls.rootModules"
};

struct ToggleEnabled {
    bool enabled = true;
};

struct Shutdown {};

using Event = std::variant<DocumentOpened, DocumentClosed, FoldersChanged, ConfigChanged, ToggleEnabled, Shutdown>;

const char* EventName(const Event& e);

// One JSON object per line, keyed by "event":
//   {"event":"didOpen","uri":"file:///a/main.tf"}
//   {"event":"workspaceFolders","added":[{"uri":"file:///a","name":"a"}],"removed":[]}
//   {"event":"configChanged","sections":["terraform"]}
//   {"event":"enable"} {"event":"disable"} {"event":"shutdown"}
std::expected<Event, std::string> ParseEventLine(std::string_view line);

} // namespace lsmux
