#include "lsmux/workspace.hpp"

#include "util/path_utils.hpp"

#include <algorithm>

namespace lsmux {

bool Workspace::AddFolder(WorkspaceFolder folder) {
    folder.uri = EnsureTrailingSlash(std::move(folder.uri));
    if (folder.name.empty()) {
        const std::string trimmed = folder.uri.substr(0, folder.uri.size() - 1);
        const auto slash = trimmed.rfind('/');
        folder.name = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
    }

    const bool present = std::any_of(folders_.begin(), folders_.end(),
                                     [&](const WorkspaceFolder& f) { return f.uri == folder.uri; });
    if (present) return false;
    folders_.push_back(std::move(folder));
    return true;
}

bool Workspace::RemoveFolder(const std::string& uri) {
    const std::string key = EnsureTrailingSlash(uri);
    const auto it = std::find_if(folders_.begin(), folders_.end(),
                                 [&](const WorkspaceFolder& f) { return f.uri == key; });
    if (it == folders_.end()) return false;
    folders_.erase(it);
    return true;
}

std::optional<WorkspaceFolder> Workspace::FolderFor(const std::string& uri) const {
    const WorkspaceFolder* best = nullptr;
    for (const auto& f : folders_) {
        if (!IsUnderRoot(uri, f.uri)) continue;
        if (!best || f.uri.size() > best->uri.size()) best = &f;
    }
    if (!best) return std::nullopt;
    return *best;
}

WorkspaceFolder Workspace::OutermostFolder(const WorkspaceFolder& folder) const {
    const WorkspaceFolder* best = &folder;
    for (const auto& f : folders_) {
        if (IsUnderRoot(folder.uri, f.uri) && f.uri.size() < best->uri.size()) best = &f;
    }
    return *best;
}

std::optional<WorkspaceFolder> Workspace::RootFor(const std::string& document_uri) const {
    auto folder = FolderFor(document_uri);
    if (!folder) return std::nullopt;
    return OutermostFolder(*folder);
}

} // namespace lsmux
