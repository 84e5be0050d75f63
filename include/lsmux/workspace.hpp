#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lsmux {

struct WorkspaceFolder {
    std::string uri;  // always ends in '/'
    std::string name;

    bool operator==(const WorkspaceFolder&) const = default;
};

// Open folders and documents of the host. Folder lookups follow URI prefixes,
// so "file:///a/" encloses "file:///a/b/main.tf" but not "file:///ab/x.tf".
class Workspace {
public:
    // Returns false when the folder was already present.
    bool AddFolder(WorkspaceFolder folder);
    bool RemoveFolder(const std::string& uri);
    const std::vector<WorkspaceFolder>& Folders() const { return folders_; }

    // Innermost folder containing `uri`.
    std::optional<WorkspaceFolder> FolderFor(const std::string& uri) const;
    // Shortest folder enclosing `folder` (possibly the folder itself).
    WorkspaceFolder OutermostFolder(const WorkspaceFolder& folder) const;
    // Outermost root serving a document, nullopt for documents outside every folder.
    std::optional<WorkspaceFolder> RootFor(const std::string& document_uri) const;

    void OpenDocument(const std::string& uri) { documents_.insert(uri); }
    void CloseDocument(const std::string& uri) { documents_.erase(uri); }
    const std::set<std::string>& OpenDocuments() const { return documents_; }

private:
    std::vector<WorkspaceFolder> folders_;
    std::set<std::string> documents_;
};

} // namespace lsmux
