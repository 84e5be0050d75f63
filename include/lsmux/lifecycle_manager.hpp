#pragma once

#include "lsmux/client_registry.hpp"
#include "lsmux/events.hpp"
#include "lsmux/install_orchestrator.hpp"
#include "lsmux/language_client.hpp"
#include "lsmux/user_interface.hpp"
#include "lsmux/workspace.hpp"
#include "util/result.hpp"
#include "util/settings.hpp"

#include <deque>
#include <string>

namespace lsmux {

// Owns one language client per outermost workspace root. All entry points
// run on the thread that drains the queue; nothing here is thread-safe.
class LifecycleManager {
public:
    LifecycleManager(Settings settings,
                     IInstaller& installer,
                     IClientFactory& factory,
                     IUserInterface& ui,
                     ISettingsStore& store);
    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    // Installs (unless disabled or a custom binary is configured) and starts
    // clients for documents that are already open.
    Result Activate();

    void Post(Event e) { queue_.push_back(std::move(e)); }
    // Handles queued events in order. Returns false once a Shutdown was handled.
    bool RunPending();
    Result Dispatch(const Event& e);

    // Stops every client and waits for all of them.
    Result Deactivate();

    const ClientRegistry& Registry() const { return registry_; }
    const Workspace& GetWorkspace() const { return workspace_; }
    Workspace& GetWorkspace() { return workspace_; }
    const Settings& GetSettings() const { return settings_; }

    bool Enabled() const { return settings_.external; }
    // Binary the clients run; empty until an install succeeded.
    const std::string& Command() const { return command_; }
    std::string InstallDir() const;

private:
    Result InstallThenStart();
    Result StartForOpenDocuments();
    Result StartForDocument(const std::string& uri);
    Result StopRoot(const std::string& root_key);

    Result OnDocumentOpened(const DocumentOpened& e);
    Result OnDocumentClosed(const DocumentClosed& e);
    Result OnFoldersChanged(const FoldersChanged& e);
    Result OnConfigChanged(const ConfigChanged& e);
    Result OnToggleEnabled(const ToggleEnabled& e);

    Settings settings_;
    IInstaller& installer_;
    IClientFactory& factory_;
    IUserInterface& ui_;
    ISettingsStore& store_;

    Workspace workspace_;
    ClientRegistry registry_;
    std::deque<Event> queue_;
    std::string command_;
    bool shut_down_ = false;
};

// True for "terraform", "terraform-ls" and their sub-keys.
bool AffectsLanguageServer(const std::string& section);

} // namespace lsmux
