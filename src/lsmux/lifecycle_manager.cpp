#include "lsmux/lifecycle_manager.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <variant>

namespace lsmux {

namespace {

constexpr const char kReloadMessage[] = "Reload the host to apply language server changes";

bool HasPrefixSection(const std::string& section, const std::string& name) {
    return section == name || section.rfind(name + ".", 0) == 0;
}

} // namespace

bool AffectsLanguageServer(const std::string& section) {
    return HasPrefixSection(section, "terraform") || HasPrefixSection(section, "terraform-ls");
}

LifecycleManager::LifecycleManager(Settings settings,
                                   IInstaller& installer,
                                   IClientFactory& factory,
                                   IUserInterface& ui,
                                   ISettingsStore& store)
    : settings_(std::move(settings)), installer_(installer), factory_(factory), ui_(ui), store_(store) {}

std::string LifecycleManager::InstallDir() const {
    return settings_.install_dir.empty() ? DefaultInstallDir() : settings_.install_dir;
}

Result LifecycleManager::Activate() {
    if (!settings_.external) {
        LogInfo("language server disabled");
        return Result::Ok();
    }
    return InstallThenStart();
}

bool LifecycleManager::RunPending() {
    while (!queue_.empty() && !shut_down_) {
        Event e = std::move(queue_.front());
        queue_.pop_front();

        LogDebug("event %s", EventName(e));
        if (auto r = Dispatch(e); !r.is_ok()) {
            LogError("%s: %s", EventName(e), r.msg.c_str());
        }
    }
    return !shut_down_;
}

Result LifecycleManager::Dispatch(const Event& e) {
    if (shut_down_) return Result::Fail(ErrorKind::Process, "already shut down");

    if (auto* p = std::get_if<DocumentOpened>(&e)) return OnDocumentOpened(*p);
    if (auto* p = std::get_if<DocumentClosed>(&e)) return OnDocumentClosed(*p);
    if (auto* p = std::get_if<FoldersChanged>(&e)) return OnFoldersChanged(*p);
    if (auto* p = std::get_if<ConfigChanged>(&e)) return OnConfigChanged(*p);
    if (auto* p = std::get_if<ToggleEnabled>(&e)) return OnToggleEnabled(*p);

    auto r = Deactivate();
    shut_down_ = true;
    return r;
}

Result LifecycleManager::Deactivate() {
    return registry_.StopAll();
}

Result LifecycleManager::InstallThenStart() {
    if (!settings_.path_to_binary.empty()) {
        LogInfo("using custom language server binary %s", settings_.path_to_binary.c_str());
        command_ = settings_.path_to_binary;
        return StartForOpenDocuments();
    }

    const std::string dir = InstallDir();
    LogInfo("installing language server to %s", dir.c_str());

    if (auto r = registry_.StopAll(); !r.is_ok()) {
        LogWarn("stopping clients before install: %s", r.msg.c_str());
    }
    command_.clear();

    auto r = installer_.Install(dir);
    if (!r.is_ok()) {
        LogError("unable to install language server: %s", r.msg.c_str());
        ui_.ShowError(r.msg);
        return r;
    }

    if (!installer_.HasBinary(dir)) {
        const std::string msg = "unable to install language server: no binary in " + dir;
        LogWarn("%s, clients will not be started", msg.c_str());
        ui_.ShowError(msg);
        return Result::Ok();
    }

    command_ = installer_.BinaryPath(dir);
    return StartForOpenDocuments();
}

Result LifecycleManager::StartForOpenDocuments() {
    Result first_failure = Result::Ok();
    for (const auto& uri : workspace_.OpenDocuments()) {
        auto r = StartForDocument(uri);
        if (!r.is_ok() && first_failure.is_ok()) first_failure = r;
    }
    return first_failure;
}

Result LifecycleManager::StartForDocument(const std::string& uri) {
    if (command_.empty()) return Result::Ok();

    auto root = workspace_.RootFor(uri);
    if (!root) {
        LogDebug("%s is outside every workspace folder", uri.c_str());
        return Result::Ok();
    }
    if (registry_.Contains(root->uri)) return Result::Ok();

    ClientLaunch launch;
    launch.command = command_;
    launch.args = settings_.args;
    launch.root_uri = root->uri;
    launch.root_name = root->name;
    launch.root_modules = settings_.root_modules;

    LogInfo("starting client %s for folder %s", command_.c_str(), root->name.c_str());
    auto client = factory_.Create(launch);
    if (!client) return Result::Fail(ErrorKind::Process, "no client for " + root->uri);

    if (auto r = client->Start(); !r.is_ok()) {
        LogError("client for %s failed to start: %s", root->uri.c_str(), r.msg.c_str());
        return r;
    }
    return registry_.Insert(root->uri, std::move(client));
}

Result LifecycleManager::StopRoot(const std::string& root_key) {
    auto client = registry_.Take(root_key);
    if (!client) return Result::Ok();
    LogInfo("stopping client for %s", root_key.c_str());
    return client->Stop();
}

Result LifecycleManager::OnDocumentOpened(const DocumentOpened& e) {
    workspace_.OpenDocument(e.uri);
    if (!settings_.external) return Result::Ok();
    return StartForDocument(e.uri);
}

Result LifecycleManager::OnDocumentClosed(const DocumentClosed& e) {
    // The root's client keeps running; only folder removal stops it.
    workspace_.CloseDocument(e.uri);
    return Result::Ok();
}

Result LifecycleManager::OnFoldersChanged(const FoldersChanged& e) {
    Result first_failure = Result::Ok();
    auto note = [&first_failure](Result r) {
        if (!r.is_ok() && first_failure.is_ok()) first_failure = std::move(r);
    };

    for (const auto& f : e.removed) {
        const std::string key = EnsureTrailingSlash(f.uri);
        workspace_.RemoveFolder(key);
        note(StopRoot(key));
    }

    bool regrouped = !e.removed.empty();
    for (const auto& f : e.added) {
        WorkspaceFolder folder = f;
        folder.uri = EnsureTrailingSlash(folder.uri);
        if (!workspace_.AddFolder(folder)) continue;

        // A new outer folder takes over the roots it encloses.
        for (const auto& key : registry_.Keys()) {
            if (key != folder.uri && IsUnderRoot(key, folder.uri)) {
                note(StopRoot(key));
            }
        }
        regrouped = true;
    }

    if (regrouped && settings_.external) note(StartForOpenDocuments());
    return first_failure;
}

Result LifecycleManager::OnConfigChanged(const ConfigChanged& e) {
    const bool relevant = std::any_of(e.sections.begin(), e.sections.end(), AffectsLanguageServer);
    if (!relevant) return Result::Ok();

    if (ui_.ShowInformation(kReloadMessage, {"Reload"}) == "Reload") {
        ui_.ReloadHost();
    }
    return Result::Ok();
}

Result LifecycleManager::OnToggleEnabled(const ToggleEnabled& e) {
    if (!e.enabled) {
        if (auto r = store_.SetEnabled(false); !r.is_ok()) {
            ui_.ShowError(r.msg);
            return r;
        }
        settings_.external = false;
        return registry_.StopAll();
    }

    if (auto r = store_.SetEnabled(true); !r.is_ok()) {
        ui_.ShowError(r.msg);
        return r;
    }
    settings_.external = true;

    auto r = InstallThenStart();
    if (!r.is_ok()) {
        settings_.external = false;
        if (auto revert = store_.SetEnabled(false); !revert.is_ok()) {
            LogError("cannot revert enable flag: %s", revert.msg.c_str());
        }
    }
    return r;
}

} // namespace lsmux
