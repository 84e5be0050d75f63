#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace lsmux {

inline constexpr const char kDefaultReleasesUrl[] = "https://releases.hashicorp.com/terraform-ls";
inline constexpr const char kDefaultBinaryName[] = "terraform-ls";

struct Settings {
    // terraform.languageServer.*
    bool external = true;
    std::string path_to_binary;
    std::vector<std::string> args{"serve"};

    // terraform-ls.*
    std::vector<std::string> root_modules;

    // lsmux.*
    std::string install_dir;
    std::string releases_url = kDefaultReleasesUrl;
    std::string binary_name = kDefaultBinaryName;
    std::string log_level = "info";
};

// $XDG_DATA_HOME/lsmux/lsp, falling back to ~/.local/share/lsmux/lsp.
std::string DefaultInstallDir();
// $XDG_CONFIG_HOME/lsmux/settings.json, falling back to ~/.config/lsmux/settings.json.
std::string DefaultSettingsPath();

class ISettingsStore {
public:
    virtual ~ISettingsStore() = default;
    // Persists terraform.languageServer.external.
    virtual Result SetEnabled(bool enabled) = 0;
};

class SettingsFile final : public ISettingsStore {
public:
    explicit SettingsFile(std::string path) : path_(std::move(path)) {}

    // A missing file yields defaults. Pre-2.0 "languageServer.enabled" settings
    // are migrated and written back.
    Result Load(Settings& out);
    Result SetEnabled(bool enabled) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

} // namespace lsmux
