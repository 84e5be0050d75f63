#include "util/settings.hpp"

#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <filesystem>

namespace lsmux {

std::string DefaultInstallDir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/lsmux/lsp";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.local/share/lsmux/lsp";
    }
    return "./lsp";
}

std::string DefaultSettingsPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/lsmux/settings.json";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.config/lsmux/settings.json";
    }
    return "./lsmux-settings.json";
}

Result SettingsFile::Load(Settings& out) {
    out = Settings{};

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LogInfo("Settings file %s not found, using defaults", path_.c_str());
        out.install_dir = DefaultInstallDir();
        return Result::Ok();
    }

    nlohmann::json json;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path_, json, err)) {
        return Result::Fail(ErrorKind::Config, err);
    }

    if (config::detail::MigrateLegacySettings(json)) {
        LogInfo("Migrated legacy languageServer settings in %s", path_.c_str());
        if (!config::detail::WriteJsonObjectToFile(path_, json, err)) {
            LogWarn("Cannot persist migrated settings: %s", err.c_str());
        }
    }

    if (!config::detail::FillSettingsFromJson(json, out, err)) {
        return Result::Fail(ErrorKind::Config, err + " in " + path_);
    }
    if (out.install_dir.empty()) {
        out.install_dir = DefaultInstallDir();
    }
    return Result::Ok();
}

Result SettingsFile::SetEnabled(bool enabled) {
    nlohmann::json json = nlohmann::json::object();
    std::string err;

    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
        if (!config::detail::LoadJsonObjectFromFile(path_, json, err)) {
            return Result::Fail(ErrorKind::Config, err);
        }
    }

    try {
        json["terraform"]["languageServer"]["external"] = enabled;
    } catch (const nlohmann::json::type_error& e) {
        return Result::Fail(ErrorKind::Config, std::string("cannot update settings: ") + e.what());
    }

    if (!config::detail::WriteJsonObjectToFile(path_, json, err)) {
        return Result::Fail(ErrorKind::Config, err);
    }
    LogDebug("Persisted languageServer.external=%s", enabled ? "true" : "false");
    return Result::Ok();
}

} // namespace lsmux
