#include "util/config_json_utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

namespace lsmux::config::detail {

namespace {

const nlohmann::json* FindObject(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object())
        return nullptr;
    return &*it;
}

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

// Present but not an array of strings is an error, absent is not.
bool GetStringArrayIfPresent(const nlohmann::json& j,
                             const char* key,
                             std::vector<std::string>& out,
                             std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            err = std::string("'") + key + "' must be an array of strings";
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool WriteJsonObjectToFile(const std::string& path, const nlohmann::json& j, std::string& err) {
    const std::string tmp_path = path + ".tmp";

    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (ec) {
        err = "cannot create " + parent.string() + ": " + ec.message();
        return false;
    }
    {
        std::ofstream os(tmp_path, std::ios::trunc);
        if (!os.good()) {
            err = "cannot write " + tmp_path;
            return false;
        }
        os << j.dump(2) << "\n";
        os.close();
        if (!os.good()) {
            err = "write failed: " + tmp_path;
            std::remove(tmp_path.c_str());
            return false;
        }
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        err = "rename failed: " + tmp_path + " -> " + path;
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

bool FillSettingsFromJson(const nlohmann::json& j, Settings& cfg, std::string& err) {
    if (const auto* terraform = FindObject(j, "terraform")) {
        if (const auto* ls = FindObject(*terraform, "languageServer")) {
            GetBoolIfPresent(*ls, "external", cfg.external);
            GetStringIfPresent(*ls, "pathToBinary", cfg.path_to_binary);
            if (!GetStringArrayIfPresent(*ls, "args", cfg.args, err))
                return false;
        }
    }

    if (const auto* tfls = FindObject(j, "terraform-ls")) {
        if (!GetStringArrayIfPresent(*tfls, "rootModules", cfg.root_modules, err))
            return false;
    }

    if (const auto* own = FindObject(j, "lsmux")) {
        GetStringIfPresent(*own, "installDir", cfg.install_dir);
        GetStringIfPresent(*own, "releasesUrl", cfg.releases_url);
        GetStringIfPresent(*own, "binaryName", cfg.binary_name);
        GetStringIfPresent(*own, "logLevel", cfg.log_level);
    }

    if (cfg.binary_name.empty()) {
        err = "lsmux.binaryName must not be empty";
        return false;
    }
    if (cfg.releases_url.empty()) {
        err = "lsmux.releasesUrl must not be empty";
        return false;
    }
    while (cfg.releases_url.size() > 1 && cfg.releases_url.back() == '/') {
        cfg.releases_url.pop_back();
    }

    return true;
}

bool MigrateLegacySettings(nlohmann::json& j) {
    auto terraform = j.find("terraform");
    if (terraform == j.end() || !terraform->is_object())
        return false;
    auto ls = terraform->find("languageServer");
    if (ls == terraform->end() || !ls->is_object() || !ls->contains("enabled"))
        return false;

    (*terraform)["languageServer"] = {{"external", true}, {"args", {"serve"}}};
    return true;
}

} // namespace lsmux::config::detail
