#pragma once

#include "util/settings.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace lsmux::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool WriteJsonObjectToFile(const std::string& path, const nlohmann::json& j, std::string& err);
bool FillSettingsFromJson(const nlohmann::json& j, Settings& cfg, std::string& err);

// Rewrites a pre-2.0 terraform.languageServer block. Returns true when `j` changed.
bool MigrateLegacySettings(nlohmann::json& j);

} // namespace lsmux::config::detail
