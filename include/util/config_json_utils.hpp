#pragma once

#include "util/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace stash::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool ParseJsonObject(const std::string& text, const std::string& origin, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, StashConfigFromFile& cfg, std::string& err);

} // namespace stash::config::detail
