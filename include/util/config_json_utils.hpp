#pragma once

#include "util/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace coldstash::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, Config& cfg, std::string& err);

} // namespace coldstash::config::detail
