#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace gexec::config {

// Defaults, then the JSON file (GEXEC_CONFIG or ~/.gexec/config.json), then
// GEXEC_* environment variables.
Config LoadConfig();

Config LoadConfigFrom(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

}  // namespace gexec::config
