#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace cadence::config {

// ~/.cadence/config.json
std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file at config_path (when present and parsable), then
// CADENCE_* environment variables.
Config LoadConfig(const std::filesystem::path& config_path);
Config LoadConfig();

}  // namespace cadence::config
