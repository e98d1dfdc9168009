#pragma once

#include <filesystem>

#include "config/config_schema.hpp"

namespace scanbound::config {

std::filesystem::path DefaultConfigPath();

// ~/.scanbound/config.json followed by environment overrides.
Config LoadConfig();
Config LoadConfigFrom(const std::filesystem::path& path);
void ApplyEnvironment(Config& config);

}  // namespace scanbound::config
