#pragma once

#include "almanac/common/result.hpp"
#include "almanac/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace almanac::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Schedule file from config, falling back to `<config dir>/schedules.json`.
[[nodiscard]] common::Result<std::filesystem::path> schedule_file(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);

/// Returns warnings on success; hard errors fail the result.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace almanac::config
