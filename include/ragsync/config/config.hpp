#pragma once

#include "ragsync/common/result.hpp"
#include "ragsync/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ragsync::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] std::string render_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace ragsync::config
