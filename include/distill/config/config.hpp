#pragma once

#include "distill/common/result.hpp"
#include "distill/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace distill::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Parse configuration text on top of the defaults; unknown keys are ignored.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] std::string render_config(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard problems fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace distill::config
