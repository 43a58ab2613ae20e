#pragma once

#include "devpulse/common/result.hpp"
#include "devpulse/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace devpulse::config {

/// Location of the configuration file. An explicit path wins, then DEVPULSE_CONFIG_PATH,
/// then ~/.devpulse/config.toml. A directory override resolves to <dir>/config.toml.
[[nodiscard]] common::Result<std::filesystem::path>
config_path(const std::optional<std::filesystem::path> &explicit_path = std::nullopt);
[[nodiscard]] common::Result<std::filesystem::path> config_dir();

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Result<Config>
load_config(const std::optional<std::filesystem::path> &explicit_path = std::nullopt);
[[nodiscard]] common::Status
save_config(const Config &config,
            const std::optional<std::filesystem::path> &explicit_path = std::nullopt);
[[nodiscard]] std::string render_config(const Config &config);

/// Hard errors fail; soft issues come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace devpulse::config
