#pragma once

#include "sessionsync/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sessionsync::config {

inline constexpr const char *APP_DIR_NAME = "cs-cli";

struct SyncSettings {
  std::uint64_t http_timeout_ms = 30000;
  std::uint64_t oauth_timeout_secs = 300;
  std::uint16_t callback_port_first = 8080;
  std::uint16_t callback_port_last = 8089;
  std::string api_base_url = "https://api.github.com";

  std::uint32_t max_retries = 3;
  std::uint64_t retry_base_delay_ms = 1000;
  std::uint64_t retry_max_delay_ms = 10000;
  double retry_backoff_multiplier = 2.0;
  double retry_jitter_factor = 0.1;
};

/// Per-user application config directory, created on demand:
/// $SESSIONSYNC_CONFIG_DIR, else the platform location (XDG on Linux).
[[nodiscard]] common::Result<std::filesystem::path> config_dir();
void set_config_dir_override(std::optional<std::filesystem::path> path);
void clear_config_dir_override();

/// Loads KEY=VALUE lines into the environment without overriding variables
/// that are already set.
void load_dotenv_file(const std::filesystem::path &path);
void load_dotenv_files();

/// Applies SESSIONSYNC_* overrides; unparsable values are skipped and reported.
void apply_env_overrides(SyncSettings &settings, std::vector<std::string> &warnings);

/// Defaults plus environment overrides. Warnings are logged, never fatal.
[[nodiscard]] SyncSettings load_settings();

[[nodiscard]] common::Result<std::vector<std::string>>
validate_settings(const SyncSettings &settings);

} // namespace sessionsync::config
