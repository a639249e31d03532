#include "sessionsync/sync/gist_config.hpp"

#include "sessionsync/common/encoding.hpp"
#include "sessionsync/common/fs.hpp"
#include "sessionsync/common/json_util.hpp"
#include "sessionsync/config/config.hpp"
#include "sessionsync/observability/global.hpp"
#include "sessionsync/sessions/session_metadata.hpp"

#include <stdexcept>

namespace sessionsync::sync {

namespace {

constexpr std::chrono::hours kRecentWindow{24 * 30};

std::string now_rfc3339() { return sessions::format_timestamp(sessions::Clock::now()); }

} // namespace

// ── GistConfig ────────────────────────────────────────────────────────────────

GistConfig GistConfig::create(std::string gist_id, std::string github_username,
                              std::string token_hash) {
  GistConfig config;
  config.gist_id = std::move(gist_id);
  config.github_username = std::move(github_username);
  config.token_hash = std::move(token_hash);
  config.last_sync = now_rfc3339();
  config.created_at = config.last_sync;
  return config;
}

SyncStatus GistConfig::validate() const {
  if (gist_id.empty()) {
    return SyncStatus::failure(SyncError::config_error("gist_id", "Gist ID cannot be empty"));
  }
  if (github_username.empty()) {
    return SyncStatus::failure(
        SyncError::config_error("github_username", "GitHub username cannot be empty"));
  }
  if (token_hash.size() != 64 || !common::is_hex(token_hash)) {
    return SyncStatus::failure(SyncError::config_error(
        "token_hash", "Token hash must be 64 hex characters (SHA-256)"));
  }
  if (auto parsed = sessions::parse_timestamp(last_sync); !parsed.ok()) {
    return SyncStatus::failure(SyncError::config_error("last_sync", parsed.error()));
  }
  if (auto parsed = sessions::parse_timestamp(created_at); !parsed.ok()) {
    return SyncStatus::failure(SyncError::config_error("created_at", parsed.error()));
  }
  return SyncStatus::success();
}

void GistConfig::touch_sync_time() { last_sync = now_rfc3339(); }

bool GistConfig::is_recent() const {
  auto parsed = sessions::parse_timestamp(last_sync);
  if (!parsed.ok()) {
    return false;
  }
  return parsed.value() > sessions::Clock::now() - kRecentWindow;
}

std::string GistConfig::to_json() const {
  std::string out = "{\n";
  out += "  \"gist_id\": \"" + common::json_escape(gist_id) + "\",\n";
  out += "  \"github_username\": \"" + common::json_escape(github_username) + "\",\n";
  out += "  \"token_hash\": \"" + common::json_escape(token_hash) + "\",\n";
  out += "  \"last_sync\": \"" + common::json_escape(last_sync) + "\",\n";
  out += "  \"created_at\": \"" + common::json_escape(created_at) + "\",\n";
  out += "  \"version\": " + std::to_string(version) + "\n";
  out += "}\n";
  return out;
}

SyncResult<GistConfig> GistConfig::from_json(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '{' || trimmed.back() != '}') {
    return SyncResult<GistConfig>::failure(
        SyncError::config_error("json_parse", "Invalid configuration format"));
  }

  GistConfig config;
  config.gist_id = common::json_get_string(trimmed, "gist_id");
  config.github_username = common::json_get_string(trimmed, "github_username");
  config.token_hash = common::json_get_string(trimmed, "token_hash");
  config.last_sync = common::json_get_string(trimmed, "last_sync");
  config.created_at = common::json_get_string(trimmed, "created_at");

  const std::string version_text = common::json_get_number(trimmed, "version");
  if (version_text.empty()) {
    return SyncResult<GistConfig>::failure(
        SyncError::config_error("version", "missing or not a number"));
  }
  try {
    config.version = static_cast<std::uint32_t>(std::stoul(version_text));
  } catch (const std::exception &) {
    return SyncResult<GistConfig>::failure(
        SyncError::config_error("version", "invalid value: " + version_text));
  }
  return SyncResult<GistConfig>::success(std::move(config));
}

// ── GistConfigStore ───────────────────────────────────────────────────────────

SyncResult<GistConfigStore> GistConfigStore::open_default() {
  auto dir = config::config_dir();
  if (!dir.ok()) {
    return SyncResult<GistConfigStore>::failure(
        SyncError::config_error("config_directory", dir.error()));
  }
  return SyncResult<GistConfigStore>::success(GistConfigStore(dir.value() / GIST_CONFIG_FILENAME));
}

GistConfigStore::GistConfigStore(std::filesystem::path path) : path_(std::move(path)) {}

std::filesystem::path GistConfigStore::backup_path() const {
  return path_.string() + GIST_CONFIG_BACKUP_SUFFIX;
}

bool GistConfigStore::exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

SyncResult<std::optional<GistConfig>> GistConfigStore::load() const {
  using ResultT = SyncResult<std::optional<GistConfig>>;
  if (!exists()) {
    observability::log_debug("gist_config", "no pointer file at " + path_.string());
    return ResultT::success(std::nullopt);
  }

  auto content = common::read_file(path_);
  if (!content.ok()) {
    return ResultT::failure(SyncError::config_error("file_read", content.error()));
  }
  if (common::trim(content.value()).empty()) {
    return ResultT::success(std::nullopt);
  }

  auto config = GistConfig::from_json(content.value());
  if (!config.ok()) {
    return ResultT::failure(config.error());
  }
  auto valid = config.value().validate();
  if (!valid.ok()) {
    return ResultT::failure(valid.error());
  }
  return ResultT::success(config.value());
}

SyncStatus GistConfigStore::save(const GistConfig &config) const {
  auto valid = config.validate();
  if (!valid.ok()) {
    return valid;
  }
  if (path_.has_parent_path()) {
    auto dir = common::ensure_dir(path_.parent_path());
    if (!dir.ok()) {
      return SyncStatus::failure(SyncError::config_error("directory_creation", dir.error()));
    }
  }
  auto written = common::write_file_atomic(path_, config.to_json());
  if (!written.ok()) {
    return SyncStatus::failure(SyncError::config_error("file_write", written.error()));
  }
  observability::log_debug("gist_config", "saved pointer to " + path_.string());
  return SyncStatus::success();
}

SyncStatus GistConfigStore::remove() const {
  std::error_code ec;
  const bool removed = std::filesystem::remove(path_, ec);
  if (ec) {
    return SyncStatus::failure(SyncError::config_error("file_removal", ec.message()));
  }
  if (removed) {
    observability::log_info("gist_config", "removed gist pointer");
  }
  return SyncStatus::success();
}

SyncResult<std::optional<std::filesystem::path>> GistConfigStore::backup() const {
  using ResultT = SyncResult<std::optional<std::filesystem::path>>;
  if (!exists()) {
    return ResultT::success(std::nullopt);
  }
  const auto target = backup_path();
  std::error_code ec;
  std::filesystem::copy_file(path_, target, std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    return ResultT::failure(SyncError::config_error("backup_creation", ec.message()));
  }
  observability::log_info("gist_config", "created pointer backup " + target.string());
  return ResultT::success(target);
}

SyncStatus GistConfigStore::restore_from_backup() const {
  const auto source = backup_path();
  std::error_code ec;
  if (!std::filesystem::exists(source, ec)) {
    return SyncStatus::failure(SyncError::config_error("backup_restore", "No backup file found"));
  }
  std::filesystem::copy_file(source, path_, std::filesystem::copy_options::overwrite_existing,
                             ec);
  if (ec) {
    return SyncStatus::failure(SyncError::config_error("backup_restore", ec.message()));
  }
  observability::log_info("gist_config", "restored pointer from backup");
  return SyncStatus::success();
}

bool GistConfigStore::validate_file() const {
  auto loaded = load();
  if (!loaded.ok()) {
    observability::log_warn("gist_config",
                            "pointer file validation failed: " + loaded.error().to_string());
    return false;
  }
  return loaded.value().has_value();
}

} // namespace sessionsync::sync
