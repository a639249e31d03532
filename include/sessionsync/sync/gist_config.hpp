#pragma once

#include "sessionsync/sync/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sessionsync::sync {

inline constexpr const char *GIST_CONFIG_FILENAME = "github-gist-config.json";
inline constexpr const char *GIST_CONFIG_BACKUP_SUFFIX = ".backup";
inline constexpr std::uint32_t GIST_CONFIG_VERSION = 1;

/// Local pointer to the remote gist holding the encrypted session.
struct GistConfig {
  std::string gist_id;
  std::string github_username;
  std::string token_hash; // SHA-256 hex of the access token, never the token
  std::string last_sync;  // RFC 3339
  std::string created_at; // RFC 3339
  std::uint32_t version = GIST_CONFIG_VERSION;

  [[nodiscard]] static GistConfig create(std::string gist_id, std::string github_username,
                                         std::string token_hash);

  [[nodiscard]] SyncStatus validate() const;
  void touch_sync_time();
  /// Last sync within the past 30 days.
  [[nodiscard]] bool is_recent() const;

  [[nodiscard]] std::string to_json() const;
  [[nodiscard]] static SyncResult<GistConfig> from_json(const std::string &json);
};

/// Reads and writes the pointer file. Writes are whole-file and atomic; two
/// processes racing on it resolve as last writer wins.
class GistConfigStore {
public:
  /// `<config_dir>/github-gist-config.json`.
  [[nodiscard]] static SyncResult<GistConfigStore> open_default();

  explicit GistConfigStore(std::filesystem::path path);

  /// nullopt when the file is absent or blank.
  [[nodiscard]] SyncResult<std::optional<GistConfig>> load() const;
  [[nodiscard]] SyncStatus save(const GistConfig &config) const;
  [[nodiscard]] SyncStatus remove() const;

  /// Copies the current file to the `.backup` sibling; nullopt when there is
  /// nothing to back up.
  [[nodiscard]] SyncResult<std::optional<std::filesystem::path>> backup() const;
  [[nodiscard]] SyncStatus restore_from_backup() const;

  /// true for a present, valid file; false when absent or invalid.
  [[nodiscard]] bool validate_file() const;

  [[nodiscard]] bool exists() const;
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::filesystem::path backup_path() const;

private:
  std::filesystem::path path_;
};

} // namespace sessionsync::sync
