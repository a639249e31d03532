#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "sessionsync/common/encoding.hpp"
#include "sessionsync/sync/gist_config.hpp"

#include <filesystem>

namespace {

namespace sync = sessionsync::sync;

sync::GistConfig sample_config() {
  return sync::GistConfig::create("abc123", "octocat", sessionsync::common::sha256_hex("gho_x"));
}

} // namespace

void register_gist_config_tests(std::vector<sessionsync::tests::TestCase> &tests) {
  using sessionsync::tests::require;
  using sessionsync::testing::ConfigDirGuard;
  using sessionsync::testing::TempWorkspace;

  tests.push_back({"gist_config_create_and_validate", [] {
                     const auto config = sample_config();
                     require(config.validate().ok(), "fresh config should validate");
                     require(config.created_at == config.last_sync, "timestamps start equal");
                     require(config.version == sync::GIST_CONFIG_VERSION, "version");
                     require(config.is_recent(), "fresh config is recent");
                     require(config.token_hash != "gho_x", "token itself must never be stored");
                   }});

  tests.push_back({"gist_config_validation_names_the_field", [] {
                     auto config = sample_config();
                     config.gist_id.clear();
                     auto result = config.validate();
                     require(!result.ok() && result.error().field == "gist_id", "gist_id");

                     config = sample_config();
                     config.github_username.clear();
                     result = config.validate();
                     require(!result.ok() && result.error().field == "github_username",
                             "github_username");

                     config = sample_config();
                     config.token_hash = "abc";
                     result = config.validate();
                     require(!result.ok() && result.error().field == "token_hash", "token_hash");

                     config = sample_config();
                     config.token_hash = std::string(64, 'g');
                     result = config.validate();
                     require(!result.ok() && result.error().field == "token_hash",
                             "non-hex token hash");

                     config = sample_config();
                     config.last_sync = "yesterday";
                     result = config.validate();
                     require(!result.ok() && result.error().field == "last_sync", "last_sync");
                   }});

  tests.push_back({"gist_config_is_recent_window", [] {
                     auto config = sample_config();
                     config.last_sync = "2001-01-01T00:00:00Z";
                     require(!config.is_recent(), "old sync should not be recent");
                     config.touch_sync_time();
                     require(config.is_recent(), "touch should refresh last_sync");
                   }});

  tests.push_back({"gist_config_store_lifecycle", [] {
                     TempWorkspace workspace;
                     sync::GistConfigStore store(workspace.path() / "cfg" /
                                                 sync::GIST_CONFIG_FILENAME);
                     auto empty = store.load();
                     require(empty.ok() && !empty.value().has_value(), "absent file is nullopt");
                     require(!store.validate_file(), "absent file does not validate");

                     const auto config = sample_config();
                     require(store.save(config).ok(), "save failed");
                     require(store.exists(), "file should exist");
                     auto loaded = store.load();
                     require(loaded.ok() && loaded.value().has_value(), "load failed");
                     require(loaded.value()->gist_id == "abc123", "gist id");
                     require(loaded.value()->github_username == "octocat", "username");
                     require(loaded.value()->token_hash == config.token_hash, "hash");
                     require(store.validate_file(), "saved file validates");

                     require(store.remove().ok(), "remove failed");
                     require(!store.exists(), "file should be gone");
                     require(store.remove().ok(), "remove must be idempotent");
                   }});

  tests.push_back({"gist_config_store_refuses_invalid_config", [] {
                     TempWorkspace workspace;
                     sync::GistConfigStore store(workspace.path() / sync::GIST_CONFIG_FILENAME);
                     auto config = sample_config();
                     config.github_username.clear();
                     require(!store.save(config).ok(), "invalid config must not be written");
                     require(!store.exists(), "nothing should be on disk");
                   }});

  tests.push_back({"gist_config_store_backup_and_restore", [] {
                     TempWorkspace workspace;
                     sync::GistConfigStore store(workspace.path() / sync::GIST_CONFIG_FILENAME);
                     auto nothing = store.backup();
                     require(nothing.ok() && !nothing.value().has_value(),
                             "no backup without a file");
                     require(!store.restore_from_backup().ok(), "restore needs a backup");

                     require(store.save(sample_config()).ok(), "save failed");
                     auto backup = store.backup();
                     require(backup.ok() && backup.value().has_value(), "backup failed");
                     require(*backup.value() == store.backup_path(), "backup location");
                     require(std::filesystem::exists(store.backup_path()), "backup file missing");

                     require(store.remove().ok(), "remove failed");
                     require(store.restore_from_backup().ok(), "restore failed");
                     auto restored = store.load();
                     require(restored.ok() && restored.value().has_value() &&
                                 restored.value()->gist_id == "abc123",
                             "restored content mismatch");
                   }});

  tests.push_back({"gist_config_store_reports_corruption", [] {
                     TempWorkspace workspace;
                     workspace.create_file(sync::GIST_CONFIG_FILENAME, "{not json at all");
                     sync::GistConfigStore store(workspace.path() / sync::GIST_CONFIG_FILENAME);
                     auto loaded = store.load();
                     require(!loaded.ok(), "corrupt file must fail");
                     require(loaded.error().kind == sync::ErrorKind::ConfigError, "kind");
                     require(!store.validate_file(), "corrupt file does not validate");

                     workspace.create_file(sync::GIST_CONFIG_FILENAME, "  \n");
                     auto blank = store.load();
                     require(blank.ok() && !blank.value().has_value(), "blank file is nullopt");

                     workspace.create_file(sync::GIST_CONFIG_FILENAME,
                                           "{\"gist_id\":\"x\",\"github_username\":\"y\"}");
                     require(!store.load().ok(), "missing version must fail");
                   }});

  tests.push_back({"gist_config_store_default_location", [] {
                     TempWorkspace workspace;
                     ConfigDirGuard guard(workspace.path());
                     auto store = sync::GistConfigStore::open_default();
                     require(store.ok(), "open_default failed");
                     require(store.value().path() ==
                                 workspace.path() / sync::GIST_CONFIG_FILENAME,
                             "pointer file location");
                     require(store.value().backup_path().filename() ==
                                 "github-gist-config.json.backup",
                             "backup name");
                   }});
}
