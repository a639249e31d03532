#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "sessionsync/config/config.hpp"

#include <cstdlib>
#include <filesystem>

void register_config_tests(std::vector<sessionsync::tests::TestCase> &tests) {
  using sessionsync::tests::require;
  using sessionsync::testing::ConfigDirGuard;
  using sessionsync::testing::EnvGuard;
  using sessionsync::testing::TempWorkspace;
  namespace cfg = sessionsync::config;

  tests.push_back({"config_dir_override_creates_directory", [] {
                     TempWorkspace workspace;
                     const auto target = workspace.path() / "app";
                     ConfigDirGuard guard(target);
                     auto dir = cfg::config_dir();
                     require(dir.ok(), "config_dir failed");
                     require(dir.value() == target, "override ignored");
                     require(std::filesystem::is_directory(target), "directory not created");
                   }});

  tests.push_back({"config_dir_honors_env_variable", [] {
                     TempWorkspace workspace;
                     cfg::clear_config_dir_override();
                     EnvGuard env("SESSIONSYNC_CONFIG_DIR", (workspace.path() / "env").string());
                     auto dir = cfg::config_dir();
                     require(dir.ok() && dir.value() == workspace.path() / "env",
                             "env override ignored");
                   }});

#ifndef _WIN32
  tests.push_back({"config_dir_defaults_to_xdg", [] {
                     TempWorkspace workspace;
                     cfg::clear_config_dir_override();
                     EnvGuard env("SESSIONSYNC_CONFIG_DIR", std::nullopt);
                     EnvGuard xdg("XDG_CONFIG_HOME", workspace.path().string());
                     auto dir = cfg::config_dir();
                     require(dir.ok(), "config_dir failed");
#if defined(__APPLE__)
                     require(dir.value().filename() == cfg::APP_DIR_NAME, "app dir name");
#else
                     require(dir.value() == workspace.path() / cfg::APP_DIR_NAME,
                             "XDG location ignored");
#endif
                   }});
#endif

  tests.push_back({"config_dotenv_does_not_override_environment", [] {
                     TempWorkspace workspace;
                     workspace.create_file(".env",
                                           "# comment\n"
                                           "export SESSIONSYNC_TEST_A=from_file\n"
                                           "SESSIONSYNC_TEST_B=\"quoted value\"\n"
                                           "SESSIONSYNC_TEST_C='single'\n"
                                           "SESSIONSYNC_TEST_D=plain # trailing\n"
                                           "not a pair\n");
                     EnvGuard a("SESSIONSYNC_TEST_A", std::string("from_env"));
                     EnvGuard b("SESSIONSYNC_TEST_B", std::nullopt);
                     EnvGuard c("SESSIONSYNC_TEST_C", std::nullopt);
                     EnvGuard d("SESSIONSYNC_TEST_D", std::nullopt);
                     cfg::load_dotenv_file(workspace.path() / ".env");

                     require(std::string(std::getenv("SESSIONSYNC_TEST_A")) == "from_env",
                             "environment must win over .env");
                     require(std::string(std::getenv("SESSIONSYNC_TEST_B")) == "quoted value",
                             "double quotes not stripped");
                     require(std::string(std::getenv("SESSIONSYNC_TEST_C")) == "single",
                             "single quotes not stripped");
                     require(std::string(std::getenv("SESSIONSYNC_TEST_D")) == "plain",
                             "trailing comment not stripped");
                   }});

  tests.push_back({"config_settings_defaults", [] {
                     EnvGuard timeout("SESSIONSYNC_HTTP_TIMEOUT_MS", std::nullopt);
                     EnvGuard retries("SESSIONSYNC_MAX_RETRIES", std::nullopt);
                     EnvGuard api("SESSIONSYNC_GITHUB_API_URL", std::nullopt);
                     const auto settings = cfg::load_settings();
                     require(settings.http_timeout_ms == 30000, "http timeout default");
                     require(settings.oauth_timeout_secs == 300, "oauth timeout default");
                     require(settings.callback_port_first == 8080 &&
                                 settings.callback_port_last == 8089,
                             "port range default");
                     require(settings.api_base_url == "https://api.github.com", "api default");
                     require(settings.max_retries == 3, "retries default");
                     auto problems = cfg::validate_settings(settings);
                     require(problems.ok() && problems.value().empty(), "defaults must validate");
                   }});

  tests.push_back({"config_env_overrides_and_bad_values", [] {
                     EnvGuard timeout("SESSIONSYNC_HTTP_TIMEOUT_MS", std::string("5000"));
                     EnvGuard retries("SESSIONSYNC_MAX_RETRIES", std::string("lots"));
                     EnvGuard oauth("SESSIONSYNC_OAUTH_TIMEOUT_SECS", std::string("-1"));
                     EnvGuard api("SESSIONSYNC_GITHUB_API_URL", std::string("http://evil.test/"));

                     cfg::SyncSettings settings;
                     std::vector<std::string> warnings;
                     cfg::apply_env_overrides(settings, warnings);
                     require(settings.http_timeout_ms == 5000, "valid override ignored");
                     require(settings.max_retries == 3, "bad number must keep default");
                     require(settings.oauth_timeout_secs == 300, "negative must keep default");
                     require(settings.api_base_url == "https://api.github.com",
                             "plain-http API must be refused");
                     require(warnings.size() == 3, "expected three warnings");
                   }});

  tests.push_back({"config_loopback_api_override_allowed", [] {
                     EnvGuard api("SESSIONSYNC_GITHUB_API_URL",
                                  std::string("http://127.0.0.1:9999/"));
                     const auto settings = cfg::load_settings();
                     require(settings.api_base_url == "http://127.0.0.1:9999",
                             "loopback override should apply without trailing slash");
                   }});

  tests.push_back({"config_validate_settings_reports_problems", [] {
                     cfg::SyncSettings settings;
                     settings.callback_port_first = 9000;
                     settings.callback_port_last = 8000;
                     settings.retry_jitter_factor = 2.0;
                     auto problems = cfg::validate_settings(settings);
                     require(problems.ok() && problems.value().size() == 2,
                             "expected two problems");
                   }});
}
