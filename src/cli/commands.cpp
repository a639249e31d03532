#include "sessionsync/cli/commands.hpp"

#include "sessionsync/auth/browser.hpp"
#include "sessionsync/auth/oauth_config.hpp"
#include "sessionsync/auth/oauth_flow.hpp"
#include "sessionsync/common/fs.hpp"
#include "sessionsync/common/json_util.hpp"
#include "sessionsync/config/config.hpp"
#include "sessionsync/http/http_client.hpp"
#include "sessionsync/observability/factory.hpp"
#include "sessionsync/observability/global.hpp"
#include "sessionsync/security/secret_store.hpp"
#include "sessionsync/security/session_cipher.hpp"
#include "sessionsync/sync/authenticator.hpp"
#include "sessionsync/sync/gist_client.hpp"
#include "sessionsync/sync/gist_config.hpp"
#include "sessionsync/sync/retry.hpp"
#include "sessionsync/sync/session_sync.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace sessionsync::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config-dir") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config-dir";
        return false;
      }
      config::set_config_dir_override(std::filesystem::path(args[i + 1]));
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config-dir=")) {
      const auto value = args[i].substr(std::string("--config-dir=").size());
      if (value.empty()) {
        error = "missing value for --config-dir";
        return false;
      }
      config::set_config_dir_override(std::filesystem::path(value));
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

int fail(const std::string &message) {
  std::cerr << "error: " << message << "\n";
  return 1;
}

int fail(const sync::SyncError &error) { return fail(error.to_string()); }

// Owns every collaborator of SessionSync for the lifetime of one command.
struct SyncRuntime {
  config::SyncSettings settings;
  auth::GitHubOAuthConfig oauth;
  http::CurlHttpClient http;
  auth::SystemBrowserLauncher browser;
  std::unique_ptr<security::SecretStore> secrets;
  std::optional<security::SessionCipher> cipher;
  std::unique_ptr<sync::GitHubGistClient> transport;
  std::unique_ptr<sync::OAuthFlowAuthorizer> authorizer;
  std::unique_ptr<sync::GitHubAuthenticator> authenticator;
  std::unique_ptr<sync::SessionSync> session_sync;
};

auth::OAuthFlowOptions flow_options(const config::SyncSettings &settings) {
  auth::OAuthFlowOptions options;
  options.port_first = settings.callback_port_first;
  options.port_last = settings.callback_port_last;
  options.callback_timeout = std::chrono::seconds(settings.oauth_timeout_secs);
  options.http_timeout_ms = settings.http_timeout_ms;
  return options;
}

sync::SyncResult<std::unique_ptr<SyncRuntime>> open_runtime() {
  using ResultT = sync::SyncResult<std::unique_ptr<SyncRuntime>>;

  auto runtime = std::make_unique<SyncRuntime>();
  runtime->settings = config::load_settings();

  auto oauth = auth::GitHubOAuthConfig::load();
  if (!oauth.ok()) {
    return ResultT::failure(oauth.error());
  }
  runtime->oauth = oauth.value();

  auto secrets = security::create_default_secret_store();
  if (!secrets.ok()) {
    return ResultT::failure(sync::SyncError::config_error("secret_store", secrets.error()));
  }
  runtime->secrets = std::move(secrets.value());

  auto cipher = security::SessionCipher::create(*runtime->secrets);
  if (!cipher.ok()) {
    return ResultT::failure(cipher.error());
  }
  runtime->cipher.emplace(std::move(cipher.value()));

  auto pointer_store = sync::GistConfigStore::open_default();
  if (!pointer_store.ok()) {
    return ResultT::failure(pointer_store.error());
  }

  const auto retry = sync::RetryConfig::from_settings(runtime->settings);
  runtime->transport = std::make_unique<sync::GitHubGistClient>(
      runtime->http, runtime->settings.api_base_url, runtime->settings.http_timeout_ms);
  runtime->authorizer = std::make_unique<sync::OAuthFlowAuthorizer>(
      runtime->oauth, runtime->http, runtime->browser, flow_options(runtime->settings));
  runtime->authenticator = std::make_unique<sync::GitHubAuthenticator>(
      *runtime->secrets, *runtime->transport, *runtime->authorizer);
  runtime->session_sync = std::make_unique<sync::SessionSync>(
      *runtime->transport, *runtime->authenticator, *runtime->cipher,
      std::move(pointer_store.value()), retry);
  return ResultT::success(std::move(runtime));
}

int run_status() {
  auto store = sync::GistConfigStore::open_default();
  if (!store.ok()) {
    return fail(store.error());
  }
  std::cout << "pointer file: " << store.value().path().string() << "\n";

  auto loaded = store.value().load();
  if (!loaded.ok()) {
    std::cout << "pointer: invalid (" << loaded.error().to_string() << ")\n";
  } else if (!loaded.value().has_value()) {
    std::cout << "pointer: none\n";
  } else {
    const auto &pointer = *loaded.value();
    std::cout << "gist: " << pointer.gist_id << "\n";
    std::cout << "github user: " << pointer.github_username << "\n";
    std::cout << "created: " << pointer.created_at << "\n";
    std::cout << "last sync: " << pointer.last_sync
              << (pointer.is_recent() ? "" : " (older than 30 days)") << "\n";
  }

  auto runtime = open_runtime();
  if (!runtime.ok()) {
    std::cout << "session: unavailable (" << runtime.error().to_string() << ")\n";
    return 0;
  }
  auto &session_sync = *runtime.value()->session_sync;
  if (!session_sync.has_cookies()) {
    std::cout << "session: none\n";
    return 0;
  }
  std::cout << "session: available" << (session_sync.needs_refresh() ? " (refresh soon)" : "")
            << "\n";
  return 0;
}

int run_pull() {
  auto runtime = open_runtime();
  if (!runtime.ok()) {
    return fail(runtime.error());
  }
  auto cookies = runtime.value()->session_sync->get_cookies();
  if (!cookies.ok()) {
    return fail(cookies.error());
  }
  std::cout << common::json_write_flat(cookies.value()) << "\n";
  return 0;
}

int run_push(const std::vector<std::string> &args) {
  if (args.empty()) {
    return fail("usage: sessionsync push <file.json|->");
  }

  std::string content;
  if (args[0] == "-") {
    content = read_stdin_all();
  } else {
    auto file = common::read_file(common::expand_path(args[0]));
    if (!file.ok()) {
      return fail(file.error());
    }
    content = file.value();
  }

  auto cookies = common::json_parse_flat(content);
  if (!cookies.ok()) {
    return fail("cookie file must be a flat JSON object of strings: " + cookies.error());
  }

  auto runtime = open_runtime();
  if (!runtime.ok()) {
    return fail(runtime.error());
  }
  auto stored = runtime.value()->session_sync->store_cookies(cookies.value());
  if (!stored.ok()) {
    return fail(stored.error());
  }
  std::cout << "Stored " << cookies.value().size() << " cookie(s).\n";
  return 0;
}

int run_clear() {
  auto runtime = open_runtime();
  if (!runtime.ok()) {
    return fail(runtime.error());
  }
  auto deleted = runtime.value()->session_sync->delete_cookies();
  if (!deleted.ok()) {
    return fail(deleted.error());
  }
  std::cout << "Synced session removed.\n";
  return 0;
}

int run_reset() {
  auto runtime = open_runtime();
  if (!runtime.ok()) {
    return fail(runtime.error());
  }
  auto reset = runtime.value()->session_sync->delete_all_authentication();
  if (!reset.ok()) {
    return fail(reset.error());
  }
  std::cout << "Synced session and GitHub authorization removed.\n";
  return 0;
}

int run_backup() {
  auto store = sync::GistConfigStore::open_default();
  if (!store.ok()) {
    return fail(store.error());
  }
  auto backed_up = store.value().backup();
  if (!backed_up.ok()) {
    return fail(backed_up.error());
  }
  if (!backed_up.value().has_value()) {
    std::cout << "Nothing to back up.\n";
    return 0;
  }
  std::cout << "Backed up to " << backed_up.value()->string() << "\n";
  return 0;
}

int run_restore() {
  auto store = sync::GistConfigStore::open_default();
  if (!store.ok()) {
    return fail(store.error());
  }
  auto restored = store.value().restore_from_backup();
  if (!restored.ok()) {
    return fail(restored.error());
  }
  std::cout << "Restored " << store.value().path().string() << "\n";
  return 0;
}

} // namespace

std::string version_string() {
#ifdef SESSIONSYNC_VERSION
  return std::string("sessionsync ") + SESSIONSYNC_VERSION;
#else
  return "sessionsync 0.1.0";
#endif
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: sessionsync [--config-dir DIR] <command> [args]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  status               Show the gist pointer and whether a session is synced\n";
  std::cout << "  pull                 Print the synced cookie map as JSON\n";
  std::cout << "  push <file.json|->   Encrypt and upload a flat JSON cookie map\n";
  std::cout << "  clear                Delete the synced session and its gist\n";
  std::cout << "  reset                clear, then forget the stored GitHub token\n";
  std::cout << "  backup               Copy the pointer file to its .backup sibling\n";
  std::cout << "  restore              Restore the pointer file from its backup\n";
  std::cout << "  version              Show version\n\n";
  std::cout << "Environment: GITHUB_CLIENT_ID, GITHUB_CLIENT_SECRET, GITHUB_CALLBACK_URL,\n";
  std::cout << "  SESSIONSYNC_CONFIG_DIR, SESSIONSYNC_SECRET_BACKEND, SESSIONSYNC_LOG,\n";
  std::cout << "  SESSIONSYNC_LOG_LEVEL\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    return fail(global_error);
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }

  config::load_dotenv_files();
  observability::init_from_env();

  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "pull") {
    return run_pull();
  }
  if (subcommand == "push") {
    return run_push(args);
  }
  if (subcommand == "clear") {
    return run_clear();
  }
  if (subcommand == "reset") {
    return run_reset();
  }
  if (subcommand == "backup") {
    return run_backup();
  }
  if (subcommand == "restore") {
    return run_restore();
  }

  std::cerr << "error: unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace sessionsync::cli
