#include "sessionsync/config/config.hpp"

#include "sessionsync/common/fs.hpp"
#include "sessionsync/observability/global.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace sessionsync::config {

namespace {

std::optional<std::filesystem::path> g_config_dir_override;

std::optional<std::filesystem::path> resolved_config_dir_override() {
  if (g_config_dir_override.has_value()) {
    return g_config_dir_override;
  }
  if (const char *env = std::getenv("SESSIONSYNC_CONFIG_DIR"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

common::Result<std::filesystem::path> platform_config_root() {
#if defined(_WIN32)
  if (const char *appdata = std::getenv("APPDATA"); appdata != nullptr && *appdata != '\0') {
    return common::Result<std::filesystem::path>::success(std::filesystem::path(appdata));
  }
  return common::Result<std::filesystem::path>::failure("APPDATA is not set");
#else
  const auto home = common::home_dir();
#if defined(__APPLE__)
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / "Library" /
                                                        "Application Support");
#else
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
    return common::Result<std::filesystem::path>::success(std::filesystem::path(xdg));
  }
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / ".config");
#endif
#endif
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  const auto comment = value.find(" #");
  if (comment != std::string::npos) {
    value = common::trim(value.substr(0, comment));
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  for (const char ch : name) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  setenv(name.c_str(), value.c_str(), 0);
#endif
}

template <typename T>
void override_unsigned(const char *name, T &target, std::vector<std::string> &warnings) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return;
  }
  if (*raw == '-') {
    warnings.push_back(std::string(name) + " must not be negative, keeping default");
    return;
  }
  try {
    std::size_t consumed = 0;
    const unsigned long long parsed = std::stoull(raw, &consumed);
    if (consumed != std::string(raw).size() || parsed > std::numeric_limits<T>::max()) {
      throw std::out_of_range(name);
    }
    target = static_cast<T>(parsed);
  } catch (const std::exception &) {
    warnings.push_back(std::string(name) + " is not a valid number, keeping default");
  }
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_dir = resolved_config_dir_override(); override_dir.has_value()) {
    return common::ensure_dir(*override_dir);
  }
  const auto root = platform_config_root();
  if (!root.ok()) {
    return common::Result<std::filesystem::path>::failure("unable to determine config directory: " +
                                                          root.error());
  }
  return common::ensure_dir(root.value() / APP_DIR_NAME);
}

void set_config_dir_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_dir_override = std::nullopt;
    return;
  }
  g_config_dir_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_dir_override() { g_config_dir_override = std::nullopt; }

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    const std::string value = strip_env_quotes(trimmed.substr(eq + 1));
    set_env_if_missing(key, value);
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("SESSIONSYNC_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

void apply_env_overrides(SyncSettings &settings, std::vector<std::string> &warnings) {
  override_unsigned("SESSIONSYNC_HTTP_TIMEOUT_MS", settings.http_timeout_ms, warnings);
  override_unsigned("SESSIONSYNC_OAUTH_TIMEOUT_SECS", settings.oauth_timeout_secs, warnings);
  override_unsigned("SESSIONSYNC_MAX_RETRIES", settings.max_retries, warnings);

  if (const char *api = std::getenv("SESSIONSYNC_GITHUB_API_URL"); api != nullptr && *api) {
    std::string url = common::trim(api);
    while (!url.empty() && url.back() == '/') {
      url.pop_back();
    }
    if (common::starts_with(url, "https://") || common::starts_with(url, "http://127.0.0.1") ||
        common::starts_with(url, "http://localhost")) {
      settings.api_base_url = url;
    } else {
      warnings.push_back("SESSIONSYNC_GITHUB_API_URL must be https or loopback, keeping default");
    }
  }
}

SyncSettings load_settings() {
  SyncSettings settings;
  std::vector<std::string> warnings;
  apply_env_overrides(settings, warnings);
  for (const auto &warning : warnings) {
    observability::log_warn("config", warning);
  }
  return settings;
}

common::Result<std::vector<std::string>> validate_settings(const SyncSettings &settings) {
  std::vector<std::string> problems;
  if (settings.http_timeout_ms == 0) {
    problems.emplace_back("http_timeout_ms must be positive");
  }
  if (settings.oauth_timeout_secs == 0) {
    problems.emplace_back("oauth_timeout_secs must be positive");
  }
  if (settings.callback_port_first == 0 ||
      settings.callback_port_first > settings.callback_port_last) {
    problems.emplace_back("callback port range is empty");
  }
  if (settings.retry_backoff_multiplier < 1.0) {
    problems.emplace_back("retry_backoff_multiplier must be >= 1.0");
  }
  if (settings.retry_jitter_factor < 0.0 || settings.retry_jitter_factor > 1.0) {
    problems.emplace_back("retry_jitter_factor must be within [0, 1]");
  }
  if (settings.retry_base_delay_ms > settings.retry_max_delay_ms) {
    problems.emplace_back("retry_base_delay_ms exceeds retry_max_delay_ms");
  }
  return common::Result<std::vector<std::string>>::success(std::move(problems));
}

} // namespace sessionsync::config
