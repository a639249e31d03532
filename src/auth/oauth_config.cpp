#include "sessionsync/auth/oauth_config.hpp"

#include "sessionsync/common/encoding.hpp"
#include "sessionsync/common/fs.hpp"
#include "sessionsync/common/random.hpp"

#include <openssl/crypto.h>

#include <cctype>
#include <cstdlib>

namespace sessionsync::auth {

namespace {

constexpr std::size_t CLIENT_ID_MIN = 8;
constexpr std::size_t CLIENT_ID_MAX = 64;
constexpr std::size_t CLIENT_SECRET_MIN = 16;
constexpr std::size_t CLIENT_SECRET_MAX = 128;

bool valid_host_char(unsigned char ch) {
  return std::isalnum(ch) != 0 || ch == '-' || ch == '.';
}

std::string join(const std::vector<std::string> &values, const std::string &separator) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += values[i];
  }
  return out;
}

} // namespace

// ── Callback URL ──────────────────────────────────────────────────────────────

common::Result<CallbackUrl> CallbackUrl::parse(const std::string &url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return common::Result<CallbackUrl>::failure("missing scheme");
  }

  CallbackUrl parsed;
  parsed.scheme = common::to_lower(url.substr(0, scheme_end));
  for (const unsigned char ch : parsed.scheme) {
    if (std::isalpha(ch) == 0) {
      return common::Result<CallbackUrl>::failure("invalid scheme");
    }
  }

  const std::string rest = url.substr(scheme_end + 3);
  if (rest.find_first_of("?#") != std::string::npos) {
    return common::Result<CallbackUrl>::failure("query and fragment are not allowed");
  }

  const auto path_start = rest.find('/');
  const std::string authority = rest.substr(0, path_start);
  parsed.path = path_start == std::string::npos ? "/" : rest.substr(path_start);

  const auto colon = authority.rfind(':');
  parsed.host = authority.substr(0, colon);
  if (parsed.host.empty()) {
    return common::Result<CallbackUrl>::failure("missing host");
  }
  for (const unsigned char ch : parsed.host) {
    if (!valid_host_char(ch)) {
      return common::Result<CallbackUrl>::failure("invalid host");
    }
  }

  if (colon != std::string::npos) {
    const std::string port_text = authority.substr(colon + 1);
    if (port_text.empty() || port_text.size() > 5) {
      return common::Result<CallbackUrl>::failure("invalid port");
    }
    unsigned long port = 0;
    for (const unsigned char ch : port_text) {
      if (std::isdigit(ch) == 0) {
        return common::Result<CallbackUrl>::failure("invalid port");
      }
      port = port * 10 + static_cast<unsigned long>(ch - '0');
    }
    if (port == 0 || port > 65535) {
      return common::Result<CallbackUrl>::failure("port out of range");
    }
    parsed.port = static_cast<std::uint16_t>(port);
  }

  return common::Result<CallbackUrl>::success(std::move(parsed));
}

std::string CallbackUrl::to_string() const { return with_port(port); }

std::string CallbackUrl::with_port(std::uint16_t new_port) const {
  std::string out = scheme + "://" + host;
  if (new_port != 0) {
    out += ":" + std::to_string(new_port);
  }
  return out + path;
}

bool CallbackUrl::is_loopback() const {
  return host == "localhost" || host == "127.0.0.1";
}

// ── Configuration ─────────────────────────────────────────────────────────────

sync::SyncResult<GitHubOAuthConfig> GitHubOAuthConfig::load() {
  std::optional<std::string> callback;
  if (const char *value = std::getenv(ENV_CALLBACK_URL); value != nullptr && *value != '\0') {
    callback = common::trim(value);
  }
  return from_values(common::trim(common::getenv_or(ENV_CLIENT_ID, "")),
                     common::trim(common::getenv_or(ENV_CLIENT_SECRET, "")),
                     std::move(callback));
}

sync::SyncResult<GitHubOAuthConfig>
GitHubOAuthConfig::from_values(std::string client_id, std::string client_secret,
                               std::optional<std::string> callback_url) {
  GitHubOAuthConfig config;
  config.client_id = std::move(client_id);
  config.client_secret = std::move(client_secret);
  if (callback_url.has_value()) {
    config.callback_url = std::move(*callback_url);
  }

  auto valid = config.validate();
  if (!valid.ok()) {
    return sync::SyncResult<GitHubOAuthConfig>::failure(valid.error());
  }
  return sync::SyncResult<GitHubOAuthConfig>::success(std::move(config));
}

sync::SyncStatus GitHubOAuthConfig::validate() const {
  if (client_id.empty()) {
    return sync::SyncStatus::failure(sync::SyncError::config_error(ENV_CLIENT_ID, "is not set"));
  }
  if (client_id.size() < CLIENT_ID_MIN || client_id.size() > CLIENT_ID_MAX) {
    return sync::SyncStatus::failure(
        sync::SyncError::config_error(ENV_CLIENT_ID, "must be 8-64 characters"));
  }
  if (client_secret.empty()) {
    return sync::SyncStatus::failure(
        sync::SyncError::config_error(ENV_CLIENT_SECRET, "is not set"));
  }
  if (client_secret.size() < CLIENT_SECRET_MIN || client_secret.size() > CLIENT_SECRET_MAX) {
    return sync::SyncStatus::failure(
        sync::SyncError::config_error(ENV_CLIENT_SECRET, "must be 16-128 characters"));
  }
  if (!common::starts_with(callback_url, "http://localhost:") &&
      !common::starts_with(callback_url, "https://")) {
    return sync::SyncStatus::failure(sync::SyncError::config_error(
        ENV_CALLBACK_URL, "must start with http://localhost: or https://"));
  }
  auto parsed = CallbackUrl::parse(callback_url);
  if (!parsed.ok()) {
    return sync::SyncStatus::failure(
        sync::SyncError::config_error(ENV_CALLBACK_URL, "malformed URL: " + parsed.error()));
  }
  if (scopes.empty()) {
    return sync::SyncStatus::failure(sync::SyncError::config_error("scopes", "empty"));
  }
  return sync::SyncStatus::success();
}

// ── CSRF state ────────────────────────────────────────────────────────────────

common::Result<OAuthState> OAuthState::create() {
  auto value = common::random_alphanumeric(STATE_LENGTH);
  if (!value.ok()) {
    return common::Result<OAuthState>::failure("failed to generate OAuth state: " +
                                               value.error());
  }
  return common::Result<OAuthState>::success(OAuthState(value.value()));
}

bool OAuthState::validate_format(const std::string &state) {
  if (state.size() < STATE_MIN_LENGTH || state.size() > STATE_MAX_LENGTH) {
    return false;
  }
  return common::is_ascii_alphanumeric(state);
}

bool constant_time_equal(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

common::Result<bool> validate_callback_state(const std::string &expected,
                                             const std::string &received) {
  if (!OAuthState::validate_format(expected)) {
    return common::Result<bool>::failure("expected OAuth state is malformed");
  }
  if (!OAuthState::validate_format(received)) {
    return common::Result<bool>::failure("received OAuth state is malformed");
  }
  return common::Result<bool>::success(constant_time_equal(expected, received));
}

common::Result<std::string> build_authorize_url(const GitHubOAuthConfig &config,
                                                const std::string &state,
                                                const std::string &redirect_uri) {
  if (!OAuthState::validate_format(state)) {
    return common::Result<std::string>::failure("refusing to build URL with malformed state");
  }

  std::string url = config.authorize_url;
  url += "?client_id=" + common::url_encode_component(config.client_id);
  url += "&redirect_uri=" + common::url_encode_component(redirect_uri);
  url += "&scope=" + common::url_encode_component(join(config.scopes, ","));
  url += "&state=" + common::url_encode_component(state);
  return common::Result<std::string>::success(std::move(url));
}

} // namespace sessionsync::auth
