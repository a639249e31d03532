#pragma once

#include "sessionsync/common/result.hpp"
#include "sessionsync/sync/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sessionsync::auth {

// ── Constants ─────────────────────────────────────────────────────────────────

inline constexpr const char *GITHUB_AUTHORIZE_URL = "https://github.com/login/oauth/authorize";
inline constexpr const char *GITHUB_TOKEN_URL = "https://github.com/login/oauth/access_token";
inline constexpr const char *DEFAULT_CALLBACK_URL = "http://localhost:8080/auth/github/callback";
inline constexpr const char *GIST_SCOPE = "gist";

inline constexpr const char *ENV_CLIENT_ID = "GITHUB_CLIENT_ID";
inline constexpr const char *ENV_CLIENT_SECRET = "GITHUB_CLIENT_SECRET";
inline constexpr const char *ENV_CALLBACK_URL = "GITHUB_CALLBACK_URL";

inline constexpr std::size_t STATE_LENGTH = 32;
inline constexpr std::size_t STATE_MIN_LENGTH = 16;
inline constexpr std::size_t STATE_MAX_LENGTH = 128;

// ── Callback URL ──────────────────────────────────────────────────────────────

struct CallbackUrl {
  std::string scheme;
  std::string host;
  std::uint16_t port = 0; // 0 when the URL carries no explicit port
  std::string path;

  /// Accepts `scheme://host[:port][/path]`; query strings and fragments are rejected.
  [[nodiscard]] static common::Result<CallbackUrl> parse(const std::string &url);

  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] std::string with_port(std::uint16_t new_port) const;
  [[nodiscard]] bool is_loopback() const;
};

// ── Configuration ─────────────────────────────────────────────────────────────

struct GitHubOAuthConfig {
  std::string client_id;
  std::string client_secret;
  std::string callback_url = DEFAULT_CALLBACK_URL;
  std::vector<std::string> scopes{GIST_SCOPE};
  std::string authorize_url = GITHUB_AUTHORIZE_URL;
  std::string token_url = GITHUB_TOKEN_URL;

  /// Reads GITHUB_CLIENT_ID, GITHUB_CLIENT_SECRET and GITHUB_CALLBACK_URL.
  [[nodiscard]] static sync::SyncResult<GitHubOAuthConfig> load();

  [[nodiscard]] static sync::SyncResult<GitHubOAuthConfig>
  from_values(std::string client_id, std::string client_secret,
              std::optional<std::string> callback_url = std::nullopt);

  [[nodiscard]] sync::SyncStatus validate() const;
};

// ── CSRF state ────────────────────────────────────────────────────────────────

class OAuthState {
public:
  /// 32 alphanumeric characters from the OpenSSL CSPRNG.
  [[nodiscard]] static common::Result<OAuthState> create();

  /// Length 16-128, ASCII alphanumeric only.
  [[nodiscard]] static bool validate_format(const std::string &state);

  [[nodiscard]] const std::string &value() const { return value_; }

private:
  explicit OAuthState(std::string value) : value_(std::move(value)) {}

  std::string value_;
};

/// Comparison whose running time does not depend on the first differing byte.
[[nodiscard]] bool constant_time_equal(const std::string &a, const std::string &b);

/// Format errors fail; a well-formed mismatch is `false`.
[[nodiscard]] common::Result<bool> validate_callback_state(const std::string &expected,
                                                           const std::string &received);

[[nodiscard]] common::Result<std::string>
build_authorize_url(const GitHubOAuthConfig &config, const std::string &state,
                    const std::string &redirect_uri);

} // namespace sessionsync::auth
