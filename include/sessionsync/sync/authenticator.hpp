#pragma once

#include "sessionsync/auth/browser.hpp"
#include "sessionsync/auth/oauth_config.hpp"
#include "sessionsync/auth/oauth_flow.hpp"
#include "sessionsync/http/http_client.hpp"
#include "sessionsync/security/secret_store.hpp"
#include "sessionsync/sync/gist_client.hpp"
#include "sessionsync/sync/retry.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace sessionsync::sync {

/// Obtains a fresh access token, normally by running the interactive OAuth flow.
class Authorizer {
public:
  virtual ~Authorizer() = default;

  [[nodiscard]] virtual SyncResult<std::string> authorize() = 0;
};

/// Runs a new GitHubOAuthFlow for every authorize() call.
class OAuthFlowAuthorizer final : public Authorizer {
public:
  OAuthFlowAuthorizer(const auth::GitHubOAuthConfig &config, http::HttpClient &http,
                      auth::BrowserLauncher &browser, auth::OAuthFlowOptions options = {});

  [[nodiscard]] SyncResult<std::string> authorize() override;

private:
  const auth::GitHubOAuthConfig &config_;
  http::HttpClient &http_;
  auth::BrowserLauncher &browser_;
  auth::OAuthFlowOptions options_;
};

/// Owns the GitHub access token: kept in the secret store between runs,
/// validated against the API before reuse and replaced through the Authorizer
/// when missing or rejected.
class GitHubAuthenticator {
public:
  GitHubAuthenticator(security::SecretStore &secrets, GistTransport &transport,
                      Authorizer &authorizer, RetryConfig retry = RetryConfig::auth(),
                      Sleeper sleep = default_sleeper());

  /// May run the interactive flow.
  [[nodiscard]] SyncResult<std::string> ensure_token();

  /// Cached or stored token without validation or interaction.
  [[nodiscard]] std::optional<std::string> available_token();

  /// Drops the current token and authorizes again.
  [[nodiscard]] SyncResult<std::string> reauthenticate();

  /// Forgets the token in memory and in the secret store.
  [[nodiscard]] SyncStatus clear();

  /// Login of the token owner, known after ensure_token() succeeded.
  [[nodiscard]] std::string username() const;

  /// SHA-256 hex, used to notice that the pointer was written under another token.
  [[nodiscard]] static std::string token_hash(const std::string &token);

private:
  SyncResult<std::string> authorize_locked();

  security::SecretStore &secrets_;
  GistTransport &transport_;
  Authorizer &authorizer_;
  RetryConfig retry_;
  Sleeper sleep_;

  mutable std::mutex mutex_;
  std::optional<std::string> token_;
  std::string username_;
};

} // namespace sessionsync::sync
