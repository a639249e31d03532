#include "sessionsync/sync/authenticator.hpp"

#include "sessionsync/common/encoding.hpp"
#include "sessionsync/common/fs.hpp"
#include "sessionsync/observability/global.hpp"

namespace sessionsync::sync {

OAuthFlowAuthorizer::OAuthFlowAuthorizer(const auth::GitHubOAuthConfig &config,
                                         http::HttpClient &http, auth::BrowserLauncher &browser,
                                         auth::OAuthFlowOptions options)
    : config_(config), http_(http), browser_(browser), options_(std::move(options)) {}

SyncResult<std::string> OAuthFlowAuthorizer::authorize() {
  auth::GitHubOAuthFlow flow(config_, http_, browser_, options_);
  return flow.authenticate();
}

GitHubAuthenticator::GitHubAuthenticator(security::SecretStore &secrets, GistTransport &transport,
                                         Authorizer &authorizer, RetryConfig retry,
                                         Sleeper sleep)
    : secrets_(secrets), transport_(transport), authorizer_(authorizer), retry_(retry),
      sleep_(std::move(sleep)) {}

std::string GitHubAuthenticator::token_hash(const std::string &token) {
  return common::sha256_hex(token);
}

std::string GitHubAuthenticator::username() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return username_;
}

std::optional<std::string> GitHubAuthenticator::available_token() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (token_.has_value()) {
    return token_;
  }
  auto stored = secrets_.get(security::github_token_id());
  if (!stored.ok()) {
    observability::log_warn("auth", "unable to read stored token: " + stored.error());
    return std::nullopt;
  }
  if (!stored.value().has_value()) {
    return std::nullopt;
  }
  const std::string token = common::trim(*stored.value());
  if (token.empty()) {
    return std::nullopt;
  }
  return token;
}

SyncResult<std::string> GitHubAuthenticator::ensure_token() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (token_.has_value()) {
    return SyncResult<std::string>::success(*token_);
  }

  auto stored = secrets_.get(security::github_token_id());
  if (!stored.ok()) {
    observability::log_warn("auth", "unable to read stored token: " + stored.error());
  } else if (stored.value().has_value() && !common::trim(*stored.value()).empty()) {
    const std::string token = common::trim(*stored.value());
    auto user = execute_with_retry([&]() { return transport_.current_user(token); }, retry_,
                                   "validate_token", sleep_);
    if (user.ok()) {
      token_ = token;
      username_ = user.value();
      observability::log_debug("auth", "reusing stored GitHub token for " + username_);
      return SyncResult<std::string>::success(token);
    }
    if (user.error().kind != ErrorKind::AuthenticationRequired) {
      return SyncResult<std::string>::failure(user.error());
    }
    observability::log_info("auth", "stored GitHub token was rejected; authorizing again");
    auto removed = secrets_.remove(security::github_token_id());
    if (!removed.ok()) {
      observability::log_warn("auth", "failed to remove rejected token: " + removed.error());
    }
  }

  return authorize_locked();
}

SyncResult<std::string> GitHubAuthenticator::reauthenticate() {
  std::lock_guard<std::mutex> lock(mutex_);
  token_.reset();
  username_.clear();
  auto removed = secrets_.remove(security::github_token_id());
  if (!removed.ok()) {
    observability::log_warn("auth", "failed to remove rejected token: " + removed.error());
  }
  return authorize_locked();
}

SyncResult<std::string> GitHubAuthenticator::authorize_locked() {
  auto token = authorizer_.authorize();
  if (!token.ok()) {
    return token;
  }

  auto user = execute_with_retry([&]() { return transport_.current_user(token.value()); },
                                 retry_, "validate_token", sleep_);
  if (!user.ok()) {
    return SyncResult<std::string>::failure(user.error());
  }

  auto saved = secrets_.set(security::github_token_id(), token.value());
  if (!saved.ok()) {
    // The token still works for this process; it just will not survive it.
    observability::log_warn("auth", "failed to persist GitHub token: " + saved.error());
  }

  token_ = token.value();
  username_ = user.value();
  observability::log_info("auth", "authorized as " + username_);
  return token;
}

SyncStatus GitHubAuthenticator::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  token_.reset();
  username_.clear();
  auto removed = secrets_.remove(security::github_token_id());
  if (!removed.ok()) {
    return SyncStatus::failure(
        SyncError::config_error("github_token", "failed to remove stored token: " + removed.error()));
  }
  return SyncStatus::success();
}

} // namespace sessionsync::sync
