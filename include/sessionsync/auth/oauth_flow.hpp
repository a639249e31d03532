#pragma once

#include "sessionsync/auth/browser.hpp"
#include "sessionsync/auth/oauth_config.hpp"
#include "sessionsync/http/http_client.hpp"
#include "sessionsync/sync/errors.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace sessionsync::auth {

enum class FlowState {
  Idle,
  ListenerBound,
  BrowserOpened,
  AwaitingCallback,
  CodeReceived,
  TokenExchanged,
  Done,
  Aborted,
};

[[nodiscard]] const char *flow_state_name(FlowState state);

struct OAuthFlowOptions {
  std::string bind_host = "127.0.0.1";
  std::uint16_t port_first = 8080;
  std::uint16_t port_last = 8089;
  std::chrono::seconds callback_timeout{300};
  std::uint64_t http_timeout_ms = 30000;
  bool print_instructions = true;
};

/// Extracts the authorization code from the raw callback request. The state is
/// verified before anything else, so a forged `error` callback without the
/// right state is reported as a security violation rather than a denial.
[[nodiscard]] sync::SyncResult<std::string>
parse_callback_request(const std::string &raw_request, const std::string &expected_state);

/// Single POST to the token endpoint. Authorization codes are single-use, so
/// this is never retried.
[[nodiscard]] sync::SyncResult<std::string>
exchange_code(http::HttpClient &http, const GitHubOAuthConfig &config, const std::string &code,
              const std::string &redirect_uri, std::uint64_t timeout_ms);

/// Authorization-code flow over a loopback redirect listener. One object drives
/// one attempt; a second authenticate() call fails.
class GitHubOAuthFlow {
public:
  GitHubOAuthFlow(const GitHubOAuthConfig &config, http::HttpClient &http,
                  BrowserLauncher &browser, OAuthFlowOptions options = {});

  [[nodiscard]] sync::SyncResult<std::string> authenticate();

  [[nodiscard]] FlowState state() const { return state_; }
  [[nodiscard]] const std::string &abort_reason() const { return abort_reason_; }
  [[nodiscard]] std::uint16_t bound_port() const { return bound_port_; }

private:
  void transition(FlowState next);
  sync::SyncResult<std::string> abort(sync::SyncError error);

  const GitHubOAuthConfig &config_;
  http::HttpClient &http_;
  BrowserLauncher &browser_;
  OAuthFlowOptions options_;
  FlowState state_ = FlowState::Idle;
  std::string abort_reason_;
  std::uint16_t bound_port_ = 0;
};

} // namespace sessionsync::auth
