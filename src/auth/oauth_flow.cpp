#include "sessionsync/auth/oauth_flow.hpp"

#include "sessionsync/auth/callback_listener.hpp"
#include "sessionsync/common/encoding.hpp"
#include "sessionsync/common/fs.hpp"
#include "sessionsync/common/json_util.hpp"
#include "sessionsync/observability/global.hpp"

#include <iostream>

namespace sessionsync::auth {

namespace {

constexpr const char *kExchangeOperation = "oauth_token_exchange";

std::string request_target(const std::string &raw_request) {
  const auto line_end = raw_request.find("\r\n");
  const std::string line = raw_request.substr(0, line_end);
  const auto first_space = line.find(' ');
  if (first_space == std::string::npos) {
    return "";
  }
  const auto second_space = line.find(' ', first_space + 1);
  if (second_space == std::string::npos) {
    return "";
  }
  return line.substr(first_space + 1, second_space - first_space - 1);
}

std::string find_param(const std::unordered_map<std::string, std::string> &params,
                       const std::string &name) {
  const auto it = params.find(name);
  return it == params.end() ? std::string() : it->second;
}

} // namespace

const char *flow_state_name(FlowState state) {
  switch (state) {
  case FlowState::Idle:
    return "Idle";
  case FlowState::ListenerBound:
    return "ListenerBound";
  case FlowState::BrowserOpened:
    return "BrowserOpened";
  case FlowState::AwaitingCallback:
    return "AwaitingCallback";
  case FlowState::CodeReceived:
    return "CodeReceived";
  case FlowState::TokenExchanged:
    return "TokenExchanged";
  case FlowState::Done:
    return "Done";
  case FlowState::Aborted:
    return "Aborted";
  }
  return "Unknown";
}

sync::SyncResult<std::string> parse_callback_request(const std::string &raw_request,
                                                     const std::string &expected_state) {
  using ResultT = sync::SyncResult<std::string>;

  if (!common::starts_with(raw_request, "GET ")) {
    return ResultT::failure(
        sync::SyncError::authentication_required("malformed OAuth callback request"));
  }
  const std::string target = request_target(raw_request);
  const auto query_start = target.find('?');
  if (target.empty() || query_start == std::string::npos) {
    return ResultT::failure(
        sync::SyncError::authentication_required("OAuth callback carried no parameters"));
  }
  const auto params = common::parse_query_string(target.substr(query_start + 1));

  const auto state_it = params.find("state");
  if (state_it == params.end()) {
    return ResultT::failure(
        sync::SyncError::security_violation("OAuth callback is missing the state parameter"));
  }
  auto state_matches = validate_callback_state(expected_state, state_it->second);
  if (!state_matches.ok()) {
    return ResultT::failure(sync::SyncError::security_violation(state_matches.error()));
  }
  if (!state_matches.value()) {
    return ResultT::failure(sync::SyncError::security_violation(
        "OAuth state mismatch, possible CSRF attempt"));
  }

  if (const auto error = find_param(params, "error"); !error.empty()) {
    std::string message = "GitHub authorization failed: " + error;
    if (const auto description = find_param(params, "error_description");
        !description.empty()) {
      message += " - " + description;
    }
    return ResultT::failure(sync::SyncError::authentication_required(message));
  }

  const std::string code = find_param(params, "code");
  if (code.empty()) {
    return ResultT::failure(sync::SyncError::authentication_required(
        "OAuth callback is missing the authorization code"));
  }
  return ResultT::success(code);
}

sync::SyncResult<std::string> exchange_code(http::HttpClient &http,
                                            const GitHubOAuthConfig &config,
                                            const std::string &code,
                                            const std::string &redirect_uri,
                                            std::uint64_t timeout_ms) {
  using ResultT = sync::SyncResult<std::string>;

  std::string body = "client_id=" + common::url_encode_component(config.client_id);
  body += "&client_secret=" + common::url_encode_component(config.client_secret);
  body += "&code=" + common::url_encode_component(code);
  body += "&redirect_uri=" + common::url_encode_component(redirect_uri);

  const http::Headers headers = {
      {"Accept", "application/json"},
      {"Content-Type", "application/x-www-form-urlencoded"},
  };
  auto response = http.post(config.token_url, headers, body, timeout_ms);

  if (response.timeout) {
    return ResultT::failure(sync::SyncError::network_timeout(
        std::chrono::seconds(timeout_ms / 1000), kExchangeOperation));
  }
  if (response.network_error) {
    return ResultT::failure(sync::SyncError::api_request_failed(
        kExchangeOperation, 0, response.network_error_message));
  }
  if (!response.is_success()) {
    return ResultT::failure(sync::SyncError::authentication_required(
        "token exchange failed (HTTP " + std::to_string(response.status) + ")"));
  }

  const std::string trimmed = common::trim(response.body);
  if (trimmed.empty() || trimmed.front() != '{') {
    return ResultT::failure(
        sync::SyncError::authentication_required("token exchange returned an unparsable body"));
  }

  // GitHub reports a bad or expired code with HTTP 200 and an `error` member.
  if (const auto error = common::json_get_string(trimmed, "error"); !error.empty()) {
    std::string message = "token exchange rejected: " + error;
    if (const auto description = common::json_get_string(trimmed, "error_description");
        !description.empty()) {
      message += " - " + description;
    }
    return ResultT::failure(sync::SyncError::authentication_required(message));
  }

  std::string token = common::json_get_string(trimmed, "access_token");
  if (token.empty()) {
    return ResultT::failure(
        sync::SyncError::authentication_required("token exchange returned no access_token"));
  }
  return ResultT::success(std::move(token));
}

GitHubOAuthFlow::GitHubOAuthFlow(const GitHubOAuthConfig &config, http::HttpClient &http,
                                 BrowserLauncher &browser, OAuthFlowOptions options)
    : config_(config), http_(http), browser_(browser), options_(std::move(options)) {}

void GitHubOAuthFlow::transition(FlowState next) {
  observability::record_oauth_transition(flow_state_name(state_), flow_state_name(next));
  state_ = next;
}

sync::SyncResult<std::string> GitHubOAuthFlow::abort(sync::SyncError error) {
  abort_reason_ = error.to_string();
  observability::log_warn("oauth", "authorization aborted: " + abort_reason_);
  transition(FlowState::Aborted);
  return sync::SyncResult<std::string>::failure(std::move(error));
}

sync::SyncResult<std::string> GitHubOAuthFlow::authenticate() {
  if (state_ != FlowState::Idle) {
    return sync::SyncResult<std::string>::failure(sync::SyncError::authentication_required(
        "authorization flow already used; start a new one"));
  }

  auto csrf = OAuthState::create();
  if (!csrf.ok()) {
    return abort(sync::SyncError::security_violation(csrf.error()));
  }

  auto callback = CallbackUrl::parse(config_.callback_url);
  if (!callback.ok()) {
    return abort(sync::SyncError::config_error(ENV_CALLBACK_URL, callback.error()));
  }

  CallbackListener listener;
  auto bound =
      listener.bind_first_free(options_.bind_host, options_.port_first, options_.port_last);
  if (!bound.ok()) {
    return abort(sync::SyncError::authentication_required(bound.error()));
  }
  bound_port_ = listener.port();
  transition(FlowState::ListenerBound);

  // The redirect URI must name the port actually bound, both here and in the
  // token exchange.
  const std::string redirect_uri = callback.value().with_port(bound_port_);
  auto url = build_authorize_url(config_, csrf.value().value(), redirect_uri);
  if (!url.ok()) {
    return abort(sync::SyncError::security_violation(url.error()));
  }

  if (options_.print_instructions) {
    std::cerr << "\nOpening your browser to authorize GitHub access...\n";
    std::cerr << "If it does not open, visit:\n  " << url.value() << "\n\n";
  }
  auto launched = browser_.open(url.value());
  if (!launched.ok()) {
    observability::log_warn("oauth", "browser launch failed: " + launched.error());
  }
  transition(FlowState::BrowserOpened);

  transition(FlowState::AwaitingCallback);
  auto request = listener.accept_one(options_.callback_timeout);
  listener.close();
  if (!request.ok()) {
    return abort(sync::SyncError::authentication_required(request.error()));
  }
  if (!request.value().has_value()) {
    return abort(sync::SyncError::authentication_required(
        "timed out after " + std::to_string(options_.callback_timeout.count()) +
        "s waiting for the OAuth callback"));
  }

  auto code = parse_callback_request(*request.value(), csrf.value().value());
  if (!code.ok()) {
    return abort(code.error());
  }
  transition(FlowState::CodeReceived);

  auto token =
      exchange_code(http_, config_, code.value(), redirect_uri, options_.http_timeout_ms);
  if (!token.ok()) {
    return abort(token.error());
  }
  transition(FlowState::TokenExchanged);

  observability::log_info("oauth", "GitHub authorization complete");
  transition(FlowState::Done);
  return token;
}

} // namespace sessionsync::auth
