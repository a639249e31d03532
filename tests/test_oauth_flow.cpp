#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "sessionsync/auth/browser.hpp"
#include "sessionsync/auth/callback_listener.hpp"
#include "sessionsync/auth/oauth_flow.hpp"

#include <chrono>

namespace {

namespace auth = sessionsync::auth;
using sessionsync::sync::ErrorKind;

auth::GitHubOAuthConfig test_config() {
  auto config = auth::GitHubOAuthConfig::from_values("Iv1.testclient", "0123456789abcdef0123");
  if (!config.ok()) {
    throw std::runtime_error(config.error().to_string());
  }
  return config.value();
}

auth::OAuthFlowOptions test_options(std::uint16_t first, std::uint16_t last) {
  auth::OAuthFlowOptions options;
  options.port_first = first;
  options.port_last = last;
  options.callback_timeout = std::chrono::seconds(5);
  options.print_instructions = false;
  return options;
}

std::string callback_request(const std::string &query) {
  return "GET /auth/github/callback?" + query + " HTTP/1.1\r\nHost: localhost\r\n\r\n";
}

} // namespace

void register_oauth_flow_tests(std::vector<sessionsync::tests::TestCase> &tests) {
  using sessionsync::tests::require;
  using sessionsync::testing::FakeBrowserLauncher;
  using sessionsync::testing::FakeHttpClient;
  using sessionsync::testing::query_param;

  tests.push_back({"oauth_flow_completes_over_loopback", [] {
                     const auto config = test_config();
                     FakeHttpClient http;
                     http.push_json(200, "{\"access_token\":\"gho_flow\",\"token_type\":\"bearer\","
                                         "\"scope\":\"gist\"}");
                     FakeBrowserLauncher browser;
                     auth::GitHubOAuthFlow flow(config, http, browser, test_options(38080, 38089));

                     auto token = flow.authenticate();
                     require(token.ok(), "flow failed: " + (token.ok() ? std::string()
                                                                        : token.error().to_string()));
                     require(token.value() == "gho_flow", "wrong token");
                     require(flow.state() == auth::FlowState::Done, "flow should end in Done");
                     require(flow.bound_port() >= 38080 && flow.bound_port() <= 38089,
                             "bound port outside the range");

                     const std::string redirect = query_param(browser.opened_url(), "redirect_uri");
                     require(redirect == "http://localhost:" + std::to_string(flow.bound_port()) +
                                             "/auth/github/callback",
                             "redirect_uri should carry the bound port: " + redirect);

                     require(http.request_count() == 1, "exactly one token exchange");
                     const auto exchange = http.last_request();
                     require(exchange.method == "POST", "exchange must POST");
                     require(exchange.url == auth::GITHUB_TOKEN_URL, "token endpoint");
                     const std::string body = exchange.body.value_or("");
                     require(body.find("code=test-code") != std::string::npos,
                             "code missing from exchange");
                     require(body.find("redirect_uri=http%3A%2F%2Flocalhost%3A" +
                                                std::to_string(flow.bound_port())) !=
                                 std::string::npos,
                             "exchange must reuse the redirect_uri");

                     const std::string page = browser.response_text();
                     require(page.find("200 OK") != std::string::npos,
                             "listener should answer 200: " + page);
                     require(page.find("Authorization Complete") != std::string::npos,
                             "completion page missing");
                   }});

  tests.push_back({"oauth_flow_rejects_state_mismatch", [] {
                     const auto config = test_config();
                     FakeHttpClient http;
                     FakeBrowserLauncher browser(FakeBrowserLauncher::Reply{
                         .forced_state = std::string(32, 'Z')});
                     auth::GitHubOAuthFlow flow(config, http, browser, test_options(38090, 38099));

                     auto token = flow.authenticate();
                     require(!token.ok(), "mismatched state must fail");
                     require(token.error().kind == ErrorKind::SecurityViolation,
                             "expected SecurityViolation");
                     require(flow.state() == auth::FlowState::Aborted, "flow should abort");
                     require(http.request_count() == 0, "no token exchange after a bad state");
                     (void)browser.response_text();
                   }});

  tests.push_back({"oauth_flow_reports_provider_denial", [] {
                     const auto config = test_config();
                     FakeHttpClient http;
                     FakeBrowserLauncher browser(FakeBrowserLauncher::Reply{
                         .code = "",
                         .extra_query = "error=access_denied&error_description=User%20denied"});
                     auth::GitHubOAuthFlow flow(config, http, browser, test_options(38100, 38109));

                     auto token = flow.authenticate();
                     require(!token.ok(), "denial must fail");
                     require(token.error().kind == ErrorKind::AuthenticationRequired, "kind");
                     require(token.error().to_string().find("access_denied") != std::string::npos,
                             "provider error should be surfaced");
                     require(flow.abort_reason().find("User denied") != std::string::npos,
                             "description should be surfaced");
                     (void)browser.response_text();
                   }});

  tests.push_back({"oauth_flow_times_out_without_callback", [] {
                     const auto config = test_config();
                     FakeHttpClient http;
                     FakeBrowserLauncher browser(FakeBrowserLauncher::Reply{.connect = false});
                     auto options = test_options(38110, 38119);
                     options.callback_timeout = std::chrono::seconds(1);
                     auth::GitHubOAuthFlow flow(config, http, browser, options);

                     const auto started = std::chrono::steady_clock::now();
                     auto token = flow.authenticate();
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(!token.ok(), "flow must time out");
                     require(token.error().kind == ErrorKind::AuthenticationRequired, "kind");
                     require(token.error().to_string().find("timed out") != std::string::npos,
                             "timeout should be named");
                     require(elapsed < std::chrono::seconds(4), "timeout not honored");
                     require(!browser.opened_url().empty(), "browser should still be asked");
                   }});

  tests.push_back({"oauth_flow_is_single_use", [] {
                     const auto config = test_config();
                     FakeHttpClient http;
                     FakeBrowserLauncher browser(FakeBrowserLauncher::Reply{.connect = false});
                     auto options = test_options(38120, 38120);
                     options.callback_timeout = std::chrono::seconds(1);
                     auth::GitHubOAuthFlow flow(config, http, browser, options);
                     require(!flow.authenticate().ok(), "first attempt times out");
                     auto second = flow.authenticate();
                     require(!second.ok(), "second attempt must be refused");
                     require(second.error().to_string().find("already used") != std::string::npos,
                             "reuse should be named");
                   }});

  tests.push_back({"oauth_parse_callback_request_cases", [] {
                     const std::string state(32, 'S');

                     auto ok = auth::parse_callback_request(
                         callback_request("code=abc123&state=" + state), state);
                     require(ok.ok() && ok.value() == "abc123", "valid callback");

                     auto missing_state =
                         auth::parse_callback_request(callback_request("code=abc123"), state);
                     require(!missing_state.ok() &&
                                 missing_state.error().kind == ErrorKind::SecurityViolation,
                             "missing state is a security violation");

                     auto forged_error = auth::parse_callback_request(
                         callback_request("error=access_denied&state=" + std::string(32, 'X')),
                         state);
                     require(!forged_error.ok() &&
                                 forged_error.error().kind == ErrorKind::SecurityViolation,
                             "error callbacks are checked for state first");

                     auto no_code =
                         auth::parse_callback_request(callback_request("state=" + state), state);
                     require(!no_code.ok() &&
                                 no_code.error().kind == ErrorKind::AuthenticationRequired,
                             "missing code");

                     auto post = auth::parse_callback_request(
                         "POST /auth/github/callback HTTP/1.1\r\n\r\n", state);
                     require(!post.ok(), "non-GET must fail");

                     auto no_query = auth::parse_callback_request(
                         "GET /auth/github/callback HTTP/1.1\r\n\r\n", state);
                     require(!no_query.ok(), "no parameters must fail");
                   }});

  tests.push_back({"oauth_exchange_code_error_mapping", [] {
                     const auto config = test_config();
                     const std::string redirect = "http://localhost:8080/auth/github/callback";

                     FakeHttpClient rejected;
                     rejected.push_json(200, "{\"error\":\"bad_verification_code\","
                                             "\"error_description\":\"The code is expired\"}");
                     auto bad_code = auth::exchange_code(rejected, config, "c", redirect, 1000);
                     require(!bad_code.ok() &&
                                 bad_code.error().kind == ErrorKind::AuthenticationRequired,
                             "200 with error member must fail");
                     require(bad_code.error().to_string().find("bad_verification_code") !=
                                 std::string::npos,
                             "provider error code should be surfaced");

                     FakeHttpClient server_error;
                     server_error.push_json(500, "{}");
                     auto failed = auth::exchange_code(server_error, config, "c", redirect, 1000);
                     require(!failed.ok() &&
                                 failed.error().kind == ErrorKind::AuthenticationRequired,
                             "HTTP failure");
                     require(server_error.request_count() == 1, "exchange must not be retried");

                     FakeHttpClient timeout;
                     timeout.push_response(sessionsync::http::HttpResponse{.timeout = true});
                     auto timed_out = auth::exchange_code(timeout, config, "c", redirect, 2000);
                     require(!timed_out.ok() &&
                                 timed_out.error().kind == ErrorKind::NetworkTimeout,
                             "timeout kind");

                     FakeHttpClient garbage;
                     garbage.push_json(200, "access_token=abc");
                     require(!auth::exchange_code(garbage, config, "c", redirect, 1000).ok(),
                             "non-JSON body must fail");

                     FakeHttpClient empty_token;
                     empty_token.push_json(200, "{\"token_type\":\"bearer\"}");
                     require(!auth::exchange_code(empty_token, config, "c", redirect, 1000).ok(),
                             "missing access_token must fail");

                     FakeHttpClient headers;
                     headers.push_json(200, "{\"access_token\":\"gho_x\"}");
                     auto token = auth::exchange_code(headers, config, "c", redirect, 1000);
                     require(token.ok() && token.value() == "gho_x", "success");
                     const auto request = headers.last_request();
                     require(request.headers.at("Accept") == "application/json",
                             "Accept header must ask for JSON");
                   }});

  tests.push_back({"oauth_callback_listener_binds_ephemeral_port", [] {
                     auth::CallbackListener listener;
                     require(listener.bind("127.0.0.1", 0).ok(), "bind failed");
                     require(listener.is_bound() && listener.port() != 0, "port should be known");
                     auto nothing = listener.accept_one(std::chrono::milliseconds(50));
                     require(nothing.ok() && !nothing.value().has_value(),
                             "idle listener should time out with nullopt");
                     listener.close();
                     require(!listener.is_bound(), "close should release the socket");
                   }});

  tests.push_back({"browser_windows_start_command_keeps_query_intact", [] {
                     const std::string url = "https://github.com/login/oauth/authorize"
                                             "?client_id=abc&redirect_uri=x&state=S";
                     const auto command = auth::SystemBrowserLauncher::windows_start_command(url);
                     require(command.size() == 5, "cmd /c start <title> <url>");
                     require(command[0] == "cmd" && command[1] == "/c" && command[2] == "start",
                             "launcher prefix");
                     require(command[3] == "\"\"", "empty title must survive _spawnvp");
                     require(command[4] == "https://github.com/login/oauth/authorize"
                                           "?client_id=abc^&redirect_uri=x^&state=S",
                             "every & must be caret-escaped: " + command[4]);
                     require(auth::escape_cmd_argument("a|b<c>d^e(f)") ==
                                 "a^|b^<c^>d^^e^(f^)",
                             "metacharacters escaped");
                     require(auth::escape_cmd_argument("plain%3A%2F") == "plain%3A%2F",
                             "url-encoded text untouched");
                   }});
}
