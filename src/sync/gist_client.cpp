#include "sessionsync/sync/gist_client.hpp"

#include "sessionsync/common/encoding.hpp"
#include "sessionsync/common/fs.hpp"
#include "sessionsync/common/json_util.hpp"
#include "sessionsync/observability/global.hpp"

#include <chrono>
#include <stdexcept>

namespace sessionsync::sync {

namespace {

constexpr std::chrono::seconds kDefaultRateLimitWait{60};

std::chrono::seconds timeout_seconds(std::uint64_t timeout_ms) {
  const auto secs = timeout_ms / 1000;
  return std::chrono::seconds(secs == 0 ? 1 : static_cast<std::int64_t>(secs));
}

std::optional<std::int64_t> parse_integer(const std::string &text) {
  const std::string trimmed = common::trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const long long value = std::stoll(trimmed, &consumed);
    if (consumed != trimmed.size()) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

bool is_rate_limited(const http::HttpResponse &response) {
  if (response.status == 429) {
    return true;
  }
  if (response.status != 403) {
    return false;
  }
  return response.header("x-ratelimit-remaining") == "0" ||
         !response.header("retry-after").empty();
}

std::chrono::seconds rate_limit_wait(const http::HttpResponse &response) {
  if (auto retry_after = parse_integer(response.header("retry-after"));
      retry_after.has_value() && *retry_after >= 0) {
    return std::chrono::seconds(*retry_after);
  }
  if (auto reset = parse_integer(response.header("x-ratelimit-reset")); reset.has_value()) {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    const auto wait = *reset - now;
    return std::chrono::seconds(wait > 0 ? wait : 1);
  }
  return kDefaultRateLimitWait;
}

std::optional<std::string> api_message(const std::string &body) {
  const std::string message = common::json_get_string(body, "message");
  if (message.empty()) {
    return std::nullopt;
  }
  return message;
}

bool looks_like_object(const std::string &body) {
  const std::string trimmed = common::trim(body);
  return !trimmed.empty() && trimmed.front() == '{' && trimmed.back() == '}';
}

std::string files_payload(const std::string &filename, const std::string &content) {
  return "\"files\":{\"" + common::json_escape(filename) + "\":{\"content\":\"" +
         common::json_escape(content) + "\"}}";
}

} // namespace

SyncError map_http_failure(const std::string &operation, const http::HttpResponse &response,
                           std::uint64_t timeout_ms, const std::string &gist_id) {
  if (response.timeout) {
    return SyncError::network_timeout(timeout_seconds(timeout_ms), operation);
  }
  if (response.network_error) {
    return SyncError::api_request_failed(operation, 0, response.network_error_message);
  }
  if (response.status == 401) {
    return SyncError::authentication_required("GitHub rejected the access token");
  }
  if (is_rate_limited(response)) {
    return SyncError::rate_limit_exceeded(rate_limit_wait(response));
  }
  if (response.status == 404) {
    return SyncError::gist_not_found(gist_id.empty() ? operation : gist_id);
  }
  return SyncError::api_request_failed(operation, response.status, api_message(response.body));
}

GitHubGistClient::GitHubGistClient(http::HttpClient &http, std::string api_base_url,
                                   std::uint64_t timeout_ms)
    : http_(http), api_base_url_(std::move(api_base_url)), timeout_ms_(timeout_ms) {
  while (!api_base_url_.empty() && api_base_url_.back() == '/') {
    api_base_url_.pop_back();
  }
}

http::HttpRequest GitHubGistClient::make_request(const std::string &method,
                                                 const std::string &path,
                                                 const std::string &token) const {
  http::HttpRequest request;
  request.method = method;
  request.url = common::starts_with(path, "https://") || common::starts_with(path, "http://")
                    ? path
                    : api_base_url_ + path;
  request.headers = {
      {"Authorization", "Bearer " + token},
      {"Accept", "application/vnd.github+json"},
      {"X-GitHub-Api-Version", GITHUB_API_VERSION},
  };
  request.timeout_ms = timeout_ms_;
  return request;
}

SyncResult<std::string> GitHubGistClient::create_gist(const std::string &description,
                                                      const std::string &filename,
                                                      const std::string &content,
                                                      const std::string &token) {
  auto request = make_request("POST", "/gists", token);
  request.headers["Content-Type"] = "application/json";
  request.body = "{\"description\":\"" + common::json_escape(description) +
                 "\",\"public\":false," + files_payload(filename, content) + "}";

  const auto response = http_.send(request);
  if (!response.is_success()) {
    return SyncResult<std::string>::failure(map_http_failure("create_gist", response, timeout_ms_));
  }
  if (!looks_like_object(response.body)) {
    return SyncResult<std::string>::failure(
        SyncError::serialization_failed("create_gist returned a non-JSON body"));
  }
  std::string id = common::json_get_string(response.body, "id");
  if (id.empty()) {
    return SyncResult<std::string>::failure(
        SyncError::serialization_failed("create_gist response has no id"));
  }
  observability::log_info("gist", "created secret gist " + id);
  return SyncResult<std::string>::success(std::move(id));
}

SyncStatus GitHubGistClient::update_gist(const std::string &gist_id, const std::string &filename,
                                         const std::string &content, const std::string &token) {
  auto request =
      make_request("PATCH", "/gists/" + common::url_encode_component(gist_id), token);
  request.headers["Content-Type"] = "application/json";
  request.body = "{" + files_payload(filename, content) + "}";

  const auto response = http_.send(request);
  if (!response.is_success()) {
    return SyncStatus::failure(map_http_failure("update_gist", response, timeout_ms_, gist_id));
  }
  return SyncStatus::success();
}

SyncResult<std::string> GitHubGistClient::read_gist_file(const std::string &gist_id,
                                                         const std::string &filename,
                                                         const std::string &token) {
  using ResultT = SyncResult<std::string>;

  const auto response =
      http_.send(make_request("GET", "/gists/" + common::url_encode_component(gist_id), token));
  if (!response.is_success()) {
    return ResultT::failure(map_http_failure("read_gist", response, timeout_ms_, gist_id));
  }
  if (!looks_like_object(response.body)) {
    return ResultT::failure(SyncError::serialization_failed("read_gist returned a non-JSON body"));
  }

  const std::string files = common::json_get_object(response.body, "files");
  const std::string file = files.empty() ? "" : common::json_get_object(files, filename);
  if (file.empty()) {
    return ResultT::failure(SyncError::gist_not_found(gist_id + "/" + filename));
  }

  // Large files are truncated in the gist listing; the raw URL has the full text.
  if (common::json_get_bool(file, "truncated", false)) {
    const std::string raw_url = common::json_get_string(file, "raw_url");
    if (raw_url.empty()) {
      return ResultT::failure(
          SyncError::serialization_failed("truncated gist file has no raw_url"));
    }
    auto raw_request = make_request("GET", raw_url, token);
    raw_request.headers["Accept"] = "text/plain";
    const auto raw = http_.send(raw_request);
    if (!raw.is_success()) {
      return ResultT::failure(map_http_failure("read_gist_raw", raw, timeout_ms_, gist_id));
    }
    return ResultT::success(raw.body);
  }

  if (!common::json_has_key(file, "content")) {
    return ResultT::failure(SyncError::serialization_failed("gist file has no content"));
  }
  return ResultT::success(common::json_get_string(file, "content"));
}

SyncStatus GitHubGistClient::delete_gist(const std::string &gist_id, const std::string &token) {
  const auto response = http_.send(
      make_request("DELETE", "/gists/" + common::url_encode_component(gist_id), token));
  if (!response.is_success()) {
    return SyncStatus::failure(map_http_failure("delete_gist", response, timeout_ms_, gist_id));
  }
  observability::log_info("gist", "deleted gist " + gist_id);
  return SyncStatus::success();
}

SyncResult<std::string> GitHubGistClient::current_user(const std::string &token) {
  const auto response = http_.send(make_request("GET", "/user", token));
  if (!response.is_success()) {
    return SyncResult<std::string>::failure(map_http_failure("get_user", response, timeout_ms_));
  }
  if (!looks_like_object(response.body)) {
    return SyncResult<std::string>::failure(
        SyncError::serialization_failed("get_user returned a non-JSON body"));
  }
  std::string login = common::json_get_string(response.body, "login");
  if (login.empty()) {
    return SyncResult<std::string>::failure(
        SyncError::serialization_failed("get_user response has no login"));
  }
  return SyncResult<std::string>::success(std::move(login));
}

} // namespace sessionsync::sync
