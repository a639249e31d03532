#include "tests/helpers/test_helpers.hpp"

#include "sessionsync/common/encoding.hpp"
#include "sessionsync/config/config.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#endif

namespace sessionsync::testing {

// ── Filesystem and environment ────────────────────────────────────────────────

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("sessionsync-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
}

std::string TempWorkspace::read_file(const std::string &name) const {
  std::ifstream in(path_ / name, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ConfigDirGuard::ConfigDirGuard(const std::filesystem::path &dir) {
  config::set_config_dir_override(dir);
}

ConfigDirGuard::~ConfigDirGuard() { config::clear_config_dir_override(); }

// ── FakeHttpClient ────────────────────────────────────────────────────────────

http::HttpResponse json_response(std::uint16_t status, std::string body) {
  http::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  response.headers["content-type"] = "application/json";
  return response;
}

void FakeHttpClient::push_response(http::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  queued_.push_back(std::move(response));
}

void FakeHttpClient::push_json(std::uint16_t status, std::string body) {
  push_response(json_response(status, std::move(body)));
}

void FakeHttpClient::set_fallback(http::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  fallback_ = std::move(response);
}

http::HttpResponse FakeHttpClient::send(const http::HttpRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(request);
  if (queued_.empty()) {
    return fallback_;
  }
  auto response = std::move(queued_.front());
  queued_.pop_front();
  return response;
}

std::vector<http::HttpRequest> FakeHttpClient::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

std::size_t FakeHttpClient::request_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.size();
}

http::HttpRequest FakeHttpClient::last_request() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.empty() ? http::HttpRequest{} : requests_.back();
}

// ── InMemoryGistTransport ─────────────────────────────────────────────────────

void InMemoryGistTransport::accept_token(const std::string &token, const std::string &login) {
  std::lock_guard<std::mutex> lock(mutex_);
  tokens_[token] = login;
}

void InMemoryGistTransport::revoke_token(const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  tokens_.erase(token);
}

void InMemoryGistTransport::fail_next(const std::string &operation, sync::SyncError error) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_[operation].push_back(std::move(error));
}

void InMemoryGistTransport::put_file(const std::string &gist_id, const std::string &filename,
                                     const std::string &content) {
  std::lock_guard<std::mutex> lock(mutex_);
  gists_[gist_id][filename] = content;
}

void InMemoryGistTransport::remove_gist(const std::string &gist_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  gists_.erase(gist_id);
}

bool InMemoryGistTransport::has_gist(const std::string &gist_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return gists_.count(gist_id) > 0;
}

std::optional<std::string> InMemoryGistTransport::file(const std::string &gist_id,
                                                       const std::string &filename) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto gist = gists_.find(gist_id);
  if (gist == gists_.end()) {
    return std::nullopt;
  }
  const auto entry = gist->second.find(filename);
  if (entry == gist->second.end()) {
    return std::nullopt;
  }
  return entry->second;
}

std::size_t InMemoryGistTransport::gist_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return gists_.size();
}

std::size_t InMemoryGistTransport::calls(const std::string &operation) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = calls_.find(operation);
  return it == calls_.end() ? 0 : it->second;
}

std::optional<sync::SyncError> InMemoryGistTransport::intercept(const std::string &operation,
                                                                const std::string &token) {
  ++calls_[operation];
  auto &scripted = failures_[operation];
  if (!scripted.empty()) {
    auto error = std::move(scripted.front());
    scripted.pop_front();
    return error;
  }
  if (tokens_.count(token) == 0) {
    return sync::SyncError::authentication_required("GitHub rejected the access token");
  }
  return std::nullopt;
}

sync::SyncResult<std::string> InMemoryGistTransport::create_gist(const std::string &,
                                                                 const std::string &filename,
                                                                 const std::string &content,
                                                                 const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto error = intercept("create", token)) {
    return sync::SyncResult<std::string>::failure(*error);
  }
  const std::string id = "gist" + std::to_string(next_id_++);
  gists_[id][filename] = content;
  return sync::SyncResult<std::string>::success(id);
}

sync::SyncStatus InMemoryGistTransport::update_gist(const std::string &gist_id,
                                                    const std::string &filename,
                                                    const std::string &content,
                                                    const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto error = intercept("update", token)) {
    return sync::SyncStatus::failure(*error);
  }
  const auto gist = gists_.find(gist_id);
  if (gist == gists_.end()) {
    return sync::SyncStatus::failure(sync::SyncError::gist_not_found(gist_id));
  }
  gist->second[filename] = content;
  return sync::SyncStatus::success();
}

sync::SyncResult<std::string> InMemoryGistTransport::read_gist_file(const std::string &gist_id,
                                                                    const std::string &filename,
                                                                    const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto error = intercept("read", token)) {
    return sync::SyncResult<std::string>::failure(*error);
  }
  const auto gist = gists_.find(gist_id);
  if (gist == gists_.end()) {
    return sync::SyncResult<std::string>::failure(sync::SyncError::gist_not_found(gist_id));
  }
  const auto entry = gist->second.find(filename);
  if (entry == gist->second.end()) {
    return sync::SyncResult<std::string>::failure(
        sync::SyncError::gist_not_found(gist_id + "/" + filename));
  }
  return sync::SyncResult<std::string>::success(entry->second);
}

sync::SyncStatus InMemoryGistTransport::delete_gist(const std::string &gist_id,
                                                    const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto error = intercept("delete", token)) {
    return sync::SyncStatus::failure(*error);
  }
  if (gists_.erase(gist_id) == 0) {
    return sync::SyncStatus::failure(sync::SyncError::gist_not_found(gist_id));
  }
  return sync::SyncStatus::success();
}

sync::SyncResult<std::string> InMemoryGistTransport::current_user(const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto error = intercept("user", token)) {
    return sync::SyncResult<std::string>::failure(*error);
  }
  return sync::SyncResult<std::string>::success(tokens_.at(token));
}

// ── FakeAuthorizer ────────────────────────────────────────────────────────────

void FakeAuthorizer::push_token(std::string token) { tokens_.push_back(std::move(token)); }

sync::SyncResult<std::string> FakeAuthorizer::authorize() {
  ++calls_;
  if (tokens_.empty()) {
    return sync::SyncResult<std::string>::failure(
        sync::SyncError::authentication_required("user cancelled authorization"));
  }
  auto token = std::move(tokens_.front());
  tokens_.pop_front();
  return sync::SyncResult<std::string>::success(std::move(token));
}

// ── Loopback browser ──────────────────────────────────────────────────────────

std::string query_param(const std::string &url, const std::string &name) {
  const auto query_start = url.find('?');
  if (query_start == std::string::npos) {
    return "";
  }
  const auto params = common::parse_query_string(url.substr(query_start + 1));
  const auto it = params.find(name);
  return it == params.end() ? std::string() : it->second;
}

common::Result<std::string> send_raw_http(std::uint16_t port, const std::string &raw_request) {
#ifdef _WIN32
  (void)port;
  (void)raw_request;
  return common::Result<std::string>::failure("loopback client is not supported on Windows");
#else
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return common::Result<std::string>::failure("socket() failed");
  }

  timeval tv{};
  tv.tv_sec = 10;
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    ::close(fd);
    return common::Result<std::string>::failure("connect() failed");
  }

  std::size_t sent = 0;
  while (sent < raw_request.size()) {
    const auto n = ::send(fd, raw_request.data() + sent, raw_request.size() - sent, 0);
    if (n <= 0) {
      ::close(fd);
      return common::Result<std::string>::failure("send() failed");
    }
    sent += static_cast<std::size_t>(n);
  }

  std::string response;
  char buffer[4096];
  while (true) {
    const auto n = ::recv(fd, buffer, sizeof(buffer), 0);
    if (n <= 0) {
      break;
    }
    response.append(buffer, static_cast<std::size_t>(n));
  }
  ::close(fd);
  return common::Result<std::string>::success(response);
#endif
}

FakeBrowserLauncher::~FakeBrowserLauncher() {
  if (worker_.joinable()) {
    worker_.join();
  }
}

common::Status FakeBrowserLauncher::open(const std::string &url) {
  opened_url_ = url;
  if (!reply_.connect) {
    return common::Status::error("no browser available");
  }

  const std::string redirect_uri = query_param(url, "redirect_uri");
  const auto scheme_end = redirect_uri.find("://");
  const auto port_start = redirect_uri.find(':', scheme_end + 3);
  const auto path_start = redirect_uri.find('/', scheme_end + 3);
  if (scheme_end == std::string::npos || port_start == std::string::npos) {
    return common::Status::error("redirect_uri carries no port: " + redirect_uri);
  }
  const auto port = static_cast<std::uint16_t>(
      std::stoi(redirect_uri.substr(port_start + 1, path_start - port_start - 1)));
  const std::string path =
      path_start == std::string::npos ? std::string("/") : redirect_uri.substr(path_start);

  const std::string state = reply_.forced_state.value_or(query_param(url, "state"));
  std::string target = path + "?code=" + common::url_encode_component(reply_.code) +
                       "&state=" + common::url_encode_component(state);
  if (!reply_.extra_query.empty()) {
    target += "&" + reply_.extra_query;
  }
  const std::string request =
      "GET " + target + " HTTP/1.1\r\nHost: localhost:" + std::to_string(port) + "\r\n\r\n";

  worker_ = std::thread([this, port, request]() {
    auto reply = send_raw_http(port, request);
    std::lock_guard<std::mutex> lock(mutex_);
    response_ = reply.ok() ? reply.value() : reply.error();
  });
  return common::Status::success();
}

std::string FakeBrowserLauncher::response_text() {
  if (worker_.joinable()) {
    worker_.join();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return response_;
}

} // namespace sessionsync::testing
