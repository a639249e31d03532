#pragma once

#include "sessionsync/auth/browser.hpp"
#include "sessionsync/http/http_client.hpp"
#include "sessionsync/sync/authenticator.hpp"
#include "sessionsync/sync/gist_client.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sessionsync::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

/// Points config_dir() at a workspace for the lifetime of the guard.
class ConfigDirGuard {
public:
  explicit ConfigDirGuard(const std::filesystem::path &dir);
  ~ConfigDirGuard();

  ConfigDirGuard(const ConfigDirGuard &) = delete;
  ConfigDirGuard &operator=(const ConfigDirGuard &) = delete;
};

/// Replays queued responses in order; once the queue is empty the fallback is returned.
class FakeHttpClient final : public http::HttpClient {
public:
  void push_response(http::HttpResponse response);
  void push_json(std::uint16_t status, std::string body);
  void set_fallback(http::HttpResponse response);

  [[nodiscard]] http::HttpResponse send(const http::HttpRequest &request) override;

  [[nodiscard]] std::vector<http::HttpRequest> requests() const;
  [[nodiscard]] std::size_t request_count() const;
  [[nodiscard]] http::HttpRequest last_request() const;

private:
  mutable std::mutex mutex_;
  std::deque<http::HttpResponse> queued_;
  http::HttpResponse fallback_{.status = 500, .body = "{\"message\":\"no response queued\"}"};
  std::vector<http::HttpRequest> requests_;
};

[[nodiscard]] http::HttpResponse json_response(std::uint16_t status, std::string body);

/// Gist storage in memory. Tokens not in the accepted set get a 401-style
/// AuthenticationRequired; scripted failures are consumed before the real call.
class InMemoryGistTransport final : public sync::GistTransport {
public:
  void accept_token(const std::string &token, const std::string &login);
  void revoke_token(const std::string &token);

  /// Next call of `operation` ("create", "update", "read", "delete", "user")
  /// fails with `error`.
  void fail_next(const std::string &operation, sync::SyncError error);

  void put_file(const std::string &gist_id, const std::string &filename,
                const std::string &content);
  void remove_gist(const std::string &gist_id);
  [[nodiscard]] bool has_gist(const std::string &gist_id) const;
  [[nodiscard]] std::optional<std::string> file(const std::string &gist_id,
                                                const std::string &filename) const;
  [[nodiscard]] std::size_t gist_count() const;
  [[nodiscard]] std::size_t calls(const std::string &operation) const;

  [[nodiscard]] sync::SyncResult<std::string> create_gist(const std::string &description,
                                                          const std::string &filename,
                                                          const std::string &content,
                                                          const std::string &token) override;
  [[nodiscard]] sync::SyncStatus update_gist(const std::string &gist_id,
                                             const std::string &filename,
                                             const std::string &content,
                                             const std::string &token) override;
  [[nodiscard]] sync::SyncResult<std::string> read_gist_file(const std::string &gist_id,
                                                             const std::string &filename,
                                                             const std::string &token) override;
  [[nodiscard]] sync::SyncStatus delete_gist(const std::string &gist_id,
                                             const std::string &token) override;
  [[nodiscard]] sync::SyncResult<std::string> current_user(const std::string &token) override;

private:
  [[nodiscard]] std::optional<sync::SyncError> intercept(const std::string &operation,
                                                         const std::string &token);

  mutable std::mutex mutex_;
  std::map<std::string, std::string> tokens_;
  std::map<std::string, std::deque<sync::SyncError>> failures_;
  std::map<std::string, std::map<std::string, std::string>> gists_;
  std::map<std::string, std::size_t> calls_;
  std::size_t next_id_ = 1;
};

/// Hands out queued tokens; an empty queue fails like a cancelled login.
class FakeAuthorizer final : public sync::Authorizer {
public:
  void push_token(std::string token);
  [[nodiscard]] sync::SyncResult<std::string> authorize() override;
  [[nodiscard]] std::size_t calls() const { return calls_; }

private:
  std::deque<std::string> tokens_;
  std::size_t calls_ = 0;
};

/// Plays the user's browser: on open() it reads the authorize URL and, from a
/// background thread, hits the loopback redirect URI with `code` and either
/// the state from the URL or `forced_state`.
class FakeBrowserLauncher final : public auth::BrowserLauncher {
public:
  struct Reply {
    std::string code = "test-code";
    std::optional<std::string> forced_state;
    std::string extra_query;
    bool connect = true;
  };

  FakeBrowserLauncher() = default;
  explicit FakeBrowserLauncher(Reply reply) : reply_(std::move(reply)) {}
  ~FakeBrowserLauncher() override;

  FakeBrowserLauncher(const FakeBrowserLauncher &) = delete;
  FakeBrowserLauncher &operator=(const FakeBrowserLauncher &) = delete;

  [[nodiscard]] common::Status open(const std::string &url) override;

  [[nodiscard]] const std::string &opened_url() const { return opened_url_; }
  /// Body of the page the listener answered with, once the thread has finished.
  [[nodiscard]] std::string response_text();

private:
  Reply reply_;
  std::string opened_url_;
  std::thread worker_;
  std::mutex mutex_;
  std::string response_;
};

/// Connects to 127.0.0.1:port, sends `raw_request` and returns everything read
/// until the peer closes.
[[nodiscard]] common::Result<std::string> send_raw_http(std::uint16_t port,
                                                        const std::string &raw_request);

/// Value of `name` in the query string of `url`, URL-decoded.
[[nodiscard]] std::string query_param(const std::string &url, const std::string &name);

/// Sleeper that records requested delays instead of waiting.
struct RecordingSleeper {
  std::shared_ptr<std::vector<std::chrono::milliseconds>> delays =
      std::make_shared<std::vector<std::chrono::milliseconds>>();

  [[nodiscard]] sync::Sleeper sleeper() const {
    auto target = delays;
    return [target](std::chrono::milliseconds delay) { target->push_back(delay); };
  }
};

} // namespace sessionsync::testing
