#include "sessionsync/sync/session_sync.hpp"

#include "sessionsync/common/encoding.hpp"
#include "sessionsync/observability/global.hpp"

#include <chrono>
#include <type_traits>

namespace sessionsync::sync {

namespace {

// Runs `op` with a token. A 401 during an interactive operation drops the token,
// re-authorizes and runs `op` one more time.
template <typename Op>
auto with_token(GitHubAuthenticator &authenticator, bool interactive, Op &&op)
    -> std::invoke_result_t<Op &, const std::string &> {
  using ResultT = std::invoke_result_t<Op &, const std::string &>;

  std::string token;
  if (interactive) {
    auto ensured = authenticator.ensure_token();
    if (!ensured.ok()) {
      return ResultT::failure(ensured.error());
    }
    token = ensured.value();
  } else {
    auto available = authenticator.available_token();
    if (!available.has_value()) {
      return ResultT::failure(SyncError::authentication_required("no stored GitHub token"));
    }
    token = *available;
  }

  auto result = op(token);
  if (result.ok() || !interactive || result.error().kind != ErrorKind::AuthenticationRequired) {
    return result;
  }

  observability::log_info("sync", "GitHub token rejected; re-authenticating once");
  auto fresh = authenticator.reauthenticate();
  if (!fresh.ok()) {
    return ResultT::failure(fresh.error());
  }
  return op(fresh.value());
}

class OperationTimer {
public:
  explicit OperationTimer(std::string operation)
      : operation_(std::move(operation)), started_(std::chrono::steady_clock::now()) {
    observability::record_sync_start(operation_);
  }

  void finish(bool success) {
    observability::record_sync_end(operation_,
                                   std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - started_),
                                   success);
  }

private:
  std::string operation_;
  std::chrono::steady_clock::time_point started_;
};

template <typename R> R finished(OperationTimer &timer, R result) {
  timer.finish(result.ok());
  return result;
}

} // namespace

SessionSync::SessionSync(GistTransport &transport, GitHubAuthenticator &authenticator,
                         const security::SessionCipher &cipher, GistConfigStore pointer_store,
                         RetryConfig retry, Sleeper sleep)
    : transport_(transport), authenticator_(authenticator), cipher_(cipher),
      pointer_store_(std::move(pointer_store)), retry_(retry), sleep_(std::move(sleep)) {}

void SessionSync::discard_pointer(const std::string &reason) {
  observability::log_warn("sync", "discarding local gist pointer: " + reason);
  auto backed_up = pointer_store_.backup();
  if (!backed_up.ok()) {
    observability::log_warn("sync", backed_up.error().to_string());
  }
  auto removed = pointer_store_.remove();
  if (!removed.ok()) {
    observability::log_error("sync", removed.error().to_string());
  }
}

SyncResult<std::string> SessionSync::create_remote(const std::string &content,
                                                   const std::string &token) {
  // Creating is not idempotent: only retry when the server refused the request
  // outright, never after a timeout or 5xx that may have created the gist.
  return execute_with_retry(
      [&]() { return transport_.create_gist(GIST_DESCRIPTION, GIST_FILENAME, content, token); },
      retry_, "create_gist",
      [](const SyncError &error) { return error.kind == ErrorKind::RateLimitExceeded; },
      &detail::rate_limit_delay, sleep_);
}

SyncResult<sessions::SessionData> SessionSync::fetch_session(bool interactive) {
  using ResultT = SyncResult<sessions::SessionData>;

  auto loaded = pointer_store_.load();
  if (!loaded.ok()) {
    discard_pointer(loaded.error().to_string());
    return ResultT::failure(loaded.error());
  }
  if (!loaded.value().has_value()) {
    return ResultT::failure(SyncError::invalid_session_data("no synced session found"));
  }
  const GistConfig pointer = *loaded.value();

  auto content = with_token(authenticator_, interactive, [&](const std::string &token) {
    return execute_with_retry(
        [&]() { return transport_.read_gist_file(pointer.gist_id, GIST_FILENAME, token); },
        retry_, "read_gist", sleep_);
  });
  if (!content.ok()) {
    if (content.error().kind == ErrorKind::GistNotFound) {
      discard_pointer(content.error().to_string());
    }
    return ResultT::failure(content.error());
  }

  auto blob = common::base64_decode(content.value());
  if (!blob.ok()) {
    auto error = SyncError::serialization_failed("remote content is not base64: " + blob.error());
    discard_pointer(error.to_string());
    return ResultT::failure(error);
  }

  auto session = cipher_.open_session(blob.value());
  if (!session.ok()) {
    discard_pointer(session.error().to_string());
    return session;
  }
  return session;
}

bool SessionSync::has_cookies() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto session = fetch_session(false);
  if (!session.ok()) {
    observability::log_debug("sync", "no usable session: " + session.error().to_string());
    return false;
  }
  return true;
}

SyncStatus SessionSync::store_cookies(const sessions::CookieMap &cookies) {
  std::lock_guard<std::mutex> lock(mutex_);
  OperationTimer timer("store_cookies");

  if (cookies.empty()) {
    return finished(timer, SyncStatus::failure(
                               SyncError::invalid_session_data("no cookies to store")));
  }

  auto session = sessions::SessionData::create(cookies);
  if (!session.ok()) {
    return finished(timer,
                    SyncStatus::failure(SyncError::invalid_session_data(session.error())));
  }
  auto sealed = cipher_.seal_session(session.value());
  if (!sealed.ok()) {
    return finished(timer, SyncStatus::failure(sealed.error()));
  }
  const std::string content = common::base64_encode(sealed.value());

  std::optional<GistConfig> existing;
  auto loaded = pointer_store_.load();
  if (loaded.ok()) {
    existing = loaded.value();
  } else {
    discard_pointer(loaded.error().to_string());
  }

  auto stored = with_token(authenticator_, true, [&](const std::string &token) -> SyncStatus {
    const std::string hash = GitHubAuthenticator::token_hash(token);
    std::optional<GistConfig> pointer = existing;

    if (pointer.has_value()) {
      if (pointer->token_hash != hash) {
        observability::log_info("sync", "access token changed since the last sync");
        auto backed_up = pointer_store_.backup();
        if (!backed_up.ok()) {
          observability::log_warn("sync", backed_up.error().to_string());
        }
      }

      auto updated = execute_with_retry(
          [&]() { return transport_.update_gist(pointer->gist_id, GIST_FILENAME, content, token); },
          retry_, "update_gist", sleep_);
      if (updated.ok()) {
        pointer->token_hash = hash;
        if (const auto login = authenticator_.username(); !login.empty()) {
          pointer->github_username = login;
        }
        pointer->touch_sync_time();
        return pointer_store_.save(*pointer);
      }
      if (updated.error().kind != ErrorKind::GistNotFound) {
        return updated;
      }
      observability::log_info("sync", "remote gist " + pointer->gist_id +
                                          " is gone; creating a new one");
    }

    auto created = create_remote(content, token);
    if (!created.ok()) {
      return SyncStatus::failure(created.error());
    }
    return pointer_store_.save(
        GistConfig::create(created.value(), authenticator_.username(), hash));
  });

  return finished(timer, std::move(stored));
}

SyncResult<sessions::CookieMap> SessionSync::get_cookies() {
  std::lock_guard<std::mutex> lock(mutex_);
  OperationTimer timer("get_cookies");

  auto session = fetch_session(true);
  if (!session.ok()) {
    return finished(timer, SyncResult<sessions::CookieMap>::failure(session.error()));
  }
  return finished(timer, SyncResult<sessions::CookieMap>::success(session.value().cookies));
}

SyncStatus SessionSync::delete_cookies() {
  std::lock_guard<std::mutex> lock(mutex_);
  OperationTimer timer("delete_cookies");

  auto loaded = pointer_store_.load();
  if (!loaded.ok()) {
    discard_pointer(loaded.error().to_string());
    return finished(timer, SyncStatus::success());
  }
  if (!loaded.value().has_value()) {
    return finished(timer, SyncStatus::success());
  }
  const GistConfig pointer = *loaded.value();

  auto deleted = with_token(authenticator_, true, [&](const std::string &token) {
    return execute_with_retry([&]() { return transport_.delete_gist(pointer.gist_id, token); },
                              retry_, "delete_gist", sleep_);
  });
  if (!deleted.ok() && deleted.error().kind != ErrorKind::GistNotFound) {
    return finished(timer, std::move(deleted));
  }
  return finished(timer, pointer_store_.remove());
}

SyncStatus SessionSync::delete_all_authentication() {
  auto deleted = delete_cookies();
  if (!deleted.ok()) {
    std::lock_guard<std::mutex> lock(mutex_);
    discard_pointer("reset requested: " + deleted.error().to_string());
  }

  auto cleared = authenticator_.clear();
  if (!deleted.ok()) {
    return deleted;
  }
  return cleared;
}

bool SessionSync::needs_refresh() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto session = fetch_session(false);
  if (!session.ok()) {
    return true;
  }
  return session.value().metadata.needs_refresh();
}

std::future<SyncStatus> SessionSync::store_cookies_async(sessions::CookieMap cookies) {
  return std::async(std::launch::async,
                    [this, cookies = std::move(cookies)]() { return store_cookies(cookies); });
}

std::future<SyncResult<sessions::CookieMap>> SessionSync::get_cookies_async() {
  return std::async(std::launch::async, [this]() { return get_cookies(); });
}

} // namespace sessionsync::sync
