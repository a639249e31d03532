#pragma once

#include "sessionsync/security/session_cipher.hpp"
#include "sessionsync/sessions/session_metadata.hpp"
#include "sessionsync/sync/authenticator.hpp"
#include "sessionsync/sync/gist_config.hpp"
#include "sessionsync/sync/gist_client.hpp"
#include "sessionsync/sync/retry.hpp"

#include <future>
#include <mutex>

namespace sessionsync::sync {

/// Encrypted cookie sync through a secret gist. Operations are serialized;
/// the async variants run the same work on a separate thread.
class SessionSync {
public:
  SessionSync(GistTransport &transport, GitHubAuthenticator &authenticator,
              const security::SessionCipher &cipher, GistConfigStore pointer_store,
              RetryConfig retry = RetryConfig::http(), Sleeper sleep = default_sleeper());

  /// Never interactive and never fails: any problem reads as "no session".
  [[nodiscard]] bool has_cookies();

  [[nodiscard]] SyncStatus store_cookies(const sessions::CookieMap &cookies);

  /// Decryption or validation failures discard the local pointer.
  [[nodiscard]] SyncResult<sessions::CookieMap> get_cookies();

  /// Deletes the remote gist and the local pointer. Idempotent.
  [[nodiscard]] SyncStatus delete_cookies();

  /// delete_cookies() plus the stored OAuth token.
  [[nodiscard]] SyncStatus delete_all_authentication();

  /// True when the remote session is missing, unreadable or within 7 days of expiry.
  [[nodiscard]] bool needs_refresh();

  [[nodiscard]] std::future<SyncStatus> store_cookies_async(sessions::CookieMap cookies);
  [[nodiscard]] std::future<SyncResult<sessions::CookieMap>> get_cookies_async();

  [[nodiscard]] const GistConfigStore &pointer_store() const { return pointer_store_; }

private:
  [[nodiscard]] SyncResult<sessions::SessionData> fetch_session(bool interactive);
  [[nodiscard]] SyncResult<std::string> create_remote(const std::string &content,
                                                      const std::string &token);
  void discard_pointer(const std::string &reason);

  GistTransport &transport_;
  GitHubAuthenticator &authenticator_;
  const security::SessionCipher &cipher_;
  GistConfigStore pointer_store_;
  RetryConfig retry_;
  Sleeper sleep_;
  std::mutex mutex_;
};

} // namespace sessionsync::sync
