#pragma once

#include "sessionsync/security/secret_store.hpp"
#include "sessionsync/sessions/session_metadata.hpp"
#include "sessionsync/sync/errors.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sessionsync::security {

inline constexpr std::size_t KEY_SIZE = 32;
inline constexpr std::size_t NONCE_SIZE = 12;
inline constexpr std::size_t TAG_SIZE = 16;
inline constexpr const char *KDF_SALT = "cs-cli-session-encryption-v1.0";
inline constexpr const char *KDF_INFO = "github-gist-session-storage";

/// 256-bit key material that is wiped when destroyed or moved from.
class SecureKey {
public:
  SecureKey() = default;
  explicit SecureKey(const std::array<std::uint8_t, KEY_SIZE> &bytes);
  ~SecureKey();

  SecureKey(const SecureKey &) = delete;
  SecureKey &operator=(const SecureKey &) = delete;
  SecureKey(SecureKey &&other) noexcept;
  SecureKey &operator=(SecureKey &&other) noexcept;

  [[nodiscard]] const std::uint8_t *data() const { return bytes_.data(); }

private:
  std::array<std::uint8_t, KEY_SIZE> bytes_{};
};

/// HKDF-SHA256 over the master secret with the fixed application salt and info.
[[nodiscard]] common::Result<SecureKey> derive_session_key(const std::vector<std::uint8_t> &master);

/// AES-256-GCM sealing of session payloads. Blob layout:
/// nonce(12) || ciphertext || tag(16), with a fresh random nonce per call.
class SessionCipher {
public:
  /// Loads the master secret from `store`, creating and storing one on first
  /// use. A stored secret that does not decode to 32 bytes is an error.
  [[nodiscard]] static sync::SyncResult<SessionCipher> create(SecretStore &store);

  [[nodiscard]] static sync::SyncResult<SessionCipher>
  from_master_secret(const std::vector<std::uint8_t> &master);

  [[nodiscard]] sync::SyncResult<std::vector<std::uint8_t>> seal(const std::string &plaintext) const;

  /// Every failure (short blob, tag mismatch, wrong key) is the same opaque
  /// EncryptionFailed error; no plaintext is returned unless authentication passed.
  [[nodiscard]] sync::SyncResult<std::string> open(const std::vector<std::uint8_t> &blob) const;

  [[nodiscard]] sync::SyncResult<std::vector<std::uint8_t>>
  seal_session(const sessions::SessionData &session) const;

  /// Decrypts, parses and validates.
  [[nodiscard]] sync::SyncResult<sessions::SessionData>
  open_session(const std::vector<std::uint8_t> &blob) const;

private:
  explicit SessionCipher(SecureKey key) : key_(std::move(key)) {}

  SecureKey key_;
};

} // namespace sessionsync::security
