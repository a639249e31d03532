#include "sessionsync/security/session_cipher.hpp"

#include "sessionsync/common/encoding.hpp"
#include "sessionsync/common/fs.hpp"
#include "sessionsync/common/random.hpp"
#include "sessionsync/observability/global.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <cstring>

namespace sessionsync::security {

namespace {

constexpr const char *kOpaqueFailure = "authentication failed or data is corrupt";

void wipe(std::string &value) {
  if (!value.empty()) {
    OPENSSL_cleanse(value.data(), value.size());
  }
}

void wipe(std::vector<std::uint8_t> &value) {
  if (!value.empty()) {
    OPENSSL_cleanse(value.data(), value.size());
  }
}

sync::SyncResult<std::vector<std::uint8_t>>
aes_gcm_encrypt(const SecureKey &key, const std::array<std::uint8_t, NONCE_SIZE> &nonce,
                const std::string &plaintext) {
  using ResultT = sync::SyncResult<std::vector<std::uint8_t>>;

  EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
  if (ctx == nullptr) {
    return ResultT::failure(sync::SyncError::encryption_failed("failed to create cipher context"));
  }
  auto cleanup = [&ctx]() { EVP_CIPHER_CTX_free(ctx); };

  std::vector<std::uint8_t> blob(NONCE_SIZE + plaintext.size() + TAG_SIZE);
  std::memcpy(blob.data(), nonce.data(), NONCE_SIZE);
  std::uint8_t *out = blob.data() + NONCE_SIZE;
  int out_len = 0;
  int total_len = 0;

  if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
    cleanup();
    return ResultT::failure(sync::SyncError::encryption_failed("encrypt init failed"));
  }
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx, out, &out_len,
                          reinterpret_cast<const unsigned char *>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
      cleanup();
      return ResultT::failure(sync::SyncError::encryption_failed("encrypt update failed"));
    }
    total_len += out_len;
  }
  if (EVP_EncryptFinal_ex(ctx, out + total_len, &out_len) != 1) {
    cleanup();
    return ResultT::failure(sync::SyncError::encryption_failed("encrypt final failed"));
  }
  total_len += out_len;

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, TAG_SIZE, out + total_len) != 1) {
    cleanup();
    return ResultT::failure(sync::SyncError::encryption_failed("failed to get tag"));
  }
  cleanup();

  blob.resize(NONCE_SIZE + static_cast<std::size_t>(total_len) + TAG_SIZE);
  return ResultT::success(std::move(blob));
}

} // namespace

// ── SecureKey ─────────────────────────────────────────────────────────────────

SecureKey::SecureKey(const std::array<std::uint8_t, KEY_SIZE> &bytes) : bytes_(bytes) {}

SecureKey::~SecureKey() { OPENSSL_cleanse(bytes_.data(), bytes_.size()); }

SecureKey::SecureKey(SecureKey &&other) noexcept : bytes_(other.bytes_) {
  OPENSSL_cleanse(other.bytes_.data(), other.bytes_.size());
}

SecureKey &SecureKey::operator=(SecureKey &&other) noexcept {
  if (this != &other) {
    bytes_ = other.bytes_;
    OPENSSL_cleanse(other.bytes_.data(), other.bytes_.size());
  }
  return *this;
}

common::Result<SecureKey> derive_session_key(const std::vector<std::uint8_t> &master) {
  if (master.size() != KEY_SIZE) {
    return common::Result<SecureKey>::failure("master secret must be 32 bytes");
  }

  EVP_PKEY_CTX *ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
  if (ctx == nullptr) {
    return common::Result<SecureKey>::failure("failed to create HKDF context");
  }

  std::array<std::uint8_t, KEY_SIZE> derived{};
  std::size_t derived_len = derived.size();
  const bool ok =
      EVP_PKEY_derive_init(ctx) == 1 && EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) == 1 &&
      EVP_PKEY_CTX_set1_hkdf_salt(ctx, reinterpret_cast<const unsigned char *>(KDF_SALT),
                                  static_cast<int>(std::strlen(KDF_SALT))) == 1 &&
      EVP_PKEY_CTX_set1_hkdf_key(ctx, master.data(), static_cast<int>(master.size())) == 1 &&
      EVP_PKEY_CTX_add1_hkdf_info(ctx, reinterpret_cast<const unsigned char *>(KDF_INFO),
                                  static_cast<int>(std::strlen(KDF_INFO))) == 1 &&
      EVP_PKEY_derive(ctx, derived.data(), &derived_len) == 1 && derived_len == KEY_SIZE;
  EVP_PKEY_CTX_free(ctx);

  if (!ok) {
    OPENSSL_cleanse(derived.data(), derived.size());
    return common::Result<SecureKey>::failure("HKDF derivation failed");
  }
  SecureKey key(derived);
  OPENSSL_cleanse(derived.data(), derived.size());
  return common::Result<SecureKey>::success(std::move(key));
}

// ── SessionCipher ─────────────────────────────────────────────────────────────

sync::SyncResult<SessionCipher> SessionCipher::create(SecretStore &store) {
  using ResultT = sync::SyncResult<SessionCipher>;
  const SecretId id = master_key_id();

  auto stored = store.get(id);
  if (!stored.ok()) {
    return ResultT::failure(
        sync::SyncError::encryption_failed("master key unavailable: " + stored.error()));
  }

  std::vector<std::uint8_t> master;
  if (stored.value().has_value()) {
    std::string encoded = common::trim(*stored.value());
    wipe(*stored.value());
    auto decoded = common::base64_decode(encoded);
    wipe(encoded);
    if (!decoded.ok() || decoded.value().size() != KEY_SIZE) {
      return ResultT::failure(sync::SyncError::encryption_failed(
          "stored master key in " + std::string(store.name()) + " is malformed"));
    }
    master = decoded.value();
    wipe(decoded.value());
  } else {
    auto generated = common::random_bytes(KEY_SIZE);
    if (!generated.ok()) {
      return ResultT::failure(sync::SyncError::encryption_failed(generated.error()));
    }
    master = generated.value();
    wipe(generated.value());

    std::string encoded = common::base64_encode(master);
    auto saved = store.set(id, encoded);
    wipe(encoded);
    if (!saved.ok()) {
      wipe(master);
      return ResultT::failure(
          sync::SyncError::encryption_failed("failed to store master key: " + saved.error()));
    }
    observability::log_info("crypto", "generated new session master key in " +
                                          std::string(store.name()));
  }

  auto cipher = from_master_secret(master);
  wipe(master);
  return cipher;
}

sync::SyncResult<SessionCipher>
SessionCipher::from_master_secret(const std::vector<std::uint8_t> &master) {
  auto key = derive_session_key(master);
  if (!key.ok()) {
    return sync::SyncResult<SessionCipher>::failure(
        sync::SyncError::encryption_failed(key.error()));
  }
  return sync::SyncResult<SessionCipher>::success(SessionCipher(std::move(key.value())));
}

sync::SyncResult<std::vector<std::uint8_t>> SessionCipher::seal(const std::string &plaintext) const {
  std::array<std::uint8_t, NONCE_SIZE> nonce{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    return sync::SyncResult<std::vector<std::uint8_t>>::failure(
        sync::SyncError::encryption_failed("failed to generate nonce"));
  }
  return aes_gcm_encrypt(key_, nonce, plaintext);
}

sync::SyncResult<std::string> SessionCipher::open(const std::vector<std::uint8_t> &blob) const {
  using ResultT = sync::SyncResult<std::string>;
  const auto opaque = []() {
    return ResultT::failure(sync::SyncError::encryption_failed(kOpaqueFailure));
  };

  if (blob.size() < NONCE_SIZE + TAG_SIZE) {
    return opaque();
  }

  const std::uint8_t *nonce = blob.data();
  const std::uint8_t *ciphertext = blob.data() + NONCE_SIZE;
  const std::size_t data_size = blob.size() - NONCE_SIZE - TAG_SIZE;
  const std::uint8_t *tag = ciphertext + data_size;

  EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
  if (ctx == nullptr) {
    return opaque();
  }
  auto cleanup = [&ctx]() { EVP_CIPHER_CTX_free(ctx); };

  std::string plaintext(data_size + TAG_SIZE, '\0');
  auto *out = reinterpret_cast<unsigned char *>(plaintext.data());
  int out_len = 0;
  int total_len = 0;

  if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx, nullptr, nullptr, key_.data(), nonce) != 1) {
    cleanup();
    return opaque();
  }
  if (data_size > 0) {
    if (EVP_DecryptUpdate(ctx, out, &out_len, ciphertext, static_cast<int>(data_size)) != 1) {
      cleanup();
      wipe(plaintext);
      return opaque();
    }
    total_len += out_len;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, TAG_SIZE,
                          const_cast<std::uint8_t *>(tag)) != 1 ||
      EVP_DecryptFinal_ex(ctx, out + total_len, &out_len) != 1) {
    cleanup();
    wipe(plaintext);
    return opaque();
  }
  total_len += out_len;
  cleanup();

  plaintext.resize(static_cast<std::size_t>(total_len));
  return ResultT::success(std::move(plaintext));
}

sync::SyncResult<std::vector<std::uint8_t>>
SessionCipher::seal_session(const sessions::SessionData &session) const {
  std::string json = session.to_json();
  auto sealed = seal(json);
  wipe(json);
  return sealed;
}

sync::SyncResult<sessions::SessionData>
SessionCipher::open_session(const std::vector<std::uint8_t> &blob) const {
  using ResultT = sync::SyncResult<sessions::SessionData>;

  auto plaintext = open(blob);
  if (!plaintext.ok()) {
    return ResultT::failure(plaintext.error());
  }
  auto parsed = sessions::SessionData::from_json(plaintext.value());
  wipe(plaintext.value());
  if (!parsed.ok()) {
    return ResultT::failure(sync::SyncError::serialization_failed(parsed.error()));
  }
  auto valid = parsed.value().validate();
  if (!valid.ok()) {
    return ResultT::failure(
        sync::SyncError::session_validation_failed(valid.error().to_string()));
  }
  return ResultT::success(parsed.value());
}

} // namespace sessionsync::security
