#pragma once

#include "sessionsync/common/result.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sessionsync::security {

inline constexpr const char *MASTER_KEY_SERVICE = "com.postman.cs-cli.session-key";
inline constexpr const char *MASTER_KEY_ACCOUNT = "session-encryption-master-key";
inline constexpr const char *TOKEN_SERVICE = "com.postman.cs-cli.github-token";
inline constexpr const char *TOKEN_ACCOUNT = "oauth-access-token";

struct SecretId {
  std::string service;
  std::string account;

  [[nodiscard]] std::string to_string() const { return service + "/" + account; }
};

[[nodiscard]] SecretId master_key_id();
[[nodiscard]] SecretId github_token_id();

/// Named-secret capability over an OS credential store. A missing entry is a
/// successful nullopt, not an error.
class SecretStore {
public:
  virtual ~SecretStore() = default;

  [[nodiscard]] virtual common::Result<std::optional<std::string>> get(const SecretId &id) = 0;
  [[nodiscard]] virtual common::Status set(const SecretId &id, const std::string &value) = 0;
  /// Idempotent.
  [[nodiscard]] virtual common::Status remove(const SecretId &id) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// macOS login keychain through the `security` tool.
class KeychainSecretStore final : public SecretStore {
public:
  [[nodiscard]] common::Result<std::optional<std::string>> get(const SecretId &id) override;
  [[nodiscard]] common::Status set(const SecretId &id, const std::string &value) override;
  [[nodiscard]] common::Status remove(const SecretId &id) override;
  [[nodiscard]] std::string_view name() const override { return "keychain"; }
};

/// freedesktop Secret Service through `secret-tool`. Values travel on stdin.
class SecretServiceStore final : public SecretStore {
public:
  [[nodiscard]] common::Result<std::optional<std::string>> get(const SecretId &id) override;
  [[nodiscard]] common::Status set(const SecretId &id, const std::string &value) override;
  [[nodiscard]] common::Status remove(const SecretId &id) override;
  [[nodiscard]] std::string_view name() const override { return "secret-service"; }
};

/// Windows Credential Manager (generic credentials).
class CredentialManagerStore final : public SecretStore {
public:
  [[nodiscard]] common::Result<std::optional<std::string>> get(const SecretId &id) override;
  [[nodiscard]] common::Status set(const SecretId &id, const std::string &value) override;
  [[nodiscard]] common::Status remove(const SecretId &id) override;
  [[nodiscard]] std::string_view name() const override { return "credential-manager"; }
};

/// One owner-only (0600) file per secret under `directory`.
class FileSecretStore final : public SecretStore {
public:
  explicit FileSecretStore(std::filesystem::path directory);

  [[nodiscard]] common::Result<std::optional<std::string>> get(const SecretId &id) override;
  [[nodiscard]] common::Status set(const SecretId &id, const std::string &value) override;
  [[nodiscard]] common::Status remove(const SecretId &id) override;
  [[nodiscard]] std::string_view name() const override { return "file"; }

  [[nodiscard]] std::filesystem::path path_for(const SecretId &id) const;

private:
  std::filesystem::path directory_;
};

class MemorySecretStore final : public SecretStore {
public:
  [[nodiscard]] common::Result<std::optional<std::string>> get(const SecretId &id) override;
  [[nodiscard]] common::Status set(const SecretId &id, const std::string &value) override;
  [[nodiscard]] common::Status remove(const SecretId &id) override;
  [[nodiscard]] std::string_view name() const override { return "memory"; }

  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, std::string> entries_;
};

/// Honors SESSIONSYNC_SECRET_BACKEND (keychain, secret-service,
/// credential-manager, file, memory); otherwise picks the platform store and
/// falls back to the file store when none is available.
[[nodiscard]] common::Result<std::unique_ptr<SecretStore>> create_default_secret_store();

[[nodiscard]] common::Result<std::unique_ptr<SecretStore>>
create_secret_store(const std::string &backend);

} // namespace sessionsync::security
