#include "sessionsync/security/secret_store.hpp"

#include "sessionsync/common/fs.hpp"
#include "sessionsync/common/process.hpp"
#include "sessionsync/config/config.hpp"
#include "sessionsync/observability/global.hpp"

#include <cctype>

#ifdef _WIN32
#include <windows.h>
#include <wincred.h>
#else
#include <sys/stat.h>
#endif

namespace sessionsync::security {

namespace {

constexpr int kKeychainItemNotFound = 44;

std::string strip_trailing_newline(std::string value) {
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
    value.pop_back();
  }
  return value;
}

std::string describe_failure(const std::string &tool, const common::CommandOutput &out) {
  std::string message = tool + " exited with status " + std::to_string(out.exit_code);
  const std::string detail = common::trim(out.output);
  if (!detail.empty()) {
    message += ": " + detail;
  }
  return message;
}

std::string sanitize_component(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const unsigned char ch : value) {
    if (std::isalnum(ch) != 0 || ch == '.' || ch == '-' || ch == '_') {
      out.push_back(static_cast<char>(ch));
    } else {
      out.push_back('_');
    }
  }
  return out;
}

#ifdef _WIN32
std::string credential_target(const SecretId &id) { return id.service + "/" + id.account; }
#endif

} // namespace

SecretId master_key_id() { return SecretId{MASTER_KEY_SERVICE, MASTER_KEY_ACCOUNT}; }

SecretId github_token_id() { return SecretId{TOKEN_SERVICE, TOKEN_ACCOUNT}; }

// ── Keychain ──────────────────────────────────────────────────────────────────

common::Result<std::optional<std::string>> KeychainSecretStore::get(const SecretId &id) {
  using ResultT = common::Result<std::optional<std::string>>;
  observability::record_secret_access(std::string(name()), "get", id.to_string());

  auto out = common::run_command(
      "security", {"find-generic-password", "-s", id.service, "-a", id.account, "-w"});
  if (!out.ok()) {
    return ResultT::failure(out.error());
  }
  if (out.value().exit_code == kKeychainItemNotFound) {
    return ResultT::success(std::nullopt);
  }
  if (out.value().exit_code != 0) {
    return ResultT::failure(describe_failure("security", out.value()));
  }
  return ResultT::success(strip_trailing_newline(out.value().output));
}

common::Status KeychainSecretStore::set(const SecretId &id, const std::string &value) {
  observability::record_secret_access(std::string(name()), "set", id.to_string());

  // `security` has no non-interactive stdin mode for the password.
  auto out = common::run_command("security", {"add-generic-password", "-U", "-s", id.service,
                                              "-a", id.account, "-w", value});
  if (!out.ok()) {
    return common::Status::error(out.error());
  }
  if (out.value().exit_code != 0) {
    return common::Status::error(describe_failure("security", out.value()));
  }
  return common::Status::success();
}

common::Status KeychainSecretStore::remove(const SecretId &id) {
  observability::record_secret_access(std::string(name()), "remove", id.to_string());

  auto out = common::run_command("security",
                                 {"delete-generic-password", "-s", id.service, "-a", id.account});
  if (!out.ok()) {
    return common::Status::error(out.error());
  }
  const int code = out.value().exit_code;
  if (code != 0 && code != kKeychainItemNotFound) {
    return common::Status::error(describe_failure("security", out.value()));
  }
  return common::Status::success();
}

// ── Secret Service ────────────────────────────────────────────────────────────

common::Result<std::optional<std::string>> SecretServiceStore::get(const SecretId &id) {
  using ResultT = common::Result<std::optional<std::string>>;
  observability::record_secret_access(std::string(name()), "get", id.to_string());

  auto out = common::run_command("secret-tool",
                                 {"lookup", "service", id.service, "account", id.account});
  if (!out.ok()) {
    return ResultT::failure(out.error());
  }
  if (out.value().exit_code != 0) {
    // lookup exits 1 with no output when the item does not exist.
    if (common::trim(out.value().output).empty()) {
      return ResultT::success(std::nullopt);
    }
    return ResultT::failure(describe_failure("secret-tool", out.value()));
  }
  return ResultT::success(strip_trailing_newline(out.value().output));
}

common::Status SecretServiceStore::set(const SecretId &id, const std::string &value) {
  observability::record_secret_access(std::string(name()), "set", id.to_string());

  auto out = common::run_command(
      "secret-tool",
      {"store", "--label=cs-cli " + id.account, "service", id.service, "account", id.account},
      value);
  if (!out.ok()) {
    return common::Status::error(out.error());
  }
  if (out.value().exit_code != 0) {
    return common::Status::error(describe_failure("secret-tool", out.value()));
  }
  return common::Status::success();
}

common::Status SecretServiceStore::remove(const SecretId &id) {
  observability::record_secret_access(std::string(name()), "remove", id.to_string());

  auto out = common::run_command("secret-tool",
                                 {"clear", "service", id.service, "account", id.account});
  if (!out.ok()) {
    return common::Status::error(out.error());
  }
  if (out.value().exit_code != 0 && !common::trim(out.value().output).empty()) {
    return common::Status::error(describe_failure("secret-tool", out.value()));
  }
  return common::Status::success();
}

// ── Credential Manager ────────────────────────────────────────────────────────

#ifdef _WIN32

common::Result<std::optional<std::string>> CredentialManagerStore::get(const SecretId &id) {
  using ResultT = common::Result<std::optional<std::string>>;
  observability::record_secret_access(std::string(name()), "get", id.to_string());

  PCREDENTIALA credential = nullptr;
  const std::string target = credential_target(id);
  if (CredReadA(target.c_str(), CRED_TYPE_GENERIC, 0, &credential) != TRUE) {
    if (GetLastError() == ERROR_NOT_FOUND) {
      return ResultT::success(std::nullopt);
    }
    return ResultT::failure("CredReadA failed with error " + std::to_string(GetLastError()));
  }
  std::string value(reinterpret_cast<const char *>(credential->CredentialBlob),
                    credential->CredentialBlobSize);
  CredFree(credential);
  return ResultT::success(std::move(value));
}

common::Status CredentialManagerStore::set(const SecretId &id, const std::string &value) {
  observability::record_secret_access(std::string(name()), "set", id.to_string());

  std::string target = credential_target(id);
  std::string user = id.account;
  CREDENTIALA credential{};
  credential.Type = CRED_TYPE_GENERIC;
  credential.TargetName = target.data();
  credential.UserName = user.data();
  credential.CredentialBlobSize = static_cast<DWORD>(value.size());
  credential.CredentialBlob = reinterpret_cast<LPBYTE>(const_cast<char *>(value.data()));
  credential.Persist = CRED_PERSIST_LOCAL_MACHINE;
  if (CredWriteA(&credential, 0) != TRUE) {
    return common::Status::error("CredWriteA failed with error " +
                                 std::to_string(GetLastError()));
  }
  return common::Status::success();
}

common::Status CredentialManagerStore::remove(const SecretId &id) {
  observability::record_secret_access(std::string(name()), "remove", id.to_string());

  const std::string target = credential_target(id);
  if (CredDeleteA(target.c_str(), CRED_TYPE_GENERIC, 0) != TRUE &&
      GetLastError() != ERROR_NOT_FOUND) {
    return common::Status::error("CredDeleteA failed with error " +
                                 std::to_string(GetLastError()));
  }
  return common::Status::success();
}

#else

common::Result<std::optional<std::string>> CredentialManagerStore::get(const SecretId &) {
  return common::Result<std::optional<std::string>>::failure(
      "Windows Credential Manager is not available on this platform");
}

common::Status CredentialManagerStore::set(const SecretId &, const std::string &) {
  return common::Status::error("Windows Credential Manager is not available on this platform");
}

common::Status CredentialManagerStore::remove(const SecretId &) {
  return common::Status::error("Windows Credential Manager is not available on this platform");
}

#endif

// ── File ──────────────────────────────────────────────────────────────────────

FileSecretStore::FileSecretStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FileSecretStore::path_for(const SecretId &id) const {
  return directory_ / (sanitize_component(id.service) + "__" + sanitize_component(id.account));
}

common::Result<std::optional<std::string>> FileSecretStore::get(const SecretId &id) {
  using ResultT = common::Result<std::optional<std::string>>;
  observability::record_secret_access(std::string(name()), "get", id.to_string());

  const auto path = path_for(id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return ResultT::success(std::nullopt);
  }
  auto content = common::read_file(path);
  if (!content.ok()) {
    return ResultT::failure(content.error());
  }
  return ResultT::success(content.value());
}

common::Status FileSecretStore::set(const SecretId &id, const std::string &value) {
  observability::record_secret_access(std::string(name()), "set", id.to_string());

  auto dir = common::ensure_dir(directory_);
  if (!dir.ok()) {
    return common::Status::error(dir.error());
  }
#ifndef _WIN32
  if (chmod(directory_.c_str(), 0700) != 0) {
    observability::log_warn("secrets", "unable to restrict permissions on " + directory_.string());
  }
#endif
  return common::write_file_atomic(path_for(id), value);
}

common::Status FileSecretStore::remove(const SecretId &id) {
  observability::record_secret_access(std::string(name()), "remove", id.to_string());

  std::error_code ec;
  std::filesystem::remove(path_for(id), ec);
  if (ec) {
    return common::Status::error("failed to remove secret " + id.to_string() + ": " +
                                 ec.message());
  }
  return common::Status::success();
}

// ── Memory ────────────────────────────────────────────────────────────────────

common::Result<std::optional<std::string>> MemorySecretStore::get(const SecretId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find({id.service, id.account});
  if (it == entries_.end()) {
    return common::Result<std::optional<std::string>>::success(std::nullopt);
  }
  return common::Result<std::optional<std::string>>::success(it->second);
}

common::Status MemorySecretStore::set(const SecretId &id, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[{id.service, id.account}] = value;
  return common::Status::success();
}

common::Status MemorySecretStore::remove(const SecretId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase({id.service, id.account});
  return common::Status::success();
}

std::size_t MemorySecretStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

// ── Factory ───────────────────────────────────────────────────────────────────

common::Result<std::unique_ptr<SecretStore>> create_secret_store(const std::string &backend) {
  using ResultT = common::Result<std::unique_ptr<SecretStore>>;
  const std::string lowered = common::to_lower(common::trim(backend));

  if (lowered == "keychain") {
    return ResultT::success(std::make_unique<KeychainSecretStore>());
  }
  if (lowered == "secret-service") {
    return ResultT::success(std::make_unique<SecretServiceStore>());
  }
  if (lowered == "credential-manager") {
    return ResultT::success(std::make_unique<CredentialManagerStore>());
  }
  if (lowered == "memory") {
    return ResultT::success(std::make_unique<MemorySecretStore>());
  }
  if (lowered == "file") {
    auto dir = config::config_dir();
    if (!dir.ok()) {
      return ResultT::failure(dir.error());
    }
    return ResultT::success(std::make_unique<FileSecretStore>(dir.value() / "secrets"));
  }
  return ResultT::failure("unknown secret backend: " + backend);
}

common::Result<std::unique_ptr<SecretStore>> create_default_secret_store() {
  const std::string requested = common::getenv_or("SESSIONSYNC_SECRET_BACKEND", "");
  if (!requested.empty()) {
    return create_secret_store(requested);
  }

#if defined(_WIN32)
  return create_secret_store("credential-manager");
#elif defined(__APPLE__)
  return create_secret_store("keychain");
#else
  if (common::command_exists("secret-tool")) {
    return create_secret_store("secret-service");
  }
  observability::log_warn("secrets",
                          "secret-tool not found; storing secrets in the config directory");
  return create_secret_store("file");
#endif
}

} // namespace sessionsync::security
