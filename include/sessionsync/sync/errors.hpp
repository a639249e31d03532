#pragma once

#include "sessionsync/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sessionsync::sync {

enum class ErrorKind {
  ClientNotInitialized,
  ApiRequestFailed,
  EncryptionFailed,
  ConfigError,
  NetworkTimeout,
  SerializationFailed,
  SessionValidationFailed,
  AuthenticationRequired,
  GistNotFound,
  InvalidSessionData,
  RateLimitExceeded,
  SecurityViolation,
};

[[nodiscard]] const char *error_kind_name(ErrorKind kind);

/// Classified failure shared by the OAuth, crypto and gist layers. Only the
/// fields relevant to `kind` are populated.
struct SyncError {
  ErrorKind kind = ErrorKind::ClientNotInitialized;
  std::string operation;
  std::uint16_t status = 0;
  std::optional<std::string> details;
  std::string field;
  std::string reason;
  std::string gist_id;
  std::chrono::seconds timeout{0};
  std::chrono::seconds retry_after{0};

  static SyncError client_not_initialized();
  static SyncError api_request_failed(std::string operation, std::uint16_t status,
                                      std::optional<std::string> details = std::nullopt);
  static SyncError encryption_failed(std::string reason);
  static SyncError config_error(std::string field, std::string reason);
  static SyncError network_timeout(std::chrono::seconds timeout, std::string operation);
  static SyncError serialization_failed(std::string reason);
  static SyncError session_validation_failed(std::string reason);
  static SyncError authentication_required(std::string reason);
  static SyncError gist_not_found(std::string gist_id);
  static SyncError invalid_session_data(std::string reason);
  static SyncError rate_limit_exceeded(std::chrono::seconds retry_after);
  static SyncError security_violation(std::string reason);

  [[nodiscard]] std::string to_string() const;

  /// Transient transport conditions only. Crypto, validation and CSRF failures
  /// are never retried.
  [[nodiscard]] bool is_retryable() const;

  [[nodiscard]] std::optional<std::chrono::seconds> retry_delay() const;

  /// Name of the remote operation for API and timeout failures.
  [[nodiscard]] std::optional<std::string> operation_context() const;
};

template <typename T> using SyncResult = common::Result<T, SyncError>;
using SyncStatus = common::Result<void, SyncError>;

} // namespace sessionsync::sync
