#include "sessionsync/sync/errors.hpp"

#include <utility>

namespace sessionsync::sync {

namespace {

constexpr std::chrono::seconds SERVER_ERROR_RETRY_DELAY{5};

SyncError make(ErrorKind kind) {
  SyncError error;
  error.kind = kind;
  return error;
}

} // namespace

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ClientNotInitialized:
    return "ClientNotInitialized";
  case ErrorKind::ApiRequestFailed:
    return "ApiRequestFailed";
  case ErrorKind::EncryptionFailed:
    return "EncryptionFailed";
  case ErrorKind::ConfigError:
    return "ConfigError";
  case ErrorKind::NetworkTimeout:
    return "NetworkTimeout";
  case ErrorKind::SerializationFailed:
    return "SerializationFailed";
  case ErrorKind::SessionValidationFailed:
    return "SessionValidationFailed";
  case ErrorKind::AuthenticationRequired:
    return "AuthenticationRequired";
  case ErrorKind::GistNotFound:
    return "GistNotFound";
  case ErrorKind::InvalidSessionData:
    return "InvalidSessionData";
  case ErrorKind::RateLimitExceeded:
    return "RateLimitExceeded";
  case ErrorKind::SecurityViolation:
    return "SecurityViolation";
  }
  return "Unknown";
}

SyncError SyncError::client_not_initialized() { return make(ErrorKind::ClientNotInitialized); }

SyncError SyncError::api_request_failed(std::string operation, std::uint16_t status,
                                        std::optional<std::string> details) {
  SyncError error = make(ErrorKind::ApiRequestFailed);
  error.operation = std::move(operation);
  error.status = status;
  error.details = std::move(details);
  return error;
}

SyncError SyncError::encryption_failed(std::string reason) {
  SyncError error = make(ErrorKind::EncryptionFailed);
  error.reason = std::move(reason);
  return error;
}

SyncError SyncError::config_error(std::string field, std::string reason) {
  SyncError error = make(ErrorKind::ConfigError);
  error.field = std::move(field);
  error.reason = std::move(reason);
  return error;
}

SyncError SyncError::network_timeout(std::chrono::seconds timeout, std::string operation) {
  SyncError error = make(ErrorKind::NetworkTimeout);
  error.timeout = timeout;
  error.operation = std::move(operation);
  return error;
}

SyncError SyncError::serialization_failed(std::string reason) {
  SyncError error = make(ErrorKind::SerializationFailed);
  error.reason = std::move(reason);
  return error;
}

SyncError SyncError::session_validation_failed(std::string reason) {
  SyncError error = make(ErrorKind::SessionValidationFailed);
  error.reason = std::move(reason);
  return error;
}

SyncError SyncError::authentication_required(std::string reason) {
  SyncError error = make(ErrorKind::AuthenticationRequired);
  error.reason = std::move(reason);
  return error;
}

SyncError SyncError::gist_not_found(std::string gist_id) {
  SyncError error = make(ErrorKind::GistNotFound);
  error.gist_id = std::move(gist_id);
  return error;
}

SyncError SyncError::invalid_session_data(std::string reason) {
  SyncError error = make(ErrorKind::InvalidSessionData);
  error.reason = std::move(reason);
  return error;
}

SyncError SyncError::rate_limit_exceeded(std::chrono::seconds retry_after) {
  SyncError error = make(ErrorKind::RateLimitExceeded);
  error.retry_after = retry_after;
  return error;
}

SyncError SyncError::security_violation(std::string reason) {
  SyncError error = make(ErrorKind::SecurityViolation);
  error.reason = std::move(reason);
  return error;
}

std::string SyncError::to_string() const {
  switch (kind) {
  case ErrorKind::ClientNotInitialized:
    return "GitHub client not initialized";
  case ErrorKind::ApiRequestFailed: {
    std::string message = "GitHub API request failed: " + operation + " (status " +
                          std::to_string(status) + ")";
    if (details.has_value() && !details->empty()) {
      message += ": " + *details;
    }
    return message;
  }
  case ErrorKind::EncryptionFailed:
    return "Encryption/decryption failed: " + reason;
  case ErrorKind::ConfigError:
    return "Configuration error in " + field + ": " + reason;
  case ErrorKind::NetworkTimeout:
    return "Network timeout after " + std::to_string(timeout.count()) + "s: " + operation;
  case ErrorKind::SerializationFailed:
    return "Serialization failed: " + reason;
  case ErrorKind::SessionValidationFailed:
    return "Session validation failed: " + reason;
  case ErrorKind::AuthenticationRequired:
    return "Authentication required: " + reason;
  case ErrorKind::GistNotFound:
    return "Gist not found: " + gist_id;
  case ErrorKind::InvalidSessionData:
    return "Invalid session data: " + reason;
  case ErrorKind::RateLimitExceeded:
    return "Rate limit exceeded, retry after " + std::to_string(retry_after.count()) + "s";
  case ErrorKind::SecurityViolation:
    return "Security violation: " + reason;
  }
  return "Unknown sync error";
}

bool SyncError::is_retryable() const {
  switch (kind) {
  case ErrorKind::NetworkTimeout:
  case ErrorKind::RateLimitExceeded:
    return true;
  case ErrorKind::ApiRequestFailed:
    return status >= 500;
  default:
    return false;
  }
}

std::optional<std::chrono::seconds> SyncError::retry_delay() const {
  if (kind == ErrorKind::RateLimitExceeded) {
    return retry_after;
  }
  if (kind == ErrorKind::ApiRequestFailed && status >= 500) {
    return SERVER_ERROR_RETRY_DELAY;
  }
  return std::nullopt;
}

std::optional<std::string> SyncError::operation_context() const {
  if (kind == ErrorKind::ApiRequestFailed || kind == ErrorKind::NetworkTimeout) {
    return operation;
  }
  return std::nullopt;
}

} // namespace sessionsync::sync
