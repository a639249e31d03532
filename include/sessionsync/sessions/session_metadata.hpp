#pragma once

#include "sessionsync/common/json_util.hpp"
#include "sessionsync/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sessionsync::sessions {

inline constexpr std::uint32_t SESSION_VERSION = 1;
inline constexpr std::chrono::hours SESSION_LIFETIME{24 * 30};
inline constexpr std::chrono::hours MAX_SESSION_AGE{24 * 90};
inline constexpr std::chrono::hours REFRESH_THRESHOLD{24 * 7};
inline constexpr std::size_t SESSION_ID_LENGTH = 32;
inline constexpr std::size_t DEVICE_ID_LENGTH = 16;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using CookieMap = common::JsonFlatMap;

/// RFC 3339 UTC with second precision: `2024-01-31T12:00:00Z`.
[[nodiscard]] std::string format_timestamp(Timestamp value);
[[nodiscard]] common::Result<Timestamp> parse_timestamp(const std::string &text);

enum class SessionValidationError {
  Expired,
  TooOld,
  InvalidSessionId,
  InvalidDeviceId,
  UnsupportedVersion,
  ContentHashMismatch,
};

[[nodiscard]] const char *to_string(SessionValidationError error);

/// Error wrapper so Result can describe a validation failure.
struct ValidationFailure {
  SessionValidationError code;

  [[nodiscard]] std::string to_string() const { return sessions::to_string(code); }
};

using ValidationResult = common::Result<void, ValidationFailure>;

/// SHA-256 hex over `k=v` pairs concatenated in bytewise key order.
[[nodiscard]] std::string compute_content_hash(const CookieMap &cookies);

/// Sorted key list of the cookie map.
[[nodiscard]] std::vector<std::string> platforms_of(const CookieMap &cookies);

/// First 16 hex characters of SHA-256(hostname), or random when the host
/// name cannot be determined.
[[nodiscard]] common::Result<std::string> derive_device_id();

struct SessionMetadata {
  std::uint32_t version = SESSION_VERSION;
  Timestamp created_at{};
  Timestamp updated_at{};
  Timestamp expires_at{};
  std::vector<std::string> platforms;
  std::string session_id;
  std::string content_hash;
  std::string device_id;

  [[nodiscard]] static common::Result<SessionMetadata> create(std::vector<std::string> platforms);

  /// Sliding expiration: every update pushes expires_at out by the full lifetime.
  void update(std::vector<std::string> new_platforms, std::string new_content_hash);

  [[nodiscard]] ValidationResult validate() const;
  [[nodiscard]] ValidationResult validate_at(Timestamp now) const;
  [[nodiscard]] bool is_valid() const { return validate().ok(); }

  [[nodiscard]] bool needs_refresh() const;
  /// Zero once expired.
  [[nodiscard]] std::chrono::seconds time_until_expiration() const;

  [[nodiscard]] std::string to_json() const;
  [[nodiscard]] static common::Result<SessionMetadata> from_json(const std::string &json);
};

struct SessionData {
  SessionMetadata metadata;
  CookieMap cookies;

  [[nodiscard]] static common::Result<SessionData> create(CookieMap cookies);

  void update(CookieMap new_cookies);

  /// Metadata checks plus the content hash recomputed from `cookies`.
  [[nodiscard]] ValidationResult validate() const;

  [[nodiscard]] std::string to_json() const;
  [[nodiscard]] static common::Result<SessionData> from_json(const std::string &json);
};

} // namespace sessionsync::sessions
