#include "sessionsync/sessions/session_metadata.hpp"

#include "sessionsync/common/encoding.hpp"
#include "sessionsync/common/fs.hpp"
#include "sessionsync/common/random.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace sessionsync::sessions {

namespace {

bool parse_digits(const std::string &text, std::size_t pos, std::size_t count, int &out) {
  out = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
    out = out * 10 + (text[i] - '0');
  }
  return true;
}

std::string hostname() {
#ifndef _WIN32
  char buf[256] = {0};
  if (gethostname(buf, sizeof(buf) - 1) == 0 && buf[0] != '\0') {
    return buf;
  }
#endif
  std::string env = common::getenv_or("HOSTNAME", "");
  if (env.empty()) {
    env = common::getenv_or("COMPUTERNAME", "");
  }
  return common::trim(env);
}

bool valid_identifier(const std::string &value, std::size_t length) {
  return value.size() == length && common::is_ascii_alphanumeric(value);
}

common::Result<Timestamp> timestamp_field(const std::string &json, const char *field) {
  const std::string text = common::json_get_string(json, field);
  if (text.empty()) {
    return common::Result<Timestamp>::failure(std::string("missing field: ") + field);
  }
  auto parsed = parse_timestamp(text);
  if (!parsed.ok()) {
    return common::Result<Timestamp>::failure(std::string(field) + ": " + parsed.error());
  }
  return parsed;
}

} // namespace

std::string format_timestamp(Timestamp value) {
  using namespace std::chrono;
  const auto day = floor<days>(value);
  const year_month_day ymd{day};
  const hh_mm_ss hms{floor<seconds>(value - day)};

  char buf[32] = {0};
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
                static_cast<int>(hms.seconds().count()));
  return buf;
}

common::Result<Timestamp> parse_timestamp(const std::string &text) {
  using namespace std::chrono;
  // YYYY-MM-DDTHH:MM:SSZ
  if (text.size() != 20 || text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
      text[13] != ':' || text[16] != ':' || text[19] != 'Z') {
    return common::Result<Timestamp>::failure("invalid timestamp: " + text);
  }
  int y = 0;
  int mo = 0;
  int d = 0;
  int h = 0;
  int mi = 0;
  int s = 0;
  if (!parse_digits(text, 0, 4, y) || !parse_digits(text, 5, 2, mo) ||
      !parse_digits(text, 8, 2, d) || !parse_digits(text, 11, 2, h) ||
      !parse_digits(text, 14, 2, mi) || !parse_digits(text, 17, 2, s)) {
    return common::Result<Timestamp>::failure("invalid timestamp: " + text);
  }
  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                           day{static_cast<unsigned>(d)}};
  if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
    return common::Result<Timestamp>::failure("timestamp out of range: " + text);
  }
  const Timestamp value = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s};
  return common::Result<Timestamp>::success(value);
}

const char *to_string(SessionValidationError error) {
  switch (error) {
  case SessionValidationError::Expired:
    return "session has expired";
  case SessionValidationError::TooOld:
    return "session exceeds the maximum age";
  case SessionValidationError::InvalidSessionId:
    return "invalid session id";
  case SessionValidationError::InvalidDeviceId:
    return "invalid device id";
  case SessionValidationError::UnsupportedVersion:
    return "unsupported session version";
  case SessionValidationError::ContentHashMismatch:
    return "content hash mismatch";
  }
  return "unknown validation error";
}

std::string compute_content_hash(const CookieMap &cookies) {
  std::vector<const std::pair<const std::string, std::string> *> entries;
  entries.reserve(cookies.size());
  for (const auto &entry : cookies) {
    entries.push_back(&entry);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto *a, const auto *b) { return a->first < b->first; });

  std::string canonical;
  for (const auto *entry : entries) {
    canonical += entry->first;
    canonical += '=';
    canonical += entry->second;
  }
  return common::sha256_hex(canonical);
}

std::vector<std::string> platforms_of(const CookieMap &cookies) {
  std::vector<std::string> keys;
  keys.reserve(cookies.size());
  for (const auto &[key, value] : cookies) {
    keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

common::Result<std::string> derive_device_id() {
  const std::string host = hostname();
  if (!host.empty()) {
    return common::Result<std::string>::success(
        common::sha256_hex(host).substr(0, DEVICE_ID_LENGTH));
  }
  return common::random_alphanumeric(DEVICE_ID_LENGTH);
}

// ── SessionMetadata ───────────────────────────────────────────────────────────

common::Result<SessionMetadata> SessionMetadata::create(std::vector<std::string> platforms) {
  auto session_id = common::random_alphanumeric(SESSION_ID_LENGTH);
  if (!session_id.ok()) {
    return common::Result<SessionMetadata>::failure(session_id.error());
  }
  auto device_id = derive_device_id();
  if (!device_id.ok()) {
    return common::Result<SessionMetadata>::failure(device_id.error());
  }

  const auto now = Clock::now();
  SessionMetadata metadata;
  metadata.created_at = now;
  metadata.updated_at = now;
  metadata.expires_at = now + SESSION_LIFETIME;
  metadata.platforms = std::move(platforms);
  metadata.session_id = session_id.value();
  metadata.device_id = device_id.value();
  return common::Result<SessionMetadata>::success(std::move(metadata));
}

void SessionMetadata::update(std::vector<std::string> new_platforms,
                             std::string new_content_hash) {
  const auto now = Clock::now();
  updated_at = now;
  expires_at = now + SESSION_LIFETIME;
  platforms = std::move(new_platforms);
  content_hash = std::move(new_content_hash);
}

ValidationResult SessionMetadata::validate() const { return validate_at(Clock::now()); }

ValidationResult SessionMetadata::validate_at(Timestamp now) const {
  if (now > expires_at) {
    return ValidationResult::failure({SessionValidationError::Expired});
  }
  if (now - created_at > MAX_SESSION_AGE) {
    return ValidationResult::failure({SessionValidationError::TooOld});
  }
  if (!valid_identifier(session_id, SESSION_ID_LENGTH)) {
    return ValidationResult::failure({SessionValidationError::InvalidSessionId});
  }
  if (!valid_identifier(device_id, DEVICE_ID_LENGTH)) {
    return ValidationResult::failure({SessionValidationError::InvalidDeviceId});
  }
  if (version > SESSION_VERSION) {
    return ValidationResult::failure({SessionValidationError::UnsupportedVersion});
  }
  return ValidationResult::success();
}

bool SessionMetadata::needs_refresh() const {
  return time_until_expiration() < REFRESH_THRESHOLD;
}

std::chrono::seconds SessionMetadata::time_until_expiration() const {
  const auto remaining = expires_at - Clock::now();
  if (remaining <= Clock::duration::zero()) {
    return std::chrono::seconds{0};
  }
  return std::chrono::duration_cast<std::chrono::seconds>(remaining);
}

std::string SessionMetadata::to_json() const {
  std::string out = "{";
  out += "\"version\":" + std::to_string(version);
  out += ",\"created_at\":\"" + format_timestamp(created_at) + "\"";
  out += ",\"updated_at\":\"" + format_timestamp(updated_at) + "\"";
  out += ",\"expires_at\":\"" + format_timestamp(expires_at) + "\"";
  out += ",\"platforms\":" + common::json_write_string_array(platforms);
  out += ",\"session_id\":\"" + common::json_escape(session_id) + "\"";
  out += ",\"content_hash\":\"" + common::json_escape(content_hash) + "\"";
  out += ",\"device_id\":\"" + common::json_escape(device_id) + "\"";
  out += "}";
  return out;
}

common::Result<SessionMetadata> SessionMetadata::from_json(const std::string &json) {
  using ResultT = common::Result<SessionMetadata>;
  SessionMetadata metadata;

  const std::string version_text = common::json_get_number(json, "version");
  if (version_text.empty()) {
    return ResultT::failure("missing field: version");
  }
  try {
    const unsigned long long parsed = std::stoull(version_text);
    if (parsed > 0xffffffffULL) {
      return ResultT::failure("version out of range");
    }
    metadata.version = static_cast<std::uint32_t>(parsed);
  } catch (const std::exception &) {
    return ResultT::failure("invalid version: " + version_text);
  }

  auto created = timestamp_field(json, "created_at");
  if (!created.ok()) {
    return ResultT::failure(created.error());
  }
  auto updated = timestamp_field(json, "updated_at");
  if (!updated.ok()) {
    return ResultT::failure(updated.error());
  }
  auto expires = timestamp_field(json, "expires_at");
  if (!expires.ok()) {
    return ResultT::failure(expires.error());
  }
  metadata.created_at = created.value();
  metadata.updated_at = updated.value();
  metadata.expires_at = expires.value();

  auto platforms = common::json_get_string_array(json, "platforms");
  if (!platforms.ok()) {
    return ResultT::failure("platforms: " + platforms.error());
  }
  metadata.platforms = platforms.value();

  metadata.session_id = common::json_get_string(json, "session_id");
  metadata.content_hash = common::json_get_string(json, "content_hash");
  metadata.device_id = common::json_get_string(json, "device_id");
  return ResultT::success(std::move(metadata));
}

// ── SessionData ───────────────────────────────────────────────────────────────

common::Result<SessionData> SessionData::create(CookieMap cookies) {
  auto metadata = SessionMetadata::create(platforms_of(cookies));
  if (!metadata.ok()) {
    return common::Result<SessionData>::failure(metadata.error());
  }
  SessionData data;
  data.metadata = metadata.value();
  data.metadata.content_hash = compute_content_hash(cookies);
  data.cookies = std::move(cookies);
  return common::Result<SessionData>::success(std::move(data));
}

void SessionData::update(CookieMap new_cookies) {
  metadata.update(platforms_of(new_cookies), compute_content_hash(new_cookies));
  cookies = std::move(new_cookies);
}

ValidationResult SessionData::validate() const {
  auto valid = metadata.validate();
  if (!valid.ok()) {
    return valid;
  }
  if (compute_content_hash(cookies) != metadata.content_hash) {
    return ValidationResult::failure({SessionValidationError::ContentHashMismatch});
  }
  return ValidationResult::success();
}

std::string SessionData::to_json() const {
  return "{\"metadata\":" + metadata.to_json() + ",\"cookies\":" +
         common::json_write_flat(cookies) + "}";
}

common::Result<SessionData> SessionData::from_json(const std::string &json) {
  using ResultT = common::Result<SessionData>;

  const std::string metadata_json = common::json_get_object(json, "metadata");
  if (metadata_json.empty()) {
    return ResultT::failure("missing field: metadata");
  }
  const std::string cookies_json = common::json_get_object(json, "cookies");
  if (cookies_json.empty()) {
    return ResultT::failure("missing field: cookies");
  }

  auto metadata = SessionMetadata::from_json(metadata_json);
  if (!metadata.ok()) {
    return ResultT::failure("metadata: " + metadata.error());
  }
  auto cookies = common::json_parse_flat(cookies_json);
  if (!cookies.ok()) {
    return ResultT::failure("cookies: " + cookies.error());
  }

  SessionData data;
  data.metadata = metadata.value();
  data.cookies = cookies.value();
  return ResultT::success(std::move(data));
}

} // namespace sessionsync::sessions
