#include "test_framework.hpp"

#include "sessionsync/common/random.hpp"
#include "sessionsync/sessions/session_metadata.hpp"

#include <chrono>

namespace {

namespace ss = sessionsync::sessions;

ss::SessionMetadata fresh_metadata() {
  auto metadata = ss::SessionMetadata::create({"github", "slack"});
  if (!metadata.ok()) {
    throw std::runtime_error(metadata.error());
  }
  return metadata.value();
}

} // namespace

void register_session_metadata_tests(std::vector<sessionsync::tests::TestCase> &tests) {
  using sessionsync::tests::require;
  using namespace std::chrono;

  tests.push_back({"session_metadata_create_sets_lifetime", [] {
                     const auto metadata = fresh_metadata();
                     require(metadata.version == ss::SESSION_VERSION, "version");
                     require(metadata.expires_at - metadata.created_at == ss::SESSION_LIFETIME,
                             "expiry should be created_at + 30 days");
                     require(metadata.session_id.size() == 32, "session id length");
                     require(metadata.device_id.size() == 16, "device id length");
                     require(sessionsync::common::is_ascii_alphanumeric(metadata.session_id),
                             "session id charset");
                     require(metadata.is_valid(), "fresh metadata should validate");
                     require(!metadata.needs_refresh(), "fresh metadata should not need refresh");
                   }});

  tests.push_back({"session_metadata_ids_are_unique", [] {
                     const auto a = fresh_metadata();
                     const auto b = fresh_metadata();
                     require(a.session_id != b.session_id, "session ids must differ");
                     require(a.device_id == b.device_id, "device id is per host");
                   }});

  tests.push_back({"session_metadata_expiry_boundary", [] {
                     const auto metadata = fresh_metadata();
                     require(metadata.validate_at(metadata.expires_at - seconds(1)).ok(),
                             "one second before expiry is valid");
                     require(metadata.validate_at(metadata.expires_at).ok(),
                             "the expiry instant itself is still valid");
                     const auto after = metadata.validate_at(metadata.expires_at + seconds(1));
                     require(!after.ok(), "one second after expiry must fail");
                     require(after.error().code == ss::SessionValidationError::Expired,
                             "expected Expired");
                   }});

  tests.push_back({"session_metadata_too_old", [] {
                     auto metadata = fresh_metadata();
                     const auto now = ss::Clock::now();
                     metadata.created_at = now - ss::MAX_SESSION_AGE - hours(1);
                     metadata.expires_at = now + hours(24);
                     const auto result = metadata.validate_at(now);
                     require(!result.ok(), "91-day-old session must fail");
                     require(result.error().code == ss::SessionValidationError::TooOld,
                             "expected TooOld");
                   }});

  tests.push_back({"session_metadata_rejects_bad_identifiers", [] {
                     auto metadata = fresh_metadata();
                     metadata.session_id = "short";
                     require(metadata.validate().error().code ==
                                 ss::SessionValidationError::InvalidSessionId,
                             "expected InvalidSessionId");

                     metadata = fresh_metadata();
                     metadata.device_id = "not-alnum-000000";
                     require(metadata.validate().error().code ==
                                 ss::SessionValidationError::InvalidDeviceId,
                             "expected InvalidDeviceId");

                     metadata = fresh_metadata();
                     metadata.version = ss::SESSION_VERSION + 1;
                     require(metadata.validate().error().code ==
                                 ss::SessionValidationError::UnsupportedVersion,
                             "expected UnsupportedVersion");
                   }});

  tests.push_back({"session_metadata_refresh_threshold", [] {
                     auto metadata = fresh_metadata();
                     metadata.expires_at = ss::Clock::now() + hours(24 * 6);
                     require(metadata.needs_refresh(), "6 days left should need refresh");
                     metadata.expires_at = ss::Clock::now() + hours(24 * 8);
                     require(!metadata.needs_refresh(), "8 days left should not");
                     metadata.expires_at = ss::Clock::now() - hours(1);
                     require(metadata.time_until_expiration() == seconds(0),
                             "expired sessions report zero");
                   }});

  tests.push_back({"session_metadata_update_slides_expiry", [] {
                     auto metadata = fresh_metadata();
                     metadata.expires_at = ss::Clock::now() + hours(1);
                     metadata.update({"jira"}, "abc");
                     require(metadata.time_until_expiration() > hours(24 * 29),
                             "update should push expiry out");
                     require(metadata.platforms.size() == 1 && metadata.platforms[0] == "jira",
                             "platforms replaced");
                     require(metadata.content_hash == "abc", "hash replaced");
                   }});

  tests.push_back({"session_content_hash_ignores_insertion_order", [] {
                     ss::CookieMap first;
                     first["b"] = "2";
                     first["a"] = "1";
                     ss::CookieMap second;
                     second["a"] = "1";
                     second["b"] = "2";
                     require(ss::compute_content_hash(first) == ss::compute_content_hash(second),
                             "hash must not depend on insertion order");
                     second["b"] = "3";
                     require(ss::compute_content_hash(first) != ss::compute_content_hash(second),
                             "hash must depend on values");
                     require(ss::compute_content_hash(first).size() == 64, "sha256 hex length");
                   }});

  tests.push_back({"session_data_detects_tampered_cookies", [] {
                     ss::CookieMap cookies;
                     cookies["session"] = "abc";
                     cookies["csrf"] = "xyz";
                     auto data = ss::SessionData::create(cookies);
                     require(data.ok(), "create should succeed");
                     require(data.value().validate().ok(), "fresh data validates");
                     require(data.value().metadata.platforms ==
                                 std::vector<std::string>({"csrf", "session"}),
                             "platforms sorted");

                     auto tampered = data.value();
                     tampered.cookies["session"] = "evil";
                     const auto result = tampered.validate();
                     require(!result.ok(), "tampered cookies must fail");
                     require(result.error().code ==
                                 ss::SessionValidationError::ContentHashMismatch,
                             "expected ContentHashMismatch");
                   }});

  tests.push_back({"session_data_json_round_trip", [] {
                     ss::CookieMap cookies;
                     cookies["session"] = "a\"b\\c";
                     cookies["unicode"] = "caf\xC3\xA9";
                     auto data = ss::SessionData::create(cookies);
                     require(data.ok(), "create should succeed");
                     const std::string json = data.value().to_json();
                     require(json.find("\"metadata\":") != std::string::npos, "metadata member");
                     require(json.find("\"cookies\":") != std::string::npos, "cookies member");

                     auto parsed = ss::SessionData::from_json(json);
                     require(parsed.ok(), "parse failed");
                     require(parsed.value().cookies == cookies, "cookies differ");
                     require(parsed.value().metadata.session_id ==
                                 data.value().metadata.session_id,
                             "session id differs");
                     require(parsed.value().validate().ok(), "parsed data should validate");
                   }});

  tests.push_back({"session_data_rejects_missing_members", [] {
                     require(!ss::SessionData::from_json("{\"cookies\":{}}").ok(),
                             "missing metadata must fail");
                     require(!ss::SessionData::from_json("not json").ok(), "garbage must fail");
                   }});

  tests.push_back({"session_timestamps_are_strict_rfc3339", [] {
                     auto parsed = ss::parse_timestamp("2024-01-31T12:34:56Z");
                     require(parsed.ok(), "valid timestamp rejected");
                     require(ss::format_timestamp(parsed.value()) == "2024-01-31T12:34:56Z",
                             "format mismatch");
                     require(!ss::parse_timestamp("2024-02-30T00:00:00Z").ok(),
                             "invalid date accepted");
                     require(!ss::parse_timestamp("2024-01-31 12:34:56").ok(),
                             "missing T/Z accepted");
                     require(!ss::parse_timestamp("2024-01-31T24:00:00Z").ok(),
                             "hour 24 accepted");
                   }});
}
