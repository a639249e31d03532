#pragma once

#include "sessionsync/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sessionsync::common {

[[nodiscard]] std::string base64_encode(const std::vector<std::uint8_t> &bytes);
[[nodiscard]] std::string base64_encode(const std::string &bytes);
/// Strict decode; embedded whitespace is ignored, anything else outside the
/// alphabet fails.
[[nodiscard]] Result<std::vector<std::uint8_t>> base64_decode(const std::string &text);

[[nodiscard]] std::string hex_encode(const std::uint8_t *data, std::size_t size);
[[nodiscard]] bool is_hex(const std::string &value);

/// Lowercase hex SHA-256 digest.
[[nodiscard]] std::string sha256_hex(const std::string &data);

[[nodiscard]] std::string url_encode_component(const std::string &value);
[[nodiscard]] Result<std::string> url_decode_component(const std::string &value);

/// Parses `a=1&b=2`. Pairs without '=' or with malformed escapes are dropped.
[[nodiscard]] std::unordered_map<std::string, std::string>
parse_query_string(const std::string &query);

} // namespace sessionsync::common
