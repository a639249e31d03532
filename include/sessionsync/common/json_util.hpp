#pragma once

#include "sessionsync/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace sessionsync::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal (without the surrounding quotes).
/// \uXXXX escapes, including surrogate pairs, are decoded to UTF-8.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// True when `field` is a member of the top-level object.
[[nodiscard]] bool json_has_key(const std::string &json, const std::string &field);

// Field lookups only consider members of the top-level object; a key of the same
// name inside a nested object is never returned. Missing or mistyped fields
// yield an empty string.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);
[[nodiscard]] bool json_get_bool(const std::string &json, const std::string &field,
                                 bool fallback = false);

/// Extract a string array field like "platforms": ["a","b"].
[[nodiscard]] Result<std::vector<std::string>> json_get_string_array(const std::string &json,
                                                                     const std::string &field);

using JsonFlatMap = std::unordered_map<std::string, std::string>;

/// Parse an object whose members are all strings. Any other member type fails.
[[nodiscard]] Result<JsonFlatMap> json_parse_flat(const std::string &json);

/// Serialize a string map; keys are emitted in sorted order.
[[nodiscard]] std::string json_write_flat(const JsonFlatMap &values);
[[nodiscard]] std::string json_write_string_array(const std::vector<std::string> &values);

} // namespace sessionsync::common
