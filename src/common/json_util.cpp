#include "sessionsync/common/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <sstream>
#include <utility>

namespace sessionsync::common {

namespace {

struct MemberSpan {
  std::size_t begin = std::string::npos;
  std::size_t end = std::string::npos;
};

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::optional<std::uint32_t> parse_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_value(raw[i]);
    if (digit < 0) {
      return std::nullopt;
    }
    value = (value << 4) | static_cast<std::uint32_t>(digit);
  }
  return value;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// End (exclusive) of the JSON value starting at pos, or npos if malformed.
std::size_t skip_value(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end == pos ? std::string::npos : end;
}

// Walks the members of the top-level object. The visitor returns true to stop.
template <typename Visitor> bool for_each_member(const std::string &json, Visitor &&visit) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return false;
  }
  pos = json_skip_ws(json, pos + 1);
  if (pos < json.size() && json[pos] == '}') {
    return true;
  }

  while (pos < json.size()) {
    if (json[pos] != '"') {
      return false;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return false;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return false;
    }
    const std::size_t value_begin = json_skip_ws(json, pos + 1);
    const std::size_t value_end = skip_value(json, value_begin);
    if (value_end == std::string::npos) {
      return false;
    }
    if (visit(key, MemberSpan{value_begin, value_end})) {
      return true;
    }

    pos = json_skip_ws(json, value_end);
    if (pos < json.size() && json[pos] == ',') {
      pos = json_skip_ws(json, pos + 1);
      continue;
    }
    return pos < json.size() && json[pos] == '}';
  }
  return false;
}

MemberSpan find_member(const std::string &json, const std::string &field) {
  MemberSpan found;
  (void)for_each_member(json, [&](const std::string &key, const MemberSpan &span) {
    if (key == field) {
      found = span;
      return true;
    }
    return false;
  });
  return found;
}

std::optional<std::string> decode_string_at(const std::string &json, const MemberSpan &span) {
  if (span.begin == std::string::npos || json[span.begin] != '"') {
    return std::nullopt;
  }
  return json_unescape(json.substr(span.begin + 1, span.end - span.begin - 2));
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        escaped += "\\u00";
        escaped.push_back("0123456789abcdef"[(static_cast<unsigned char>(ch) >> 4) & 0x0F]);
        escaped.push_back("0123456789abcdef"[static_cast<unsigned char>(ch) & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto cp = parse_hex4(raw, i + 1);
      if (!cp.has_value()) {
        out.push_back('u');
        break;
      }
      i += 4;
      std::uint32_t code = *cp;
      if (code >= 0xD800 && code <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        const auto low = parse_hex4(raw, i + 3);
        if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      if (code >= 0xD800 && code <= 0xDFFF) {
        code = 0xFFFD;
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

bool json_has_key(const std::string &json, const std::string &field) {
  return find_member(json, field).begin != std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  return decode_string_at(json, find_member(json, field)).value_or("");
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto span = find_member(json, field);
  if (span.begin == std::string::npos) {
    return "";
  }
  const char first = json[span.begin];
  if (first != '-' && std::isdigit(static_cast<unsigned char>(first)) == 0) {
    return "";
  }
  return json.substr(span.begin, span.end - span.begin);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto span = find_member(json, field);
  if (span.begin == std::string::npos || json[span.begin] != '{') {
    return "";
  }
  return json.substr(span.begin, span.end - span.begin);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto span = find_member(json, field);
  if (span.begin == std::string::npos || json[span.begin] != '[') {
    return "";
  }
  return json.substr(span.begin, span.end - span.begin);
}

bool json_get_bool(const std::string &json, const std::string &field, const bool fallback) {
  const auto span = find_member(json, field);
  if (span.begin == std::string::npos) {
    return fallback;
  }
  const std::string raw = json.substr(span.begin, span.end - span.begin);
  if (raw == "true") {
    return true;
  }
  if (raw == "false") {
    return false;
  }
  return fallback;
}

Result<std::vector<std::string>> json_get_string_array(const std::string &json,
                                                       const std::string &field) {
  using R = Result<std::vector<std::string>>;
  const std::string array = json_get_array(json, field);
  if (array.empty()) {
    return R::failure("missing array field: " + field);
  }

  std::vector<std::string> values;
  std::size_t pos = json_skip_ws(array, 1);
  if (pos < array.size() && array[pos] == ']') {
    return R::success(std::move(values));
  }
  while (pos < array.size()) {
    if (array[pos] != '"') {
      return R::failure("non-string element in array: " + field);
    }
    const auto end = json_find_string_end(array, pos);
    if (end == std::string::npos) {
      return R::failure("unterminated string in array: " + field);
    }
    values.push_back(json_unescape(array.substr(pos + 1, end - pos - 1)));
    pos = json_skip_ws(array, end + 1);
    if (pos < array.size() && array[pos] == ',') {
      pos = json_skip_ws(array, pos + 1);
      continue;
    }
    if (pos < array.size() && array[pos] == ']') {
      return R::success(std::move(values));
    }
    break;
  }
  return R::failure("malformed array: " + field);
}

Result<JsonFlatMap> json_parse_flat(const std::string &json) {
  JsonFlatMap values;
  std::string bad_key;
  const bool complete =
      for_each_member(json, [&](const std::string &key, const MemberSpan &span) {
        auto decoded = decode_string_at(json, span);
        if (!decoded.has_value()) {
          bad_key = key;
          return true;
        }
        values[key] = std::move(*decoded);
        return false;
      });
  if (!bad_key.empty()) {
    return Result<JsonFlatMap>::failure("non-string value for key: " + bad_key);
  }
  if (!complete) {
    return Result<JsonFlatMap>::failure("malformed JSON object");
  }
  return Result<JsonFlatMap>::success(std::move(values));
}

std::string json_write_flat(const JsonFlatMap &values) {
  std::vector<const std::pair<const std::string, std::string> *> entries;
  entries.reserve(values.size());
  for (const auto &entry : values) {
    entries.push_back(&entry);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto *lhs, const auto *rhs) { return lhs->first < rhs->first; });

  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto *entry : entries) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << '"' << json_escape(entry->first) << "\":\"" << json_escape(entry->second) << '"';
  }
  out << '}';
  return out.str();
}

std::string json_write_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << '"' << json_escape(values[i]) << '"';
  }
  out << ']';
  return out.str();
}

} // namespace sessionsync::common
