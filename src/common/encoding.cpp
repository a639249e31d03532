#include "sessionsync/common/encoding.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cctype>
#include <sstream>

namespace sessionsync::common {

namespace {

bool is_base64_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '+' || ch == '/';
}

int hex_digit(const char ch) {
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

} // namespace

std::string base64_encode(const std::vector<std::uint8_t> &bytes) {
  if (bytes.empty()) {
    return "";
  }
  const int output_len = 4 * static_cast<int>((bytes.size() + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), bytes.data(),
                  static_cast<int>(bytes.size()));
  return output;
}

std::string base64_encode(const std::string &bytes) {
  return base64_encode(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
}

Result<std::vector<std::uint8_t>> base64_decode(const std::string &text) {
  using R = Result<std::vector<std::uint8_t>>;

  std::string compact;
  compact.reserve(text.size());
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    compact.push_back(ch);
  }
  if (compact.empty()) {
    return R::success({});
  }
  if (compact.size() % 4 != 0) {
    return R::failure("Invalid base64 length");
  }

  std::size_t padding = 0;
  for (std::size_t i = 0; i < compact.size(); ++i) {
    const char ch = compact[i];
    if (ch == '=') {
      if (i + 2 < compact.size()) {
        return R::failure("Invalid base64 padding");
      }
      ++padding;
      continue;
    }
    if (padding > 0 || !is_base64_char(ch)) {
      return R::failure("Invalid base64 input");
    }
  }

  std::vector<std::uint8_t> decoded(compact.size() / 4 * 3);
  const int len = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char *>(compact.data()),
                                  static_cast<int>(compact.size()));
  if (len < 0 || static_cast<std::size_t>(len) < padding) {
    return R::failure("Invalid base64 input");
  }
  decoded.resize(static_cast<std::size_t>(len) - padding);
  return R::success(std::move(decoded));
}

std::string hex_encode(const std::uint8_t *data, const std::size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

bool is_hex(const std::string &value) {
  if (value.empty()) {
    return false;
  }
  for (const char ch : value) {
    if (hex_digit(ch) < 0) {
      return false;
    }
  }
  return true;
}

std::string sha256_hex(const std::string &data) {
  std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest.data());
  return hex_encode(digest.data(), digest.size());
}

std::string url_encode_component(const std::string &value) {
  std::ostringstream encoded;
  for (const unsigned char ch : value) {
    if ((ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
        (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      encoded << static_cast<char>(ch);
    } else {
      encoded << '%';
      encoded << "0123456789ABCDEF"[ch >> 4];
      encoded << "0123456789ABCDEF"[ch & 0x0F];
    }
  }
  return encoded.str();
}

Result<std::string> url_decode_component(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch == '+') {
      out.push_back(' ');
      continue;
    }
    if (ch != '%') {
      out.push_back(ch);
      continue;
    }
    if (i + 2 >= value.size()) {
      return Result<std::string>::failure("truncated percent escape");
    }
    const int hi = hex_digit(value[i + 1]);
    const int lo = hex_digit(value[i + 2]);
    if (hi < 0 || lo < 0) {
      return Result<std::string>::failure("invalid percent escape");
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return Result<std::string>::success(std::move(out));
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> params;
  std::stringstream stream(query);
  std::string pair;
  while (std::getline(stream, pair, '&')) {
    const auto eq = pair.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    auto key = url_decode_component(pair.substr(0, eq));
    auto value = url_decode_component(pair.substr(eq + 1));
    if (!key.ok() || !value.ok() || key.value().empty()) {
      continue;
    }
    params[key.value()] = value.value();
  }
  return params;
}

} // namespace sessionsync::common
