#include "sessionsync/common/random.hpp"

#include <openssl/rand.h>

#include <array>

namespace sessionsync::common {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
constexpr std::size_t kAlphabetSize = sizeof(kAlphabet) - 1;
// Largest multiple of 62 that fits in a byte; bytes at or above it are rejected.
constexpr unsigned kRejectThreshold = 256 - (256 % kAlphabetSize);

} // namespace

Result<std::vector<std::uint8_t>> random_bytes(const std::size_t count) {
  std::vector<std::uint8_t> bytes(count);
  if (count == 0) {
    return Result<std::vector<std::uint8_t>>::success(std::move(bytes));
  }
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return Result<std::vector<std::uint8_t>>::failure("secure random generator unavailable");
  }
  return Result<std::vector<std::uint8_t>>::success(std::move(bytes));
}

Result<std::string> random_alphanumeric(const std::size_t length) {
  std::string out;
  out.reserve(length);
  std::array<unsigned char, 64> pool{};
  while (out.size() < length) {
    if (RAND_bytes(pool.data(), static_cast<int>(pool.size())) != 1) {
      return Result<std::string>::failure("secure random generator unavailable");
    }
    for (const unsigned char byte : pool) {
      if (byte >= kRejectThreshold) {
        continue;
      }
      out.push_back(kAlphabet[byte % kAlphabetSize]);
      if (out.size() == length) {
        break;
      }
    }
  }
  return Result<std::string>::success(std::move(out));
}

bool is_ascii_alphanumeric(const std::string &value) {
  for (const char ch : value) {
    const bool alnum = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
                       (ch >= '0' && ch <= '9');
    if (!alnum) {
      return false;
    }
  }
  return true;
}

} // namespace sessionsync::common
